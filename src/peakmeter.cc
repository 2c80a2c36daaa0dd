/*
 * Copyright (C) 2024 The tame authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "peakmeter.hh"

#include <algorithm>

PeakMeter::PeakMeter (double delay) :
  m_delay (delay)
{
}

void
PeakMeter::set_volume (float volume, double time)
{
  std::lock_guard<std::mutex> lg (m_mutex);

  if (volume == m_volume)
    return;

  /* several changes within one delay: old samples may be from any of them */
  if (time < m_change_time + m_delay)
    m_previous_volume = std::max (m_previous_volume, m_volume);
  else
    m_previous_volume = m_volume;

  m_volume      = volume;
  m_change_time = time;
}

void
PeakMeter::add_period (float peak, double end_time)
{
  std::lock_guard<std::mutex> lg (m_mutex);

  Period period;
  period.peak   = peak;
  period.volume = m_volume;
  if (end_time < m_change_time + m_delay)
    period.volume = std::max (m_previous_volume, m_volume);

  m_periods[0] = m_periods[1];
  m_periods[1] = period;
  m_error      = Error::Code::NONE;
}

void
PeakMeter::set_error (const Error& err)
{
  std::lock_guard<std::mutex> lg (m_mutex);
  m_error = err;
}

Error
PeakMeter::read (float& peak, float& volume) const
{
  std::lock_guard<std::mutex> lg (m_mutex);
  if (m_error)
    return m_error;

  auto level = [] (const Period& p) { return p.peak / std::max (p.volume, 0.01f); };

  const Period& loudest = level (m_periods[0]) > level (m_periods[1]) ? m_periods[0] : m_periods[1];
  peak   = loudest.peak;
  volume = loudest.volume;
  return Error::Code::NONE;
}
