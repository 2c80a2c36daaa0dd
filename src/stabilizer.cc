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

#include "stabilizer.hh"
#include "utils.hh"

#include <math.h>

using std::max;
using std::min;

constexpr double Stabilizer::update_interval;

Stabilizer::Stabilizer (double base_leeway_db)
{
  reset (base_leeway_db);
}

void
Stabilizer::reset (double base_leeway_db)
{
  m_base_leeway_db    = base_leeway_db;
  m_current_leeway_db = base_leeway_db;
  m_have_last_volume  = false;
  m_last_volume       = 0;
  m_change_times.clear();
}

void
Stabilizer::track (const LimiterConfig& config, float new_volume, double now)
{
  if (!config.stabilizer_enabled)
    return;

  if (m_have_last_volume && fabs (new_volume - m_last_volume) > config.stabilizer_change_threshold)
    m_change_times.push_back (now);

  m_last_volume      = new_volume;
  m_have_last_volume = true;
}

/* returns true if the current leeway was changed */
bool
Stabilizer::update (const LimiterConfig& config, double now)
{
  if (now - m_last_check_time < update_interval)
    return false;
  m_last_check_time = now;

  const double cutoff = now - config.stabilizer_window;
  while (!m_change_times.empty() && m_change_times.front() <= cutoff)
    m_change_times.pop_front();

  const int n_changes = m_change_times.size();
  const double old_leeway_db = m_current_leeway_db;
  const double max_leeway_db = max (m_base_leeway_db, config.stabilizer_max_leeway);

  if (n_changes >= config.stabilizer_threshold)
    {
      m_current_leeway_db = min (m_current_leeway_db + config.stabilizer_step, max_leeway_db);
    }
  else if (n_changes < config.stabilizer_threshold / 2)
    {
      m_current_leeway_db = max (m_current_leeway_db - config.stabilizer_step / 2, m_base_leeway_db);
    }
  /* between threshold / 2 and threshold: keep leeway */

  m_current_leeway_db = bound (m_base_leeway_db, m_current_leeway_db, max_leeway_db);
  if (m_current_leeway_db != old_leeway_db)
    {
      debug ("tame: stabilizer: %d changes in %.1fs, leeway %.1f dB -> %.1f dB\n",
             n_changes, config.stabilizer_window, old_leeway_db, m_current_leeway_db);
      return true;
    }
  return false;
}
