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

#include "audioendpoint.hh"

#include <math.h>

constexpr float AudioEndpoint::user_change_epsilon;

AudioEndpoint::~AudioEndpoint()
{
}

void
AudioEndpoint::init_volume()
{
  float v;
  Error err = read_volume (v);
  if (err)
    {
      debug ("tame: initial volume read failed: %s\n", err.message());
      return;
    }
  m_cached_volume   = bound<float> (0, v, 1);
  m_last_set_volume = m_cached_volume;
  m_user_set_volume = m_cached_volume;
}

/* peak normalized as if the volume were 100% */
float
AudioEndpoint::peak_level()
{
  float peak;
  float peak_volume = m_cached_volume;
  Error err = read_peak (peak, peak_volume);
  if (err)
    {
      debug ("tame: peak read failed: %s\n", err.message());
      return 0;
    }
  peak = std::max (peak, 0.0f);

  if (peak_is_post_volume() && peak_volume > 0.01)
    {
      /* i.e. at volume 50%, a peak of 0.25 means the content peak is 0.5 */
      return std::min (1.0f, peak / peak_volume);
    }
  return peak;
}

float
AudioEndpoint::volume()
{
  float v;
  Error err = read_volume (v);
  if (err)
    {
      debug ("tame: volume read failed: %s\n", err.message());
      return m_cached_volume;
    }
  m_cached_volume = bound<float> (0, v, 1);
  return m_cached_volume;
}

void
AudioEndpoint::set_volume (float v)
{
  if (std::isnan (v))
    return;

  v = bound<float> (0, v, 1);

  Error err = write_volume (v);
  if (err)
    {
      debug ("tame: volume write failed: %s\n", err.message());
      return;
    }
  /* coarse mixers round, remember what the device really uses */
  v = bound<float> (0, v, 1);
  m_last_set_volume = v;
  m_cached_volume   = v;
}

bool
AudioEndpoint::detect_user_change (double now)
{
  const float current = volume();

  if (fabs (current - m_last_set_volume) > user_change_epsilon)
    {
      m_have_user_change = true;
      m_user_set_time    = now;
      m_user_set_volume  = current;
      m_last_set_volume  = current;
      return true;
    }
  return false;
}
