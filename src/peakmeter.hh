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

#ifndef TAME_PEAK_METER_HH
#define TAME_PEAK_METER_HH

#include <mutex>

#include "utils.hh"

/*
 * Peak history of a capture meter that runs behind the mixer.
 *
 * Captured periods reach the meter up to delay seconds after they were played,
 * so each period is tagged with the device volume it was played at. Right after
 * a volume change the tag is the larger of the old and new volume, because the
 * period may still contain samples from before the change.
 */
class PeakMeter
{
  struct Period
  {
    float peak   = 0;
    float volume = 0;
  };

  mutable std::mutex m_mutex;
  double             m_delay;
  Period             m_periods[2];
  float              m_volume = 0;
  float              m_previous_volume = 0;
  double             m_change_time = 0;
  Error              m_error;

public:
  explicit PeakMeter (double delay);

  void  set_volume (float volume, double time);
  void  add_period (float peak, double end_time);
  void  set_error (const Error& err);

  /* loudest recent period, relative to the volume it was played at */
  Error read (float& peak, float& volume) const;
};

#endif /* TAME_PEAK_METER_HH */
