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

#ifndef TAME_STABILIZER_HH
#define TAME_STABILIZER_HH

#include <deque>

#include "limiterconfig.hh"

/*
 * Adaptive leeway: if the limiter changes the volume too often within the
 * configured window, the leeway is widened step by step (less sensitive
 * limiting), and once things calm down it decays back to the base leeway.
 *
 * Invariant: base_leeway_db() <= current_leeway_db() <= max (base, stabilizer_max_leeway)
 */
class Stabilizer
{
  double             m_base_leeway_db    = 0;
  double             m_current_leeway_db = 0;
  std::deque<double> m_change_times;
  bool               m_have_last_volume  = false;
  float              m_last_volume       = 0;
  double             m_last_check_time   = 0;

public:
  static constexpr double update_interval = 1.0;

  explicit Stabilizer (double base_leeway_db = 0);

  void track (const LimiterConfig& config, float new_volume, double now);
  bool update (const LimiterConfig& config, double now);
  void reset (double base_leeway_db);

  double
  base_leeway_db() const
  {
    return m_base_leeway_db;
  }
  double
  current_leeway_db() const
  {
    return m_current_leeway_db;
  }
  size_t
  n_changes() const
  {
    return m_change_times.size();
  }
};

#endif /* TAME_STABILIZER_HH */
