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

#ifndef TAME_LIMITER_CONFIG_HH
#define TAME_LIMITER_CONFIG_HH

#include <string>
#include <vector>

/*
 * User tunable limiter parameters; times are in seconds, leeway values in dB.
 *
 * The default member values are the factory defaults. Values coming from the
 * outside (command line, settings file, keyboard) should be passed through
 * clamped() before they are used, the control loop itself never checks ranges.
 */
struct LimiterConfig
{
  double volume_cap                  = 0.2;
  double attack_time                 = 0.05;
  double release_time                = 0.5;
  double hold_time                   = 0.15;
  double user_cooldown               = 2.0;
  double leeway_db                   = 3.0;
  double dampening                   = 1.0;  // max attenuation multiplier for sustained peaks
  double dampening_speed             = 0.0;  // time to reach full dampening

  bool   stabilizer_enabled          = false;
  double stabilizer_window           = 5.0;
  int    stabilizer_threshold        = 5;    // number of changes within window
  double stabilizer_max_leeway       = 12.0;
  double stabilizer_step             = 1.0;
  double stabilizer_change_threshold = 0.05;

  LimiterConfig clamped() const;
};

class LimiterLimits
{
public:
  static constexpr double min_volume_cap       = 0.01;
  static constexpr double max_volume_cap       = 1.0;

  /* range for volume cap changes via keyboard */
  static constexpr double min_hotkey_volume_cap = 0.05;
  static constexpr double hotkey_volume_cap_step = 0.01;

  static constexpr double max_attack_time      = 10;
  static constexpr double max_time             = 60;
  static constexpr double max_user_cooldown    = 600;
  static constexpr double max_leeway_db        = 40;
  static constexpr double max_dampening        = 10;
  static constexpr double min_stabilizer_window = 0.1;
  static constexpr double max_stabilizer_window = 600;
  static constexpr int    max_stabilizer_threshold = 1000;
};

/* one entry per LimiterConfig field, used for settings files and option parsing */
struct LimiterConfigField
{
  enum class Type { DOUBLE, INT, BOOL };

  const char               *name;
  Type                      type;
  double LimiterConfig::   *double_value;
  int LimiterConfig::      *int_value;
  bool LimiterConfig::     *bool_value;
  const char               *help;

  std::string get (const LimiterConfig& config) const;
  bool        set (LimiterConfig& config, const std::string& value) const;
};

const std::vector<LimiterConfigField>& limiter_config_fields();

#endif /* TAME_LIMITER_CONFIG_HH */
