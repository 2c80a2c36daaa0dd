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

#include "limiterconfig.hh"
#include "utils.hh"

#include <stdlib.h>
#include <errno.h>
#include <math.h>

using std::string;
using std::vector;

constexpr double LimiterLimits::min_volume_cap;
constexpr double LimiterLimits::max_volume_cap;
constexpr double LimiterLimits::min_hotkey_volume_cap;
constexpr double LimiterLimits::hotkey_volume_cap_step;
constexpr double LimiterLimits::max_attack_time;
constexpr double LimiterLimits::max_time;
constexpr double LimiterLimits::max_user_cooldown;
constexpr double LimiterLimits::max_leeway_db;
constexpr double LimiterLimits::max_dampening;
constexpr double LimiterLimits::min_stabilizer_window;
constexpr double LimiterLimits::max_stabilizer_window;
constexpr int    LimiterLimits::max_stabilizer_threshold;

LimiterConfig
LimiterConfig::clamped() const
{
  typedef LimiterLimits L;

  LimiterConfig c = *this;

  c.volume_cap      = bound<double> (L::min_volume_cap, volume_cap, L::max_volume_cap);
  c.attack_time     = bound<double> (0, attack_time, L::max_attack_time);
  c.release_time    = bound<double> (0, release_time, L::max_time);
  c.hold_time       = bound<double> (0, hold_time, L::max_time);
  c.user_cooldown   = bound<double> (0, user_cooldown, L::max_user_cooldown);
  c.leeway_db       = bound<double> (0, leeway_db, L::max_leeway_db);
  c.dampening       = bound<double> (1, dampening, L::max_dampening);
  c.dampening_speed = bound<double> (0, dampening_speed, L::max_time);

  c.stabilizer_window           = bound<double> (L::min_stabilizer_window, stabilizer_window, L::max_stabilizer_window);
  c.stabilizer_threshold        = bound<int> (1, stabilizer_threshold, L::max_stabilizer_threshold);
  c.stabilizer_max_leeway       = bound<double> (0, stabilizer_max_leeway, L::max_leeway_db);
  c.stabilizer_step             = bound<double> (0, stabilizer_step, L::max_leeway_db);
  c.stabilizer_change_threshold = bound<double> (0, stabilizer_change_threshold, 1);

  /* NaN compares false everywhere, so bound() would let it through */
  LimiterConfig defaults;
  for (const auto& field : limiter_config_fields())
    {
      if (field.type == LimiterConfigField::Type::DOUBLE && std::isnan (c.*field.double_value))
        c.*field.double_value = defaults.*field.double_value;
    }
  return c;
}

string
LimiterConfigField::get (const LimiterConfig& config) const
{
  switch (type)
    {
      case Type::DOUBLE:
        return string_printf ("%.6g", config.*double_value);
      case Type::INT:
        return string_printf ("%d", config.*int_value);
      case Type::BOOL:
        return config.*bool_value ? "true" : "false";
    }
  return "";
}

bool
LimiterConfigField::set (LimiterConfig& config, const string& value) const
{
  if (value.empty())
    return false;

  const char *start = value.c_str();
  char *end = nullptr;
  errno = 0;

  switch (type)
    {
      case Type::DOUBLE:
        {
          double d = strtod (start, &end);
          if (errno || *end || std::isnan (d))
            return false;
          config.*double_value = d;
          return true;
        }
      case Type::INT:
        {
          long l = strtol (start, &end, 10);
          if (errno || *end || l < -1000000 || l > 1000000)
            return false;
          config.*int_value = l;
          return true;
        }
      case Type::BOOL:
        {
          if (value == "true" || value == "1" || value == "yes" || value == "on")
            config.*bool_value = true;
          else if (value == "false" || value == "0" || value == "no" || value == "off")
            config.*bool_value = false;
          else
            return false;
          return true;
        }
    }
  return false;
}

const vector<LimiterConfigField>&
limiter_config_fields()
{
  typedef LimiterConfigField::Type T;
  typedef LimiterConfig C;

  static const vector<LimiterConfigField> fields =
    {
      { "volume_cap",      T::DOUBLE, &C::volume_cap,      nullptr, nullptr, "maximum loudness (peak * volume)" },
      { "attack_time",     T::DOUBLE, &C::attack_time,     nullptr, nullptr, "peak duration before limiting (s)" },
      { "release_time",    T::DOUBLE, &C::release_time,    nullptr, nullptr, "time to restore the volume (s)" },
      { "hold_time",       T::DOUBLE, &C::hold_time,       nullptr, nullptr, "delay before release starts (s)" },
      { "user_cooldown",   T::DOUBLE, &C::user_cooldown,   nullptr, nullptr, "pause after manual volume change (s)" },
      { "leeway_db",       T::DOUBLE, &C::leeway_db,       nullptr, nullptr, "partial limiting zone above cap (dB)" },
      { "dampening",       T::DOUBLE, &C::dampening,       nullptr, nullptr, "extra attenuation for sustained peaks" },
      { "dampening_speed", T::DOUBLE, &C::dampening_speed, nullptr, nullptr, "time to reach full dampening (s)" },
      { "stabilizer_enabled",          T::BOOL,   nullptr, nullptr, &C::stabilizer_enabled,
        "widen leeway when limiting too often" },
      { "stabilizer_window",           T::DOUBLE, &C::stabilizer_window, nullptr, nullptr,
        "stabilizer time window (s)" },
      { "stabilizer_threshold",        T::INT,    nullptr, &C::stabilizer_threshold, nullptr,
        "volume changes in window that widen leeway" },
      { "stabilizer_max_leeway",       T::DOUBLE, &C::stabilizer_max_leeway, nullptr, nullptr,
        "maximum leeway used by stabilizer (dB)" },
      { "stabilizer_step",             T::DOUBLE, &C::stabilizer_step, nullptr, nullptr,
        "leeway step per adjustment (dB)" },
      { "stabilizer_change_threshold", T::DOUBLE, &C::stabilizer_change_threshold, nullptr, nullptr,
        "minimum volume change that is counted" },
    };
  return fields;
}
