/*
 * Copyright (C) 2018-2020 Stefan Westerfeld
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

#ifndef TAME_UTILS_HH
#define TAME_UTILS_HH

#include <algorithm>
#include <vector>
#include <string>

double get_time();
void   sleep_seconds (double seconds);

/* convert a level difference in dB to a linear amplitude factor */
double db_to_factor (double db);

template<typename T>
inline const T&
bound (const T& min_value, const T& value, const T& max_value)
{
  return std::min (std::max (value, min_value), max_value);
}

// detect compiler
#if __clang__
  #define TAME_COMP_CLANG
#elif __GNUC__ > 2
  #define TAME_COMP_GCC
#else
  #error "unsupported compiler"
#endif

#ifdef TAME_COMP_GCC
  #define TAME_PRINTF(format_idx, arg_idx)      __attribute__ ((__format__ (gnu_printf, format_idx, arg_idx)))
#else
  #define TAME_PRINTF(format_idx, arg_idx)      __attribute__ ((__format__ (__printf__, format_idx, arg_idx)))
#endif

void error (const char *format, ...) TAME_PRINTF (1, 2);
void warning (const char *format, ...) TAME_PRINTF (1, 2);
void info (const char *format, ...) TAME_PRINTF (1, 2);
void debug (const char *format, ...) TAME_PRINTF (1, 2);

enum class Log { ERROR = 3, WARNING = 2, INFO = 1, DEBUG = 0 };

void set_log_level (Log level);
Log  log_level();

std::string string_printf (const char *fmt, ...) TAME_PRINTF (1, 2);

class Error
{
public:
  enum class Code {
    NONE,
    STR
  };
  Error (Code code = Code::NONE) :
    m_code (code)
  {
    switch (code)
      {
        case Code::NONE:
          m_message = "OK";
          break;

        default:
          m_message = "Unknown error";
      }
  }
  explicit
  Error (const std::string& message) :
    m_code (Code::STR),
    m_message (message)
  {
  }
  Code
  code() const
  {
    return m_code;
  }
  const char *
  message() const
  {
    return m_message.c_str();
  }
  operator bool() const
  {
    return m_code != Code::NONE;
  }
private:
  Code        m_code;
  std::string m_message;
};

#endif /* TAME_UTILS_HH */
