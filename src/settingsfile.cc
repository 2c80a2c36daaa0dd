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

#include "settingsfile.hh"

#include <regex>
#include <stdio.h>

using std::string;
using std::regex;

static const LimiterConfigField *
find_field (const string& name)
{
  for (const auto& field : limiter_config_fields())
    {
      if (name == field.name)
        return &field;
    }
  return nullptr;
}

/* starts from defaults; values not present in the file keep their default */
Error
load_settings (const string& filename, LimiterConfig& config)
{
  FILE *f = fopen (filename.c_str(), "r");
  if (!f)
    return Error (string_printf ("error opening settings file '%s'", filename.c_str()));

  const regex blank_re (R"(\s*(#.*)?[\r\n]*)");
  const regex entry_re (R"(\s*([a-z_]+)\s+(\S+)\s*(#.*)?[\r\n]*)");

  LimiterConfig new_config;

  char buffer[1024];
  int line = 1;
  while (fgets (buffer, 1024, f))
    {
      string s = buffer;

      std::smatch match;
      if (regex_match (s, blank_re))
        {
          /* blank line or comment */
        }
      else if (regex_match (s, match, entry_re))
        {
          const LimiterConfigField *field = find_field (match[1].str());
          if (!field)
            {
              fclose (f);
              return Error (string_printf ("unknown setting '%s' in settings file '%s', line %d",
                                           match[1].str().c_str(), filename.c_str(), line));
            }
          if (!field->set (new_config, match[2].str()))
            {
              fclose (f);
              return Error (string_printf ("bad value '%s' for setting '%s' in settings file '%s', line %d",
                                           match[2].str().c_str(), field->name, filename.c_str(), line));
            }
        }
      else
        {
          fclose (f);
          return Error (string_printf ("parse error in settings file '%s', line %d", filename.c_str(), line));
        }
      line++;
    }
  const bool read_error = ferror (f);
  fclose (f);

  if (read_error)
    return Error (string_printf ("error reading settings file '%s'", filename.c_str()));

  config = new_config.clamped();
  return Error::Code::NONE;
}

string
settings_to_string (const LimiterConfig& config)
{
  string s = "# tame settings\n\n";
  for (const auto& field : limiter_config_fields())
    s += string_printf ("%-28s %s\n", field.name, field.get (config).c_str());

  return s;
}

Error
save_settings (const string& filename, const LimiterConfig& config)
{
  FILE *f = fopen (filename.c_str(), "w");
  if (!f)
    return Error (string_printf ("error writing to settings file '%s'", filename.c_str()));

  const string s = settings_to_string (config);
  const size_t written = fwrite (s.data(), 1, s.size(), f);

  if (fclose (f) != 0 || written != s.size())
    return Error (string_printf ("error writing to settings file '%s'", filename.c_str()));

  return Error::Code::NONE;
}
