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

#include <stdio.h>
#include <unistd.h>
#include <assert.h>
#include <math.h>

#include <string>

#include "settingsfile.hh"
#include "utils.hh"

using std::string;

static string
settings_filename()
{
  return string_printf ("/tmp/tame-testsettings-%d.conf", int (getpid()));
}

static void
write_file (const string& filename, const string& text)
{
  FILE *f = fopen (filename.c_str(), "w");
  assert (f);
  fputs (text.c_str(), f);
  fclose (f);
}

static Error
load_text (const string& text, LimiterConfig& config)
{
  const string filename = settings_filename();
  write_file (filename, text);
  Error err = load_settings (filename, config);
  unlink (filename.c_str());
  return err;
}

int
main()
{
  const LimiterConfig defaults;

  /* save / load */
  {
    LimiterConfig config;
    config.volume_cap           = 0.35;
    config.attack_time          = 0.1;
    config.leeway_db            = 4.5;
    config.dampening            = 1.5;
    config.stabilizer_enabled   = true;
    config.stabilizer_threshold = 8;

    const string filename = settings_filename();
    Error err = save_settings (filename, config);
    assert (!err);

    LimiterConfig loaded;
    err = load_settings (filename, loaded);
    unlink (filename.c_str());
    if (err)
      {
        fprintf (stderr, "testsettings: %s\n", err.message());
        return 1;
      }
    for (const auto& field : limiter_config_fields())
      {
        printf ("%-28s %s\n", field.name, field.get (loaded).c_str());
        assert (field.get (loaded) == field.get (config));
      }
  }

  /* comments, blank lines, missing values keep defaults */
  {
    LimiterConfig config;
    config.volume_cap = 0.9;

    Error err = load_text ("# my settings\n"
                           "\n"
                           "   \n"
                           "volume_cap 0.4   # quieter\n"
                           "  stabilizer_enabled yes\n"
                           "hold_time\t0.3\r\n", config);
    assert (!err);
    assert (config.volume_cap == 0.4);
    assert (config.stabilizer_enabled);
    assert (config.hold_time == 0.3);
    assert (config.release_time == defaults.release_time);
    assert (config.leeway_db == defaults.leeway_db);
  }

  /* out of range values are clamped */
  {
    LimiterConfig config;
    Error err = load_text ("volume_cap 5\n"
                           "dampening 0.2\n"
                           "attack_time -1\n"
                           "stabilizer_threshold 0\n", config);
    assert (!err);
    assert (config.volume_cap == 1.0);
    assert (config.dampening == 1.0);
    assert (config.attack_time == 0);
    assert (config.stabilizer_threshold == 1);
  }

  /* errors leave the config unchanged */
  {
    LimiterConfig config;
    config.volume_cap = 0.42;

    Error err = load_text ("volume_cap 0.3\nloudness 7\n", config);
    printf ("unknown setting: %s\n", err.message());
    assert (err);

    err = load_text ("volume_cap 0.3\nattack_time fast\n", config);
    printf ("bad value: %s\n", err.message());
    assert (err);

    err = load_text ("stabilizer_enabled maybe\n", config);
    assert (err);

    err = load_text ("stabilizer_threshold 2.5\n", config);
    assert (err);

    err = load_text ("volume_cap 0.3 0.4\n", config);
    printf ("parse error: %s\n", err.message());
    assert (err);

    err = load_text ("volume_cap nan\n", config);
    assert (err);

    err = load_settings ("/nonexistent/tame.conf", config);
    assert (err);

    assert (config.volume_cap == 0.42);
  }

  /* NaN from code is replaced by the default */
  {
    LimiterConfig config;
    config.release_time = NAN;
    config.volume_cap = NAN;
    LimiterConfig c = config.clamped();
    assert (c.release_time == defaults.release_time);
    assert (c.volume_cap == defaults.volume_cap);
  }

  /* defaults as written by "tame defaults" */
  {
    const string s = settings_to_string (defaults);
    assert (s.find ("volume_cap                   0.2\n") != string::npos);
    assert (s.find ("stabilizer_enabled           false\n") != string::npos);
    assert (s.find ("stabilizer_threshold         5\n") != string::npos);
  }
  return 0;
}
