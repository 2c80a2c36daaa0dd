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

#include <string.h>
#include <stdlib.h>
#include <stdio.h>
#include <signal.h>
#include <poll.h>
#include <unistd.h>
#include <math.h>
#include <string>
#include <vector>
#include <algorithm>

#include "utils.hh"
#include "limiterconfig.hh"
#include "settingsfile.hh"
#include "controlloop.hh"
#include "audioclip.hh"
#include "simendpoint.hh"

#include "config.h"

#if HAVE_ALSA
#include "alsaendpoint.hh"
#endif

using std::string;
using std::vector;
using std::min;
using std::max;

void
print_usage()
{
  printf ("usage: tame <command> [ <args>... ]\n");
  printf ("\n");
  printf ("Commands:\n");
  printf ("  * limit the loudness of an output device\n");
  printf ("    tame run --meter-device <name> [ <options>... ]\n");
  printf ("\n");
  printf ("  * run the limiter on an audio file and report/render the volume changes\n");
  printf ("    tame simulate <input_audio> [ <output_wav> ]\n");
  printf ("\n");
  printf ("  * print or write the default settings\n");
  printf ("    tame defaults [ <settings_file> ]\n");
  printf ("\n");
  printf ("Global options:\n");
  printf ("  --settings <file>     load settings from file\n");
  printf ("  -q, --quiet           disable information messages\n");
  printf ("  --debug               enable debug messages\n");
  printf ("\n");
  printf ("Limiter options:\n");

  const LimiterConfig defaults;
  for (const auto& field : limiter_config_fields())
    {
      string option = field.name;
      std::replace (option.begin(), option.end(), '_', '-');
      option = "--" + option + " <v>";
      printf ("  %-34s %-42s [%s]\n", option.c_str(), field.help, field.get (defaults).c_str());
    }
  printf ("  --stabilizer                       enable stabilizer\n");
  printf ("\n");
  printf ("Options for run:\n");
  printf ("  --device <name>       ALSA mixer device                   [default]\n");
  printf ("  --control <name>      ALSA mixer control                  [Master]\n");
  printf ("  --meter-device <name> ALSA capture device that carries the output signal\n");
  printf ("                        (loopback or monitor device, required)\n");
  printf ("  --meter-rate <rate>   meter sample rate                   [48000]\n");
  printf ("  --meter-channels <n>  meter channels                      [2]\n");
  printf ("  --meter-pre-volume    meter signal is not affected by the volume control\n");
  printf ("  --status              show peak / volume / leeway while running\n");
  printf ("  --save                save settings to --settings file on exit\n");
  printf ("\n");
  printf ("Options for simulate:\n");
  printf ("  --volume <v>          initial volume                      [1]\n");
  printf ("  --user-volume <t:v,...> manual volume changes at times t (seconds)\n");
  printf ("  --trace               print one line per tick\n");
  printf ("\n");
  printf ("While running, type (followed by Enter):\n");
  printf ("  +/-  raise/lower volume cap    p  pause/resume    s  toggle stabilizer\n");
  printf ("  r    reset settings to defaults (keeps volume cap)  q  quit\n");
}

class ArgParser
{
  vector<string> m_args;
  bool
  starts_with (const string& s, const string& start)
  {
    return s.substr (0, start.size()) == start;
  }
public:
  ArgParser (int argc, char **argv)
  {
    for (int i = 1; i < argc; i++)
      m_args.push_back (argv[i]);
  }
  bool
  parse_cmd (const string& cmd)
  {
    for (auto it = m_args.begin(); it != m_args.end(); it++)
      {
        if (!it->empty() && (*it)[0] != '-')
          {
            if (*it == cmd)
              {
                m_args.erase (it);
                return true;
              }
            else /* first positional arg is not cmd */
              {
                return false;
              }
          }
      }
    return false;
  }
  bool
  parse_opt (const string& option, string& out_s)
  {
    bool found_option = false;
    auto it = m_args.begin();
    while (it != m_args.end())
      {
        auto next_it = it + 1;
        if (*it == option && next_it != m_args.end())   /* --option foo */
          {
            out_s = *next_it;
            next_it = m_args.erase (it, it + 2);
            found_option = true;
          }
        else if (starts_with (*it, (option + "=")))   /* --option=foo */
          {
            out_s = it->substr (option.size() + 1);
            next_it = m_args.erase (it);
            found_option = true;
          }
        it = next_it;
      }
    return found_option;
  }
  bool
  parse_opt (const string& option, int& out_i)
  {
    string out_s;
    if (parse_opt (option, out_s))
      {
        out_i = atoi (out_s.c_str());
        return true;
      }
    return false;
  }
  bool
  parse_opt (const string& option, double& out_d)
  {
    string out_s;
    if (parse_opt (option, out_s))
      {
        out_d = atof (out_s.c_str());
        return true;
      }
    return false;
  }
  bool
  parse_opt (const string& option)
  {
    for (auto it = m_args.begin(); it != m_args.end(); it++)
      {
        if (*it == option) /* --option */
          {
            m_args.erase (it);
            return true;
          }
      }
    return false;
  }
  bool
  parse_args (size_t expected_count, vector<string>& out_args)
  {
    if (m_args.size() == expected_count)
      {
        out_args = m_args;
        return true;
      }
    return false;
  }
  bool
  parse_args (size_t min_count, size_t max_count, vector<string>& out_args)
  {
    if (m_args.size() >= min_count && m_args.size() <= max_count)
      {
        out_args = m_args;
        return true;
      }
    return false;
  }
};

void
parse_shared_options (ArgParser& ap)
{
  if (ap.parse_opt ("--quiet") || ap.parse_opt ("-q"))
    {
      set_log_level (Log::WARNING);
    }
  if (ap.parse_opt ("--debug"))
    {
      set_log_level (Log::DEBUG);
    }
}

/* settings file first, then command line options on top */
void
parse_config_options (ArgParser& ap, LimiterConfig& config, string& settings_file)
{
  if (ap.parse_opt ("--settings", settings_file))
    {
      Error err = load_settings (settings_file, config);
      if (err)
        {
          error ("tame: %s\n", err.message());
          exit (1);
        }
    }
  for (const auto& field : limiter_config_fields())
    {
      string option = field.name;
      std::replace (option.begin(), option.end(), '_', '-');
      option = "--" + option;

      string value;
      if (ap.parse_opt (option, value))
        {
          if (!field.set (config, value))
            {
              error ("tame: bad value '%s' for option %s\n", value.c_str(), option.c_str());
              exit (1);
            }
        }
    }
  if (ap.parse_opt ("--stabilizer"))
    {
      config.stabilizer_enabled = true;
    }
  config = config.clamped();
}

#if HAVE_ALSA
static volatile sig_atomic_t quit_requested = 0;

static void
handle_quit_signal (int)
{
  quit_requested = 1;
}

static void
print_status (const ControlLoop& loop)
{
  const Telemetry t = loop.telemetry();

  string leeway = string_printf ("%.1fdB", t.current_leeway_db);
  if (t.current_leeway_db > t.base_leeway_db)
    leeway += string_printf (" (+%.1f)", t.current_leeway_db - t.base_leeway_db);

  printf ("\rpeak %3d%%  volume %3d%%  cap %3d%%  leeway %-14s %-9s %s   ",
          int (t.ui_peak * 100), int (t.ui_volume * 100), int (lrint (t.volume_cap * 100)),
          leeway.c_str(), limiter_phase_name (t.phase), t.is_running ? "" : "[paused]");
  fflush (stdout);
}

/* returns false if the user asked to quit */
static bool
handle_command (ControlLoop& loop, char command)
{
  switch (command)
    {
      case '+':
      case '-':
        {
          const double delta = command == '+' ? LimiterLimits::hotkey_volume_cap_step : -LimiterLimits::hotkey_volume_cap_step;
          const double cap = loop.adjust_volume_cap (delta);
          info ("tame: volume cap %d%%\n", int (lrint (cap * 100)));
          break;
        }
      case 'p':
        info ("tame: limiter %s\n", loop.toggle_running() ? "enabled" : "disabled");
        break;
      case 's':
        {
          const bool enabled = !loop.config().stabilizer_enabled;
          loop.set_stabilizer_enabled (enabled);
          info ("tame: stabilizer %s\n", enabled ? "enabled" : "disabled");
          break;
        }
      case 'r':
        loop.reset_defaults();
        info ("tame: settings reset to defaults\n");
        break;
      case 'q':
        return false;
    }
  return true;
}
#endif

int
run_limiter (ArgParser& ap, const LimiterConfig& config, const string& settings_file)
{
#if HAVE_ALSA
  AlsaEndpoint::Options options;

  ap.parse_opt ("--device", options.mixer_device);
  ap.parse_opt ("--control", options.mixer_control);
  ap.parse_opt ("--meter-device", options.meter_device);
  ap.parse_opt ("--meter-rate", options.meter_rate);
  ap.parse_opt ("--meter-channels", options.meter_channels);
  if (ap.parse_opt ("--meter-pre-volume"))
    options.meter_pre_volume = true;

  const bool show_status = ap.parse_opt ("--status");
  const bool save = ap.parse_opt ("--save");

  vector<string> args;
  if (!ap.parse_args (0, args))
    {
      error ("tame: error parsing commandline args (use tame -h)\n");
      return 1;
    }
  if (save && settings_file.empty())
    {
      error ("tame: --save needs a settings file (--settings)\n");
      return 1;
    }
  if (options.meter_device.empty())
    {
      /* the "default" capture device is usually a microphone, not the output */
      error ("tame: run needs --meter-device (the capture device that carries the output signal, e.g. a loopback or monitor device)\n");
      return 1;
    }
  if (options.meter_rate < 8000 || options.meter_channels < 1)
    {
      error ("tame: unsupported meter format (rate %d, channels %d)\n", options.meter_rate, options.meter_channels);
      return 1;
    }

  AlsaEndpoint endpoint;
  Error err = endpoint.open (options);
  if (err)
    {
      error ("tame: %s\n", err.message());
      return 1;
    }

  ControlLoop loop (endpoint, config);
  info ("tame: limiting '%s' control '%s' to volume cap %d%%\n",
        options.mixer_device.c_str(), options.mixer_control.c_str(), int (lrint (config.volume_cap * 100)));

  signal (SIGINT, handle_quit_signal);
  signal (SIGTERM, handle_quit_signal);

  err = loop.start();
  if (err)
    {
      error ("tame: %s\n", err.message());
      return 1;
    }

  /* ui thread: keyboard commands and status display at 10Hz */
  bool read_stdin = true;
  while (!quit_requested)
    {
      pollfd pfd = { STDIN_FILENO, POLLIN, 0 };
      int r = poll (&pfd, read_stdin ? 1 : 0, 100);
      if (r > 0 && (pfd.revents & (POLLIN | POLLHUP)))
        {
          char buffer[256];
          ssize_t count = read (STDIN_FILENO, buffer, sizeof (buffer));
          if (count <= 0)
            {
              read_stdin = false; /* eof: keep running until signal */
            }
          for (ssize_t i = 0; i < count; i++)
            {
              if (!handle_command (loop, buffer[i]))
                quit_requested = 1;
            }
        }
      if (show_status)
        print_status (loop);
    }
  if (show_status)
    printf ("\n");

  err = loop.stop();
  if (err)
    {
      error ("tame: %s\n", err.message());
      return 1;
    }
  if (save)
    {
      err = save_settings (settings_file, loop.config());
      if (err)
        {
          error ("tame: %s\n", err.message());
          return 1;
        }
      info ("tame: settings saved to '%s'\n", settings_file.c_str());
    }
  return 0;
#else
  error ("tame: ALSA support is not available in this build of tame\n");
  return 1;
#endif
}

static bool
parse_user_volume (const string& changes, SimEndpoint& endpoint)
{
  size_t start = 0;
  while (start <= changes.size())
    {
      size_t end = changes.find (',', start);
      if (end == string::npos)
        end = changes.size();

      const string item = changes.substr (start, end - start);
      double time, volume;
      char junk;
      if (sscanf (item.c_str(), "%lf:%lf%c", &time, &volume, &junk) != 2 || time < 0)
        return false;

      endpoint.add_user_change (time, volume);
      start = end + 1;
    }
  return true;
}

int
simulate (ArgParser& ap, const LimiterConfig& config)
{
  double volume = 1;
  string user_volume;

  ap.parse_opt ("--volume", volume);
  ap.parse_opt ("--user-volume", user_volume);
  const bool trace = ap.parse_opt ("--trace");

  vector<string> args;
  if (!ap.parse_args (1, 2, args))
    {
      error ("tame: error parsing commandline args (use tame -h)\n");
      return 1;
    }

  AudioClip clip;
  Error err = clip.load (args[0]);
  if (err)
    {
      error ("tame: error loading %s: %s\n", args[0].c_str(), err.message());
      return 1;
    }

  SimEndpoint endpoint (clip, volume);
  if (!user_volume.empty() && !parse_user_volume (user_volume, endpoint))
    {
      error ("tame: bad --user-volume value '%s' (expected <time>:<volume>,...)\n", user_volume.c_str());
      return 1;
    }

  ControlLoop loop (endpoint, config);

  if (trace)
    printf ("# time     peak    volume  leeway  phase\n");

  double now = 0;
  double interval = ControlLoop::active_interval;
  double time_limiting = 0;
  float  min_volume = endpoint.volume();
  size_t n_ticks = 0;
  while (!endpoint.finished())
    {
      endpoint.advance (interval);
      now += interval;
      interval = loop.tick (now);
      n_ticks++;

      const Telemetry t = loop.telemetry();
      if (t.is_limiting)
        time_limiting += interval;
      min_volume = min (min_volume, t.ui_volume);

      if (trace)
        printf ("%8.3f  %6.4f  %6.4f  %6.2f  %s\n", now, t.ui_peak, t.ui_volume, t.current_leeway_db, limiter_phase_name (t.phase));
    }

  info ("tame: simulated %.2f seconds in %zd ticks\n", clip.duration(), n_ticks);
  info ("tame: %zd volume changes, minimum volume %.3f, limiting for %.2f seconds\n",
        endpoint.n_volume_writes(), min_volume, time_limiting);

  if (args.size() == 2)
    {
      err = endpoint.render().save (args[1]);
      if (err)
        {
          error ("tame: error saving %s: %s\n", args[1].c_str(), err.message());
          return 1;
        }
    }
  return 0;
}

int
print_defaults (const vector<string>& args)
{
  const LimiterConfig defaults;

  if (args.empty())
    {
      printf ("%s", settings_to_string (defaults).c_str());
      return 0;
    }
  Error err = save_settings (args[0], defaults);
  if (err)
    {
      error ("tame: %s\n", err.message());
      return 1;
    }
  return 0;
}

int
main (int argc, char **argv)
{
  ArgParser ap (argc, argv);
  vector<string> args;

  if (ap.parse_opt ("--help") || ap.parse_opt ("-h"))
    {
      print_usage();
      return 0;
    }
  if (ap.parse_opt ("--version") || ap.parse_opt ("-v"))
    {
      printf ("tame %s\n", VERSION);
      return 0;
    }

  LimiterConfig config;
  string settings_file;
  if (ap.parse_cmd ("run"))
    {
      parse_shared_options (ap);
      parse_config_options (ap, config, settings_file);

      return run_limiter (ap, config, settings_file);
    }
  else if (ap.parse_cmd ("simulate"))
    {
      parse_shared_options (ap);
      parse_config_options (ap, config, settings_file);

      return simulate (ap, config);
    }
  else if (ap.parse_cmd ("defaults"))
    {
      if (ap.parse_args (0, 1, args))
        return print_defaults (args);
    }
  error ("tame: error parsing commandline args (use tame -h)\n");
  return 1;
}
