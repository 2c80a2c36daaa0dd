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
#include <stdlib.h>
#include <assert.h>

#include "stabilizer.hh"

static LimiterConfig
stabilizer_config()
{
  LimiterConfig config;
  config.stabilizer_enabled          = true;
  config.stabilizer_window           = 5;
  config.stabilizer_threshold        = 5;
  config.stabilizer_step             = 1;
  config.stabilizer_max_leeway       = 12;
  config.stabilizer_change_threshold = 0.05;
  return config;
}

/* n alternating volume writes starting at time t, each one a significant change */
static void
track_changes (Stabilizer& stabilizer, const LimiterConfig& config, int n, double t)
{
  for (int i = 0; i <= n; i++)
    stabilizer.track (config, i % 2 ? 1.0 : 0.25, t + i * 0.01);
}

int
main()
{
  const LimiterConfig config = stabilizer_config();

  /* first write has no prior volume, small changes are not counted */
  {
    Stabilizer s (3);
    s.track (config, 0.5, 0.1);
    assert (s.n_changes() == 0);
    s.track (config, 0.52, 0.2);
    assert (s.n_changes() == 0);
    s.track (config, 0.6, 0.3);
    assert (s.n_changes() == 1);
  }

  /* disabled stabilizer tracks nothing */
  {
    LimiterConfig disabled = config;
    disabled.stabilizer_enabled = false;

    Stabilizer s (3);
    track_changes (s, disabled, 10, 0.1);
    assert (s.n_changes() == 0);
  }

  /* frequent changes: widen leeway by one step per check, at most once per second */
  {
    Stabilizer s (3);
    track_changes (s, config, 5, 0.1);
    assert (s.n_changes() == 5);

    assert (!s.update (config, 0.5));
    assert (s.update (config, 1.0));
    assert (s.current_leeway_db() == 4);
    assert (!s.update (config, 1.5));
    assert (s.current_leeway_db() == 4);
    assert (s.update (config, 2.0));
    assert (s.current_leeway_db() == 5);

    /* upper bound */
    for (int i = 0; i < 40; i++)
      {
        track_changes (s, config, 5, 3 + i);
        s.update (config, 3.5 + i);
        assert (s.current_leeway_db() <= config.stabilizer_max_leeway);
      }
    printf ("widen: %f dB\n", s.current_leeway_db());
    assert (s.current_leeway_db() == config.stabilizer_max_leeway);

    /* quiet: changes leave the window, decay by half a step down to base */
    double t = 100;
    assert (s.update (config, t));
    assert (s.n_changes() == 0);
    assert (s.current_leeway_db() == 11.5);
    for (int i = 0; i < 40; i++)
      {
        t += 1;
        s.update (config, t);
        assert (s.current_leeway_db() >= s.base_leeway_db());
      }
    printf ("decay: %f dB\n", s.current_leeway_db());
    assert (s.current_leeway_db() == 3);
  }

  /* hysteresis: between threshold / 2 and threshold nothing changes */
  {
    Stabilizer s (3);
    track_changes (s, config, 5, 0.1);
    s.update (config, 1.0);
    assert (s.current_leeway_db() == 4);

    Stabilizer h (3);
    track_changes (h, config, 3, 0.1);
    assert (h.n_changes() == 3);
    assert (!h.update (config, 1.0));
    assert (h.current_leeway_db() == 3);

    /* 2 changes: still inside band with integer threshold / 2 */
    s.track (config, 0.25, 10);
    s.track (config, 1.0, 10.01);
    assert (!s.update (config, 11));
    assert (s.n_changes() == 2);
    assert (s.current_leeway_db() == 4);

    /* 1 change: decay */
    s.track (config, 0.25, 14);
    assert (s.update (config, 16));
    assert (s.n_changes() == 1);
    assert (s.current_leeway_db() == 3.5);
  }

  /* base above max leeway: base wins */
  {
    Stabilizer s (15);
    track_changes (s, config, 10, 0.1);
    s.update (config, 1.0);
    assert (s.current_leeway_db() == 15);
  }

  /* window edge: changes older than the window are dropped */
  {
    Stabilizer s (0);
    track_changes (s, config, 5, 0.0);
    s.update (config, 4.0);
    assert (s.current_leeway_db() == 1);
    s.update (config, 5.06);
    assert (s.n_changes() == 0);
    assert (s.current_leeway_db() == 0.5);
  }

  /* reset clears window and dynamic leeway */
  {
    Stabilizer s (3);
    track_changes (s, config, 5, 0.1);
    s.update (config, 1.0);
    s.reset (6);
    assert (s.n_changes() == 0);
    assert (s.base_leeway_db() == 6);
    assert (s.current_leeway_db() == 6);
  }
  return 0;
}
