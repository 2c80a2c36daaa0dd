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
#include <vector>

#include "audioclip.hh"
#include "simendpoint.hh"
#include "controlloop.hh"
#include "utils.hh"

using std::string;
using std::vector;

static const int    sample_rate = 44100;
static const int    n_channels  = 2;

/* 2s quiet, 2s loud, 2s quiet */
static AudioClip
generate_clip()
{
  vector<float> samples;
  for (int i = 0; i < 6 * sample_rate; i++)
    {
      const double t = double (i) / sample_rate;
      const double amp = (t >= 2 && t < 4) ? 0.8 : 0.1;
      const float value = amp * sin (2 * M_PI * 440 * t);
      for (int c = 0; c < n_channels; c++)
        samples.push_back (value);
    }
  return AudioClip (samples, n_channels, sample_rate, 16);
}

static void
simulate (SimEndpoint& endpoint, ControlLoop& loop)
{
  double now = 0;
  double interval = ControlLoop::active_interval;
  while (!endpoint.finished())
    {
      endpoint.advance (interval);
      now += interval;
      interval = loop.tick (now);
    }
}

static float
peak (const AudioClip& clip, double start, double end)
{
  return clip.peak (lrint (start * clip.sample_rate()), lrint (end * clip.sample_rate()));
}

int
main()
{
  const string filename = string_printf ("/tmp/tame-testsimulate-%d.wav", int (getpid()));

  /* file round trip through libsndfile */
  Error err = generate_clip().save (filename);
  if (err)
    {
      fprintf (stderr, "testsimulate: save failed: %s\n", err.message());
      return 1;
    }
  AudioClip clip;
  err = clip.load (filename);
  unlink (filename.c_str());
  if (err)
    {
      fprintf (stderr, "testsimulate: load failed: %s\n", err.message());
      return 1;
    }
  assert (clip.n_channels() == n_channels);
  assert (clip.sample_rate() == sample_rate);
  assert (clip.n_frames() == size_t (6 * sample_rate));
  assert (fabs (peak (clip, 2, 4) - 0.8) < 0.01);

  LimiterConfig config;

  /* loud part is limited to the cap, volume comes back afterwards */
  {
    SimEndpoint endpoint (clip, 1.0);
    ControlLoop loop (endpoint, config);
    simulate (endpoint, loop);

    const AudioClip out = endpoint.render();
    printf ("simulate: quiet %f loud %f after %f, %zd volume writes\n",
            peak (out, 0, 2), peak (out, 2.2, 4), peak (out, 5, 6), endpoint.n_volume_writes());

    assert (fabs (peak (out, 0, 2) - 0.1) < 0.01);
    assert (peak (out, 2.2, 4) <= config.volume_cap * 1.02);
    assert (fabs (peak (out, 5, 6) - 0.1) < 0.01);
    assert (!loop.state().is_limiting);
    assert (endpoint.n_volume_writes() > 0);
  }

  /* manual volume change before the loud part */
  {
    SimEndpoint endpoint (clip, 1.0);
    endpoint.add_user_change (0.5, 0.5);

    ControlLoop loop (endpoint, config);
    simulate (endpoint, loop);

    const AudioClip out = endpoint.render();
    printf ("simulate/user: quiet %f loud %f after %f\n", peak (out, 1.5, 2), peak (out, 2.8, 4), peak (out, 5, 6));

    /* cooldown after the change lasts until 2.5s */
    assert (fabs (peak (out, 1.5, 2) - 0.05) < 0.01);
    assert (peak (out, 2.8, 4) <= config.volume_cap * 1.02);
    assert (fabs (peak (out, 5, 6) - 0.05) < 0.01);
    assert (loop.state().original_volume == 0.5);
  }

  /* a manual change during the loud part wins over limiting for the cooldown */
  {
    SimEndpoint endpoint (clip, 1.0);
    endpoint.add_user_change (3.0, 0.6);

    ControlLoop loop (endpoint, config);
    simulate (endpoint, loop);

    const AudioClip out = endpoint.render();
    printf ("simulate/cooldown: during cooldown %f\n", peak (out, 3.1, 3.9));
    assert (fabs (peak (out, 3.1, 3.9) - 0.48) < 0.01);
  }
  return 0;
}
