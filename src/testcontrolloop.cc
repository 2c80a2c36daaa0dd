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
#include <string.h>
#include <assert.h>
#include <math.h>

#include "controlloop.hh"
#include "fakeendpoint.hh"

/* drives the loop on a virtual clock with one tick every active_interval */
class TickClock
{
  int m_n = 0;
public:
  double
  now() const
  {
    return m_n * ControlLoop::active_interval;
  }
  double
  tick (ControlLoop& loop)
  {
    double t = now();
    m_n++;
    return loop.tick (t);
  }
  void
  skip (double seconds)
  {
    m_n += lrint (seconds / ControlLoop::active_interval);
  }
};

static LimiterConfig
hard_config()
{
  LimiterConfig config;
  config.leeway_db = 0;
  return config;
}

static bool
near (double a, double b, double eps = 1e-4)
{
  return fabs (a - b) < eps;
}

/* reach the limiting state on a steady 0.8 peak: ticks at 0, 0.02, 0.04, 0.06 */
static void
start_limiting (FakeEndpoint& ep, ControlLoop& loop, TickClock& clock)
{
  ep.content_peak = 0.8;
  for (int i = 0; i < 4; i++)
    clock.tick (loop);
  assert (loop.state().is_limiting);
}

int
test_attack()
{
  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, hard_config());
  TickClock    clock;

  ep.content_peak = 0.8;
  for (int i = 0; i < 3; i++)
    {
      double idle = clock.tick (loop);
      assert (idle == ControlLoop::active_interval);
      assert (!loop.state().is_limiting);
      assert (loop.state().phase == LimiterPhase::TRACKING);
      assert (ep.writes.empty());
    }
  clock.tick (loop);
  assert (loop.state().is_limiting);
  assert (loop.state().phase == LimiterPhase::LIMITING);
  assert (ep.writes.size() == 1);
  printf ("attack: volume %f\n", ep.writes.back());
  assert (near (ep.writes.back(), 0.25));

  /* stays at cap / peak while the signal is loud */
  for (int i = 0; i < 10; i++)
    clock.tick (loop);
  assert (near (ep.device_volume, 0.25));
  assert (near (loop.telemetry().ui_volume, 0.25));
  assert (near (loop.telemetry().ui_peak, 0.8));
  return 0;
}

int
test_transient()
{
  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, hard_config());
  TickClock    clock;

  /* bursts shorter than attack time never accumulate */
  for (int burst = 0; burst < 20; burst++)
    {
      ep.content_peak = 0.9;
      clock.tick (loop);
      clock.tick (loop);
      ep.content_peak = 0.05;
      clock.tick (loop);
      assert (loop.state().time_over_threshold == 0);
    }
  assert (!loop.state().is_limiting);
  assert (ep.writes.empty());
  assert (ep.device_volume == 1.0);
  return 0;
}

int
test_release()
{
  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, hard_config());
  TickClock    clock;
  const LimiterConfig config = loop.config();

  start_limiting (ep, loop, clock);
  const double last_loud = clock.now() - ControlLoop::active_interval;

  ep.content_peak = 0;
  while (clock.now() - last_loud <= config.hold_time)
    {
      clock.tick (loop);
      assert (loop.state().is_limiting);
      assert (loop.state().phase == LimiterPhase::HOLDING);
      assert (near (ep.device_volume, 0.25));
    }

  int   release_ticks = 0;
  float last_volume = ep.device_volume;
  while (loop.state().is_limiting)
    {
      clock.tick (loop);
      release_ticks++;
      printf ("release: %d %f\n", release_ticks, ep.device_volume);

      assert (ep.device_volume >= last_volume);
      assert (ep.device_volume <= 1.0);
      if (loop.state().is_limiting)
        {
          assert (loop.state().phase == LimiterPhase::RELEASING);
          assert (near (ep.device_volume, 0.25 + 0.75 * release_ticks * ControlLoop::active_interval / config.release_time, 1e-3));
        }
      last_volume = ep.device_volume;
      assert (release_ticks <= 30);
    }
  /* full release from 0.25 to 1.0 takes release_time */
  const int expected_ticks = lrint (config.release_time / ControlLoop::active_interval);
  assert (release_ticks >= expected_ticks - 1 && release_ticks <= expected_ticks + 1);
  assert (ep.device_volume == 1.0);
  assert (loop.state().phase == LimiterPhase::IDLE);
  assert (!loop.telemetry().is_limiting);
  return 0;
}

int
test_instant_release()
{
  LimiterConfig config = hard_config();
  config.release_time = 0;

  FakeEndpoint ep (0.8);
  ControlLoop  loop (ep, config);
  TickClock    clock;

  start_limiting (ep, loop, clock);
  ep.content_peak = 0;
  clock.skip (1);
  clock.tick (loop);
  assert (!loop.state().is_limiting);
  assert (near (ep.device_volume, 0.8));
  return 0;
}

int
test_quantized_volume()
{
  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, hard_config());
  TickClock    clock;

  /* 31 step mixer: cap / peak = 0.2419 is rounded to 7 / 31 = 0.2258 */
  ep.volume_steps = 31;
  ep.content_peak = 0.8267;
  for (int i = 0; i < 4; i++)
    clock.tick (loop);
  printf ("quantized: volume %f\n", ep.device_volume);
  assert (near (ep.device_volume, 7 / 31.0));

  /* the rounded write is not mistaken for a manual change */
  for (int i = 0; i < 100; i++)
    {
      clock.tick (loop);
      assert (!ep.has_user_change());
      assert (loop.state().is_limiting);
      assert (loop.state().phase == LimiterPhase::LIMITING);
      assert (loop.state().original_volume == 1.0);
    }
  assert (near (ep.device_volume, 7 / 31.0));

  ep.content_peak = 0;
  for (int i = 0; i < 100; i++)
    clock.tick (loop);
  assert (!loop.state().is_limiting);
  assert (ep.device_volume == 1.0);
  return 0;
}

int
test_coarse_release()
{
  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, hard_config());
  TickClock    clock;
  const LimiterConfig config = loop.config();

  /* release steps (0.028 per tick) are smaller than the mixer steps (0.1) */
  ep.volume_steps = 10;
  ep.content_peak = 0.7;
  for (int i = 0; i < 4; i++)
    clock.tick (loop);
  assert (loop.state().is_limiting);
  assert (near (ep.device_volume, 0.3));

  ep.content_peak = 0;
  const double quiet_start = clock.now();
  while (clock.now() - quiet_start <= config.hold_time)
    clock.tick (loop);

  int   release_ticks = 0;
  float last_volume = ep.device_volume;
  while (loop.state().is_limiting)
    {
      clock.tick (loop);
      release_ticks++;
      assert (ep.device_volume >= last_volume);
      assert (!ep.has_user_change());
      last_volume = ep.device_volume;
      assert (release_ticks <= 30);
    }
  printf ("coarse release: %d ticks\n", release_ticks);
  const int expected_ticks = lrint (config.release_time / ControlLoop::active_interval);
  assert (release_ticks <= expected_ticks + 1);
  assert (ep.device_volume == 1.0);
  return 0;
}

int
test_delayed_meter()
{
  FakeEndpoint ep (1.0, true);
  ControlLoop  loop (ep, hard_config());
  TickClock    clock;

  /* the meter still reports samples played before the last volume write */
  ep.meter_delay = 2;
  start_limiting (ep, loop, clock);
  assert (near (ep.device_volume, 0.25));

  const size_t n_writes = ep.writes.size();
  for (int i = 0; i < 100; i++)
    {
      clock.tick (loop);
      assert (near (ep.device_volume, 0.25));
      assert (near (loop.telemetry().ui_peak, 0.8));
    }
  for (size_t i = n_writes; i < ep.writes.size(); i++)
    assert (near (ep.writes[i], 0.25));
  assert (loop.state().is_limiting);
  assert (!ep.has_user_change());
  return 0;
}

int
test_leeway()
{
  LimiterConfig config;
  config.leeway_db = 6;
  config.volume_cap = 0.25;

  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, config);
  TickClock    clock;

  /* exactly at the cap is not over threshold */
  ep.content_peak = 0.25;
  for (int i = 0; i < 50; i++)
    clock.tick (loop);
  assert (!loop.state().is_limiting);
  assert (ep.writes.empty());

  /* just above the cap: only a small part of the way to cap / peak */
  ep.content_peak = 0.26;
  for (int i = 0; i < 10; i++)
    clock.tick (loop);
  assert (loop.state().is_limiting);
  printf ("leeway: volume %f\n", ep.device_volume);
  assert (ep.device_volume < 1.0 && ep.device_volume > 0.99);

  /* above the soft threshold: full limiting */
  ep.content_peak = 0.5;
  clock.tick (loop);
  assert (near (ep.device_volume, 0.5));
  return 0;
}

int
test_dampening()
{
  LimiterConfig config = hard_config();
  config.dampening = 2;
  config.dampening_speed = 1;

  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, config);
  TickClock    clock;

  start_limiting (ep, loop, clock);
  const float first = ep.device_volume;
  printf ("dampening: first %f\n", first);
  assert (first < 0.25 && first > 0.24);

  float last_volume = first;
  for (int i = 0; i < 60; i++)
    {
      clock.tick (loop);
      assert (ep.device_volume <= last_volume);
      last_volume = ep.device_volume;
    }
  printf ("dampening: sustained %f\n", ep.device_volume);
  assert (near (ep.device_volume, 0.125));
  return 0;
}

int
test_bounds()
{
  LimiterConfig config = hard_config();
  config.dampening = 10;
  config.volume_cap = 0.01;

  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, config);
  TickClock    clock;

  srand (42);
  for (int i = 0; i < 5000; i++)
    {
      ep.content_peak = (rand() % 1000) / 999.0;
      clock.tick (loop);
    }
  assert (!ep.writes.empty());
  for (auto v : ep.writes)
    assert (v >= ControlLoop::min_volume && v <= ControlLoop::max_volume);
  return 0;
}

int
test_user_change()
{
  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, hard_config());
  TickClock    clock;
  const LimiterConfig config = loop.config();

  start_limiting (ep, loop, clock);

  /* user turns the volume to 0.5 while limiting */
  ep.device_volume = 0.5;
  const size_t n_writes = ep.writes.size();
  const double change_time = clock.now();

  double idle = clock.tick (loop);
  assert (idle == ControlLoop::cooldown_interval);
  assert (!loop.state().is_limiting);
  assert (loop.state().original_volume == 0.5);
  assert (loop.state().time_over_threshold == 0);

  /* the same volume is not a second user change */
  assert (!ep.detect_user_change (clock.now()));

  /* no volume writes during cooldown, even with loud content */
  while (clock.now() - change_time < config.user_cooldown)
    {
      clock.tick (loop);
      assert (ep.writes.size() == n_writes);
      assert (loop.telemetry().phase == LimiterPhase::IDLE);
    }
  assert (ep.device_volume == 0.5);

  /* then limiting resumes towards cap / peak */
  for (int i = 0; i < 5; i++)
    clock.tick (loop);
  assert (loop.state().is_limiting);
  assert (near (ep.device_volume, 0.25));

  /* release target is the volume the user chose */
  ep.content_peak = 0;
  for (int i = 0; i < 100; i++)
    clock.tick (loop);
  assert (!loop.state().is_limiting);
  assert (near (ep.device_volume, 0.5));
  return 0;
}

int
test_pause()
{
  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, hard_config());
  TickClock    clock;

  ep.content_peak = 0.8;
  clock.tick (loop);
  clock.tick (loop);
  clock.tick (loop);
  assert (loop.state().time_over_threshold > 0);

  loop.set_running (false);
  for (int i = 0; i < 20; i++)
    {
      double idle = clock.tick (loop);
      assert (idle == ControlLoop::paused_interval);
    }
  assert (ep.writes.empty());
  assert (loop.state().time_over_threshold == 0);
  assert (!loop.state().is_running);
  assert (!loop.telemetry().is_running);

  /* sustain history starts over after resume */
  assert (loop.toggle_running());
  clock.tick (loop);
  clock.tick (loop);
  assert (!loop.state().is_limiting);
  assert (ep.writes.empty());
  clock.tick (loop);
  clock.tick (loop);
  assert (loop.state().is_limiting);
  return 0;
}

int
test_endpoint_failures()
{
  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, hard_config());
  TickClock    clock;

  ep.content_peak = 0.8;
  ep.fail_write = true;
  for (int i = 0; i < 10; i++)
    clock.tick (loop);

  /* failed writes are not mistaken for user changes */
  assert (loop.state().is_limiting);
  assert (ep.writes.empty());
  assert (loop.state().original_volume == 1.0);

  ep.fail_write = false;
  clock.tick (loop);
  assert (near (ep.device_volume, 0.25));

  /* failed peak reads count as silence */
  ep.fail_peak = true;
  clock.tick (loop);
  assert (loop.state().time_over_threshold == 0);
  return 0;
}

int
test_config()
{
  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, LimiterConfig());

  assert (near (loop.adjust_volume_cap (LimiterLimits::hotkey_volume_cap_step), 0.21, 1e-9));
  for (int i = 0; i < 100; i++)
    loop.adjust_volume_cap (-LimiterLimits::hotkey_volume_cap_step);
  assert (loop.config().volume_cap == LimiterLimits::min_hotkey_volume_cap);
  for (int i = 0; i < 200; i++)
    loop.adjust_volume_cap (LimiterLimits::hotkey_volume_cap_step);
  assert (loop.config().volume_cap == LimiterLimits::max_volume_cap);

  loop.set_volume_cap (7);
  assert (loop.config().volume_cap == 1.0);
  assert (loop.telemetry().volume_cap == 1.0);

  loop.set_leeway_db (9);
  assert (loop.telemetry().base_leeway_db == 9);
  assert (loop.telemetry().current_leeway_db == 9);

  loop.update_config ([] (LimiterConfig& c) {
    c.volume_cap = 0.5;
    c.attack_time = 1;
    c.stabilizer_enabled = true;
  });

  loop.reset_defaults();

  const LimiterConfig defaults;
  const LimiterConfig config = loop.config();
  assert (config.volume_cap == 0.5);
  assert (config.attack_time == defaults.attack_time);
  assert (config.leeway_db == defaults.leeway_db);
  assert (config.stabilizer_enabled == defaults.stabilizer_enabled);
  assert (loop.telemetry().current_leeway_db == defaults.leeway_db);
  assert (loop.telemetry().base_leeway_db == defaults.leeway_db);
  return 0;
}

int
test_stabilizer_in_loop()
{
  LimiterConfig config = hard_config();
  config.attack_time = 0;
  config.hold_time = 0;
  config.release_time = 0;
  config.stabilizer_enabled = true;
  config.stabilizer_threshold = 4;

  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, config);
  TickClock    clock;

  /* pumping content: limit / release every few ticks */
  for (int i = 0; i < 500; i++)
    {
      ep.content_peak = (i / 5) % 2 ? 0.8 : 0;
      clock.tick (loop);

      const Telemetry t = loop.telemetry();
      assert (t.current_leeway_db >= t.base_leeway_db);
      assert (t.current_leeway_db <= config.stabilizer_max_leeway);
    }
  printf ("stabilizer: leeway %f dB, %zd changes\n", loop.telemetry().current_leeway_db, loop.state().n_volume_changes);
  assert (loop.telemetry().current_leeway_db > 0);

  /* disabling resets the dynamic leeway */
  loop.set_stabilizer_enabled (false);
  assert (loop.telemetry().current_leeway_db == 0);
  assert (loop.state().n_volume_changes == 0);
  return 0;
}

int
test_thread()
{
  FakeEndpoint ep (1.0);
  ControlLoop  loop (ep, hard_config());

  ep.content_peak = 0.8;

  Error err = loop.stop();
  assert (err);

  err = loop.start();
  assert (!err);
  assert (loop.is_started());

  err = loop.start();
  assert (err);

  sleep_seconds (0.3);

  err = loop.stop();
  if (err)
    {
      fprintf (stderr, "testcontrolloop: %s\n", err.message());
      return 1;
    }
  assert (!loop.is_started());
  printf ("thread: volume %f\n", loop.telemetry().ui_volume);
  assert (loop.telemetry().is_limiting);
  assert (near (loop.telemetry().ui_volume, 0.25));
  return 0;
}

int
main (int argc, char **argv)
{
  struct { const char *name; int (*fun)(); } tests[] = {
    { "attack",           test_attack },
    { "transient",        test_transient },
    { "release",          test_release },
    { "instant-release",  test_instant_release },
    { "quantized-volume", test_quantized_volume },
    { "coarse-release",   test_coarse_release },
    { "delayed-meter",    test_delayed_meter },
    { "leeway",           test_leeway },
    { "dampening",        test_dampening },
    { "bounds",           test_bounds },
    { "user-change",      test_user_change },
    { "pause",            test_pause },
    { "endpoint-failures", test_endpoint_failures },
    { "config",           test_config },
    { "stabilizer",       test_stabilizer_in_loop },
    { "thread",           test_thread },
  };
  for (auto& test : tests)
    {
      if (argc == 2 && strcmp (argv[1], test.name) != 0)
        continue;

      printf ("=== %s\n", test.name);
      int result = test.fun();
      if (result != 0)
        return result;
    }
  return 0;
}
