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

#include "controlloop.hh"
#include "utils.hh"

#include <system_error>
#include <chrono>
#include <math.h>

using std::max;
using std::min;

constexpr double ControlLoop::active_interval;
constexpr double ControlLoop::paused_interval;
constexpr double ControlLoop::cooldown_interval;
constexpr double ControlLoop::min_peak;
constexpr float  ControlLoop::min_volume;
constexpr float  ControlLoop::max_volume;
constexpr float  ControlLoop::release_snap_distance;

const char *
limiter_phase_name (LimiterPhase phase)
{
  switch (phase)
    {
      case LimiterPhase::IDLE:      return "idle";
      case LimiterPhase::TRACKING:  return "tracking";
      case LimiterPhase::LIMITING:  return "limiting";
      case LimiterPhase::HOLDING:   return "holding";
      case LimiterPhase::RELEASING: return "releasing";
    }
  return "unknown";
}

ControlLoop::ControlLoop (AudioEndpoint& endpoint, const LimiterConfig& config) :
  m_endpoint (endpoint),
  m_config (config.clamped()),
  m_stabilizer (m_config.leeway_db)
{
  m_state.original_volume   = m_endpoint.volume();
  m_state.current_leeway_db = m_config.leeway_db;
  m_published_state         = m_state;

  m_telemetry.ui_volume         = m_state.original_volume;
  m_telemetry.original_volume   = m_state.original_volume;
  m_telemetry.volume_cap        = m_config.volume_cap;
  m_telemetry.base_leeway_db    = m_config.leeway_db;
  m_telemetry.current_leeway_db = m_config.leeway_db;
}

ControlLoop::~ControlLoop()
{
  {
    std::lock_guard<std::mutex> lg (m_mutex);
    m_stop_requested = true;
    m_stop_cond.notify_all();
  }
  if (m_thread.joinable())
    m_thread.join();
}

double
ControlLoop::tick (double now)
{
  LimiterConfig config;
  bool          is_running;
  double        leeway_db;
  {
    std::lock_guard<std::mutex> lg (m_mutex);
    config     = m_config;
    is_running = m_is_running;
    leeway_db  = m_stabilizer.current_leeway_db();
  }

  const double dt = m_last_tick_time < 0 ? 0 : max (now - m_last_tick_time, 0.0);
  m_last_tick_time = now;

  if (!is_running)
    {
      /* don't let a resumed loop inherit sustain time from before the pause */
      m_state.time_over_threshold = 0;
      publish (config, now);
      return paused_interval;
    }

  /* manual volume changes always win over limiting */
  if (m_endpoint.detect_user_change (now))
    {
      debug ("tame: user changed volume %.3f -> %.3f\n", m_state.original_volume, m_endpoint.user_set_volume());

      m_state.original_volume     = m_endpoint.user_set_volume();
      m_state.is_limiting         = false;
      m_state.is_releasing        = false;
      m_state.time_over_threshold = 0;
    }
  if (m_endpoint.has_user_change() && now - m_endpoint.user_set_time() < config.user_cooldown)
    {
      m_state.phase = LimiterPhase::IDLE;
      publish (config, now);
      return cooldown_interval;
    }

  const float raw_peak         = m_endpoint.peak_level();
  const float potential_output = raw_peak * m_state.original_volume;

  if (potential_output > config.volume_cap && raw_peak > min_peak)
    {
      m_state.time_over_threshold     += dt;
      m_state.last_over_threshold_time = now;
      m_state.is_releasing             = false;

      if (m_state.time_over_threshold >= config.attack_time)
        {
          if (!m_state.is_limiting)
            {
              debug ("tame: limiting: peak %.3f at volume %.3f exceeds cap %.3f\n",
                     raw_peak, m_state.original_volume, config.volume_cap);
              m_state.is_limiting = true;
            }
          m_state.phase = LimiterPhase::LIMITING;

          const float target = limit_target (config, raw_peak, potential_output, leeway_db);
          track_volume_change (target, now);
          m_endpoint.set_volume (target);
        }
      else
        {
          /* transient peaks shorter than attack time are ignored */
          m_state.phase = LimiterPhase::TRACKING;
        }
    }
  else
    {
      m_state.time_over_threshold = 0;

      if (m_state.is_limiting)
        {
          const double time_since_loud = now - m_state.last_over_threshold_time;
          if (time_since_loud > config.hold_time)
            {
              const float new_volume = release_step (config, dt);
              track_volume_change (new_volume, now);
              m_endpoint.set_volume (new_volume);
            }
          else
            {
              m_state.phase = LimiterPhase::HOLDING;
            }
        }
      else
        {
          m_state.phase = LimiterPhase::IDLE;
        }
    }

  publish (config, now);
  return active_interval;
}

float
ControlLoop::limit_target (const LimiterConfig& config, float raw_peak, float potential_output, double leeway_db) const
{
  const double soft_threshold = config.volume_cap * db_to_factor (leeway_db);

  /* position in the leeway zone: 0 at the cap, 1 at the soft threshold and above */
  double leeway_ratio = 1;
  if (potential_output < soft_threshold)
    leeway_ratio = (potential_output - config.volume_cap) / (soft_threshold - config.volume_cap);

  /* long sustained peaks get attenuated more, ramping up over dampening_speed */
  const double time_since_attack = m_state.time_over_threshold - config.attack_time;
  double ramp = 1;
  if (config.dampening_speed > 0.001)
    ramp = min (1.0, time_since_attack / config.dampening_speed);

  const double sustained_factor = bound (1.0, 1 + (config.dampening - 1) * ramp, config.dampening);

  /* volume that makes the current content hit the cap exactly */
  const double base_target = config.volume_cap / max<double> (raw_peak, 0.01);

  double target = m_state.original_volume * (1 - leeway_ratio) + base_target * leeway_ratio;
  target /= sustained_factor;

  return bound<double> (min_volume, target, max_volume);
}

float
ControlLoop::release_step (const LimiterConfig& config, double dt)
{
  const float current = m_endpoint.volume();
  const float target  = m_state.original_volume;

  if (!m_state.is_releasing)
    {
      debug ("tame: releasing from volume %.3f to %.3f\n", current, target);
      m_state.is_releasing         = true;
      m_state.release_start_volume = current;
      m_state.release_volume       = current;
    }
  m_state.phase = LimiterPhase::RELEASING;

  /* linear ramp, a full release from release_start_volume takes release_time seconds */
  const float distance = target - m_state.release_start_volume;
  float new_volume = target;
  if (config.release_time > 0 && distance > 0)
    new_volume = min<float> (m_state.release_volume + distance * dt / config.release_time, target);
  m_state.release_volume = new_volume;

  if (target - new_volume <= release_snap_distance)
    {
      debug ("tame: release done, volume %.3f\n", target);
      new_volume            = target;
      m_state.is_limiting   = false;
      m_state.is_releasing  = false;
      m_state.phase         = LimiterPhase::IDLE;
    }
  return new_volume;
}

void
ControlLoop::track_volume_change (float new_volume, double now)
{
  std::lock_guard<std::mutex> lg (m_mutex);
  m_stabilizer.track (m_config, new_volume, now);
}

void
ControlLoop::publish (const LimiterConfig& config, double now)
{
  const float ui_peak   = m_endpoint.peak_level();
  const float ui_volume = m_endpoint.volume();

  std::lock_guard<std::mutex> lg (m_mutex);
  if (m_config.stabilizer_enabled)
    m_stabilizer.update (m_config, now);

  m_state.current_leeway_db = m_stabilizer.current_leeway_db();
  m_state.n_volume_changes  = m_stabilizer.n_changes();
  m_published_state         = m_state;

  m_telemetry.ui_peak         = ui_peak;
  m_telemetry.ui_volume       = ui_volume;
  m_telemetry.is_limiting     = m_state.is_limiting;
  m_telemetry.original_volume = m_state.original_volume;
  m_telemetry.phase           = m_state.phase;
}

void
ControlLoop::thread_run()
{
  debug ("tame: control loop thread started\n");
  for (;;)
    {
      const double idle = tick (get_time());

      std::unique_lock<std::mutex> lck (m_mutex);
      if (m_stop_cond.wait_for (lck, std::chrono::duration<double> (idle), [this] { return m_stop_requested; }))
        break;
    }

  std::lock_guard<std::mutex> lg (m_mutex);
  m_thread_done = true;
  m_done_cond.notify_all();
  debug ("tame: control loop thread stopped\n");
}

Error
ControlLoop::start()
{
  std::lock_guard<std::mutex> lg (m_mutex);
  if (m_thread.joinable())
    return Error ("control loop already started");

  m_stop_requested = false;
  m_thread_done    = false;
  try
    {
      m_thread = std::thread (&ControlLoop::thread_run, this);
    }
  catch (const std::system_error& e)
    {
      return Error (string_printf ("failed to start control loop thread: %s", e.what()));
    }
  return Error::Code::NONE;
}

/* asks the loop thread to exit and waits at most timeout seconds for it */
Error
ControlLoop::stop (double timeout)
{
  std::unique_lock<std::mutex> lck (m_mutex);
  if (!m_thread.joinable())
    return Error ("control loop not started");

  m_stop_requested = true;
  m_stop_cond.notify_all();

  if (!m_done_cond.wait_for (lck, std::chrono::duration<double> (timeout), [this] { return m_thread_done; }))
    return Error (string_printf ("control loop thread did not stop within %.2f seconds", timeout));

  lck.unlock();
  try
    {
      m_thread.join();
    }
  catch (const std::system_error& e)
    {
      return Error (string_printf ("failed to join control loop thread: %s", e.what()));
    }
  return Error::Code::NONE;
}

bool
ControlLoop::is_started() const
{
  std::lock_guard<std::mutex> lg (m_mutex);
  return m_thread.joinable() && !m_thread_done;
}

/* must be called with m_mutex locked */
void
ControlLoop::apply_config (const LimiterConfig& new_config)
{
  const LimiterConfig c = new_config.clamped();

  if (c.leeway_db != m_config.leeway_db)
    {
      /* base and dynamic leeway both follow a new leeway setting */
      m_stabilizer.reset (c.leeway_db);
    }
  else if (m_config.stabilizer_enabled && !c.stabilizer_enabled)
    {
      m_stabilizer.reset (c.leeway_db);
    }
  m_config = c;
  m_telemetry.volume_cap = m_config.volume_cap;
}

LimiterConfig
ControlLoop::config() const
{
  std::lock_guard<std::mutex> lg (m_mutex);
  return m_config;
}

void
ControlLoop::set_config (const LimiterConfig& config)
{
  std::lock_guard<std::mutex> lg (m_mutex);
  apply_config (config);
}

void
ControlLoop::update_config (const std::function<void (LimiterConfig&)>& fun)
{
  std::lock_guard<std::mutex> lg (m_mutex);
  LimiterConfig c = m_config;
  fun (c);
  apply_config (c);
}

void
ControlLoop::set_volume_cap (double volume_cap)
{
  update_config ([volume_cap] (LimiterConfig& c) { c.volume_cap = volume_cap; });
}

double
ControlLoop::adjust_volume_cap (double delta)
{
  std::lock_guard<std::mutex> lg (m_mutex);
  LimiterConfig c = m_config;
  c.volume_cap = bound (LimiterLimits::min_hotkey_volume_cap, c.volume_cap + delta, LimiterLimits::max_volume_cap);
  apply_config (c);
  return m_config.volume_cap;
}

void
ControlLoop::set_leeway_db (double leeway_db)
{
  update_config ([leeway_db] (LimiterConfig& c) { c.leeway_db = leeway_db; });
}

void
ControlLoop::set_stabilizer_enabled (bool enabled)
{
  update_config ([enabled] (LimiterConfig& c) { c.stabilizer_enabled = enabled; });
}

void
ControlLoop::set_running (bool running)
{
  std::lock_guard<std::mutex> lg (m_mutex);
  m_is_running = running;
}

bool
ControlLoop::toggle_running()
{
  std::lock_guard<std::mutex> lg (m_mutex);
  m_is_running = !m_is_running;
  return m_is_running;
}

/* restore factory defaults for everything but the volume cap */
void
ControlLoop::reset_defaults()
{
  std::lock_guard<std::mutex> lg (m_mutex);
  LimiterConfig defaults;
  defaults.volume_cap = m_config.volume_cap;

  m_config = defaults.clamped();
  m_stabilizer.reset (m_config.leeway_db);
  m_telemetry.volume_cap = m_config.volume_cap;
}

Telemetry
ControlLoop::telemetry() const
{
  std::lock_guard<std::mutex> lg (m_mutex);
  Telemetry t = m_telemetry;
  t.current_leeway_db = m_stabilizer.current_leeway_db();
  t.base_leeway_db    = m_stabilizer.base_leeway_db();
  t.volume_cap        = m_config.volume_cap;
  t.is_running        = m_is_running;
  return t;
}

LimiterState
ControlLoop::state() const
{
  std::lock_guard<std::mutex> lg (m_mutex);
  LimiterState s = m_published_state;
  s.is_running        = m_is_running;
  s.current_leeway_db = m_stabilizer.current_leeway_db();
  s.n_volume_changes  = m_stabilizer.n_changes();
  return s;
}
