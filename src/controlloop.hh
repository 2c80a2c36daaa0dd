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

#ifndef TAME_CONTROL_LOOP_HH
#define TAME_CONTROL_LOOP_HH

#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>

#include "audioendpoint.hh"
#include "limiterconfig.hh"
#include "stabilizer.hh"

enum class LimiterPhase { IDLE, TRACKING, LIMITING, HOLDING, RELEASING };

const char *limiter_phase_name (LimiterPhase phase);

struct LimiterState
{
  bool         is_running               = true;
  float        original_volume          = 0;  // release target, follows manual volume changes
  bool         is_limiting              = false;
  double       time_over_threshold      = 0;
  double       last_over_threshold_time = 0;
  bool         is_releasing             = false;
  float        release_start_volume     = 0;
  float        release_volume           = 0;  // ramp position, the device may round it
  double       current_leeway_db        = 0;
  size_t       n_volume_changes         = 0;  // stabilizer window
  LimiterPhase phase                    = LimiterPhase::IDLE;
};

struct Telemetry
{
  float        ui_peak           = 0;
  float        ui_volume         = 0;
  double       current_leeway_db = 0;
  double       base_leeway_db    = 0;
  bool         is_limiting       = false;
  bool         is_running        = true;
  float        original_volume   = 0;
  double       volume_cap        = 0;
  LimiterPhase phase             = LimiterPhase::IDLE;
};

/*
 * The limiter: polls peak level and volume of an AudioEndpoint and lowers the
 * volume while the content is too loud for the configured cap.
 *
 * tick() can be driven directly (simulation, tests) or by the background
 * thread created by start(). Configuration and the stabilizer are shared with
 * other threads and guarded by m_mutex, which is never held during endpoint
 * calls or while sleeping. Everything else in m_state belongs to the thread
 * calling tick().
 */
class ControlLoop
{
  AudioEndpoint&          m_endpoint;

  mutable std::mutex      m_mutex;
  LimiterConfig           m_config;
  bool                    m_is_running = true;
  Stabilizer              m_stabilizer;
  Telemetry               m_telemetry;
  LimiterState            m_published_state;

  LimiterState            m_state;
  double                  m_last_tick_time = -1;

  std::thread             m_thread;
  std::condition_variable m_stop_cond;
  std::condition_variable m_done_cond;
  bool                    m_stop_requested = false;
  bool                    m_thread_done = false;

  void  thread_run();
  float limit_target (const LimiterConfig& config, float raw_peak, float potential_output, double leeway_db) const;
  float release_step (const LimiterConfig& config, double dt);
  void  track_volume_change (float new_volume, double now);
  void  publish (const LimiterConfig& config, double now);
  void  apply_config (const LimiterConfig& new_config);

public:
  static constexpr double active_interval      = 0.020;
  static constexpr double paused_interval      = 0.050;
  static constexpr double cooldown_interval    = 0.020;
  static constexpr double min_peak             = 0.001;  // below this, content counts as silence
  static constexpr float  min_volume           = 0.01;
  static constexpr float  max_volume           = 1.0;
  static constexpr float  release_snap_distance = 0.005;

  ControlLoop (AudioEndpoint& endpoint, const LimiterConfig& config);
  ~ControlLoop();

  /* one pass of the limiter at time now (seconds); returns the idle time before the next tick */
  double tick (double now);

  Error start();
  Error stop (double timeout = 1.0);
  bool  is_started() const;

  /* configuration interface for UI / keyboard / settings */
  LimiterConfig config() const;
  void          set_config (const LimiterConfig& config);
  void          update_config (const std::function<void (LimiterConfig&)>& fun);
  void          set_volume_cap (double volume_cap);
  double        adjust_volume_cap (double delta);
  void          set_leeway_db (double leeway_db);
  void          set_stabilizer_enabled (bool enabled);
  void          set_running (bool running);
  bool          toggle_running();
  void          reset_defaults();

  Telemetry     telemetry() const;
  LimiterState  state() const;
};

#endif /* TAME_CONTROL_LOOP_HH */
