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

#ifndef TAME_ALSA_ENDPOINT_HH
#define TAME_ALSA_ENDPOINT_HH

#include <string>
#include <thread>
#include <mutex>

#include <alsa/asoundlib.h>

#include "audioendpoint.hh"
#include "peakmeter.hh"

/*
 * Real output device: volume via an ALSA simple mixer control, peak level via
 * an ALSA capture device that carries the output signal (loopback / monitor),
 * which is read continuously on a separate meter thread.
 */
class AlsaEndpoint : public AudioEndpoint
{
public:
  static constexpr double meter_period  = 0.010;
  static constexpr double meter_latency = 0.020;

  struct Options
  {
    std::string mixer_device      = "default";
    std::string mixer_control     = "Master";
    std::string meter_device;
    int         meter_rate        = 48000;
    int         meter_channels    = 2;
    bool        meter_pre_volume  = false;
  };

private:
  Options           m_options;

  snd_mixer_t      *m_mixer = nullptr;
  snd_mixer_elem_t *m_elem  = nullptr;
  long              m_min_raw_volume = 0;
  long              m_max_raw_volume = 0;

  snd_pcm_t        *m_pcm = nullptr;
  size_t            m_period_frames = 0;

  std::thread       m_meter_thread;
  std::mutex        m_meter_mutex;
  bool              m_stop_meter = false;
  PeakMeter         m_meter { meter_period + meter_latency };

  Error open_mixer();
  Error open_meter();
  void  meter_run();

protected:
  Error read_peak (float& peak, float& volume) override;
  Error read_volume (float& volume) override;
  Error write_volume (float& volume) override;
  bool  peak_is_post_volume() const override;

public:
  ~AlsaEndpoint();

  Error open (const Options& options);
  void  close();
};

#endif /* TAME_ALSA_ENDPOINT_HH */
