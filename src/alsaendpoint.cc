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

#include "alsaendpoint.hh"

#include <vector>
#include <system_error>
#include <stdlib.h>
#include <stdint.h>
#include <math.h>

using std::string;
using std::vector;

constexpr double AlsaEndpoint::meter_period;
constexpr double AlsaEndpoint::meter_latency;

AlsaEndpoint::~AlsaEndpoint()
{
  close();
}

Error
AlsaEndpoint::open (const Options& options)
{
  m_options = options;
  if (m_options.meter_device.empty())
    return Error ("no meter device given");

  Error err = open_mixer();
  if (err)
    {
      close();
      return err;
    }
  err = open_meter();
  if (err)
    {
      close();
      return err;
    }
  init_volume();

  m_stop_meter = false;
  try
    {
      m_meter_thread = std::thread (&AlsaEndpoint::meter_run, this);
    }
  catch (const std::system_error& e)
    {
      close();
      return Error (string_printf ("failed to start meter thread: %s", e.what()));
    }
  return Error::Code::NONE;
}

Error
AlsaEndpoint::open_mixer()
{
  int err = snd_mixer_open (&m_mixer, 0);
  if (err < 0)
    return Error (string_printf ("snd_mixer_open failed: %s", snd_strerror (err)));

  err = snd_mixer_attach (m_mixer, m_options.mixer_device.c_str());
  if (err < 0)
    return Error (string_printf ("can't attach mixer device '%s': %s", m_options.mixer_device.c_str(), snd_strerror (err)));

  err = snd_mixer_selem_register (m_mixer, nullptr, nullptr);
  if (err < 0)
    return Error (string_printf ("snd_mixer_selem_register failed: %s", snd_strerror (err)));

  err = snd_mixer_load (m_mixer);
  if (err < 0)
    return Error (string_printf ("snd_mixer_load failed: %s", snd_strerror (err)));

  snd_mixer_selem_id_t *sid;
  snd_mixer_selem_id_alloca (&sid);
  snd_mixer_selem_id_set_index (sid, 0);
  snd_mixer_selem_id_set_name (sid, m_options.mixer_control.c_str());

  m_elem = snd_mixer_find_selem (m_mixer, sid);
  if (!m_elem)
    return Error (string_printf ("mixer control '%s' not found on '%s'", m_options.mixer_control.c_str(), m_options.mixer_device.c_str()));

  if (!snd_mixer_selem_has_playback_volume (m_elem))
    return Error (string_printf ("mixer control '%s' has no playback volume", m_options.mixer_control.c_str()));

  err = snd_mixer_selem_get_playback_volume_range (m_elem, &m_min_raw_volume, &m_max_raw_volume);
  if (err < 0)
    return Error (string_printf ("can't get volume range: %s", snd_strerror (err)));

  if (m_max_raw_volume <= m_min_raw_volume)
    return Error (string_printf ("mixer control '%s' has empty volume range", m_options.mixer_control.c_str()));

  return Error::Code::NONE;
}

Error
AlsaEndpoint::open_meter()
{
  int err = snd_pcm_open (&m_pcm, m_options.meter_device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
  if (err < 0)
    {
      m_pcm = nullptr;
      return Error (string_printf ("can't open meter device '%s': %s", m_options.meter_device.c_str(), snd_strerror (err)));
    }

  /* 10ms periods, so the 20ms control loop always sees fresh peaks */
  const unsigned int latency_us = lrint (meter_latency * 1000000);
  err = snd_pcm_set_params (m_pcm, SND_PCM_FORMAT_S16_LE, SND_PCM_ACCESS_RW_INTERLEAVED,
                            m_options.meter_channels, m_options.meter_rate, /* soft resample */ 1, latency_us);
  if (err < 0)
    return Error (string_printf ("can't configure meter device '%s': %s", m_options.meter_device.c_str(), snd_strerror (err)));

  m_period_frames = std::max<long> (lrint (m_options.meter_rate * meter_period), 1);
  return Error::Code::NONE;
}

void
AlsaEndpoint::meter_run()
{
  vector<int16_t> buffer (m_period_frames * m_options.meter_channels);

  for (;;)
    {
      {
        std::lock_guard<std::mutex> lg (m_meter_mutex);
        if (m_stop_meter)
          return;
      }
      snd_pcm_sframes_t frames = snd_pcm_readi (m_pcm, buffer.data(), m_period_frames);
      if (frames < 0)
        {
          /* overrun or suspend: recover and try again */
          int err = snd_pcm_recover (m_pcm, frames, /* silent */ 1);
          if (err < 0)
            {
              m_meter.set_error (Error (string_printf ("meter read failed: %s", snd_strerror (err))));
              sleep_seconds (0.05);
            }
          continue;
        }

      int max_abs = 0;
      for (size_t i = 0; i < size_t (frames) * m_options.meter_channels; i++)
        max_abs = std::max (max_abs, abs (int (buffer[i])));

      m_meter.add_period (max_abs / 32768.0, get_time());
    }
}

Error
AlsaEndpoint::read_peak (float& peak, float& volume)
{
  return m_meter.read (peak, volume);
}

Error
AlsaEndpoint::read_volume (float& volume)
{
  if (!m_elem)
    return Error ("mixer not open");

  /* pick up volume changes made by other programs */
  int err = snd_mixer_handle_events (m_mixer);
  if (err < 0)
    return Error (string_printf ("snd_mixer_handle_events failed: %s", snd_strerror (err)));

  long raw_volume;
  err = snd_mixer_selem_get_playback_volume (m_elem, SND_MIXER_SCHN_FRONT_LEFT, &raw_volume);
  if (err < 0)
    return Error (string_printf ("can't read volume: %s", snd_strerror (err)));

  volume = double (raw_volume - m_min_raw_volume) / (m_max_raw_volume - m_min_raw_volume);
  m_meter.set_volume (volume, get_time());
  return Error::Code::NONE;
}

Error
AlsaEndpoint::write_volume (float& volume)
{
  if (!m_elem)
    return Error ("mixer not open");

  const long raw_volume = m_min_raw_volume + lrint (volume * (m_max_raw_volume - m_min_raw_volume));

  int err = snd_mixer_selem_set_playback_volume_all (m_elem, raw_volume);
  if (err < 0)
    return Error (string_printf ("can't set volume: %s", snd_strerror (err)));

  volume = double (raw_volume - m_min_raw_volume) / (m_max_raw_volume - m_min_raw_volume);
  m_meter.set_volume (volume, get_time());
  return Error::Code::NONE;
}

bool
AlsaEndpoint::peak_is_post_volume() const
{
  return !m_options.meter_pre_volume;
}

void
AlsaEndpoint::close()
{
  if (m_meter_thread.joinable())
    {
      {
        std::lock_guard<std::mutex> lg (m_meter_mutex);
        m_stop_meter = true;
      }
      m_meter_thread.join();
    }
  if (m_pcm)
    {
      snd_pcm_close (m_pcm);
      m_pcm = nullptr;
    }
  if (m_mixer)
    {
      snd_mixer_close (m_mixer);
      m_mixer = nullptr;
      m_elem  = nullptr;
    }
}
