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

#include "simendpoint.hh"

#include <algorithm>
#include <math.h>

using std::vector;

SimEndpoint::SimEndpoint (const AudioClip& clip, float initial_volume) :
  m_clip (clip),
  m_volume (bound<float> (0, initial_volume, 1)),
  m_frame_volume (clip.n_frames(), m_volume)
{
  init_volume();
}

Error
SimEndpoint::read_peak (float& peak, float& volume)
{
  peak   = m_clip.peak (m_meter_start_frame, m_frame) * m_volume;
  volume = m_volume;
  return Error::Code::NONE;
}

Error
SimEndpoint::read_volume (float& volume)
{
  volume = m_volume;
  return Error::Code::NONE;
}

Error
SimEndpoint::write_volume (float& volume)
{
  m_volume = volume;
  m_n_volume_writes++;
  return Error::Code::NONE;
}

void
SimEndpoint::add_user_change (double time, float volume)
{
  m_user_changes.push_back ({ time, bound<float> (0, volume, 1) });
  std::stable_sort (m_user_changes.begin() + m_next_user_change, m_user_changes.end(),
                    [] (const UserVolumeChange& a, const UserVolumeChange& b) { return a.time < b.time; });
}

void
SimEndpoint::advance (double seconds)
{
  const size_t n_frames  = m_clip.n_frames();
  const size_t end_frame = std::min<size_t> (n_frames, lrint ((position() + seconds) * m_clip.sample_rate()));

  m_meter_start_frame = m_frame;
  while (m_frame < end_frame)
    {
      /* a scripted manual volume change takes effect when playback reaches it */
      while (m_next_user_change < m_user_changes.size() &&
             m_user_changes[m_next_user_change].time * m_clip.sample_rate() <= m_frame)
        {
          m_volume = m_user_changes[m_next_user_change].volume;
          m_next_user_change++;
        }
      m_frame_volume[m_frame++] = m_volume;
    }
}

bool
SimEndpoint::finished() const
{
  return m_frame >= m_clip.n_frames();
}

double
SimEndpoint::position() const
{
  return m_clip.sample_rate() ? double (m_frame) / m_clip.sample_rate() : 0;
}

size_t
SimEndpoint::n_volume_writes() const
{
  return m_n_volume_writes;
}

AudioClip
SimEndpoint::render() const
{
  const int n_channels = m_clip.n_channels();

  vector<float> samples = m_clip.samples();
  for (size_t i = 0; i < samples.size(); i++)
    samples[i] *= m_frame_volume[i / n_channels];

  return AudioClip (samples, n_channels, m_clip.sample_rate(), m_clip.bit_depth());
}
