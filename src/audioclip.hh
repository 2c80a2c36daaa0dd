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

#ifndef TAME_AUDIO_CLIP_HH
#define TAME_AUDIO_CLIP_HH

#include <vector>
#include <string>

#include "utils.hh"

/* interleaved audio data held in memory, loaded from / saved to files with libsndfile */
class AudioClip
{
  std::vector<float> m_samples;
  int                m_n_channels  = 0;
  int                m_sample_rate = 0;
  int                m_bit_depth   = 0;

public:
  AudioClip();
  AudioClip (const std::vector<float>& samples, int n_channels, int sample_rate, int bit_depth);

  Error load (const std::string& filename);
  Error save (const std::string& filename) const;

  int                       sample_rate() const;
  int                       bit_depth() const;

  int
  n_channels() const
  {
    return m_n_channels;
  }
  size_t
  n_frames() const
  {
    return m_n_channels ? m_samples.size() / m_n_channels : 0;
  }
  double
  duration() const
  {
    return m_sample_rate ? double (n_frames()) / m_sample_rate : 0;
  }
  const std::vector<float>&
  samples() const
  {
    return m_samples;
  }

  /* maximum absolute sample value of frames [start_frame, end_frame) */
  float peak (size_t start_frame, size_t end_frame) const;
};

#endif /* TAME_AUDIO_CLIP_HH */
