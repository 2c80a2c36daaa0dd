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

#ifndef TAME_SIM_ENDPOINT_HH
#define TAME_SIM_ENDPOINT_HH

#include <vector>

#include "audioendpoint.hh"
#include "audioclip.hh"

/*
 * Plays an AudioClip on a virtual clock: the meter reports the peak of the
 * content played during the last advance() multiplied by the volume, like a
 * post-volume hardware meter, and every frame remembers the volume it was
 * played with, so the result can be rendered to a file.
 */
class SimEndpoint : public AudioEndpoint
{
public:
  struct UserVolumeChange
  {
    double time;
    float  volume;
  };

private:
  const AudioClip&              m_clip;
  size_t                        m_frame = 0;
  size_t                        m_meter_start_frame = 0;
  float                         m_volume = 1;
  std::vector<float>            m_frame_volume;
  std::vector<UserVolumeChange> m_user_changes;
  size_t                        m_next_user_change = 0;
  size_t                        m_n_volume_writes = 0;

protected:
  Error read_peak (float& peak, float& volume) override;
  Error read_volume (float& volume) override;
  Error write_volume (float& volume) override;

public:
  SimEndpoint (const AudioClip& clip, float initial_volume);

  void      add_user_change (double time, float volume);
  void      advance (double seconds);

  bool      finished() const;
  double    position() const;
  size_t    n_volume_writes() const;

  /* input clip with the applied volume of each frame */
  AudioClip render() const;
};

#endif /* TAME_SIM_ENDPOINT_HH */
