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

#ifndef TAME_AUDIO_ENDPOINT_HH
#define TAME_AUDIO_ENDPOINT_HH

#include "utils.hh"

/*
 * Output device as seen by the control loop: one peak meter, one volume control.
 *
 * Backends implement the read_* / write_* hooks; the public operations never
 * fail, a failed read returns cached values and a failed write is dropped.
 */
class AudioEndpoint
{
  float  m_cached_volume    = 0;
  float  m_last_set_volume  = 0;
  bool   m_have_user_change = false;
  double m_user_set_time    = 0;
  float  m_user_set_volume  = 0;

protected:
  /* volume is preset to the cached volume; backends replace it with the
   * device volume the returned peak was measured at */
  virtual Error read_peak (float& peak, float& volume) = 0;
  virtual Error read_volume (float& volume) = 0;
  /* volume is replaced by the volume the device actually applied */
  virtual Error write_volume (float& volume) = 0;

  /* meter sees the signal after the volume control (and needs normalization) */
  virtual bool
  peak_is_post_volume() const
  {
    return true;
  }

  /* backends call this once the device is open */
  void init_volume();

public:
  static constexpr float user_change_epsilon = 0.01;

  virtual ~AudioEndpoint();

  float peak_level();
  float volume();
  void  set_volume (float volume);
  bool  detect_user_change (double now);

  bool
  has_user_change() const
  {
    return m_have_user_change;
  }
  double
  user_set_time() const
  {
    return m_user_set_time;
  }
  float
  user_set_volume() const
  {
    return m_user_set_volume;
  }
  float
  last_set_volume() const
  {
    return m_last_set_volume;
  }
};

#endif /* TAME_AUDIO_ENDPOINT_HH */
