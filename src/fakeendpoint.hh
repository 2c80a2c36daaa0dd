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

#ifndef TAME_FAKE_ENDPOINT_HH
#define TAME_FAKE_ENDPOINT_HH

#include <vector>

#include <math.h>

#include "audioendpoint.hh"

/*
 * scripted endpoint for the tests: content peak and device volume are set directly
 *
 * volume_steps > 0 emulates a mixer with a coarse volume range, meter_delay > 0
 * a meter that reports the signal as played meter_delay reads ago
 */
class FakeEndpoint : public AudioEndpoint
{
protected:
  Error
  read_peak (float& peak, float& volume) override
  {
    if (fail_peak)
      return Error ("peak read failed");

    meter_volumes.push_back (device_volume);
    const size_t n = meter_volumes.size();
    const float meter_volume = meter_volumes[n > meter_delay ? n - 1 - meter_delay : 0];

    peak   = post_volume ? content_peak * meter_volume : content_peak;
    volume = meter_volume;
    return Error::Code::NONE;
  }
  Error
  read_volume (float& volume) override
  {
    if (fail_read)
      return Error ("volume read failed");

    volume = device_volume;
    return Error::Code::NONE;
  }
  Error
  write_volume (float& volume) override
  {
    if (fail_write)
      return Error ("volume write failed");

    if (volume_steps > 0)
      volume = float (lrint (volume * volume_steps)) / volume_steps;

    device_volume = volume;
    writes.push_back (volume);
    return Error::Code::NONE;
  }
  bool
  peak_is_post_volume() const override
  {
    return post_volume;
  }

public:
  float              content_peak  = 0;
  float              device_volume = 1;
  bool               post_volume   = false;
  bool               fail_peak     = false;
  bool               fail_read     = false;
  bool               fail_write    = false;
  int                volume_steps  = 0;
  size_t             meter_delay   = 0;
  std::vector<float> writes;
  std::vector<float> meter_volumes;

  explicit
  FakeEndpoint (float volume = 1, bool post = false) :
    device_volume (volume),
    post_volume (post)
  {
    init_volume();
  }
};

#endif /* TAME_FAKE_ENDPOINT_HH */
