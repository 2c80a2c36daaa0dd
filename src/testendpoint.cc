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
#include <assert.h>
#include <math.h>

#include "fakeendpoint.hh"
#include "peakmeter.hh"

static bool
near (double a, double b)
{
  return fabs (a - b) < 1e-5;
}

int
main()
{
  /* post-volume meter: peak is reported as if volume was 100% */
  {
    FakeEndpoint ep (0.5, true);
    ep.content_peak = 0.4;
    assert (near (ep.peak_level(), 0.4));

    ep.content_peak = 1;
    ep.device_volume = 0.25;
    ep.volume();
    assert (near (ep.peak_level(), 1.0));

    /* near-silent volume: no normalization */
    ep.device_volume = 0.005;
    ep.volume();
    ep.content_peak = 0.5;
    assert (near (ep.peak_level(), 0.0025));
  }

  /* normalization never exceeds full scale */
  {
    FakeEndpoint ep (0.5, true);
    ep.content_peak = 1.2;        /* inter-sample overs */
    assert (ep.peak_level() == 1.0);
  }

  /* delayed meter: peaks are normalized by the volume they were played at */
  {
    FakeEndpoint ep (1.0, true);
    ep.meter_delay = 1;
    ep.content_peak = 0.8;
    assert (near (ep.peak_level(), 0.8));

    ep.set_volume (0.25);
    const float stale_peak = ep.peak_level();     /* still played at volume 1.0 */
    printf ("stale peak: %f\n", stale_peak);
    assert (near (stale_peak, 0.8));
    assert (near (ep.peak_level(), 0.8));
  }

  /* coarse mixer: the rounded volume is what counts as our own write */
  {
    FakeEndpoint ep (1.0);
    ep.volume_steps = 10;
    ep.set_volume (0.24);
    assert (ep.device_volume == 0.2f);
    assert (ep.last_set_volume() == 0.2f);
    assert (ep.volume() == 0.2f);
    assert (!ep.detect_user_change (1.0));
    assert (!ep.has_user_change());

    ep.set_volume (0.96);
    assert (ep.last_set_volume() == 1.0f);
    assert (!ep.detect_user_change (2.0));
  }

  /* peak meter: periods captured around a volume change keep the old volume */
  {
    PeakMeter meter (0.03);
    float peak, volume;

    assert (!meter.read (peak, volume));
    assert (peak == 0);

    meter.set_volume (1.0, 0);
    meter.add_period (0.8, 0.01);
    meter.add_period (0.8, 0.02);
    meter.set_volume (0.25, 0.025);
    assert (!meter.read (peak, volume));
    assert (near (peak, 0.8) && volume == 1.0f);

    /* within the meter delay: may still hold samples played at 1.0 */
    meter.add_period (0.8, 0.035);
    meter.add_period (0.2, 0.045);
    assert (!meter.read (peak, volume));
    assert (near (peak, 0.8) && volume == 1.0f);

    /* after the delay: the new volume */
    meter.add_period (0.2, 0.06);
    meter.add_period (0.2, 0.07);
    assert (!meter.read (peak, volume));
    assert (near (peak, 0.2) && volume == 0.25f);

    /* the loudest period relative to its volume wins */
    meter.set_volume (0.5, 0.08);
    meter.add_period (0.3, 0.12);
    assert (!meter.read (peak, volume));
    assert (near (peak, 0.2) && volume == 0.25f);

    meter.set_error (Error ("capture failed"));
    Error err = meter.read (peak, volume);
    assert (err);
    printf ("meter error: %s\n", err.message());
    meter.add_period (0.3, 0.15);
    assert (!meter.read (peak, volume));
  }

  /* pre-volume meter: unchanged */
  {
    FakeEndpoint ep (0.5, false);
    ep.content_peak = 0.4;
    assert (near (ep.peak_level(), 0.4));
  }

  /* failures */
  {
    FakeEndpoint ep (0.7);
    ep.content_peak = 0.4;
    ep.fail_peak = true;
    assert (ep.peak_level() == 0);

    ep.fail_read = true;
    ep.device_volume = 0.2;
    assert (near (ep.volume(), 0.7));     /* last known volume */

    ep.fail_write = true;
    ep.set_volume (0.3);
    assert (ep.writes.empty());
    assert (near (ep.last_set_volume(), 0.7));
  }

  /* set_volume clamps and ignores NaN */
  {
    FakeEndpoint ep (0.5);
    ep.set_volume (1.5);
    assert (ep.writes.back() == 1.0);
    ep.set_volume (-1);
    assert (ep.writes.back() == 0.0);
    ep.set_volume (NAN);
    assert (ep.writes.size() == 2);
    assert (ep.last_set_volume() == 0.0);
  }

  /* user change detection */
  {
    FakeEndpoint ep (0.5);
    assert (!ep.has_user_change());
    assert (!ep.detect_user_change (1.0));

    ep.set_volume (0.3);
    assert (!ep.detect_user_change (2.0));

    /* below epsilon: ignored */
    ep.device_volume = 0.305;
    assert (!ep.detect_user_change (3.0));

    ep.device_volume = 0.8;
    assert (ep.detect_user_change (4.0));
    assert (ep.has_user_change());
    assert (ep.user_set_time() == 4.0);
    assert (near (ep.user_set_volume(), 0.8));
    assert (near (ep.last_set_volume(), 0.8));

    /* reported once */
    assert (!ep.detect_user_change (5.0));
    assert (ep.user_set_time() == 4.0);

    /* out of range device values are clamped */
    ep.device_volume = 1.7;
    assert (ep.detect_user_change (6.0));
    assert (ep.user_set_volume() == 1.0);
  }
  printf ("endpoint tests passed\n");
  return 0;
}
