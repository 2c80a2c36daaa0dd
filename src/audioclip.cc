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

#include "audioclip.hh"

#include <sndfile.h>
#include <math.h>

using std::string;
using std::vector;

AudioClip::AudioClip()
{
}

AudioClip::AudioClip (const vector<float>& samples, int n_channels, int sample_rate, int bit_depth)
{
  m_samples     = samples;
  m_n_channels  = n_channels;
  m_sample_rate = sample_rate;
  m_bit_depth   = bit_depth;
}

static int
sf_format_bit_depth (int format)
{
  switch (format & SF_FORMAT_SUBMASK)
    {
      case SF_FORMAT_PCM_U8:
      case SF_FORMAT_PCM_S8:
          return 8;

      case SF_FORMAT_PCM_16:
          return 16;

      case SF_FORMAT_PCM_24:
          return 24;

      case SF_FORMAT_PCM_32:
      case SF_FORMAT_FLOAT:
          return 32;

      case SF_FORMAT_DOUBLE:
          return 64;

      default:
          return 32; /* unknown */
    }
}

Error
AudioClip::load (const string& filename)
{
  SF_INFO sfinfo = { 0, };

  SNDFILE *sndfile = sf_open (filename.c_str(), SFM_READ, &sfinfo);
  if (sf_error (sndfile))
    {
      Error err (sf_strerror (sndfile));
      if (sndfile)
        sf_close (sndfile);
      return err;
    }
  if (sfinfo.channels < 1 || sfinfo.samplerate < 1)
    {
      sf_close (sndfile);
      return Error ("unsupported audio format");
    }

  m_samples.clear(); // get rid of old contents
  m_n_channels  = sfinfo.channels;
  m_sample_rate = sfinfo.samplerate;
  m_bit_depth   = sf_format_bit_depth (sfinfo.format);

  const bool read_float_data = (sfinfo.format & SF_FORMAT_SUBMASK) == SF_FORMAT_FLOAT ||
                               (sfinfo.format & SF_FORMAT_SUBMASK) == SF_FORMAT_DOUBLE;
  const size_t block_frames = 1024;
  vector<float> fsamples (block_frames * m_n_channels);
  vector<int>   isamples (block_frames * m_n_channels);
  for (;;)
    {
      sf_count_t r_count;
      if (read_float_data)
        {
          r_count = sf_readf_float (sndfile, fsamples.data(), block_frames);
        }
      else
        {
          /* use the int API to get the same normalization for reading and writing */
          r_count = sf_readf_int (sndfile, isamples.data(), block_frames);

          const double norm = 1.0 / 0x80000000LL;
          for (sf_count_t i = 0; i < r_count * m_n_channels; i++)
            fsamples[i] = isamples[i] * norm;
        }
      if (sf_error (sndfile))
        {
          Error err (sf_strerror (sndfile));
          sf_close (sndfile);
          return err;
        }
      if (r_count <= 0)
        break;

      m_samples.insert (m_samples.end(), fsamples.begin(), fsamples.begin() + r_count * m_n_channels);
    }
  sf_close (sndfile);
  return Error::Code::NONE;
}

Error
AudioClip::save (const string& filename) const
{
  SF_INFO sfinfo = { 0, };
  sfinfo.samplerate = m_sample_rate;
  sfinfo.channels   = m_n_channels;
  sfinfo.format     = SF_FORMAT_WAV | (m_bit_depth > 16 ? SF_FORMAT_PCM_24 : SF_FORMAT_PCM_16);

  SNDFILE *sndfile = sf_open (filename.c_str(), SFM_WRITE, &sfinfo);
  if (sf_error (sndfile))
    {
      string msg = sf_strerror (sndfile);
      if (sndfile)
        sf_close (sndfile);
      return Error (msg);
    }

  vector<int> isamples (m_samples.size());
  for (size_t i = 0; i < m_samples.size(); i++)
    {
      const double norm      =  0x80000000LL;
      const double min_value = -0x80000000LL;
      const double max_value =  0x7FFFFFFF;

      isamples[i] = lrint (bound<double> (min_value, m_samples[i] * norm, max_value));
    }

  const sf_count_t frames = n_frames();
  const sf_count_t count = sf_writef_int (sndfile, isamples.data(), frames);
  if (sf_error (sndfile))
    {
      Error err (sf_strerror (sndfile));
      sf_close (sndfile);
      return err;
    }
  if (sf_close (sndfile))
    return Error ("sf_close returned an error");

  if (count != frames)
    return Error ("writing sample data failed: short write");

  return Error::Code::NONE;
}

int
AudioClip::sample_rate() const
{
  return m_sample_rate;
}

int
AudioClip::bit_depth() const
{
  return m_bit_depth;
}

float
AudioClip::peak (size_t start_frame, size_t end_frame) const
{
  end_frame = std::min (end_frame, n_frames());

  float maximum = 0;
  for (size_t i = start_frame * m_n_channels; i < end_frame * m_n_channels; i++)
    maximum = std::max (maximum, fabsf (m_samples[i]));
  return maximum;
}
