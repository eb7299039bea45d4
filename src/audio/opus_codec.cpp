/*
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
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 *
 * libopus decoder operations
 */

#include "audio/opus_codec.h"

#include <opus/opus.h>

#include "logging.h"

namespace {

void *opus_codec_create(int sample_rate, int channels) {
   int error = OPUS_OK;
   OpusDecoder *decoder = opus_decoder_create(sample_rate, channels, &error);
   if (!decoder || error != OPUS_OK) {
      VASR_LOG_ERROR("Failed to create Opus decoder (%d Hz, %d ch): %s", sample_rate, channels,
                     opus_strerror(error));
      return nullptr;
   }
   return decoder;
}

int opus_codec_decode(void *decoder,
                      const uint8_t *packet,
                      size_t len,
                      int16_t *pcm_out,
                      int frame_size) {
   if (!decoder || !pcm_out)
      return OPUS_BAD_ARG;
   if (len > VASR_OPUS_MAX_PACKET_SIZE)
      return OPUS_INVALID_PACKET;

   /* A zero-length packet asks libopus for loss concealment */
   return opus_decode(static_cast<OpusDecoder *>(decoder), len > 0 ? packet : nullptr,
                      (opus_int32)len, pcm_out, frame_size, 0);
}

const char *opus_codec_strerror(int error) {
   return opus_strerror(error);
}

void opus_codec_destroy(void *decoder) {
   if (decoder)
      opus_decoder_destroy(static_cast<OpusDecoder *>(decoder));
}

}  // namespace

extern "C" {

const vasr_codec_ops_t vasr_opus_codec_ops = {
   "opus", opus_codec_create, opus_codec_decode, opus_codec_strerror, opus_codec_destroy,
};

} /* extern "C" */
