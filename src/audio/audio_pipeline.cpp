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
 * Audio Pipeline Implementation
 */

#include "audio/audio_pipeline.h"

#include <endian.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <new>
#include <vector>

#include "logging.h"
#include "utils/string_utils.h"
#include "vasr.h"

static_assert(sizeof(vasr_wav_header_t) == VASR_WAV_HEADER_SIZE, "WAV header must be 44 bytes");

namespace {

/* Fill a canonical PCM header for data_bytes of mono/16-bit/16 kHz audio */
void fill_wav_header(vasr_wav_header_t *header, uint32_t data_bytes) {
   memcpy(header->riff_header, "RIFF", 4);
   header->wav_size = htole32(data_bytes + VASR_WAV_HEADER_SIZE - 8);
   memcpy(header->wave_header, "WAVE", 4);
   memcpy(header->fmt_header, "fmt ", 4);
   header->fmt_chunk_size = htole32(16);
   header->audio_format = htole16(1);
   header->num_channels = htole16(VASR_CHANNELS);
   header->sample_rate = htole32(VASR_SAMPLE_RATE);
   header->byte_rate = htole32(VASR_SAMPLE_RATE * VASR_CHANNELS * VASR_SAMPLE_WIDTH);
   header->block_align = htole16(VASR_CHANNELS * VASR_SAMPLE_WIDTH);
   header->bits_per_sample = htole16(VASR_SAMPLE_WIDTH * 8);
   memcpy(header->data_header, "data", 4);
   header->data_bytes = htole32(data_bytes);
}

/* Owns a codec instance for the duration of one decode pass */
class DecoderHandle {
 public:
   explicit DecoderHandle(const vasr_codec_ops_t *ops)
       : ops_(ops), decoder_(ops->create(VASR_SAMPLE_RATE, VASR_CHANNELS)) {}
   ~DecoderHandle() {
      if (decoder_)
         ops_->destroy(decoder_);
   }
   DecoderHandle(const DecoderHandle &) = delete;
   DecoderHandle &operator=(const DecoderHandle &) = delete;

   void *get() const {
      return decoder_;
   }

 private:
   const vasr_codec_ops_t *ops_;
   void *decoder_;
};

}  // namespace

extern "C" {

int vasr_audio_decode_packets(const vasr_codec_ops_t *codec,
                              const vasr_packet_t *packets,
                              size_t count,
                              vasr_pcm_t *pcm_out) {
   if (!pcm_out || (!packets && count > 0))
      return VASR_ERR_INVALID_PARAM;

   memset(pcm_out, 0, sizeof(*pcm_out));
   if (!codec)
      codec = &vasr_opus_codec_ops;

   try {
      DecoderHandle decoder(codec);
      if (!decoder.get()) {
         VASR_LOG_ERROR("Could not create %s decoder", codec->name);
         return VASR_ERR_CODEC;
      }

      std::vector<int16_t> samples;
      samples.reserve(count * VASR_OPUS_FRAME_SIZE);
      std::vector<int16_t> frame(VASR_OPUS_FRAME_SIZE * VASR_CHANNELS);

      for (size_t i = 0; i < count; i++) {
         int decoded = codec->decode(decoder.get(), packets[i].data, packets[i].len, frame.data(),
                                     VASR_OPUS_FRAME_SIZE);
         if (decoded < 0) {
            VASR_LOG_WARNING("%s decode error on packet %zu/%zu (%zu bytes): %s, skipping",
                             codec->name, i + 1, count, packets[i].len,
                             codec->strerror ? codec->strerror(decoded) : "unknown");
            pcm_out->packets_skipped++;
            continue;
         }
         samples.insert(samples.end(), frame.begin(), frame.begin() + decoded * VASR_CHANNELS);
         pcm_out->packets_decoded++;
      }

      pcm_out->samples = (int16_t *)malloc((samples.empty() ? 1 : samples.size()) *
                                           sizeof(int16_t));
      if (!pcm_out->samples) {
         VASR_LOG_ERROR("Failed to allocate %zu samples", samples.size());
         return VASR_ERR_OUT_OF_MEMORY;
      }
      if (!samples.empty())
         memcpy(pcm_out->samples, samples.data(), samples.size() * sizeof(int16_t));
      pcm_out->num_samples = samples.size();
   } catch (const std::bad_alloc &) {
      VASR_LOG_ERROR("Out of memory decoding %zu packets", count);
      vasr_pcm_free(pcm_out);
      return VASR_ERR_OUT_OF_MEMORY;
   }

   VASR_LOG_INFO("Decoded %zu/%zu %s packets into %zu samples (%.2f s)",
                 pcm_out->packets_decoded, count, codec->name, pcm_out->num_samples,
                 (double)pcm_out->num_samples / VASR_SAMPLE_RATE);
   return VASR_SUCCESS;
}

int vasr_audio_build_container(const int16_t *samples,
                               size_t num_samples,
                               vasr_audio_container_t *container_out) {
   if (!container_out || (!samples && num_samples > 0))
      return VASR_ERR_INVALID_PARAM;

   container_out->data = NULL;
   container_out->size = 0;

   size_t data_bytes = num_samples * VASR_SAMPLE_WIDTH;
   if (data_bytes > UINT32_MAX - VASR_WAV_HEADER_SIZE) {
      VASR_LOG_ERROR("Audio too long for a WAV container (%zu bytes)", data_bytes);
      return VASR_ERR_INVALID_PARAM;
   }

   uint8_t *buffer = (uint8_t *)malloc(VASR_WAV_HEADER_SIZE + data_bytes);
   if (!buffer) {
      VASR_LOG_ERROR("Failed to allocate %zu byte container", VASR_WAV_HEADER_SIZE + data_bytes);
      return VASR_ERR_OUT_OF_MEMORY;
   }

   vasr_wav_header_t header;
   fill_wav_header(&header, (uint32_t)data_bytes);
   memcpy(buffer, &header, VASR_WAV_HEADER_SIZE);

   /* Samples are little-endian on the wire */
   uint8_t *out = buffer + VASR_WAV_HEADER_SIZE;
   for (size_t i = 0; i < num_samples; i++) {
      uint16_t le = htole16((uint16_t)samples[i]);
      memcpy(out + i * VASR_SAMPLE_WIDTH, &le, VASR_SAMPLE_WIDTH);
   }

   container_out->data = buffer;
   container_out->size = VASR_WAV_HEADER_SIZE + data_bytes;
   return VASR_SUCCESS;
}

int vasr_audio_container_info(const uint8_t *data, size_t size, vasr_wav_info_t *info_out) {
   if (!data || !info_out)
      return VASR_ERR_INVALID_PARAM;
   if (size < VASR_WAV_HEADER_SIZE) {
      VASR_LOG_WARNING("Container shorter than a WAV header (%zu bytes)", size);
      return VASR_ERR_DECODE;
   }

   vasr_wav_header_t header;
   memcpy(&header, data, VASR_WAV_HEADER_SIZE);

   if (memcmp(header.riff_header, "RIFF", 4) != 0 || memcmp(header.wave_header, "WAVE", 4) != 0 ||
       memcmp(header.fmt_header, "fmt ", 4) != 0 || memcmp(header.data_header, "data", 4) != 0 ||
       le16toh(header.audio_format) != 1) {
      VASR_LOG_WARNING("Container is not a canonical PCM WAV");
      return VASR_ERR_DECODE;
   }

   info_out->channels = le16toh(header.num_channels);
   info_out->sample_width = le16toh(header.bits_per_sample) / 8;
   info_out->sample_rate = (int)le32toh(header.sample_rate);

   size_t data_bytes = le32toh(header.data_bytes);
   size_t available = size - VASR_WAV_HEADER_SIZE;
   if (data_bytes > available)
      data_bytes = available;
   info_out->data_bytes = data_bytes;

   size_t frame_bytes = (size_t)info_out->channels * (size_t)info_out->sample_width;
   info_out->frames = frame_bytes > 0 ? data_bytes / frame_bytes : 0;
   return VASR_SUCCESS;
}

size_t vasr_audio_segment_size(const vasr_wav_info_t *info, int duration_ms) {
   if (!info || duration_ms <= 0 || info->channels <= 0 || info->sample_width <= 0 ||
       info->sample_rate <= 0)
      return 0;

   size_t size_per_sec = (size_t)info->channels * (size_t)info->sample_width *
                         (size_t)info->sample_rate;
   return size_per_sec * (size_t)duration_ms / 1000;
}

int vasr_audio_save_wav(const char *dir,
                        const char *session_id,
                        const vasr_audio_container_t *container,
                        char *path_out,
                        size_t path_size) {
   if (!dir || dir[0] == '\0' || !container || !container->data)
      return VASR_ERR_INVALID_PARAM;

   if (vasr_mkdir_p(dir) != 0)
      return VASR_ERR_UNKNOWN;

   char uuid[VASR_UUID_SIZE];
   if (vasr_generate_uuid(uuid) != 0)
      return VASR_ERR_UNKNOWN;

   char path[4096];
   int n = snprintf(path, sizeof(path), "%s/asr_%s_%s.wav", dir,
                    session_id && session_id[0] ? session_id : "session", uuid);
   if (n < 0 || (size_t)n >= sizeof(path)) {
      VASR_LOG_ERROR("Output path too long");
      return VASR_ERR_INVALID_PARAM;
   }

   FILE *fp = fopen(path, "wb");
   if (!fp) {
      VASR_LOG_ERROR("Cannot open %s: %s", path, strerror(errno));
      return VASR_ERR_UNKNOWN;
   }

   size_t written = fwrite(container->data, 1, container->size, fp);
   int close_ret = fclose(fp);
   if (written != container->size || close_ret != 0) {
      VASR_LOG_ERROR("Short write to %s (%zu/%zu bytes)", path, written, container->size);
      remove(path);
      return VASR_ERR_UNKNOWN;
   }

   if (path_out && path_size > 0)
      safe_strncpy(path_out, path, path_size);

   VASR_LOG_INFO("Saved %zu bytes of audio to %s", container->size, path);
   return VASR_SUCCESS;
}

void vasr_pcm_free(vasr_pcm_t *pcm) {
   if (!pcm)
      return;
   free(pcm->samples);
   pcm->samples = NULL;
   pcm->num_samples = 0;
}

void vasr_audio_container_free(vasr_audio_container_t *container) {
   if (!container)
      return;
   free(container->data);
   container->data = NULL;
   container->size = 0;
}

} /* extern "C" */
