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
 * Voice Codec Abstraction - decode-only packet codec used by the audio pipeline
 *
 * The pipeline talks to the codec through a small vtable so the decoder can
 * be swapped (tests use a scripted codec). vasr_opus_codec_ops is the libopus
 * implementation.
 *
 * Thread Safety:
 *   - Decoder instances are NOT thread-safe; create one per session
 *   - The ops tables themselves are immutable
 */

#ifndef VASR_OPUS_CODEC_H
#define VASR_OPUS_CODEC_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Largest Opus packet the decoder accepts */
#define VASR_OPUS_MAX_PACKET_SIZE 1276

/**
 * @brief Decode-only codec operations
 */
typedef struct vasr_codec_ops {
   const char *name; /**< Codec name for logging */

   /**
    * @brief Create a decoder instance
    * @return Decoder handle, or NULL on failure
    */
   void *(*create)(int sample_rate, int channels);

   /**
    * @brief Decode one packet
    *
    * @param decoder Decoder handle
    * @param packet Compressed packet
    * @param len Packet length
    * @param pcm_out Output samples (at least frame_size * channels)
    * @param frame_size Maximum samples per channel to produce
    * @return Samples per channel decoded, or a negative codec error
    */
   int (*decode)(void *decoder,
                 const uint8_t *packet,
                 size_t len,
                 int16_t *pcm_out,
                 int frame_size);

   /**
    * @brief Describe a negative decode() return value
    */
   const char *(*strerror)(int error);

   /**
    * @brief Destroy a decoder instance (NULL is a no-op)
    */
   void (*destroy)(void *decoder);
} vasr_codec_ops_t;

/**
 * @brief libopus decoder operations
 */
extern const vasr_codec_ops_t vasr_opus_codec_ops;

#ifdef __cplusplus
}
#endif

#endif /* VASR_OPUS_CODEC_H */
