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
 * Audio Pipeline - Opus packets to the WAV byte stream the service expects
 *
 * Pipeline:
 *   1. vasr_audio_decode_packets()   Opus packets -> 16 kHz mono PCM
 *   2. vasr_audio_build_container()  PCM -> RIFF/WAVE (44-byte header + samples)
 *   3. vasr_audio_container_info()   read format back to size upload segments
 *
 * Packet decode failures are logged and the packet is skipped; the remaining
 * packets still contribute their samples in order.
 */

#ifndef VASR_AUDIO_PIPELINE_H
#define VASR_AUDIO_PIPELINE_H

#include <stddef.h>
#include <stdint.h>

#include "audio/opus_codec.h"

#ifdef __cplusplus
extern "C" {
#endif

#define VASR_WAV_HEADER_SIZE 44

/* WAV File Header Structure (44 bytes, little-endian fields) */
typedef struct __attribute__((packed)) {
   char riff_header[4];      // "RIFF"
   uint32_t wav_size;        // File size - 8 bytes
   char wave_header[4];      // "WAVE"
   char fmt_header[4];       // "fmt "
   uint32_t fmt_chunk_size;  // Format chunk size (16 for PCM)
   uint16_t audio_format;    // Audio format (1 = PCM)
   uint16_t num_channels;    // Number of channels
   uint32_t sample_rate;     // Sample rate in Hz
   uint32_t byte_rate;       // Bytes per second
   uint16_t block_align;     // Bytes per sample frame
   uint16_t bits_per_sample; // Bits per sample
   char data_header[4];      // "data"
   uint32_t data_bytes;      // Size of audio data
} vasr_wav_header_t;

/**
 * @brief One compressed audio packet (borrowed bytes)
 */
typedef struct {
   const uint8_t *data;
   size_t len;
} vasr_packet_t;

/**
 * @brief Decoded PCM (release with vasr_pcm_free())
 */
typedef struct {
   int16_t *samples;       /**< Concatenated samples in packet order */
   size_t num_samples;     /**< Total samples (mono) */
   size_t packets_decoded; /**< Packets that contributed samples */
   size_t packets_skipped; /**< Packets dropped after a codec error */
} vasr_pcm_t;

/**
 * @brief WAV container (release with vasr_audio_container_free())
 */
typedef struct {
   uint8_t *data; /**< Header followed by sample data */
   size_t size;   /**< Total bytes */
} vasr_audio_container_t;

/**
 * @brief Format read back from a container header
 */
typedef struct {
   int channels;
   int sample_width; /**< Bytes per sample */
   int sample_rate;
   size_t frames;     /**< Sample frames in the data chunk */
   size_t data_bytes; /**< Bytes in the data chunk */
} vasr_wav_info_t;

/**
 * @brief Decode packets to 16 kHz mono PCM
 *
 * Each packet is decoded with a frame size of VASR_OPUS_FRAME_SIZE samples.
 * A packet the codec rejects is logged at warning level and skipped.
 *
 * @param codec Codec operations (NULL selects vasr_opus_codec_ops)
 * @param packets Packets in playback order (may be NULL when count is 0)
 * @param count Number of packets
 * @param pcm_out Receives the samples (release with vasr_pcm_free())
 * @return VASR_SUCCESS, VASR_ERR_INVALID_PARAM, VASR_ERR_CODEC (decoder could
 *         not be created), VASR_ERR_OUT_OF_MEMORY
 */
int vasr_audio_decode_packets(const vasr_codec_ops_t *codec,
                              const vasr_packet_t *packets,
                              size_t count,
                              vasr_pcm_t *pcm_out);

/**
 * @brief Wrap PCM samples in a mono/16-bit/16 kHz WAV container
 *
 * @param samples Samples (may be NULL when num_samples is 0)
 * @param num_samples Sample count
 * @param container_out Receives the container (release with vasr_audio_container_free())
 * @return VASR_SUCCESS, VASR_ERR_INVALID_PARAM, VASR_ERR_OUT_OF_MEMORY
 */
int vasr_audio_build_container(const int16_t *samples,
                               size_t num_samples,
                               vasr_audio_container_t *container_out);

/**
 * @brief Read the format of a WAV container
 *
 * @param data Container bytes
 * @param size Container length
 * @param info_out Receives the format
 * @return VASR_SUCCESS, VASR_ERR_INVALID_PARAM, VASR_ERR_DECODE (not a PCM WAV)
 */
int vasr_audio_container_info(const uint8_t *data, size_t size, vasr_wav_info_t *info_out);

/**
 * @brief Bytes of audio covering a duration
 *
 * channels * sample_width * sample_rate * duration_ms / 1000
 *
 * @param info Container format
 * @param duration_ms Segment duration
 * @return Segment size in bytes (0 if the format or duration is invalid)
 */
size_t vasr_audio_segment_size(const vasr_wav_info_t *info, int duration_ms);

/**
 * @brief Write a container to disk as asr_<session_id>_<uuid>.wav
 *
 * Creates the directory (and parents) if needed.
 *
 * @param dir Output directory
 * @param session_id Identifier embedded in the file name
 * @param container Container to write
 * @param path_out Receives the written path (may be NULL)
 * @param path_size Size of path_out
 * @return VASR_SUCCESS, VASR_ERR_INVALID_PARAM, VASR_ERR_UNKNOWN (I/O failure)
 */
int vasr_audio_save_wav(const char *dir,
                        const char *session_id,
                        const vasr_audio_container_t *container,
                        char *path_out,
                        size_t path_size);

void vasr_pcm_free(vasr_pcm_t *pcm);
void vasr_audio_container_free(vasr_audio_container_t *container);

#ifdef __cplusplus
}
#endif

#endif /* VASR_AUDIO_PIPELINE_H */
