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
 * Chunker - single-pass segmentation of the audio upload
 *
 * Usage:
 *   vasr_chunker_t chunker;
 *   vasr_chunker_init(&chunker, data, len, segment_size);
 *   vasr_chunk_t chunk;
 *   while (vasr_chunker_next(&chunker, &chunk)) { ... send chunk ... }
 *
 * Every chunk is exactly chunk_size bytes except the last, which holds the
 * remainder (0..chunk_size bytes) and is the only one with is_final set.
 * An empty input yields a single empty final chunk.
 */

#ifndef VASR_CHUNKER_H
#define VASR_CHUNKER_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief One slice of the input (points into the caller's buffer)
 */
typedef struct {
   const uint8_t *data;
   size_t len;
   bool is_final;
} vasr_chunk_t;

/**
 * @brief Chunker state (stack-allocated, not restartable)
 */
typedef struct {
   const uint8_t *data;
   size_t len;
   size_t chunk_size;
   size_t offset;
   size_t index; /**< Chunks produced so far */
   bool done;
} vasr_chunker_t;

/**
 * @brief Prepare a chunker over a buffer
 *
 * The buffer must outlive the chunker.
 *
 * @param chunker Chunker to initialize
 * @param data Input bytes (may be NULL when len is 0)
 * @param len Input length
 * @param chunk_size Maximum chunk length, must be > 0
 * @return VASR_SUCCESS, or VASR_ERR_INVALID_PARAM (chunk_size 0, NULL data with len > 0)
 */
int vasr_chunker_init(vasr_chunker_t *chunker,
                      const uint8_t *data,
                      size_t len,
                      size_t chunk_size);

/**
 * @brief Produce the next chunk
 *
 * @param chunker Initialized chunker
 * @param chunk_out Receives the chunk
 * @return true if a chunk was produced, false once the final chunk has been returned
 */
bool vasr_chunker_next(vasr_chunker_t *chunker, vasr_chunk_t *chunk_out);

/**
 * @brief Number of chunks a buffer splits into
 *
 * @param len Input length
 * @param chunk_size Maximum chunk length (> 0)
 * @return Chunk count (>= 1), or 0 if chunk_size is 0
 */
size_t vasr_chunker_count(size_t len, size_t chunk_size);

#ifdef __cplusplus
}
#endif

#endif /* VASR_CHUNKER_H */
