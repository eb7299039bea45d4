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
 */

#include "protocol/chunker.h"

#include <string.h>

#include "vasr.h"

extern "C" {

int vasr_chunker_init(vasr_chunker_t *chunker,
                      const uint8_t *data,
                      size_t len,
                      size_t chunk_size) {
   if (!chunker || chunk_size == 0 || (!data && len > 0))
      return VASR_ERR_INVALID_PARAM;

   memset(chunker, 0, sizeof(*chunker));
   chunker->data = data;
   chunker->len = len;
   chunker->chunk_size = chunk_size;
   return VASR_SUCCESS;
}

bool vasr_chunker_next(vasr_chunker_t *chunker, vasr_chunk_t *chunk_out) {
   if (!chunker || !chunk_out || chunker->done || chunker->chunk_size == 0)
      return false;

   chunk_out->data = chunker->data ? chunker->data + chunker->offset : NULL;

   /* Strictly less-than: an exact multiple ends on a full-size final chunk */
   if (chunker->offset + chunker->chunk_size < chunker->len) {
      chunk_out->len = chunker->chunk_size;
      chunk_out->is_final = false;
      chunker->offset += chunker->chunk_size;
   } else {
      chunk_out->len = chunker->len - chunker->offset;
      chunk_out->is_final = true;
      chunker->offset = chunker->len;
      chunker->done = true;
   }

   chunker->index++;
   return true;
}

size_t vasr_chunker_count(size_t len, size_t chunk_size) {
   if (chunk_size == 0)
      return 0;
   if (len <= chunk_size)
      return 1;
   return (len + chunk_size - 1) / chunk_size;
}

} /* extern "C" */
