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
 * String and identifier utilities
 */

#ifndef VASR_STRING_UTILS_H
#define VASR_STRING_UTILS_H

#include <stdbool.h>
#include <stddef.h>
#include <string.h>

#ifdef __cplusplus
extern "C" {
#endif

#define VASR_UUID_SIZE 37 /* UUID string with null terminator */

/**
 * @brief Safe string copy with guaranteed null-termination
 *
 * Unlike strncpy, this always null-terminates the destination buffer
 * and doesn't waste cycles padding with zeros.
 *
 * @param dest Destination buffer
 * @param src Source string (must be null-terminated)
 * @param size Size of destination buffer
 */
static inline void safe_strncpy(char *dest, const char *src, size_t size) {
   if (size == 0) {
      return;
   }
   size_t len = strlen(src);
   if (len >= size) {
      len = size - 1;
   }
   memcpy(dest, src, len);
   dest[len] = '\0';
}

/**
 * @brief Generate a random (version 4) UUID string
 *
 * Reads from the kernel CSPRNG. Thread-safe.
 *
 * @param uuid Buffer to receive the UUID (VASR_UUID_SIZE bytes)
 * @return 0 on success, 1 if no random bytes were available
 */
int vasr_generate_uuid(char *uuid);

/**
 * @brief Create a directory and any missing parents (like mkdir -p)
 *
 * @param path Directory path
 * @return 0 on success (or already present), 1 on failure
 */
int vasr_mkdir_p(const char *path);

/**
 * @brief Mask a secret for display: keeps the first 4 characters
 *
 * @param secret Secret value (may be NULL)
 * @param out Output buffer
 * @param out_size Size of output buffer
 */
void vasr_mask_secret(const char *secret, char *out, size_t out_size);

#ifdef __cplusplus
}
#endif

#endif /* VASR_STRING_UTILS_H */
