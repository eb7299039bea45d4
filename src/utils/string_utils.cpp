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

#include "utils/string_utils.h"

#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <sys/random.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <string>

#include "logging.h"

extern "C" {

int vasr_generate_uuid(char *uuid) {
   if (!uuid)
      return 1;

   uint8_t bytes[16];
   size_t filled = 0;
   while (filled < sizeof(bytes)) {
      ssize_t n = getrandom(bytes + filled, sizeof(bytes) - filled, 0);
      if (n < 0) {
         if (errno == EINTR)
            continue;
         VASR_LOG_ERROR("getrandom failed: %s", strerror(errno));
         uuid[0] = '\0';
         return 1;
      }
      filled += (size_t)n;
   }

   bytes[6] = (uint8_t)((bytes[6] & 0x0F) | 0x40); /* version 4 */
   bytes[8] = (uint8_t)((bytes[8] & 0x3F) | 0x80); /* RFC 4122 variant */

   snprintf(uuid, VASR_UUID_SIZE,
            "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x", bytes[0],
            bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7], bytes[8],
            bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
   return 0;
}

int vasr_mkdir_p(const char *path) {
   if (!path || path[0] == '\0')
      return 1;

   std::string partial;
   std::string full(path);
   size_t pos = 0;
   while (pos != std::string::npos) {
      pos = full.find('/', pos + 1);
      partial = full.substr(0, pos);
      if (partial.empty())
         continue;
      if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
         VASR_LOG_ERROR("Cannot create directory %s: %s", partial.c_str(), strerror(errno));
         return 1;
      }
   }

   struct stat st;
   if (stat(path, &st) != 0 || !S_ISDIR(st.st_mode)) {
      VASR_LOG_ERROR("%s is not a directory", path);
      return 1;
   }
   return 0;
}

void vasr_mask_secret(const char *secret, char *out, size_t out_size) {
   if (!out || out_size == 0)
      return;
   if (!secret || secret[0] == '\0') {
      safe_strncpy(out, "(not set)", out_size);
      return;
   }
   if (strlen(secret) <= 4) {
      safe_strncpy(out, "****", out_size);
      return;
   }
   snprintf(out, out_size, "%.4s****", secret);
}

} /* extern "C" */
