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
 * Logging - callback dispatch and the built-in console/file sink
 */

#include "logging.h"

#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <sys/time.h>
#include <time.h>

#include <mutex>

#include "vasr.h"

namespace {

vasr_log_callback_t g_log_callback = nullptr;

/* Built-in sink state */
std::mutex g_sink_mutex;
FILE *g_log_fp = nullptr;
vasr_log_level_t g_min_level = VASR_LOG_INFO;

const char *level_tag(vasr_log_level_t level) {
   switch (level) {
      case VASR_LOG_DEBUG:
         return "DEBUG";
      case VASR_LOG_INFO:
         return "INFO";
      case VASR_LOG_WARNING:
         return "WARN";
      case VASR_LOG_ERROR:
         return "ERROR";
   }
   return "?";
}

/* Strip directories so lines stay short: "src/asr/asr_session.cpp" -> "asr_session.cpp" */
const char *base_name(const char *path) {
   const char *slash = strrchr(path, '/');
   return slash ? slash + 1 : path;
}

void default_sink(vasr_log_level_t level,
                  const char *file,
                  int line,
                  const char *func,
                  const char *fmt,
                  va_list args) {
   if (level < g_min_level)
      return;

   struct timeval tv;
   gettimeofday(&tv, NULL);
   struct tm tm_info;
   localtime_r(&tv.tv_sec, &tm_info);
   char stamp[32];
   strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_info);

   std::lock_guard<std::mutex> lock(g_sink_mutex);
   FILE *out = g_log_fp ? g_log_fp : stderr;
   fprintf(out, "[%s.%03ld] [%-5s] %s:%d %s(): ", stamp, (long)(tv.tv_usec / 1000),
           level_tag(level), base_name(file), line, func);
   vfprintf(out, fmt, args);
   fputc('\n', out);
   fflush(out);
}

}  // namespace

extern "C" {

void vasr_set_logger(vasr_log_callback_t callback) {
   g_log_callback = callback;
}

int vasr_logging_init(const char *log_file, vasr_log_level_t min_level) {
   int ret = 0;
   {
      std::lock_guard<std::mutex> lock(g_sink_mutex);
      g_min_level = min_level;
      if (g_log_fp) {
         fclose(g_log_fp);
         g_log_fp = nullptr;
      }
      if (log_file && log_file[0] != '\0') {
         g_log_fp = fopen(log_file, "a");
         if (!g_log_fp) {
            ret = 1;
         }
      }
   }
   g_log_callback = default_sink;

   if (ret != 0) {
      VASR_LOG_WARNING("Could not open log file %s, logging to stderr", log_file);
   }
   return ret;
}

void vasr_logging_close(void) {
   std::lock_guard<std::mutex> lock(g_sink_mutex);
   if (g_log_fp) {
      fclose(g_log_fp);
      g_log_fp = nullptr;
   }
}

int vasr_log_level_from_string(const char *name, vasr_log_level_t *level_out) {
   if (!name || !level_out)
      return 1;

   if (strcasecmp(name, "debug") == 0) {
      *level_out = VASR_LOG_DEBUG;
   } else if (strcasecmp(name, "info") == 0) {
      *level_out = VASR_LOG_INFO;
   } else if (strcasecmp(name, "warning") == 0 || strcasecmp(name, "warn") == 0) {
      *level_out = VASR_LOG_WARNING;
   } else if (strcasecmp(name, "error") == 0) {
      *level_out = VASR_LOG_ERROR;
   } else {
      return 1;
   }
   return 0;
}

void vasr_log(vasr_log_level_t level,
              const char *file,
              int line,
              const char *func,
              const char *fmt,
              ...) {
   vasr_log_callback_t callback = g_log_callback;
   if (!callback)
      return;

   va_list args;
   va_start(args, fmt);
   callback(level, file, line, func, fmt, args);
   va_end(args);
}

const char *vasr_error_string(int error) {
   switch (error) {
      case VASR_SUCCESS:
         return "success";
      case VASR_ERR_INVALID_PARAM:
         return "invalid parameter";
      case VASR_ERR_OUT_OF_MEMORY:
         return "out of memory";
      case VASR_ERR_CONNECTION:
         return "connection error";
      case VASR_ERR_TRANSPORT:
         return "transport error";
      case VASR_ERR_DECODE:
         return "decode error";
      case VASR_ERR_REMOTE:
         return "remote error";
      case VASR_ERR_CODEC:
         return "codec error";
      case VASR_ERR_CONFIG:
         return "configuration error";
      case VASR_ERR_UNKNOWN:
         return "unknown error";
   }
   return "unrecognized error code";
}

} /* extern "C" */
