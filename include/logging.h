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
 * Logging Interface - Callback-based logging for the vasr library
 *
 * Library code logs through the VASR_LOG_* macros. Messages are handed to a
 * callback registered by the application. vasr_logging_init() installs the
 * built-in sink, which writes timestamped lines to stderr or to a log file.
 */

#ifndef VASR_LOGGING_H
#define VASR_LOGGING_H

#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Log level enumeration
 */
typedef enum {
   VASR_LOG_DEBUG = 0,
   VASR_LOG_INFO = 1,
   VASR_LOG_WARNING = 2,
   VASR_LOG_ERROR = 3,
} vasr_log_level_t;

/**
 * @brief Callback function type for logging
 *
 * @param level Log level
 * @param file Source file name (from __FILE__)
 * @param line Line number (from __LINE__)
 * @param func Function name (from __func__)
 * @param fmt Printf-style format string
 * @param args Variable arguments list
 */
typedef void (*vasr_log_callback_t)(vasr_log_level_t level,
                                    const char *file,
                                    int line,
                                    const char *func,
                                    const char *fmt,
                                    va_list args);

/**
 * @brief Set the logging callback
 *
 * If no callback is set, messages are discarded.
 *
 * Thread Safety: NOT thread-safe. Call once at initialization before any
 * other threads are started.
 *
 * @param callback The logging callback function, or NULL to disable logging
 */
void vasr_set_logger(vasr_log_callback_t callback);

/**
 * @brief Install the built-in console/file sink
 *
 * @param log_file Path to append to, or NULL/"" for stderr
 * @param min_level Messages below this level are dropped
 * @return 0 on success, 1 if the log file could not be opened (stderr is used)
 */
int vasr_logging_init(const char *log_file, vasr_log_level_t min_level);

/**
 * @brief Close the log file opened by vasr_logging_init()
 */
void vasr_logging_close(void);

/**
 * @brief Parse a level name ("debug", "info", "warning", "error")
 *
 * @param name Level name (case-insensitive)
 * @param level_out Receives the parsed level
 * @return 0 on success, 1 if the name is not recognized
 */
int vasr_log_level_from_string(const char *name, vasr_log_level_t *level_out);

/**
 * @brief Internal logging function - do not call directly
 *
 * Use the VASR_LOG_* macros instead.
 */
void vasr_log(vasr_log_level_t level,
              const char *file,
              int line,
              const char *func,
              const char *fmt,
              ...) __attribute__((format(printf, 5, 6)));

#define VASR_LOG_DEBUG(fmt, ...) \
   vasr_log(VASR_LOG_DEBUG, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define VASR_LOG_INFO(fmt, ...) \
   vasr_log(VASR_LOG_INFO, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define VASR_LOG_WARNING(fmt, ...) \
   vasr_log(VASR_LOG_WARNING, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#define VASR_LOG_ERROR(fmt, ...) \
   vasr_log(VASR_LOG_ERROR, __FILE__, __LINE__, __func__, fmt, ##__VA_ARGS__)

#ifdef __cplusplus
}
#endif

#endif /* VASR_LOGGING_H */
