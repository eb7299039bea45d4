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
 * VASR - Common definitions and error codes
 */

#ifndef VASR_H
#define VASR_H

#define APPLICATION_NAME "vasr"
#define VASR_VERSION "1.0.0"

/* Linear audio format fixed by contract with the recognition service */
#define VASR_SAMPLE_RATE 16000
#define VASR_CHANNELS 1
#define VASR_SAMPLE_WIDTH 2   /* bytes per sample (16-bit) */
#define VASR_OPUS_FRAME_SIZE 960 /* samples per decode call */

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Return codes shared by all vasr modules
 *
 * Positive values: 0 is success, every
 * failure kind has its own code so the caller can tell where a session broke.
 */
typedef enum {
   VASR_SUCCESS = 0,           /**< Operation completed successfully */
   VASR_ERR_INVALID_PARAM = 1, /**< Invalid parameter provided */
   VASR_ERR_OUT_OF_MEMORY = 2, /**< Memory allocation failed */
   VASR_ERR_CONNECTION = 3,    /**< Could not establish the transport */
   VASR_ERR_TRANSPORT = 4,     /**< Send/receive failure or timeout mid-session */
   VASR_ERR_DECODE = 5,        /**< Malformed frame, bad compression or bad JSON */
   VASR_ERR_REMOTE = 6,        /**< Service returned a non-success status */
   VASR_ERR_CODEC = 7,         /**< Audio packet failed to decode */
   VASR_ERR_CONFIG = 8,        /**< Configuration missing or invalid */
   VASR_ERR_UNKNOWN = 9        /**< Unexpected failure */
} vasr_error_t;

/**
 * @brief Get a short name for an error code
 *
 * @param error Error code (vasr_error_t)
 * @return Static string, never NULL
 */
const char *vasr_error_string(int error);

#ifdef __cplusplus
}
#endif

#endif /* VASR_H */
