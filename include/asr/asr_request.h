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
 * Session Request Builder - the JSON document sent in the FullRequest frame
 */

#ifndef VASR_ASR_REQUEST_H
#define VASR_ASR_REQUEST_H

#include "protocol/frame_codec.h"
#include "utils/string_utils.h"

/* Forward declaration for json-c */
struct json_object;
typedef struct json_object json_object;

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Values that vary per deployment
 */
typedef struct {
   const char *appid;
   const char *cluster;
   const char *token;
   const char *language;
} vasr_request_params_t;

/**
 * @brief Build the session configuration document
 *
 * Layout:
 * @code
 * { "app":     { "appid", "cluster", "token" },
 *   "user":    { "uid" },
 *   "request": { "reqid", "show_utterances": false, "sequence": 1 },
 *   "audio":   { "format": "wav", "rate": 16000, "language",
 *                "bits": 16, "channel": 1, "codec": "raw" } }
 * @endcode
 * uid and reqid are fresh random UUIDs on every call.
 *
 * @param params Deployment values (all non-NULL)
 * @param reqid_out Receives the request id (VASR_UUID_SIZE bytes, may be NULL)
 * @param doc_out Receives the document (caller releases with json_object_put())
 * @return VASR_SUCCESS, VASR_ERR_INVALID_PARAM, VASR_ERR_OUT_OF_MEMORY, VASR_ERR_UNKNOWN
 */
int vasr_request_build(const vasr_request_params_t *params,
                       char *reqid_out,
                       json_object **doc_out);

/**
 * @brief Build the document and serialize it to compact JSON
 *
 * @param params Deployment values
 * @param reqid_out Receives the request id (may be NULL)
 * @param out Receives the JSON text without terminator (caller frees)
 * @return Same codes as vasr_request_build()
 */
int vasr_request_build_payload(const vasr_request_params_t *params,
                               char *reqid_out,
                               vasr_buffer_t *out);

#ifdef __cplusplus
}
#endif

#endif /* VASR_ASR_REQUEST_H */
