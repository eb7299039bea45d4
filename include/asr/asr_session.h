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
 * Recognition Session - one utterance in, recognized text out
 *
 * A session owns an immutable copy of the configuration and the transport and
 * codec operations to use. Each vasr_session_recognize() call runs the whole
 * exchange with the service over a connection of its own:
 *
 *   IDLE -> CONNECTED -> CONFIG_SENT -> STREAMING -> AWAITING_RESULT -> DONE
 *
 * Any failing transition moves to FAILED and records where it happened. The
 * connection is closed before the call returns, on every path.
 *
 * Thread Safety:
 *   - One vasr_session_recognize() call at a time per session
 *   - vasr_session_abort() may be called from any thread (not from a
 *     signal handler)
 *   - Distinct sessions share no state
 */

#ifndef VASR_ASR_SESSION_H
#define VASR_ASR_SESSION_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#include "audio/audio_pipeline.h"
#include "audio/opus_codec.h"
#include "config/vasr_config.h"
#include "network/transport.h"
#include "utils/string_utils.h"

#ifdef __cplusplus
extern "C" {
#endif

#define VASR_RESULT_MESSAGE_SIZE 256
#define VASR_RESULT_PATH_SIZE 512

typedef enum {
   VASR_STATE_IDLE = 0,
   VASR_STATE_CONNECTED,
   VASR_STATE_CONFIG_SENT,
   VASR_STATE_STREAMING,
   VASR_STATE_AWAITING_RESULT,
   VASR_STATE_DONE,
   VASR_STATE_FAILED,
} vasr_session_state_t;

/**
 * @brief Outcome of one recognition call (release with vasr_result_clear())
 */
typedef struct {
   char *text; /**< Recognized text, NULL on failure or when nothing was recognized */
   int error;  /**< VASR_SUCCESS or VASR_ERR_* */
   vasr_session_state_t failed_state; /**< State the call was in when it failed */
   bool has_remote_code;
   int64_t remote_code;                    /**< Service status when error is VASR_ERR_REMOTE */
   char message[VASR_RESULT_MESSAGE_SIZE]; /**< Service message or failure description */

   /* Diagnostics */
   char session_id[VASR_UUID_SIZE];
   size_t chunks_sent;
   size_t packets_skipped;
   long elapsed_ms;
   char audio_path[VASR_RESULT_PATH_SIZE]; /**< Saved WAV, empty if not saved */
} vasr_result_t;

typedef struct vasr_session vasr_session_t;

/**
 * @brief Create a session
 *
 * @param config Configuration (copied)
 * @param transport Transport operations (NULL selects vasr_ws_transport_ops)
 * @param codec Codec operations (NULL selects vasr_opus_codec_ops)
 * @return Session handle, or NULL on invalid parameters or allocation failure
 */
vasr_session_t *vasr_session_create(const vasr_config_t *config,
                                    const vasr_transport_ops_t *transport,
                                    const vasr_codec_ops_t *codec);

/**
 * @brief Recognize one utterance
 *
 * Decodes the packets, wraps the audio in a WAV container, and streams it to
 * the service in segment_duration_ms chunks. The last chunk carries the final
 * segment flag.
 *
 * A service that recognized nothing yields VASR_SUCCESS with text == NULL.
 * No text is returned on failure.
 *
 * @param session Session handle
 * @param packets Opus packets in playback order
 * @param count Number of packets
 * @param result Receives the outcome (always initialized when non-NULL)
 * @return result->error
 */
int vasr_session_recognize(vasr_session_t *session,
                           const vasr_packet_t *packets,
                           size_t count,
                           vasr_result_t *result);

/**
 * @brief Interrupt the call in progress
 *
 * The call fails with VASR_ERR_TRANSPORT at whatever state it reached. A
 * request made before a call starts fails that call before it connects. The
 * request is cleared when vasr_session_recognize() returns.
 */
void vasr_session_abort(vasr_session_t *session);

/**
 * @brief Destroy a session (NULL is a no-op)
 */
void vasr_session_destroy(vasr_session_t *session);

/**
 * @brief Free the text of a result and reset it
 */
void vasr_result_clear(vasr_result_t *result);

/**
 * @brief State name for logging ("idle", "connected", ...)
 */
const char *vasr_session_state_name(vasr_session_state_t state);

#ifdef __cplusplus
}
#endif

#endif /* VASR_ASR_SESSION_H */
