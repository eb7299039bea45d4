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
 * Transport Abstraction - message-framed duplex connection to the ASR service
 *
 * The session orchestrator only sees this vtable. Each message sent or
 * received is one complete protocol frame; ordering is preserved.
 *
 * Implementations derive their handle from struct vasr_transport and set
 * ops in open():
 * @code
 * struct MyTransport : vasr_transport {
 *    // Implementation-specific fields...
 * };
 * @endcode
 *
 * Thread Safety:
 *   - open/send/receive/close must be called from one thread
 *   - interrupt() may be called from any thread while another thread is
 *     blocked in send/receive
 */

#ifndef VASR_TRANSPORT_H
#define VASR_TRANSPORT_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define VASR_HOST_SIZE 256
#define VASR_PATH_SIZE 256
#define VASR_AUTH_SIZE 512

/**
 * @brief Connection parameters
 */
typedef struct {
   char host[VASR_HOST_SIZE];
   uint16_t port;
   char path[VASR_PATH_SIZE];
   bool use_ssl;
   bool ssl_verify;
   char ca_cert_path[VASR_PATH_SIZE]; /**< Empty for the system default */
   char authorization[VASR_AUTH_SIZE]; /**< Authorization header value */
   int connect_timeout_ms;
} vasr_transport_params_t;

typedef struct vasr_transport vasr_transport_t;

/**
 * @brief Transport operations
 *
 * All int-returning operations return VASR_SUCCESS or a VASR_ERR_* code:
 * open() reports VASR_ERR_CONNECTION, send()/receive() report
 * VASR_ERR_TRANSPORT (including timeouts and interrupts).
 */
typedef struct vasr_transport_ops {
   const char *name;

   int (*open)(const vasr_transport_params_t *params, vasr_transport_t **transport_out);

   int (*send)(vasr_transport_t *transport, const uint8_t *data, size_t len);

   /**
    * @brief Wait for one complete message
    *
    * @param data_out Receives a malloc'd copy of the message (caller frees)
    * @param len_out Receives the message length
    * @param timeout_ms Deadline for the message (<= 0 waits indefinitely)
    */
   int (*receive)(vasr_transport_t *transport,
                  uint8_t **data_out,
                  size_t *len_out,
                  int timeout_ms);

   /**
    * @brief Abort any blocked or future send/receive (thread-safe)
    */
   void (*interrupt)(vasr_transport_t *transport);

   /**
    * @brief Close the connection and free the handle (NULL is a no-op)
    */
   void (*close)(vasr_transport_t *transport);

   /**
    * @brief Describe the most recent failure (never NULL)
    */
   const char *(*last_error)(vasr_transport_t *transport);
} vasr_transport_ops_t;

/**
 * @brief Base structure for all transport handles
 */
struct vasr_transport {
   const vasr_transport_ops_t *ops;
};

typedef struct vasr_transport vasr_transport_base_t;

/**
 * @brief libwebsockets client transport (ws:// and wss://)
 */
extern const vasr_transport_ops_t vasr_ws_transport_ops;

#ifdef __cplusplus
}
#endif

#endif /* VASR_TRANSPORT_H */
