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
 * WebSocket Client Transport (libwebsockets)
 *
 * Each transport owns a private lws_context with a single client connection,
 * so concurrent sessions never share event loop state. The blocking
 * send/receive calls drive lws_service() on the calling thread until their
 * condition is met, the deadline passes, or interrupt() is called.
 *
 * lws_write() is only ever called from the WRITEABLE callback, which runs
 * inside lws_service() on the same thread.
 */

#include <libwebsockets.h>
#include <stdlib.h>
#include <string.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <new>
#include <string>
#include <vector>

#include "logging.h"
#include "network/transport.h"
#include "utils/string_utils.h"
#include "vasr.h"

namespace {

#define WS_PROTOCOL_NAME "vasr-asr"

constexpr int SERVICE_SLICE_MS = 50;
constexpr int SEND_TIMEOUT_MS = 30000;
constexpr int CLOSE_TIMEOUT_MS = 1000;

struct WsTransport : vasr_transport {
   vasr_transport_params_t params;
   struct lws_context *context = nullptr;
   struct lws *wsi = nullptr;

   std::atomic<bool> interrupted{ false };
   bool established = false;
   bool closed = false;
   bool failed = false;
   bool close_requested = false;

   /* Outgoing message, LWS_PRE bytes of headroom in front */
   std::vector<uint8_t> tx;
   size_t tx_len = 0;
   bool tx_pending = false;

   /* Incoming fragments are reassembled into complete messages */
   std::vector<uint8_t> rx_partial;
   std::deque<std::vector<uint8_t>> rx_queue;

   std::string error;
};

void lws_log_bridge(int level, const char *line) {
   std::string msg(line ? line : "");
   while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r'))
      msg.pop_back();

   if (level & LLL_ERR) {
      VASR_LOG_ERROR("lws: %s", msg.c_str());
   } else {
      VASR_LOG_WARNING("lws: %s", msg.c_str());
   }
}

std::once_flag g_lws_log_once;

int ws_callback(struct lws *wsi,
                enum lws_callback_reasons reason,
                void *user,
                void *in,
                size_t len) {
   struct lws_context *ctx = lws_get_context(wsi);
   WsTransport *t = ctx ? static_cast<WsTransport *>(lws_context_user(ctx)) : nullptr;
   if (!t)
      return lws_callback_http_dummy(wsi, reason, user, in, len);

   switch (reason) {
      case LWS_CALLBACK_CLIENT_APPEND_HANDSHAKE_HEADER: {
         if (t->params.authorization[0] == '\0')
            break;
         unsigned char **p = static_cast<unsigned char **>(in);
         unsigned char *end = *p + len;
         if (lws_add_http_header_by_name(
                 wsi, reinterpret_cast<const unsigned char *>("Authorization:"),
                 reinterpret_cast<const unsigned char *>(t->params.authorization),
                 (int)strlen(t->params.authorization), p, end)) {
            t->error = "authorization header does not fit in handshake";
            return -1;
         }
         break;
      }

      case LWS_CALLBACK_CLIENT_ESTABLISHED:
         t->established = true;
         VASR_LOG_INFO("Connected to %s:%u%s", t->params.host, t->params.port, t->params.path);
         break;

      case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
         t->failed = true;
         t->error = in ? static_cast<const char *>(in) : "connection error";
         t->wsi = nullptr;
         break;

      case LWS_CALLBACK_CLIENT_RECEIVE:
         try {
            const uint8_t *bytes = static_cast<const uint8_t *>(in);
            t->rx_partial.insert(t->rx_partial.end(), bytes, bytes + len);
            if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0) {
               t->rx_queue.push_back(std::move(t->rx_partial));
               t->rx_partial.clear();
            }
         } catch (const std::bad_alloc &) {
            t->failed = true;
            t->error = "out of memory reassembling message";
            return -1;
         }
         break;

      case LWS_CALLBACK_CLIENT_WRITEABLE:
         if (t->close_requested) {
            lws_close_reason(wsi, LWS_CLOSE_STATUS_NORMAL, nullptr, 0);
            return -1;
         }
         if (t->tx_pending) {
            int n = lws_write(wsi, t->tx.data() + LWS_PRE, t->tx_len, LWS_WRITE_BINARY);
            t->tx_pending = false;
            if (n < (int)t->tx_len) {
               t->failed = true;
               t->error = "short write on websocket";
               return -1;
            }
         }
         break;

      case LWS_CALLBACK_WS_PEER_INITIATED_CLOSE:
         if (len >= 2) {
            const uint8_t *code = static_cast<const uint8_t *>(in);
            VASR_LOG_INFO("Server closed the connection (status %u)",
                          (unsigned)((code[0] << 8) | code[1]));
         }
         break;

      case LWS_CALLBACK_CLIENT_CLOSED:
         t->closed = true;
         t->wsi = nullptr;
         break;

      default:
         return lws_callback_http_dummy(wsi, reason, user, in, len);
   }

   return 0;
}

const struct lws_protocols k_protocols[] = {
   { WS_PROTOCOL_NAME, ws_callback, 0, 0, 0, nullptr, 0 },
   { nullptr, nullptr, 0, 0, 0, nullptr, 0 },
};

/* Drive the event loop until done() holds. Returns VASR_SUCCESS or 1. */
template <typename Pred>
int service_until(WsTransport *t, Pred done, int timeout_ms, const char *what) {
   auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

   while (!done()) {
      if (t->interrupted.load()) {
         t->error = std::string(what) + " interrupted";
         return 1;
      }
      if (t->failed || t->closed) {
         if (t->error.empty())
            t->error = "connection closed by peer";
         return 1;
      }
      if (timeout_ms > 0 && std::chrono::steady_clock::now() >= deadline) {
         t->error = std::string(what) + " timed out after " + std::to_string(timeout_ms) + " ms";
         return 1;
      }
      if (lws_service(t->context, SERVICE_SLICE_MS) < 0) {
         t->failed = true;
         t->error = "event loop failure";
         return 1;
      }
   }
   return VASR_SUCCESS;
}

void ws_close(vasr_transport_t *transport) {
   if (!transport)
      return;
   WsTransport *t = static_cast<WsTransport *>(transport);

   if (t->context && t->wsi && t->established && !t->closed && !t->failed &&
       !t->interrupted.load()) {
      t->close_requested = true;
      lws_callback_on_writable(t->wsi);
      if (service_until(
              t, [t]() { return t->closed || t->wsi == nullptr; }, CLOSE_TIMEOUT_MS,
              "close") != VASR_SUCCESS) {
         VASR_LOG_DEBUG("Close handshake incomplete: %s", t->error.c_str());
      }
   }

   if (t->context) {
      lws_context_destroy(t->context);
      t->context = nullptr;
   }
   delete t;
}

int ws_open(const vasr_transport_params_t *params, vasr_transport_t **transport_out) {
   if (!params || !transport_out || params->host[0] == '\0')
      return VASR_ERR_INVALID_PARAM;
   *transport_out = nullptr;

   std::call_once(g_lws_log_once, []() { lws_set_log_level(LLL_ERR | LLL_WARN, lws_log_bridge); });

   WsTransport *t = new (std::nothrow) WsTransport();
   if (!t) {
      VASR_LOG_ERROR("Failed to allocate transport");
      return VASR_ERR_OUT_OF_MEMORY;
   }
   t->ops = &vasr_ws_transport_ops;
   t->params = *params;

   struct lws_context_creation_info info;
   memset(&info, 0, sizeof(info));
   info.port = CONTEXT_PORT_NO_LISTEN;
   info.protocols = k_protocols;
   info.gid = -1;
   info.uid = -1;
   info.user = t;
   if (params->use_ssl) {
      info.options |= LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
      if (params->ca_cert_path[0] != '\0')
         info.client_ssl_ca_filepath = t->params.ca_cert_path;
   }

   t->context = lws_create_context(&info);
   if (!t->context) {
      VASR_LOG_ERROR("Failed to create libwebsockets context");
      delete t;
      return VASR_ERR_CONNECTION;
   }

   struct lws_client_connect_info ccinfo;
   memset(&ccinfo, 0, sizeof(ccinfo));
   ccinfo.context = t->context;
   ccinfo.address = t->params.host;
   ccinfo.port = t->params.port;
   ccinfo.path = t->params.path;
   ccinfo.host = t->params.host;
   ccinfo.origin = t->params.host;
   ccinfo.protocol = nullptr; /* service does not negotiate a subprotocol */
   ccinfo.local_protocol_name = WS_PROTOCOL_NAME;
   ccinfo.pwsi = &t->wsi;
   if (params->use_ssl) {
      ccinfo.ssl_connection = LCCSCF_USE_SSL;
      if (!params->ssl_verify) {
         ccinfo.ssl_connection |= LCCSCF_ALLOW_SELFSIGNED | LCCSCF_SKIP_SERVER_CERT_HOSTNAME_CHECK |
                                  LCCSCF_ALLOW_EXPIRED;
      }
   }

   VASR_LOG_INFO("Connecting to %s://%s:%u%s", params->use_ssl ? "wss" : "ws", params->host,
                 params->port, params->path);

   if (!lws_client_connect_via_info(&ccinfo)) {
      VASR_LOG_ERROR("Could not start connection to %s", params->host);
      lws_context_destroy(t->context);
      t->context = nullptr;
      delete t;
      return VASR_ERR_CONNECTION;
   }

   if (service_until(
           t, [t]() { return t->established; }, params->connect_timeout_ms, "connect") !=
       VASR_SUCCESS) {
      VASR_LOG_ERROR("Connection to %s failed: %s", params->host, t->error.c_str());
      ws_close(t);
      return VASR_ERR_CONNECTION;
   }

   *transport_out = t;
   return VASR_SUCCESS;
}

int ws_send(vasr_transport_t *transport, const uint8_t *data, size_t len) {
   if (!transport || (!data && len > 0))
      return VASR_ERR_INVALID_PARAM;
   WsTransport *t = static_cast<WsTransport *>(transport);

   if (t->interrupted.load() || !t->wsi || t->closed || t->failed) {
      if (t->error.empty())
         t->error = "connection is not open";
      return VASR_ERR_TRANSPORT;
   }

   try {
      t->tx.resize(LWS_PRE + len);
   } catch (const std::bad_alloc &) {
      t->error = "out of memory queueing message";
      return VASR_ERR_OUT_OF_MEMORY;
   }
   if (len > 0)
      memcpy(t->tx.data() + LWS_PRE, data, len);
   t->tx_len = len;
   t->tx_pending = true;
   lws_callback_on_writable(t->wsi);

   if (service_until(
           t, [t]() { return !t->tx_pending; }, SEND_TIMEOUT_MS, "send") != VASR_SUCCESS) {
      t->tx_pending = false;
      return VASR_ERR_TRANSPORT;
   }
   return VASR_SUCCESS;
}

int ws_receive(vasr_transport_t *transport, uint8_t **data_out, size_t *len_out, int timeout_ms) {
   if (!transport || !data_out || !len_out)
      return VASR_ERR_INVALID_PARAM;
   WsTransport *t = static_cast<WsTransport *>(transport);

   *data_out = nullptr;
   *len_out = 0;

   if (service_until(
           t, [t]() { return !t->rx_queue.empty(); }, timeout_ms, "receive") != VASR_SUCCESS)
      return VASR_ERR_TRANSPORT;

   std::vector<uint8_t> &msg = t->rx_queue.front();
   uint8_t *copy = (uint8_t *)malloc(msg.empty() ? 1 : msg.size());
   if (!copy) {
      t->error = "out of memory copying message";
      return VASR_ERR_OUT_OF_MEMORY;
   }
   if (!msg.empty())
      memcpy(copy, msg.data(), msg.size());
   *data_out = copy;
   *len_out = msg.size();
   t->rx_queue.pop_front();
   return VASR_SUCCESS;
}

void ws_interrupt(vasr_transport_t *transport) {
   if (!transport)
      return;
   WsTransport *t = static_cast<WsTransport *>(transport);
   t->interrupted.store(true);
   if (t->context)
      lws_cancel_service(t->context);
}

const char *ws_last_error(vasr_transport_t *transport) {
   if (!transport)
      return "no transport";
   WsTransport *t = static_cast<WsTransport *>(transport);
   return t->error.empty() ? "no error" : t->error.c_str();
}

}  // namespace

extern "C" {

const vasr_transport_ops_t vasr_ws_transport_ops = {
   "websocket", ws_open, ws_send, ws_receive, ws_interrupt, ws_close, ws_last_error,
};

} /* extern "C" */
