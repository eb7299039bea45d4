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
 * WebSocket transport tests against a loopback libwebsockets echo server
 */

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <libwebsockets.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "network/transport.h"
#include "test_helpers.h"
#include "vasr.h"

using namespace vasr_test;

namespace {

/* Port nothing is listening on (bound, then released) */
int unused_port() {
   int fd = socket(AF_INET, SOCK_STREAM, 0);
   if (fd < 0)
      return -1;
   struct sockaddr_in addr;
   memset(&addr, 0, sizeof(addr));
   addr.sin_family = AF_INET;
   addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
   addr.sin_port = 0;
   socklen_t len = sizeof(addr);
   int port = -1;
   if (bind(fd, (struct sockaddr *)&addr, sizeof(addr)) == 0 &&
       getsockname(fd, (struct sockaddr *)&addr, &len) == 0)
      port = ntohs(addr.sin_port);
   close(fd);
   return port;
}

/* =============================================================================
 * Echo server: every complete message is sent back unchanged
 * ============================================================================= */

struct EchoServer {
   struct lws_context *context = nullptr;
   std::thread thread;
   std::atomic<bool> stop{ false };
   int port = -1;

   /* Touched by the service thread only */
   std::vector<uint8_t> rx;
   std::deque<std::vector<uint8_t>> tx;

   std::mutex mutex;
   std::string authorization; /* guarded by mutex */
   size_t messages = 0;       /* guarded by mutex */
};

int echo_callback(struct lws *wsi,
                  enum lws_callback_reasons reason,
                  void *user,
                  void *in,
                  size_t len) {
   struct lws_context *ctx = lws_get_context(wsi);
   EchoServer *server = ctx ? static_cast<EchoServer *>(lws_context_user(ctx)) : nullptr;
   if (!server)
      return lws_callback_http_dummy(wsi, reason, user, in, len);

   switch (reason) {
      case LWS_CALLBACK_ESTABLISHED: {
         int n = lws_hdr_total_length(wsi, WSI_TOKEN_HTTP_AUTHORIZATION);
         if (n > 0) {
            std::vector<char> value((size_t)n + 1);
            if (lws_hdr_copy(wsi, value.data(), n + 1, WSI_TOKEN_HTTP_AUTHORIZATION) >= 0) {
               std::lock_guard<std::mutex> lock(server->mutex);
               server->authorization = value.data();
            }
         }
         break;
      }

      case LWS_CALLBACK_RECEIVE: {
         const uint8_t *bytes = static_cast<const uint8_t *>(in);
         server->rx.insert(server->rx.end(), bytes, bytes + len);
         if (lws_is_final_fragment(wsi) && lws_remaining_packet_payload(wsi) == 0) {
            server->tx.push_back(std::move(server->rx));
            server->rx.clear();
            {
               std::lock_guard<std::mutex> lock(server->mutex);
               server->messages++;
            }
            lws_callback_on_writable(wsi);
         }
         break;
      }

      case LWS_CALLBACK_SERVER_WRITEABLE: {
         if (server->tx.empty())
            break;
         std::vector<uint8_t> &msg = server->tx.front();
         std::vector<uint8_t> buf(LWS_PRE + msg.size());
         if (!msg.empty())
            memcpy(buf.data() + LWS_PRE, msg.data(), msg.size());
         int n = lws_write(wsi, buf.data() + LWS_PRE, msg.size(), LWS_WRITE_BINARY);
         server->tx.pop_front();
         if (n < 0)
            return -1;
         if (!server->tx.empty())
            lws_callback_on_writable(wsi);
         break;
      }

      default:
         return lws_callback_http_dummy(wsi, reason, user, in, len);
   }
   return 0;
}

const struct lws_protocols k_echo_protocols[] = {
   { "echo", echo_callback, 0, 0, 0, nullptr, 0 },
   { nullptr, nullptr, 0, 0, 0, nullptr, 0 },
};

class WsTransportTest : public ::testing::Test {
 protected:
   void SetUp() override {
      start_log_capture();

      server_.port = unused_port();
      ASSERT_GT(server_.port, 0);

      struct lws_context_creation_info info;
      memset(&info, 0, sizeof(info));
      info.port = server_.port;
      info.iface = "127.0.0.1";
      info.protocols = k_echo_protocols;
      info.gid = -1;
      info.uid = -1;
      info.user = &server_;
      server_.context = lws_create_context(&info);
      ASSERT_NE(server_.context, nullptr);

      EchoServer *server = &server_;
      server_.thread = std::thread([server]() {
         while (!server->stop.load()) {
            if (lws_service(server->context, 50) < 0)
               break;
         }
      });
   }

   void TearDown() override {
      if (transport_)
         vasr_ws_transport_ops.close(transport_);
      if (server_.context) {
         server_.stop.store(true);
         lws_cancel_service(server_.context);
         if (server_.thread.joinable())
            server_.thread.join();
         lws_context_destroy(server_.context);
      }
      vasr_set_logger(nullptr);
   }

   vasr_transport_params_t params(int port) {
      vasr_transport_params_t p;
      memset(&p, 0, sizeof(p));
      safe_strncpy(p.host, "127.0.0.1", sizeof(p.host));
      p.port = (uint16_t)port;
      safe_strncpy(p.path, "/api/v2/asr", sizeof(p.path));
      p.use_ssl = false;
      safe_strncpy(p.authorization, "Bearer; loopback-token", sizeof(p.authorization));
      p.connect_timeout_ms = 3000;
      return p;
   }

   void connect() {
      vasr_transport_params_t p = params(server_.port);
      ASSERT_EQ(vasr_ws_transport_ops.open(&p, &transport_), VASR_SUCCESS);
      ASSERT_NE(transport_, nullptr);
   }

   std::vector<uint8_t> receive(int timeout_ms, int expect = VASR_SUCCESS) {
      uint8_t *data = nullptr;
      size_t len = 0;
      int ret = vasr_ws_transport_ops.receive(transport_, &data, &len, timeout_ms);
      EXPECT_EQ(ret, expect) << vasr_ws_transport_ops.last_error(transport_);
      std::vector<uint8_t> out;
      if (data)
         out.assign(data, data + len);
      free(data);
      return out;
   }

   EchoServer server_;
   vasr_transport_t *transport_ = nullptr;
};

}  // namespace

TEST_F(WsTransportTest, EchoRoundTripCarriesAuthorization) {
   connect();

   const std::vector<uint8_t> frame = { 0x11, 0x10, 0x11, 0x00, 0x00, 0x00, 0x00, 0x02, 0xAB, 0xCD };
   ASSERT_EQ(vasr_ws_transport_ops.send(transport_, frame.data(), frame.size()), VASR_SUCCESS);
   EXPECT_EQ(receive(3000), frame);

   std::lock_guard<std::mutex> lock(server_.mutex);
   EXPECT_EQ(server_.authorization, "Bearer; loopback-token");
   EXPECT_EQ(server_.messages, 1u);
}

TEST_F(WsTransportTest, MessagesKeepTheirOrder) {
   connect();

   for (uint8_t i = 0; i < 3; i++) {
      std::vector<uint8_t> msg(100 + i, i);
      ASSERT_EQ(vasr_ws_transport_ops.send(transport_, msg.data(), msg.size()), VASR_SUCCESS);
   }
   for (uint8_t i = 0; i < 3; i++)
      EXPECT_EQ(receive(3000), std::vector<uint8_t>(100 + i, i));
}

TEST_F(WsTransportTest, LargeMessageIsReassembled) {
   connect();

   /* Well beyond one rx buffer, so both ends see several fragments */
   std::vector<uint8_t> big(300000);
   for (size_t i = 0; i < big.size(); i++)
      big[i] = (uint8_t)(i * 31 + 7);

   ASSERT_EQ(vasr_ws_transport_ops.send(transport_, big.data(), big.size()), VASR_SUCCESS);
   std::vector<uint8_t> echoed = receive(10000);
   ASSERT_EQ(echoed.size(), big.size());
   EXPECT_EQ(echoed, big);
}

TEST_F(WsTransportTest, ReceiveTimeoutIsTransportError) {
   connect();

   auto start = std::chrono::steady_clock::now();
   EXPECT_TRUE(receive(200, VASR_ERR_TRANSPORT).empty());
   auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
       std::chrono::steady_clock::now() - start);

   EXPECT_GE(elapsed.count(), 200);
   EXPECT_LT(elapsed.count(), 5000);
   EXPECT_NE(std::string(vasr_ws_transport_ops.last_error(transport_)).find("timed out"),
             std::string::npos);
}

TEST_F(WsTransportTest, InterruptUnblocksReceive) {
   connect();

   vasr_transport_t *transport = transport_;
   std::thread interrupter([transport]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(150));
      vasr_ws_transport_ops.interrupt(transport);
   });

   auto start = std::chrono::steady_clock::now();
   receive(20000, VASR_ERR_TRANSPORT);
   auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
       std::chrono::steady_clock::now() - start);
   interrupter.join();

   EXPECT_LT(elapsed.count(), 5000);
   EXPECT_NE(std::string(vasr_ws_transport_ops.last_error(transport_)).find("interrupted"),
             std::string::npos);

   /* Interrupted transports refuse further traffic */
   const uint8_t byte = 0x01;
   EXPECT_EQ(vasr_ws_transport_ops.send(transport_, &byte, 1), VASR_ERR_TRANSPORT);
}

TEST_F(WsTransportTest, RefusedConnectionIsConnectionError) {
   int port = unused_port();
   ASSERT_GT(port, 0);
   vasr_transport_params_t p = params(port);

   vasr_transport_t *transport = nullptr;
   EXPECT_EQ(vasr_ws_transport_ops.open(&p, &transport), VASR_ERR_CONNECTION);
   EXPECT_EQ(transport, nullptr);
}
