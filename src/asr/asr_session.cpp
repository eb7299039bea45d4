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
 * Recognition Session Implementation
 *
 * Each state transition is a method returning a vasr_error_t. fail() records
 * the error, the state it happened in and a description in the caller's
 * result. Resources held across transitions (decoded audio, the connection,
 * decoded responses) are scoped objects, so an early return or an exception
 * releases them.
 */

#include "asr/asr_session.h"

#include <json-c/json.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <new>

#include "asr/asr_request.h"
#include "logging.h"
#include "protocol/chunker.h"
#include "protocol/frame_codec.h"
#include "vasr.h"

struct vasr_session {
   vasr_config_t config;
   const vasr_transport_ops_t *transport_ops;
   const vasr_codec_ops_t *codec_ops;

   std::mutex transport_mutex;
   vasr_transport_t *active_transport = nullptr; /* guarded by transport_mutex */
   std::atomic<bool> abort_requested{ false };
   std::atomic<bool> busy{ false };
};

namespace {

/* =============================================================================
 * Scoped holders for C resources
 * ============================================================================= */

class ScopedResponse {
 public:
   ScopedResponse() {
      memset(&response_, 0, sizeof(response_));
   }
   ~ScopedResponse() {
      vasr_response_free(&response_);
   }
   ScopedResponse(const ScopedResponse &) = delete;
   ScopedResponse &operator=(const ScopedResponse &) = delete;

   vasr_response_t *get() {
      return &response_;
   }
   vasr_response_t *operator->() {
      return &response_;
   }

 private:
   vasr_response_t response_;
};

class ScopedBuffer {
 public:
   ScopedBuffer() : buffer_{ nullptr, 0 } {}
   ~ScopedBuffer() {
      vasr_buffer_free(&buffer_);
   }
   ScopedBuffer(const ScopedBuffer &) = delete;
   ScopedBuffer &operator=(const ScopedBuffer &) = delete;

   vasr_buffer_t *get() {
      return &buffer_;
   }

 private:
   vasr_buffer_t buffer_;
};

/* Owns the session's transport for one call and publishes it for abort */
class Connection {
 public:
   explicit Connection(vasr_session_t *session) : session_(session) {}
   ~Connection() {
      close();
   }
   Connection(const Connection &) = delete;
   Connection &operator=(const Connection &) = delete;

   int open(const vasr_transport_params_t *params) {
      vasr_transport_t *transport = nullptr;
      int ret = session_->transport_ops->open(params, &transport);
      if (ret != VASR_SUCCESS)
         return ret;
      if (!transport)
         return VASR_ERR_CONNECTION;

      std::lock_guard<std::mutex> lock(session_->transport_mutex);
      transport_ = transport;
      session_->active_transport = transport;
      /* abort() may have run while open() was blocked */
      if (session_->abort_requested.load())
         session_->transport_ops->interrupt(transport);
      return VASR_SUCCESS;
   }

   void close() {
      if (!transport_)
         return;
      {
         std::lock_guard<std::mutex> lock(session_->transport_mutex);
         session_->active_transport = nullptr;
      }
      session_->transport_ops->close(transport_);
      transport_ = nullptr;
   }

   vasr_transport_t *get() const {
      return transport_;
   }

   const char *last_error() const {
      return transport_ ? session_->transport_ops->last_error(transport_) : "not connected";
   }

 private:
   vasr_session_t *session_;
   vasr_transport_t *transport_ = nullptr;
};

/* Maps a failed transport call to the error the caller sees */
int transport_error(int ret, int fallback) {
   return ret == VASR_ERR_OUT_OF_MEMORY ? VASR_ERR_OUT_OF_MEMORY : fallback;
}

const char *payload_message(const vasr_response_t *response) {
   if (response->payload.kind == VASR_PAYLOAD_JSON) {
      json_object *message;
      if (json_object_object_get_ex(response->payload.json, "message", &message) &&
          json_object_is_type(message, json_type_string))
         return json_object_get_string(message);
   } else if (response->payload.kind == VASR_PAYLOAD_TEXT) {
      return response->payload.text;
   }
   return "";
}

/* =============================================================================
 * Recognition - one pass through the state machine
 * ============================================================================= */

class Recognition {
 public:
   Recognition(vasr_session_t *session, vasr_result_t *result)
       : session_(session), config_(session->config), result_(result), connection_(session) {
      container_.data = nullptr;
      container_.size = 0;
   }
   ~Recognition() {
      connection_.close();
      vasr_audio_container_free(&container_);
   }
   Recognition(const Recognition &) = delete;
   Recognition &operator=(const Recognition &) = delete;

   int run(const vasr_packet_t *packets, size_t count) {
      try {
         return run_states(packets, count);
      } catch (const std::bad_alloc &) {
         return fail(VASR_ERR_OUT_OF_MEMORY, "out of memory");
      } catch (const std::exception &e) {
         return fail(VASR_ERR_UNKNOWN, "unexpected exception: %s", e.what());
      }
   }

 private:
   int run_states(const vasr_packet_t *packets, size_t count) {
      int ret;

      if ((ret = check_config()) != VASR_SUCCESS)
         return ret;

      if ((ret = prepare_audio(packets, count)) != VASR_SUCCESS)
         return ret;

      if ((ret = connect()) != VASR_SUCCESS)
         return ret;
      transition(VASR_STATE_CONNECTED);

      if ((ret = send_config()) != VASR_SUCCESS)
         return ret;
      transition(VASR_STATE_CONFIG_SENT);

      if ((ret = await_config_ack()) != VASR_SUCCESS)
         return ret;
      transition(VASR_STATE_STREAMING);

      if ((ret = stream_audio()) != VASR_SUCCESS)
         return ret;
      transition(VASR_STATE_AWAITING_RESULT);

      if ((ret = await_result()) != VASR_SUCCESS)
         return ret;
      transition(VASR_STATE_DONE);

      connection_.close();
      result_->error = VASR_SUCCESS;
      return VASR_SUCCESS;
   }

   /* Settings the exchange cannot run without */
   int check_config() {
      const service_config_t &service = config_.service;
      if (service.host[0] == '\0')
         return fail(VASR_ERR_CONFIG, "service.host is empty");
      if (service.port < 1 || service.port > 65535)
         return fail(VASR_ERR_CONFIG, "service.port %d is out of range", service.port);
      if (config_.audio.segment_duration_ms <= 0)
         return fail(VASR_ERR_CONFIG, "audio.segment_duration_ms must be positive (got %d)",
                     config_.audio.segment_duration_ms);
      if (config_.secrets.access_token[0] == '\0')
         return fail(VASR_ERR_CONFIG, "volcengine.access_token is not set");
      return VASR_SUCCESS;
   }

   /* Opus packets -> PCM -> WAV container, optionally saved to disk */
   int prepare_audio(const vasr_packet_t *packets, size_t count) {
      vasr_pcm_t pcm;
      int ret = vasr_audio_decode_packets(session_->codec_ops, packets, count, &pcm);
      if (ret != VASR_SUCCESS)
         return fail(ret, "could not decode %zu audio packets", count);

      result_->packets_skipped = pcm.packets_skipped;
      if (pcm.num_samples == 0)
         VASR_LOG_WARNING("Session %s: no audio decoded from %zu packets", result_->session_id,
                          count);

      ret = vasr_audio_build_container(pcm.samples, pcm.num_samples, &container_);
      vasr_pcm_free(&pcm);
      if (ret != VASR_SUCCESS)
         return fail(ret, "could not build audio container");

      if (config_.output.save_audio &&
          vasr_audio_save_wav(config_.output.dir, result_->session_id, &container_,
                              result_->audio_path, sizeof(result_->audio_path)) != VASR_SUCCESS) {
         VASR_LOG_WARNING("Session %s: could not save audio to %s, continuing",
                          result_->session_id, config_.output.dir);
      }
      return VASR_SUCCESS;
   }

   int connect() {
      vasr_transport_params_t params;
      memset(&params, 0, sizeof(params));
      safe_strncpy(params.host, config_.service.host, sizeof(params.host));
      safe_strncpy(params.path, config_.service.path, sizeof(params.path));
      params.port = (uint16_t)config_.service.port;
      params.use_ssl = config_.service.ssl;
      params.ssl_verify = config_.service.ssl_verify;
      safe_strncpy(params.ca_cert_path, config_.service.ca_cert_path, sizeof(params.ca_cert_path));
      snprintf(params.authorization, sizeof(params.authorization), "Bearer; %s",
               config_.secrets.access_token);
      params.connect_timeout_ms = config_.service.connect_timeout_ms;

      int ret = check_abort();
      if (ret != VASR_SUCCESS)
         return ret;

      ret = connection_.open(&params);
      if (ret != VASR_SUCCESS) {
         return fail(transport_error(ret, VASR_ERR_CONNECTION), "could not connect to %s:%d%s",
                     config_.service.host, config_.service.port, config_.service.path);
      }
      return VASR_SUCCESS;
   }

   int send_config() {
      vasr_request_params_t params;
      params.appid = config_.secrets.appid;
      params.cluster = config_.service.cluster;
      params.token = config_.secrets.access_token;
      params.language = config_.audio.language;

      ScopedBuffer payload;
      char reqid[VASR_UUID_SIZE];
      int ret = vasr_request_build_payload(&params, reqid, payload.get());
      if (ret != VASR_SUCCESS)
         return fail(ret, "could not build session request");

      VASR_LOG_DEBUG("Session %s: request id %s", result_->session_id, reqid);
      return send_frame(VASR_MSG_FULL_REQUEST, VASR_SEQ_NONE, payload.get()->data,
                        payload.get()->len);
   }

   int await_config_ack() {
      ScopedResponse response;
      int ret = receive_response(response.get());
      if (ret != VASR_SUCCESS)
         return ret;

      if (response->message_type == VASR_MSG_ERROR_RESPONSE)
         return remote_error(response.get());

      switch (response->payload.kind) {
         case VASR_PAYLOAD_NONE:
            VASR_LOG_DEBUG("Session %s: acknowledgement without payload", result_->session_id);
            return VASR_SUCCESS;
         case VASR_PAYLOAD_JSON:
            return check_status(response.get());
         case VASR_PAYLOAD_TEXT:
         default:
            return fail(VASR_ERR_DECODE, "configuration acknowledgement is not JSON");
      }
   }

   int stream_audio() {
      vasr_wav_info_t info;
      int ret = vasr_audio_container_info(container_.data, container_.size, &info);
      if (ret != VASR_SUCCESS)
         return fail(ret, "audio container is unreadable");

      size_t segment = vasr_audio_segment_size(&info, config_.audio.segment_duration_ms);
      vasr_chunker_t chunker;
      if (segment == 0 ||
          vasr_chunker_init(&chunker, container_.data, container_.size, segment) != VASR_SUCCESS) {
         return fail(VASR_ERR_CONFIG, "invalid segment duration %d ms",
                     config_.audio.segment_duration_ms);
      }

      size_t total = vasr_chunker_count(container_.size, segment);
      VASR_LOG_INFO("Session %s: streaming %zu bytes in %zu chunk(s) of up to %zu bytes",
                    result_->session_id, container_.size, total, segment);

      vasr_chunk_t chunk;
      while (vasr_chunker_next(&chunker, &chunk)) {
         ret = send_frame(VASR_MSG_AUDIO_ONLY_REQUEST, chunk.is_final ? VASR_SEQ_FINAL : VASR_SEQ_NONE,
                          chunk.data, chunk.len);
         if (ret != VASR_SUCCESS)
            return ret;
         result_->chunks_sent++;
         VASR_LOG_DEBUG("Session %s: sent chunk %zu/%zu (%zu bytes%s)", result_->session_id,
                        result_->chunks_sent, total, chunk.len, chunk.is_final ? ", final" : "");
      }
      return VASR_SUCCESS;
   }

   int await_result() {
      ScopedResponse response;
      int ret = receive_response(response.get());
      if (ret != VASR_SUCCESS)
         return ret;

      if (response->message_type == VASR_MSG_ERROR_RESPONSE)
         return remote_error(response.get());

      if (response->payload.kind == VASR_PAYLOAD_NONE)
         return fail(VASR_ERR_DECODE, "final response carried no payload");
      if (response->payload.kind != VASR_PAYLOAD_JSON)
         return fail(VASR_ERR_DECODE, "final response is not JSON");

      if ((ret = check_status(response.get())) != VASR_SUCCESS)
         return ret;

      json_object *results;
      if (!json_object_object_get_ex(response->payload.json, "result", &results) ||
          !json_object_is_type(results, json_type_array) ||
          json_object_array_length(results) == 0) {
         VASR_LOG_INFO("Session %s: no speech recognized", result_->session_id);
         return VASR_SUCCESS;
      }

      json_object *first = json_object_array_get_idx(results, 0);
      json_object *text;
      if (!first || !json_object_object_get_ex(first, "text", &text) ||
          !json_object_is_type(text, json_type_string)) {
         return fail(VASR_ERR_DECODE, "first result has no text");
      }
      if (json_object_get_string_len(text) == 0) {
         VASR_LOG_INFO("Session %s: no speech recognized", result_->session_id);
         return VASR_SUCCESS;
      }

      result_->text = strdup(json_object_get_string(text));
      if (!result_->text)
         return fail(VASR_ERR_OUT_OF_MEMORY, "could not copy recognized text");
      return VASR_SUCCESS;
   }

   /* =============================================================================
    * Helpers
    * ============================================================================= */

   int send_frame(vasr_message_type_t type,
                  vasr_sequence_flag_t flags,
                  const uint8_t *payload,
                  size_t len) {
      ScopedBuffer frame;
      int ret = vasr_frame_encode_request(type, flags, payload, len, frame.get());
      if (ret != VASR_SUCCESS)
         return fail(ret, "could not encode %zu byte frame", len);

      if ((ret = check_abort()) != VASR_SUCCESS)
         return ret;

      ret = session_->transport_ops->send(connection_.get(), frame.get()->data, frame.get()->len);
      if (ret != VASR_SUCCESS)
         return fail(transport_error(ret, VASR_ERR_TRANSPORT), "send failed: %s",
                     connection_.last_error());
      return VASR_SUCCESS;
   }

   int receive_response(vasr_response_t *response) {
      int ret = check_abort();
      if (ret != VASR_SUCCESS)
         return ret;

      uint8_t *data = nullptr;
      size_t len = 0;
      ret = session_->transport_ops->receive(connection_.get(), &data, &len,
                                             config_.service.receive_timeout_ms);
      if (ret != VASR_SUCCESS) {
         free(data);
         return fail(transport_error(ret, VASR_ERR_TRANSPORT), "receive failed: %s",
                     connection_.last_error());
      }

      ret = vasr_frame_decode(data, len, response);
      free(data);
      if (ret != VASR_SUCCESS)
         return fail(transport_error(ret, VASR_ERR_DECODE), "malformed %zu byte frame", len);

      VASR_LOG_DEBUG("Session %s: received message type 0x%X (%zu bytes)", result_->session_id,
                     response->message_type, len);
      return VASR_SUCCESS;
   }

   /* JSON payload: "code" must be the configured success code */
   int check_status(const vasr_response_t *response) {
      json_object *code;
      if (!json_object_object_get_ex(response->payload.json, "code", &code) ||
          !json_object_is_type(code, json_type_int)) {
         return fail(VASR_ERR_DECODE, "response has no status code");
      }

      int64_t value = json_object_get_int64(code);
      if (value != config_.service.success_code) {
         result_->has_remote_code = true;
         result_->remote_code = value;
         return fail(VASR_ERR_REMOTE, "service status %lld: %s", (long long)value,
                     payload_message(response));
      }

      safe_strncpy(result_->message, payload_message(response), sizeof(result_->message));
      return VASR_SUCCESS;
   }

   int remote_error(const vasr_response_t *response) {
      result_->has_remote_code = true;
      result_->remote_code = response->error_code;
      return fail(VASR_ERR_REMOTE, "service error %u: %s", (unsigned)response->error_code,
                  payload_message(response));
   }

   int check_abort() {
      if (session_->abort_requested.load())
         return fail(VASR_ERR_TRANSPORT, "aborted");
      return VASR_SUCCESS;
   }

   void transition(vasr_session_state_t next) {
      VASR_LOG_DEBUG("Session %s: %s -> %s", result_->session_id, vasr_session_state_name(state_),
                     vasr_session_state_name(next));
      state_ = next;
   }

   __attribute__((format(printf, 3, 4))) int fail(int error, const char *fmt, ...) {
      va_list args;
      va_start(args, fmt);
      vsnprintf(result_->message, sizeof(result_->message), fmt, args);
      va_end(args);

      free(result_->text);
      result_->text = nullptr;
      result_->error = error;
      result_->failed_state = state_;

      VASR_LOG_ERROR("Session %s failed in state %s: %s (%s)", result_->session_id,
                     vasr_session_state_name(state_), result_->message, vasr_error_string(error));
      state_ = VASR_STATE_FAILED;
      return error;
   }

   vasr_session_t *session_;
   const vasr_config_t &config_;
   vasr_result_t *result_;
   Connection connection_;
   vasr_audio_container_t container_;
   vasr_session_state_t state_ = VASR_STATE_IDLE;
};

}  // namespace

extern "C" {

vasr_session_t *vasr_session_create(const vasr_config_t *config,
                                    const vasr_transport_ops_t *transport,
                                    const vasr_codec_ops_t *codec) {
   if (!config) {
      VASR_LOG_ERROR("Session requires a configuration");
      return NULL;
   }

   vasr_session_t *session = new (std::nothrow) vasr_session_t();
   if (!session) {
      VASR_LOG_ERROR("Failed to allocate session");
      return NULL;
   }

   session->config = *config;
   session->transport_ops = transport ? transport : &vasr_ws_transport_ops;
   session->codec_ops = codec ? codec : &vasr_opus_codec_ops;

   VASR_LOG_INFO("Session created (%s transport, %s codec, %s:%d%s)",
                 session->transport_ops->name, session->codec_ops->name, config->service.host,
                 config->service.port, config->service.path);
   return session;
}

int vasr_session_recognize(vasr_session_t *session,
                           const vasr_packet_t *packets,
                           size_t count,
                           vasr_result_t *result) {
   if (!result)
      return VASR_ERR_INVALID_PARAM;

   memset(result, 0, sizeof(*result));
   result->failed_state = VASR_STATE_IDLE;

   if (!session || (!packets && count > 0)) {
      result->error = VASR_ERR_INVALID_PARAM;
      safe_strncpy(result->message, "invalid parameters", sizeof(result->message));
      return result->error;
   }

   bool expected = false;
   if (!session->busy.compare_exchange_strong(expected, true)) {
      VASR_LOG_ERROR("Recognition already in progress on this session");
      result->error = VASR_ERR_INVALID_PARAM;
      safe_strncpy(result->message, "recognition already in progress", sizeof(result->message));
      return result->error;
   }

   if (vasr_generate_uuid(result->session_id) != 0)
      safe_strncpy(result->session_id, "unknown", sizeof(result->session_id));

   auto start = std::chrono::steady_clock::now();
   {
      Recognition recognition(session, result);
      recognition.run(packets, count);
   }
   result->elapsed_ms = (long)std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - start)
                            .count();

   if (result->error == VASR_SUCCESS) {
      VASR_LOG_INFO("Session %s complete in %ld ms: %zu chunk(s), %s", result->session_id,
                    result->elapsed_ms, result->chunks_sent,
                    result->text ? "text recognized" : "no speech");
   }

   session->abort_requested.store(false);
   session->busy.store(false);
   return result->error;
}

void vasr_session_abort(vasr_session_t *session) {
   if (!session)
      return;

   session->abort_requested.store(true);
   std::lock_guard<std::mutex> lock(session->transport_mutex);
   if (session->active_transport) {
      VASR_LOG_INFO("Aborting recognition");
      session->transport_ops->interrupt(session->active_transport);
   }
}

void vasr_session_destroy(vasr_session_t *session) {
   delete session;
}

void vasr_result_clear(vasr_result_t *result) {
   if (!result)
      return;
   free(result->text);
   memset(result, 0, sizeof(*result));
}

const char *vasr_session_state_name(vasr_session_state_t state) {
   switch (state) {
      case VASR_STATE_IDLE:
         return "idle";
      case VASR_STATE_CONNECTED:
         return "connected";
      case VASR_STATE_CONFIG_SENT:
         return "config_sent";
      case VASR_STATE_STREAMING:
         return "streaming";
      case VASR_STATE_AWAITING_RESULT:
         return "awaiting_result";
      case VASR_STATE_DONE:
         return "done";
      case VASR_STATE_FAILED:
         return "failed";
   }
   return "unknown";
}

} /* extern "C" */
