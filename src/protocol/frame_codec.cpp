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
 * Frame Codec Implementation
 *
 * All multi-byte integers on the wire are big-endian. Payload compression is
 * gzip (zlib with the +16 window-bits wrapper), serialization is JSON via
 * json-c.
 */

#include "protocol/frame_codec.h"

#include <json-c/json.h>
#include <stdlib.h>
#include <string.h>
#include <zlib.h>

#include <limits>
#include <new>
#include <vector>

#include "logging.h"
#include "vasr.h"

namespace {

/* zlib window bits: 15 (32K window) + 16 selects the gzip wrapper */
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr size_t INFLATE_STEP = 16384;

uint32_t read_be32(const uint8_t *p) {
   return ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) | ((uint32_t)p[2] << 8) |
          (uint32_t)p[3];
}

void write_be32(uint8_t *p, uint32_t value) {
   p[0] = (uint8_t)(value >> 24);
   p[1] = (uint8_t)(value >> 16);
   p[2] = (uint8_t)(value >> 8);
   p[3] = (uint8_t)value;
}

/* Copy into a malloc'd buffer so C callers can release it with free() */
int buffer_from_vector(const std::vector<uint8_t> &bytes, vasr_buffer_t *out) {
   out->data = (uint8_t *)malloc(bytes.empty() ? 1 : bytes.size());
   if (!out->data) {
      out->len = 0;
      return VASR_ERR_OUT_OF_MEMORY;
   }
   if (!bytes.empty())
      memcpy(out->data, bytes.data(), bytes.size());
   out->len = bytes.size();
   return VASR_SUCCESS;
}

int gzip_compress(const uint8_t *data, size_t len, std::vector<uint8_t> &out) {
   if (len > std::numeric_limits<uInt>::max())
      return VASR_ERR_INVALID_PARAM;

   z_stream strm;
   memset(&strm, 0, sizeof(strm));
   if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8,
                    Z_DEFAULT_STRATEGY) != Z_OK) {
      VASR_LOG_ERROR("deflateInit2 failed: %s", strm.msg ? strm.msg : "unknown");
      return VASR_ERR_OUT_OF_MEMORY;
   }

   out.resize(deflateBound(&strm, (uLong)len));
   strm.next_in = const_cast<Bytef *>(data);
   strm.avail_in = (uInt)len;
   strm.next_out = out.data();
   strm.avail_out = (uInt)out.size();

   int zret = deflate(&strm, Z_FINISH);
   size_t produced = out.size() - strm.avail_out;
   deflateEnd(&strm);

   if (zret != Z_STREAM_END) {
      VASR_LOG_ERROR("deflate did not finish (zlib %d)", zret);
      return VASR_ERR_UNKNOWN;
   }
   out.resize(produced);
   return VASR_SUCCESS;
}

int gzip_decompress(const uint8_t *data, size_t len, std::vector<uint8_t> &out) {
   if (len == 0) {
      VASR_LOG_WARNING("Empty gzip member");
      return VASR_ERR_DECODE;
   }
   if (len > std::numeric_limits<uInt>::max())
      return VASR_ERR_INVALID_PARAM;

   z_stream strm;
   memset(&strm, 0, sizeof(strm));
   if (inflateInit2(&strm, GZIP_WINDOW_BITS) != Z_OK) {
      VASR_LOG_ERROR("inflateInit2 failed: %s", strm.msg ? strm.msg : "unknown");
      return VASR_ERR_OUT_OF_MEMORY;
   }

   strm.next_in = const_cast<Bytef *>(data);
   strm.avail_in = (uInt)len;
   out.clear();

   int zret = Z_OK;
   while (zret != Z_STREAM_END) {
      size_t used = out.size();
      out.resize(used + INFLATE_STEP);
      strm.next_out = out.data() + used;
      strm.avail_out = (uInt)INFLATE_STEP;

      zret = inflate(&strm, Z_NO_FLUSH);
      out.resize(used + (INFLATE_STEP - strm.avail_out));

      if (zret == Z_STREAM_END)
         break;
      if (zret != Z_OK) {
         VASR_LOG_WARNING("gzip payload is corrupt (zlib %d: %s)", zret,
                          strm.msg ? strm.msg : "no detail");
         inflateEnd(&strm);
         return VASR_ERR_DECODE;
      }
      if (strm.avail_in == 0 && strm.avail_out != 0) {
         /* Input exhausted before the end of the gzip member */
         VASR_LOG_WARNING("gzip payload is truncated");
         inflateEnd(&strm);
         return VASR_ERR_DECODE;
      }
   }

   inflateEnd(&strm);
   return VASR_SUCCESS;
}

int parse_json(const uint8_t *data, size_t len, struct json_object **obj_out) {
   if (len > (size_t)std::numeric_limits<int>::max())
      return VASR_ERR_DECODE;

   json_tokener *tok = json_tokener_new();
   if (!tok)
      return VASR_ERR_OUT_OF_MEMORY;

   struct json_object *obj = json_tokener_parse_ex(tok, (const char *)data, (int)len);
   enum json_tokener_error jerr = json_tokener_get_error(tok);
   json_tokener_free(tok);

   if (!obj || jerr != json_tokener_success) {
      VASR_LOG_WARNING("Payload is not valid JSON: %s", json_tokener_error_desc(jerr));
      if (obj)
         json_object_put(obj);
      return VASR_ERR_DECODE;
   }

   *obj_out = obj;
   return VASR_SUCCESS;
}

/* Decompress and deserialize an extracted payload into response->payload */
int decode_payload(const vasr_header_t &header,
                   const uint8_t *payload,
                   size_t payload_len,
                   vasr_response_t *response) {
   std::vector<uint8_t> inflated;
   if (header.compression == VASR_COMPRESS_GZIP) {
      int ret = gzip_decompress(payload, payload_len, inflated);
      if (ret != VASR_SUCCESS)
         return ret;
      payload = inflated.data();
      payload_len = inflated.size();
   }

   if (header.serialization == VASR_SERIAL_NONE) {
      response->payload.kind = VASR_PAYLOAD_NONE;
      return VASR_SUCCESS;
   }

   if (header.serialization == VASR_SERIAL_JSON) {
      int ret = parse_json(payload, payload_len, &response->payload.json);
      if (ret != VASR_SUCCESS)
         return ret;
      response->payload.kind = VASR_PAYLOAD_JSON;
      return VASR_SUCCESS;
   }

   /* Thrift, custom or unknown serialization: hand the bytes over untouched */
   response->payload.text = (char *)malloc(payload_len + 1);
   if (!response->payload.text)
      return VASR_ERR_OUT_OF_MEMORY;
   if (payload_len > 0)
      memcpy(response->payload.text, payload, payload_len);
   response->payload.text[payload_len] = '\0';
   response->payload.text_len = payload_len;
   response->payload.kind = VASR_PAYLOAD_TEXT;
   return VASR_SUCCESS;
}

int decode_frame(const uint8_t *data, size_t len, vasr_response_t *response) {
   vasr_header_t header;
   if (vasr_header_unpack(data, len, &header) != VASR_SUCCESS) {
      VASR_LOG_WARNING("Frame too short for a header (%zu bytes)", len);
      return VASR_ERR_DECODE;
   }
   if (header.header_words == 0) {
      VASR_LOG_WARNING("Frame declares a zero-word header");
      return VASR_ERR_DECODE;
   }

   /* Extension words are forward-compat slack: skipped, never interpreted */
   size_t header_len = (size_t)header.header_words * VASR_HEADER_SIZE;
   if (len < header_len) {
      VASR_LOG_WARNING("Frame shorter than its declared header (%zu < %zu)", len, header_len);
      return VASR_ERR_DECODE;
   }

   const uint8_t *body = data + header_len;
   size_t body_len = len - header_len;
   response->message_type = header.message_type;

   const uint8_t *payload = NULL;
   size_t payload_len = 0;

   switch (header.message_type) {
      case VASR_MSG_FULL_RESPONSE:
         if (body_len < VASR_LENGTH_SIZE) {
            VASR_LOG_WARNING("Full response missing its size field");
            return VASR_ERR_DECODE;
         }
         response->has_payload_size = true;
         response->payload_size = (int32_t)read_be32(body);
         payload = body + VASR_LENGTH_SIZE;
         payload_len = body_len - VASR_LENGTH_SIZE;
         break;

      case VASR_MSG_ACK:
         if (body_len < VASR_LENGTH_SIZE) {
            VASR_LOG_WARNING("Ack missing its sequence field");
            return VASR_ERR_DECODE;
         }
         response->has_sequence = true;
         response->sequence = (int32_t)read_be32(body);
         if (body_len >= 2 * VASR_LENGTH_SIZE) {
            response->has_payload_size = true;
            response->payload_size = read_be32(body + VASR_LENGTH_SIZE);
            payload = body + 2 * VASR_LENGTH_SIZE;
            payload_len = body_len - 2 * VASR_LENGTH_SIZE;
         }
         break;

      case VASR_MSG_ERROR_RESPONSE:
         if (body_len < 2 * VASR_LENGTH_SIZE) {
            VASR_LOG_WARNING("Error response shorter than code + size (%zu bytes)", body_len);
            return VASR_ERR_DECODE;
         }
         response->has_error_code = true;
         response->error_code = read_be32(body);
         response->has_payload_size = true;
         response->payload_size = read_be32(body + VASR_LENGTH_SIZE);
         payload = body + 2 * VASR_LENGTH_SIZE;
         payload_len = body_len - 2 * VASR_LENGTH_SIZE;
         break;

      default:
         /* Not a server frame we know how to read: message type only */
         return VASR_SUCCESS;
   }

   if (!payload || payload_len == 0) {
      /* Ack and ErrorResponse may carry nothing; a JSON FullResponse must carry a document */
      if (header.message_type == VASR_MSG_FULL_RESPONSE &&
          header.serialization == VASR_SERIAL_JSON) {
         VASR_LOG_WARNING("Full response has an empty JSON payload");
         return VASR_ERR_DECODE;
      }
      return VASR_SUCCESS;
   }

   return decode_payload(header, payload, payload_len, response);
}

}  // namespace

extern "C" {

void vasr_header_pack(const vasr_header_t *header, uint8_t out[VASR_HEADER_SIZE]) {
   out[0] = (uint8_t)(((header->version & 0x0F) << 4) | (header->header_words & 0x0F));
   out[1] = (uint8_t)(((header->message_type & 0x0F) << 4) | (header->flags & 0x0F));
   out[2] = (uint8_t)(((header->serialization & 0x0F) << 4) | (header->compression & 0x0F));
   out[3] = header->reserved;
}

int vasr_header_unpack(const uint8_t *data, size_t len, vasr_header_t *header_out) {
   if (!data || !header_out || len < VASR_HEADER_SIZE)
      return VASR_ERR_DECODE;

   header_out->version = data[0] >> 4;
   header_out->header_words = data[0] & 0x0F;
   header_out->message_type = data[1] >> 4;
   header_out->flags = data[1] & 0x0F;
   header_out->serialization = data[2] >> 4;
   header_out->compression = data[2] & 0x0F;
   header_out->reserved = data[3];
   return VASR_SUCCESS;
}

void vasr_frame_encode_header(vasr_message_type_t message_type,
                              vasr_sequence_flag_t flags,
                              uint8_t out[VASR_HEADER_SIZE]) {
   vasr_header_t header;
   header.version = VASR_PROTOCOL_VERSION;
   header.header_words = VASR_HEADER_WORDS;
   header.message_type = (uint8_t)message_type;
   header.flags = (uint8_t)flags;
   header.serialization = VASR_SERIAL_JSON;
   header.compression = VASR_COMPRESS_GZIP;
   header.reserved = 0x00;
   vasr_header_pack(&header, out);
}

int vasr_frame_encode(const vasr_header_t *header,
                      const uint8_t *payload,
                      size_t payload_len,
                      vasr_buffer_t *frame_out) {
   if (!header || !frame_out || (!payload && payload_len > 0))
      return VASR_ERR_INVALID_PARAM;

   frame_out->data = NULL;
   frame_out->len = 0;

   try {
      std::vector<uint8_t> body;
      if (header->compression == VASR_COMPRESS_GZIP) {
         int ret = gzip_compress(payload, payload_len, body);
         if (ret != VASR_SUCCESS)
            return ret;
      } else if (payload_len > 0) {
         body.assign(payload, payload + payload_len);
      }

      if (body.size() > std::numeric_limits<uint32_t>::max()) {
         VASR_LOG_ERROR("Payload too large for a 32-bit size field (%zu bytes)", body.size());
         return VASR_ERR_INVALID_PARAM;
      }

      vasr_header_t wire = *header;
      wire.header_words = VASR_HEADER_WORDS;

      std::vector<uint8_t> frame(VASR_HEADER_SIZE + VASR_LENGTH_SIZE + body.size());
      vasr_header_pack(&wire, frame.data());
      write_be32(frame.data() + VASR_HEADER_SIZE, (uint32_t)body.size());
      if (!body.empty())
         memcpy(frame.data() + VASR_HEADER_SIZE + VASR_LENGTH_SIZE, body.data(), body.size());

      return buffer_from_vector(frame, frame_out);
   } catch (const std::bad_alloc &) {
      VASR_LOG_ERROR("Out of memory encoding %zu byte payload", payload_len);
      return VASR_ERR_OUT_OF_MEMORY;
   }
}

int vasr_frame_encode_request(vasr_message_type_t message_type,
                              vasr_sequence_flag_t flags,
                              const uint8_t *payload,
                              size_t payload_len,
                              vasr_buffer_t *frame_out) {
   uint8_t raw[VASR_HEADER_SIZE];
   vasr_frame_encode_header(message_type, flags, raw);

   vasr_header_t header;
   vasr_header_unpack(raw, sizeof(raw), &header);
   return vasr_frame_encode(&header, payload, payload_len, frame_out);
}

int vasr_frame_decode(const uint8_t *data, size_t len, vasr_response_t *response_out) {
   if (!data || !response_out)
      return VASR_ERR_INVALID_PARAM;

   memset(response_out, 0, sizeof(*response_out));

   int ret;
   try {
      ret = decode_frame(data, len, response_out);
   } catch (const std::bad_alloc &) {
      VASR_LOG_ERROR("Out of memory decoding %zu byte frame", len);
      ret = VASR_ERR_OUT_OF_MEMORY;
   }

   if (ret != VASR_SUCCESS)
      vasr_response_free(response_out);
   return ret;
}

int vasr_frame_parse_request(const uint8_t *data, size_t len, vasr_request_frame_t *frame_out) {
   if (!data || !frame_out)
      return VASR_ERR_INVALID_PARAM;

   memset(frame_out, 0, sizeof(*frame_out));

   if (vasr_header_unpack(data, len, &frame_out->header) != VASR_SUCCESS ||
       frame_out->header.header_words == 0)
      return VASR_ERR_DECODE;

   size_t header_len = (size_t)frame_out->header.header_words * VASR_HEADER_SIZE;
   if (len < header_len + VASR_LENGTH_SIZE)
      return VASR_ERR_DECODE;

   frame_out->declared_size = read_be32(data + header_len);
   const uint8_t *payload = data + header_len + VASR_LENGTH_SIZE;
   size_t available = len - header_len - VASR_LENGTH_SIZE;
   if (frame_out->declared_size > available) {
      VASR_LOG_WARNING("Request frame declares %u bytes, only %zu present",
                       frame_out->declared_size, available);
      return VASR_ERR_DECODE;
   }

   try {
      std::vector<uint8_t> bytes;
      if (frame_out->header.compression == VASR_COMPRESS_GZIP) {
         int ret = gzip_decompress(payload, frame_out->declared_size, bytes);
         if (ret != VASR_SUCCESS)
            return ret;
      } else {
         bytes.assign(payload, payload + frame_out->declared_size);
      }
      return buffer_from_vector(bytes, &frame_out->payload);
   } catch (const std::bad_alloc &) {
      return VASR_ERR_OUT_OF_MEMORY;
   }
}

void vasr_response_free(vasr_response_t *response) {
   if (!response)
      return;
   if (response->payload.json) {
      json_object_put(response->payload.json);
      response->payload.json = NULL;
   }
   free(response->payload.text);
   response->payload.text = NULL;
   response->payload.text_len = 0;
   response->payload.kind = VASR_PAYLOAD_NONE;
}

void vasr_request_frame_free(vasr_request_frame_t *frame) {
   if (!frame)
      return;
   vasr_buffer_free(&frame->payload);
}

void vasr_buffer_free(vasr_buffer_t *buffer) {
   if (!buffer)
      return;
   free(buffer->data);
   buffer->data = NULL;
   buffer->len = 0;
}

int vasr_gzip_compress(const uint8_t *data, size_t len, vasr_buffer_t *out) {
   if ((!data && len > 0) || !out)
      return VASR_ERR_INVALID_PARAM;
   out->data = NULL;
   out->len = 0;
   try {
      std::vector<uint8_t> bytes;
      int ret = gzip_compress(data, len, bytes);
      if (ret != VASR_SUCCESS)
         return ret;
      return buffer_from_vector(bytes, out);
   } catch (const std::bad_alloc &) {
      return VASR_ERR_OUT_OF_MEMORY;
   }
}

int vasr_gzip_decompress(const uint8_t *data, size_t len, vasr_buffer_t *out) {
   if (!data || !out)
      return VASR_ERR_INVALID_PARAM;
   out->data = NULL;
   out->len = 0;
   try {
      std::vector<uint8_t> bytes;
      int ret = gzip_decompress(data, len, bytes);
      if (ret != VASR_SUCCESS)
         return ret;
      return buffer_from_vector(bytes, out);
   } catch (const std::bad_alloc &) {
      return VASR_ERR_OUT_OF_MEMORY;
   }
}

} /* extern "C" */
