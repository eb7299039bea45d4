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
 * Frame Codec - binary framing for the openspeech v2 ASR protocol
 *
 * Every WebSocket message is one frame:
 *
 *   byte 0   version (4 bits) | header size in 4-byte words (4 bits)
 *   byte 1   message type (4 bits) | message type specific flags (4 bits)
 *   byte 2   serialization (4 bits) | compression (4 bits)
 *   byte 3   reserved (0x00)
 *   [header extensions: 4 * (header words - 1) bytes]
 *   body     depends on message type (see vasr_frame_decode())
 *
 * Client frames always use a 4-byte header and a 4-byte big-endian payload
 * length followed by the gzip-compressed payload.
 *
 * Thread Safety: all functions are reentrant; no shared state.
 */

#ifndef VASR_FRAME_CODEC_H
#define VASR_FRAME_CODEC_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/* Forward declaration for json-c */
struct json_object;

#ifdef __cplusplus
extern "C" {
#endif

/* =============================================================================
 * Constants
 * ============================================================================= */

#define VASR_PROTOCOL_VERSION 0x1
#define VASR_HEADER_SIZE 4 /* bytes in the mandatory header word */
#define VASR_HEADER_WORDS 1
#define VASR_LENGTH_SIZE 4 /* bytes in a length / sequence / code field */

typedef enum {
   VASR_MSG_FULL_REQUEST = 0x1,
   VASR_MSG_AUDIO_ONLY_REQUEST = 0x2,
   VASR_MSG_FULL_RESPONSE = 0x9,
   VASR_MSG_ACK = 0xB,
   VASR_MSG_ERROR_RESPONSE = 0xF,
} vasr_message_type_t;

typedef enum {
   VASR_SEQ_NONE = 0x0,
   VASR_SEQ_FINAL = 0x2, /* last audio segment of the session */
} vasr_sequence_flag_t;

typedef enum {
   VASR_SERIAL_NONE = 0x0,
   VASR_SERIAL_JSON = 0x1,
   VASR_SERIAL_THRIFT = 0x3,
   VASR_SERIAL_CUSTOM = 0xF,
} vasr_serialization_t;

typedef enum {
   VASR_COMPRESS_NONE = 0x0,
   VASR_COMPRESS_GZIP = 0x1,
   VASR_COMPRESS_CUSTOM = 0xF,
} vasr_compression_t;

/* =============================================================================
 * Structures
 * ============================================================================= */

/**
 * @brief Unpacked form of the 4-byte frame header
 *
 * Fields hold raw nibble values, so unknown values received from the server
 * survive an unpack/pack round trip.
 */
typedef struct {
   uint8_t version;       /**< Protocol version (VASR_PROTOCOL_VERSION) */
   uint8_t header_words;  /**< Header size in 4-byte words (>= 1) */
   uint8_t message_type;  /**< vasr_message_type_t */
   uint8_t flags;         /**< vasr_sequence_flag_t for audio frames */
   uint8_t serialization; /**< vasr_serialization_t */
   uint8_t compression;   /**< vasr_compression_t */
   uint8_t reserved;      /**< Always 0 on encode */
} vasr_header_t;

/**
 * @brief Owned byte buffer (release with vasr_buffer_free())
 */
typedef struct {
   uint8_t *data;
   size_t len;
} vasr_buffer_t;

/**
 * @brief Kind of payload carried by a decoded response
 */
typedef enum {
   VASR_PAYLOAD_NONE = 0, /**< No payload, or serialization "none" */
   VASR_PAYLOAD_JSON,     /**< Parsed JSON document in payload.json */
   VASR_PAYLOAD_TEXT,     /**< Raw bytes (unknown serialization) in payload.text */
} vasr_payload_kind_t;

/**
 * @brief Decoded payload (tagged union, switch on kind)
 */
typedef struct {
   vasr_payload_kind_t kind;
   struct json_object *json; /**< Owned reference, VASR_PAYLOAD_JSON only */
   char *text;               /**< NUL-terminated copy, VASR_PAYLOAD_TEXT only */
   size_t text_len;          /**< Byte count of text (may contain NULs) */
} vasr_payload_t;

/**
 * @brief Result of decoding one server frame
 */
typedef struct {
   uint8_t message_type; /**< vasr_message_type_t (raw nibble) */
   bool has_sequence;
   int32_t sequence; /**< Ack frames only */
   bool has_error_code;
   uint32_t error_code; /**< ErrorResponse frames only */
   bool has_payload_size;
   int64_t payload_size; /**< Declared size field as received (not recomputed) */
   vasr_payload_t payload;
} vasr_response_t;

/**
 * @brief Client frame as seen by the receiving side
 */
typedef struct {
   vasr_header_t header;
   uint32_t declared_size; /**< Length field (compressed size) */
   vasr_buffer_t payload;  /**< Decompressed payload bytes */
} vasr_request_frame_t;

/* =============================================================================
 * Header
 * ============================================================================= */

/**
 * @brief Pack a header struct into its 4-byte wire form
 *
 * Each field is masked to its bit width.
 *
 * @param header Header to pack
 * @param out Destination (VASR_HEADER_SIZE bytes)
 */
void vasr_header_pack(const vasr_header_t *header, uint8_t out[VASR_HEADER_SIZE]);

/**
 * @brief Unpack the first 4 bytes of a frame
 *
 * @param data Frame bytes
 * @param len Number of bytes available
 * @param header_out Receives the unpacked header
 * @return VASR_SUCCESS, or VASR_ERR_DECODE if len < VASR_HEADER_SIZE
 */
int vasr_header_unpack(const uint8_t *data, size_t len, vasr_header_t *header_out);

/**
 * @brief Build the standard client header
 *
 * Version 1, one header word, JSON serialization, gzip compression.
 *
 * @param message_type Message type
 * @param flags Sequence flag
 * @param out Destination (VASR_HEADER_SIZE bytes)
 */
void vasr_frame_encode_header(vasr_message_type_t message_type,
                              vasr_sequence_flag_t flags,
                              uint8_t out[VASR_HEADER_SIZE]);

/* =============================================================================
 * Encoding
 * ============================================================================= */

/**
 * @brief Encode a frame: header + 4-byte big-endian length + payload
 *
 * The payload is gzip-compressed first when header->compression is
 * VASR_COMPRESS_GZIP; any other value sends it as-is.
 *
 * @param header Header to write (header_words is forced to 1)
 * @param payload Raw payload (may be NULL when payload_len is 0)
 * @param payload_len Payload length
 * @param frame_out Receives the encoded frame (caller frees)
 * @return VASR_SUCCESS, VASR_ERR_INVALID_PARAM, VASR_ERR_OUT_OF_MEMORY
 */
int vasr_frame_encode(const vasr_header_t *header,
                      const uint8_t *payload,
                      size_t payload_len,
                      vasr_buffer_t *frame_out);

/**
 * @brief Encode a client request frame (JSON/gzip header)
 *
 * Used for the configuration frame (VASR_MSG_FULL_REQUEST) and for every
 * audio chunk (VASR_MSG_AUDIO_ONLY_REQUEST).
 *
 * @param message_type Request type
 * @param flags Sequence flag (VASR_SEQ_FINAL on the last audio chunk)
 * @param payload Raw payload, compressed by this function
 * @param payload_len Payload length
 * @param frame_out Receives the encoded frame (caller frees)
 * @return VASR_SUCCESS, VASR_ERR_INVALID_PARAM, VASR_ERR_OUT_OF_MEMORY
 */
int vasr_frame_encode_request(vasr_message_type_t message_type,
                              vasr_sequence_flag_t flags,
                              const uint8_t *payload,
                              size_t payload_len,
                              vasr_buffer_t *frame_out);

/* =============================================================================
 * Decoding
 * ============================================================================= */

/**
 * @brief Decode a server frame
 *
 * Header extension words are skipped without interpretation. The body is
 * read according to the message type:
 * - FullResponse:  int32 size, payload
 * - Ack:           int32 sequence [, uint32 size, payload]
 * - ErrorResponse: uint32 code, uint32 size, payload
 * - anything else: no payload
 *
 * An extracted payload is gunzipped when the header says gzip, then parsed as
 * JSON when the header says JSON. Serialization "none" leaves the payload
 * unset; other serialization values yield raw text. An empty Ack or
 * ErrorResponse payload is left unset; an empty FullResponse payload under
 * JSON serialization is a decode error.
 *
 * @param data Frame bytes
 * @param len Frame length
 * @param response_out Receives the decoded frame (release with vasr_response_free())
 * @return VASR_SUCCESS, VASR_ERR_INVALID_PARAM, VASR_ERR_DECODE, VASR_ERR_OUT_OF_MEMORY
 */
int vasr_frame_decode(const uint8_t *data, size_t len, vasr_response_t *response_out);

/**
 * @brief Parse a client frame (header, length, decompressed payload)
 *
 * Counterpart of vasr_frame_encode_request() for the receiving end. The
 * payload is returned as bytes regardless of the serialization nibble.
 *
 * @param data Frame bytes
 * @param len Frame length
 * @param frame_out Receives the frame (release with vasr_request_frame_free())
 * @return VASR_SUCCESS, VASR_ERR_INVALID_PARAM, VASR_ERR_DECODE, VASR_ERR_OUT_OF_MEMORY
 */
int vasr_frame_parse_request(const uint8_t *data, size_t len, vasr_request_frame_t *frame_out);

/**
 * @brief Release a decoded response (safe on a zeroed struct)
 */
void vasr_response_free(vasr_response_t *response);

/**
 * @brief Release a parsed request frame (safe on a zeroed struct)
 */
void vasr_request_frame_free(vasr_request_frame_t *frame);

/**
 * @brief Release a buffer (safe on a zeroed struct)
 */
void vasr_buffer_free(vasr_buffer_t *buffer);

/* =============================================================================
 * Compression
 * ============================================================================= */

/**
 * @brief Compress bytes into a gzip member
 *
 * @return VASR_SUCCESS, VASR_ERR_INVALID_PARAM, VASR_ERR_OUT_OF_MEMORY
 */
int vasr_gzip_compress(const uint8_t *data, size_t len, vasr_buffer_t *out);

/**
 * @brief Decompress a gzip member
 *
 * @return VASR_SUCCESS, VASR_ERR_INVALID_PARAM, VASR_ERR_DECODE, VASR_ERR_OUT_OF_MEMORY
 */
int vasr_gzip_decompress(const uint8_t *data, size_t len, vasr_buffer_t *out);

#ifdef __cplusplus
}
#endif

#endif /* VASR_FRAME_CODEC_H */
