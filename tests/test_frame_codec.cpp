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
 * Frame codec tests
 */

#include <gtest/gtest.h>
#include <json-c/json.h>

#include <string>
#include <vector>

#include "protocol/frame_codec.h"
#include "test_helpers.h"
#include "vasr.h"

using namespace vasr_test;

namespace {

class FrameCodecTest : public ::testing::Test {
 protected:
   void SetUp() override {
      start_log_capture();
      memset(&response_, 0, sizeof(response_));
   }

   void TearDown() override {
      vasr_response_free(&response_);
      vasr_set_logger(nullptr);
   }

   int decode(const std::vector<uint8_t> &frame) {
      return vasr_frame_decode(frame.data(), frame.size(), &response_);
   }

   vasr_response_t response_;
};

}  // namespace

TEST_F(FrameCodecTest, EncodeHeaderLayout) {
   uint8_t raw[VASR_HEADER_SIZE];
   vasr_frame_encode_header(VASR_MSG_AUDIO_ONLY_REQUEST, VASR_SEQ_FINAL, raw);

   EXPECT_EQ(raw[0], 0x11);
   EXPECT_EQ(raw[1], 0x22);
   EXPECT_EQ(raw[2], 0x11);
   EXPECT_EQ(raw[3], 0x00);
}

TEST_F(FrameCodecTest, HeaderNibblesRoundTrip) {
   const vasr_message_type_t types[] = { VASR_MSG_FULL_REQUEST, VASR_MSG_AUDIO_ONLY_REQUEST,
                                         VASR_MSG_FULL_RESPONSE, VASR_MSG_ACK,
                                         VASR_MSG_ERROR_RESPONSE };
   const vasr_sequence_flag_t flags[] = { VASR_SEQ_NONE, VASR_SEQ_FINAL };

   for (vasr_message_type_t type : types) {
      for (vasr_sequence_flag_t flag : flags) {
         uint8_t raw[VASR_HEADER_SIZE];
         vasr_frame_encode_header(type, flag, raw);

         vasr_header_t header;
         ASSERT_EQ(vasr_header_unpack(raw, sizeof(raw), &header), VASR_SUCCESS);
         EXPECT_EQ(header.version, VASR_PROTOCOL_VERSION);
         EXPECT_EQ(header.header_words, 1);
         EXPECT_EQ(header.message_type, type);
         EXPECT_EQ(header.flags, flag);
         EXPECT_EQ(header.serialization, VASR_SERIAL_JSON);
         EXPECT_EQ(header.compression, VASR_COMPRESS_GZIP);
         EXPECT_EQ(header.reserved, 0);
      }
   }
}

TEST_F(FrameCodecTest, PackMasksFieldsToNibbles) {
   vasr_header_t header = { 0x1F, 0x21, 0x9, 0x32, 0x1, 0x1, 0 };
   uint8_t raw[VASR_HEADER_SIZE];
   vasr_header_pack(&header, raw);

   EXPECT_EQ(raw[0], 0xF1);
   EXPECT_EQ(raw[1], 0x92);
}

TEST_F(FrameCodecTest, RequestPayloadRecoveredForSeveralSizes) {
   const size_t sizes[] = { 0, 1, 70000 };
   for (size_t size : sizes) {
      std::vector<uint8_t> payload(size);
      for (size_t i = 0; i < size; i++)
         payload[i] = (uint8_t)(i * 31 + 7);

      vasr_buffer_t frame = { nullptr, 0 };
      ASSERT_EQ(vasr_frame_encode_request(VASR_MSG_FULL_REQUEST, VASR_SEQ_NONE, payload.data(),
                                          payload.size(), &frame),
                VASR_SUCCESS);

      vasr_request_frame_t parsed;
      ASSERT_EQ(vasr_frame_parse_request(frame.data, frame.len, &parsed), VASR_SUCCESS)
          << "size " << size;
      EXPECT_EQ(parsed.header.message_type, VASR_MSG_FULL_REQUEST);
      EXPECT_EQ(parsed.declared_size, frame.len - VASR_HEADER_SIZE - VASR_LENGTH_SIZE);
      ASSERT_EQ(parsed.payload.len, size);
      if (size > 0)
         EXPECT_EQ(memcmp(parsed.payload.data, payload.data(), size), 0);

      vasr_request_frame_free(&parsed);
      vasr_buffer_free(&frame);
   }
}

TEST_F(FrameCodecTest, LengthFieldIsBigEndianCompressedSize) {
   const std::string text = "{\"hello\":\"world\"}";
   vasr_buffer_t frame = { nullptr, 0 };
   ASSERT_EQ(vasr_frame_encode_request(VASR_MSG_FULL_REQUEST, VASR_SEQ_NONE,
                                       (const uint8_t *)text.data(), text.size(), &frame),
             VASR_SUCCESS);

   uint32_t declared = ((uint32_t)frame.data[4] << 24) | ((uint32_t)frame.data[5] << 16) |
                       ((uint32_t)frame.data[6] << 8) | frame.data[7];
   EXPECT_EQ(declared, frame.len - 8);
   /* gzip magic */
   EXPECT_EQ(frame.data[8], 0x1f);
   EXPECT_EQ(frame.data[9], 0x8b);
   vasr_buffer_free(&frame);
}

TEST_F(FrameCodecTest, DecodesFullResponseJson) {
   ASSERT_EQ(decode(full_response("{\"code\":1000,\"result\":[{\"text\":\"hi\"}]}")), VASR_SUCCESS);

   EXPECT_EQ(response_.message_type, VASR_MSG_FULL_RESPONSE);
   EXPECT_TRUE(response_.has_payload_size);
   EXPECT_FALSE(response_.has_sequence);
   EXPECT_FALSE(response_.has_error_code);
   ASSERT_EQ(response_.payload.kind, VASR_PAYLOAD_JSON);

   json_object *code;
   ASSERT_TRUE(json_object_object_get_ex(response_.payload.json, "code", &code));
   EXPECT_EQ(json_object_get_int(code), 1000);
}

TEST_F(FrameCodecTest, EmptyJsonFullResponseFails) {
   EXPECT_EQ(decode(full_response("")), VASR_ERR_DECODE);
   EXPECT_EQ(response_.payload.kind, VASR_PAYLOAD_NONE);
   EXPECT_EQ(count_logs(VASR_LOG_WARNING, "empty JSON payload"), 1u);
}

TEST_F(FrameCodecTest, DecodesErrorResponseWithEmptyPayload) {
   ASSERT_EQ(decode(error_response(45000001, "")), VASR_SUCCESS);

   EXPECT_EQ(response_.message_type, VASR_MSG_ERROR_RESPONSE);
   ASSERT_TRUE(response_.has_error_code);
   EXPECT_EQ(response_.error_code, 45000001u);
   EXPECT_EQ(response_.payload_size, 0);
   EXPECT_EQ(response_.payload.kind, VASR_PAYLOAD_NONE);
}

TEST_F(FrameCodecTest, ErrorResponseShorterThanCodeAndSizeFails) {
   std::vector<uint8_t> frame =
       server_frame(VASR_MSG_ERROR_RESPONSE, { 1234 }, "", VASR_SERIAL_JSON, VASR_COMPRESS_GZIP,
                    false);
   EXPECT_EQ(decode(frame), VASR_ERR_DECODE);
}

TEST_F(FrameCodecTest, DecodesAckWithPayload) {
   ASSERT_EQ(decode(ack(1, "{\"code\":1000}")), VASR_SUCCESS);

   EXPECT_EQ(response_.message_type, VASR_MSG_ACK);
   ASSERT_TRUE(response_.has_sequence);
   EXPECT_EQ(response_.sequence, 1);
   EXPECT_TRUE(response_.has_payload_size);
   EXPECT_EQ(response_.payload.kind, VASR_PAYLOAD_JSON);
}

TEST_F(FrameCodecTest, DecodesAckWithoutPayload) {
   std::vector<uint8_t> frame = server_frame(VASR_MSG_ACK, { (uint32_t)-3 }, "", VASR_SERIAL_JSON,
                                             VASR_COMPRESS_GZIP, false);
   ASSERT_EQ(decode(frame), VASR_SUCCESS);

   ASSERT_TRUE(response_.has_sequence);
   EXPECT_EQ(response_.sequence, -3);
   EXPECT_FALSE(response_.has_payload_size);
   EXPECT_EQ(response_.payload.kind, VASR_PAYLOAD_NONE);
}

TEST_F(FrameCodecTest, SkipsHeaderExtensionWords) {
   std::vector<uint8_t> frame = full_response("{\"code\":1000}");
   /* Two words: insert 4 opaque bytes after the mandatory header */
   frame[0] = (uint8_t)((VASR_PROTOCOL_VERSION << 4) | 2);
   const uint8_t extension[] = { 0xDE, 0xAD, 0xBE, 0xEF };
   frame.insert(frame.begin() + VASR_HEADER_SIZE, extension, extension + 4);

   ASSERT_EQ(decode(frame), VASR_SUCCESS);
   EXPECT_EQ(response_.message_type, VASR_MSG_FULL_RESPONSE);
   EXPECT_EQ(response_.payload.kind, VASR_PAYLOAD_JSON);
}

TEST_F(FrameCodecTest, TruncatedInputFails) {
   const uint8_t too_short[] = { 0x11, 0x90 };
   EXPECT_EQ(vasr_frame_decode(too_short, sizeof(too_short), &response_), VASR_ERR_DECODE);

   /* Header claims three words but only one is present */
   const uint8_t short_extension[] = { 0x13, 0x90, 0x11, 0x00, 0x00, 0x00 };
   EXPECT_EQ(vasr_frame_decode(short_extension, sizeof(short_extension), &response_),
             VASR_ERR_DECODE);

   /* Full response without its size field */
   const uint8_t no_size[] = { 0x11, 0x90, 0x11, 0x00, 0x00, 0x00 };
   EXPECT_EQ(vasr_frame_decode(no_size, sizeof(no_size), &response_), VASR_ERR_DECODE);

   /* Ack without its sequence field */
   const uint8_t no_sequence[] = { 0x11, 0xB0, 0x11, 0x00 };
   EXPECT_EQ(vasr_frame_decode(no_sequence, sizeof(no_sequence), &response_), VASR_ERR_DECODE);
}

TEST_F(FrameCodecTest, CorruptGzipFails) {
   std::vector<uint8_t> frame = server_frame(VASR_MSG_FULL_RESPONSE, {}, "not gzip at all",
                                             VASR_SERIAL_JSON, VASR_COMPRESS_NONE);
   /* Claim gzip for a plain payload */
   frame[2] = (uint8_t)((VASR_SERIAL_JSON << 4) | VASR_COMPRESS_GZIP);
   EXPECT_EQ(decode(frame), VASR_ERR_DECODE);
}

TEST_F(FrameCodecTest, InvalidJsonFails) {
   EXPECT_EQ(decode(full_response("{\"code\": 10")), VASR_ERR_DECODE);
}

TEST_F(FrameCodecTest, UnknownSerializationPassesThroughAsText) {
   std::vector<uint8_t> frame =
       server_frame(VASR_MSG_FULL_RESPONSE, {}, "raw\x01thrift", VASR_SERIAL_THRIFT, 0x7);

   ASSERT_EQ(decode(frame), VASR_SUCCESS);
   ASSERT_EQ(response_.payload.kind, VASR_PAYLOAD_TEXT);
   EXPECT_EQ(std::string(response_.payload.text, response_.payload.text_len), "raw\x01thrift");
}

TEST_F(FrameCodecTest, NoneSerializationLeavesPayloadUnset) {
   std::vector<uint8_t> frame =
       server_frame(VASR_MSG_FULL_RESPONSE, {}, "ignored", VASR_SERIAL_NONE, VASR_COMPRESS_NONE);

   ASSERT_EQ(decode(frame), VASR_SUCCESS);
   EXPECT_EQ(response_.payload.kind, VASR_PAYLOAD_NONE);
}

TEST_F(FrameCodecTest, OtherMessageTypesCarryTypeOnly) {
   std::vector<uint8_t> frame = server_frame(VASR_MSG_AUDIO_ONLY_REQUEST, {}, "{\"code\":1}");

   ASSERT_EQ(decode(frame), VASR_SUCCESS);
   EXPECT_EQ(response_.message_type, VASR_MSG_AUDIO_ONLY_REQUEST);
   EXPECT_EQ(response_.payload.kind, VASR_PAYLOAD_NONE);
   EXPECT_FALSE(response_.has_payload_size);
}

TEST_F(FrameCodecTest, DeclaredSizeSurfacedAsReceived) {
   std::vector<uint8_t> frame = full_response("{\"code\":1000}");
   /* Lie about the size: decoding uses the remaining bytes, not the field */
   frame[4] = 0x00;
   frame[5] = 0x00;
   frame[6] = 0x10;
   frame[7] = 0x00;

   ASSERT_EQ(decode(frame), VASR_SUCCESS);
   EXPECT_EQ(response_.payload_size, 0x1000);
   EXPECT_EQ(response_.payload.kind, VASR_PAYLOAD_JSON);
}

TEST_F(FrameCodecTest, GzipRoundTrip) {
   const std::string text(5000, 'a');
   vasr_buffer_t packed = { nullptr, 0 };
   ASSERT_EQ(vasr_gzip_compress((const uint8_t *)text.data(), text.size(), &packed),
             VASR_SUCCESS);
   EXPECT_LT(packed.len, text.size());

   vasr_buffer_t unpacked = { nullptr, 0 };
   ASSERT_EQ(vasr_gzip_decompress(packed.data, packed.len, &unpacked), VASR_SUCCESS);
   EXPECT_EQ(std::string((const char *)unpacked.data, unpacked.len), text);

   vasr_buffer_free(&packed);
   vasr_buffer_free(&unpacked);
}
