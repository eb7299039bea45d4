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
 * Audio pipeline tests (scripted codec, no libopus needed)
 */

#include <gtest/gtest.h>
#include <opus/opus.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "audio/audio_pipeline.h"
#include "test_helpers.h"
#include "vasr.h"

using namespace vasr_test;

namespace {

class AudioPipelineTest : public ::testing::Test {
 protected:
   void SetUp() override {
      start_log_capture();
      memset(&pcm_, 0, sizeof(pcm_));
      memset(&container_, 0, sizeof(container_));
   }

   void TearDown() override {
      vasr_pcm_free(&pcm_);
      vasr_audio_container_free(&container_);
      vasr_set_logger(nullptr);
   }

   vasr_pcm_t pcm_;
   vasr_audio_container_t container_;
};

uint16_t le16(const uint8_t *p) {
   return (uint16_t)(p[0] | (p[1] << 8));
}

uint32_t le32(const uint8_t *p) {
   return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

}  // namespace

TEST_F(AudioPipelineTest, FailedPacketIsSkippedAndLogged) {
   const uint8_t good[] = { 3, 3, 3, 3, 3 };
   const uint8_t bad[] = { kBadPacketMarker, 1, 2 };
   vasr_packet_t packets[] = { { good, sizeof(good) }, { bad, sizeof(bad) } };

   ASSERT_EQ(vasr_audio_decode_packets(&kScriptedCodecOps, packets, 2, &pcm_), VASR_SUCCESS);

   EXPECT_EQ(pcm_.packets_decoded, 1u);
   EXPECT_EQ(pcm_.packets_skipped, 1u);
   ASSERT_EQ(pcm_.num_samples, sizeof(good));
   for (size_t i = 0; i < pcm_.num_samples; i++)
      EXPECT_EQ(pcm_.samples[i], 300);
   EXPECT_EQ(count_logs(VASR_LOG_WARNING, "decode error on packet 2/2"), 1u);
}

TEST_F(AudioPipelineTest, SamplesConcatenatedInPacketOrder) {
   const uint8_t first[] = { 1, 1 };
   const uint8_t second[] = { 2, 2, 2 };
   vasr_packet_t packets[] = { { first, sizeof(first) }, { second, sizeof(second) } };

   ASSERT_EQ(vasr_audio_decode_packets(&kScriptedCodecOps, packets, 2, &pcm_), VASR_SUCCESS);

   std::vector<int16_t> samples(pcm_.samples, pcm_.samples + pcm_.num_samples);
   EXPECT_EQ(samples, (std::vector<int16_t>{ 100, 100, 200, 200, 200 }));
}

TEST_F(AudioPipelineTest, NoPacketsGivesNoSamples) {
   ASSERT_EQ(vasr_audio_decode_packets(&kScriptedCodecOps, nullptr, 0, &pcm_), VASR_SUCCESS);
   EXPECT_EQ(pcm_.num_samples, 0u);
}

TEST_F(AudioPipelineTest, ContainerHeaderIsCanonicalPcm) {
   const int16_t samples[] = { 1, -2, 0x1234 };
   ASSERT_EQ(vasr_audio_build_container(samples, 3, &container_), VASR_SUCCESS);
   ASSERT_EQ(container_.size, VASR_WAV_HEADER_SIZE + 6u);

   const uint8_t *d = container_.data;
   EXPECT_EQ(memcmp(d, "RIFF", 4), 0);
   EXPECT_EQ(le32(d + 4), 36u + 6u);
   EXPECT_EQ(memcmp(d + 8, "WAVE", 4), 0);
   EXPECT_EQ(memcmp(d + 12, "fmt ", 4), 0);
   EXPECT_EQ(le32(d + 16), 16u);
   EXPECT_EQ(le16(d + 20), 1);     /* PCM */
   EXPECT_EQ(le16(d + 22), 1);     /* mono */
   EXPECT_EQ(le32(d + 24), 16000u);
   EXPECT_EQ(le32(d + 28), 32000u);
   EXPECT_EQ(le16(d + 32), 2);
   EXPECT_EQ(le16(d + 34), 16);
   EXPECT_EQ(memcmp(d + 36, "data", 4), 0);
   EXPECT_EQ(le32(d + 40), 6u);

   /* Samples little-endian */
   EXPECT_EQ(d[44], 0x01);
   EXPECT_EQ(d[45], 0x00);
   EXPECT_EQ(d[46], 0xFE);
   EXPECT_EQ(d[47], 0xFF);
   EXPECT_EQ(d[48], 0x34);
   EXPECT_EQ(d[49], 0x12);
}

TEST_F(AudioPipelineTest, ContainerInfoAndSegmentSize) {
   std::vector<int16_t> samples(16000, 7);
   ASSERT_EQ(vasr_audio_build_container(samples.data(), samples.size(), &container_),
             VASR_SUCCESS);

   vasr_wav_info_t info;
   ASSERT_EQ(vasr_audio_container_info(container_.data, container_.size, &info), VASR_SUCCESS);
   EXPECT_EQ(info.channels, 1);
   EXPECT_EQ(info.sample_width, 2);
   EXPECT_EQ(info.sample_rate, 16000);
   EXPECT_EQ(info.frames, 16000u);
   EXPECT_EQ(info.data_bytes, 32000u);

   EXPECT_EQ(vasr_audio_segment_size(&info, 15000), 480000u);
   EXPECT_EQ(vasr_audio_segment_size(&info, 100), 3200u);
   EXPECT_EQ(vasr_audio_segment_size(&info, 0), 0u);
}

TEST_F(AudioPipelineTest, ContainerInfoRejectsNonWav) {
   std::vector<uint8_t> junk(64, 0x55);
   vasr_wav_info_t info;
   EXPECT_EQ(vasr_audio_container_info(junk.data(), junk.size(), &info), VASR_ERR_DECODE);
   EXPECT_EQ(vasr_audio_container_info(junk.data(), 10, &info), VASR_ERR_DECODE);
}

TEST_F(AudioPipelineTest, SaveWritesContainerToNewDirectory) {
   char base[] = "/tmp/vasr_audio_XXXXXX";
   ASSERT_NE(mkdtemp(base), nullptr);
   std::string dir = std::string(base) + "/nested/out";

   const int16_t samples[] = { 10, 20, 30, 40 };
   ASSERT_EQ(vasr_audio_build_container(samples, 4, &container_), VASR_SUCCESS);

   char path[512];
   ASSERT_EQ(vasr_audio_save_wav(dir.c_str(), "abc", &container_, path, sizeof(path)),
             VASR_SUCCESS);

   std::string saved(path);
   EXPECT_EQ(saved.find(dir + "/asr_abc_"), 0u);
   EXPECT_EQ(saved.substr(saved.size() - 4), ".wav");

   struct stat st;
   ASSERT_EQ(stat(path, &st), 0);
   EXPECT_EQ((size_t)st.st_size, container_.size);

   unlink(path);
   rmdir(dir.c_str());
   rmdir((std::string(base) + "/nested").c_str());
   rmdir(base);
}

TEST_F(AudioPipelineTest, OpusCodecDecodesEncodedFrames) {
   int err = OPUS_OK;
   OpusEncoder *encoder = opus_encoder_create(VASR_SAMPLE_RATE, VASR_CHANNELS,
                                              OPUS_APPLICATION_VOIP, &err);
   ASSERT_EQ(err, OPUS_OK);

   std::vector<int16_t> tone(VASR_OPUS_FRAME_SIZE);
   for (size_t i = 0; i < tone.size(); i++)
      tone[i] = (int16_t)((i % 32) < 16 ? 4000 : -4000);

   std::vector<std::vector<uint8_t>> encoded;
   for (int i = 0; i < 3; i++) {
      std::vector<uint8_t> packet(VASR_OPUS_MAX_PACKET_SIZE);
      int n = opus_encode(encoder, tone.data(), VASR_OPUS_FRAME_SIZE, packet.data(),
                          (opus_int32)packet.size());
      ASSERT_GT(n, 0);
      packet.resize(n);
      encoded.push_back(packet);
   }
   opus_encoder_destroy(encoder);

   /* Oversized packet is rejected by the codec and skipped */
   std::vector<uint8_t> oversized(VASR_OPUS_MAX_PACKET_SIZE + 1, 0x42);

   std::vector<vasr_packet_t> packets;
   for (const std::vector<uint8_t> &p : encoded)
      packets.push_back({ p.data(), p.size() });
   packets.push_back({ oversized.data(), oversized.size() });

   ASSERT_EQ(vasr_audio_decode_packets(nullptr, packets.data(), packets.size(), &pcm_),
             VASR_SUCCESS);
   EXPECT_EQ(pcm_.packets_decoded, 3u);
   EXPECT_EQ(pcm_.packets_skipped, 1u);
   EXPECT_EQ(pcm_.num_samples, 3u * VASR_OPUS_FRAME_SIZE);
}
