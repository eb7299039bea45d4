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
 * Chunker tests
 */

#include <gtest/gtest.h>

#include <vector>

#include "protocol/chunker.h"
#include "vasr.h"

namespace {

std::vector<vasr_chunk_t> split(const std::vector<uint8_t> &data, size_t chunk_size) {
   std::vector<vasr_chunk_t> chunks;
   vasr_chunker_t chunker;
   if (vasr_chunker_init(&chunker, data.empty() ? nullptr : data.data(), data.size(),
                         chunk_size) != VASR_SUCCESS)
      return chunks;

   vasr_chunk_t chunk;
   while (vasr_chunker_next(&chunker, &chunk))
      chunks.push_back(chunk);
   return chunks;
}

std::vector<uint8_t> pattern(size_t len) {
   std::vector<uint8_t> data(len);
   for (size_t i = 0; i < len; i++)
      data[i] = (uint8_t)i;
   return data;
}

}  // namespace

TEST(ChunkerTest, ExactMultipleYieldsKChunks) {
   std::vector<uint8_t> data = pattern(4 * 100);
   std::vector<vasr_chunk_t> chunks = split(data, 100);

   ASSERT_EQ(chunks.size(), 4u);
   for (size_t i = 0; i < chunks.size(); i++) {
      EXPECT_EQ(chunks[i].len, 100u);
      EXPECT_EQ(chunks[i].data, data.data() + i * 100);
      EXPECT_EQ(chunks[i].is_final, i == 3);
   }
   EXPECT_EQ(vasr_chunker_count(data.size(), 100), 4u);
}

TEST(ChunkerTest, RemainderIsFinalChunk) {
   std::vector<uint8_t> data = pattern(250);
   std::vector<vasr_chunk_t> chunks = split(data, 100);

   ASSERT_EQ(chunks.size(), 3u);
   EXPECT_EQ(chunks[0].len, 100u);
   EXPECT_FALSE(chunks[0].is_final);
   EXPECT_EQ(chunks[1].len, 100u);
   EXPECT_FALSE(chunks[1].is_final);
   EXPECT_EQ(chunks[2].len, 50u);
   EXPECT_TRUE(chunks[2].is_final);
   EXPECT_EQ(vasr_chunker_count(data.size(), 100), 3u);
}

TEST(ChunkerTest, ShortInputIsOneFinalChunk) {
   std::vector<uint8_t> data = pattern(44);
   std::vector<vasr_chunk_t> chunks = split(data, 480000);

   ASSERT_EQ(chunks.size(), 1u);
   EXPECT_EQ(chunks[0].len, 44u);
   EXPECT_TRUE(chunks[0].is_final);
}

TEST(ChunkerTest, EmptyInputIsOneEmptyFinalChunk) {
   std::vector<uint8_t> data;
   std::vector<vasr_chunk_t> chunks = split(data, 16);

   ASSERT_EQ(chunks.size(), 1u);
   EXPECT_EQ(chunks[0].len, 0u);
   EXPECT_TRUE(chunks[0].is_final);
   EXPECT_EQ(vasr_chunker_count(0, 16), 1u);
}

TEST(ChunkerTest, ZeroChunkSizeRejected) {
   std::vector<uint8_t> data = pattern(10);
   vasr_chunker_t chunker;
   EXPECT_EQ(vasr_chunker_init(&chunker, data.data(), data.size(), 0), VASR_ERR_INVALID_PARAM);
   EXPECT_EQ(vasr_chunker_count(data.size(), 0), 0u);
}

TEST(ChunkerTest, NullDataWithLengthRejected) {
   vasr_chunker_t chunker;
   EXPECT_EQ(vasr_chunker_init(&chunker, nullptr, 10, 4), VASR_ERR_INVALID_PARAM);
}

TEST(ChunkerTest, NotRestartable) {
   std::vector<uint8_t> data = pattern(10);
   vasr_chunker_t chunker;
   ASSERT_EQ(vasr_chunker_init(&chunker, data.data(), data.size(), 4), VASR_SUCCESS);

   vasr_chunk_t chunk;
   size_t produced = 0;
   while (vasr_chunker_next(&chunker, &chunk))
      produced++;
   EXPECT_EQ(produced, 3u);
   EXPECT_FALSE(vasr_chunker_next(&chunker, &chunk));
}

TEST(ChunkerTest, ChunksCoverInputInOrder) {
   std::vector<uint8_t> data = pattern(1000);
   std::vector<vasr_chunk_t> chunks = split(data, 333);

   std::vector<uint8_t> joined;
   for (const vasr_chunk_t &chunk : chunks)
      joined.insert(joined.end(), chunk.data, chunk.data + chunk.len);
   EXPECT_EQ(joined, data);
}
