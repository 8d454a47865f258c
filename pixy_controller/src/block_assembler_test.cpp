#include <gtest/gtest.h>
#include <vector>

#include "block_assembler.hpp"

using namespace pixy;

namespace {

void put16(std::vector<uint8_t>& v, uint16_t w) {
  v.push_back((uint8_t)(w & 0xFF));
  v.push_back((uint8_t)(w >> 8));
}

TEST(BlockAssemblerTest, AcceptsMatchingChecksum) {
  BlockAssembler a;
  a.begin(SYNC_WORD);
  a.set_checksum(181);
  a.accumulate(BlockField::SIGNATURE, 1);
  a.accumulate(BlockField::CENTER_X, 100);
  a.accumulate(BlockField::CENTER_Y, 50);
  a.accumulate(BlockField::WIDTH, 10);
  a.accumulate(BlockField::HEIGHT, 20);
  EXPECT_EQ(181, a.running_checksum());

  EXPECT_TRUE(a.finalize());
  EXPECT_FALSE(a.in_progress());
  ASSERT_EQ(1u, a.frame_size());
  EXPECT_EQ(100, a.frame()[0].center_x);
  EXPECT_EQ(181, a.frame()[0].checksum);
}

TEST(BlockAssemblerTest, RejectsMismatchedChecksum) {
  BlockAssembler a;
  a.begin(SYNC_WORD);
  a.set_checksum(182);
  std::vector<uint8_t> body;
  put16(body, 1);
  put16(body, 100);
  put16(body, 50);
  put16(body, 10);
  put16(body, 20);
  a.accumulate_body(body.data(), body.size());

  EXPECT_FALSE(a.finalize());
  EXPECT_EQ(0u, a.frame_size());
}

TEST(BlockAssemblerTest, ChecksumWrapsAtSixteenBits) {
  BlockAssembler a;
  a.begin(SYNC_WORD_CC);
  a.set_checksum((uint16_t)(0xFFFF + 0x0003 + (uint16_t)-2));
  std::vector<uint8_t> body;
  put16(body, 0xFFFF);
  put16(body, 0x0003);
  put16(body, 0);
  put16(body, 0);
  put16(body, 0);
  put16(body, (uint16_t)-2);
  a.accumulate_body(body.data(), body.size());

  EXPECT_EQ(-2, a.pending().angle);
  EXPECT_EQ(a.pending().checksum, a.running_checksum());
  EXPECT_TRUE(a.finalize());
}

TEST(BlockAssemblerTest, BeginDropsUnfinishedBlock) {
  BlockAssembler a;
  a.begin(SYNC_WORD);
  a.set_checksum(7);
  a.accumulate(BlockField::SIGNATURE, 3);

  a.begin(SYNC_WORD_CC);
  EXPECT_TRUE(a.in_progress());
  EXPECT_EQ(SYNC_WORD_CC, a.pending().sync);
  EXPECT_EQ(0, a.pending().signature);
  EXPECT_EQ(0, a.running_checksum());
}

TEST(BlockAssemblerTest, TakeFrameStartsEmptyFrame) {
  BlockAssembler a;
  for (uint16_t sig = 1; sig <= 3; ++sig) {
    a.begin(SYNC_WORD);
    a.set_checksum(sig);
    a.accumulate(BlockField::SIGNATURE, sig);
    ASSERT_TRUE(a.finalize());
  }

  std::vector<ObjectBlock> frame = a.take_frame();
  ASSERT_EQ(3u, frame.size());
  EXPECT_EQ(1, frame[0].signature);
  EXPECT_EQ(3, frame[2].signature);
  EXPECT_EQ(0u, a.frame_size());
}

TEST(BlockAssemblerTest, DiscardedBlockIsNotFinalized) {
  BlockAssembler a;
  a.begin(SYNC_WORD);
  a.set_checksum(0);
  a.discard();
  EXPECT_FALSE(a.in_progress());
  EXPECT_FALSE(a.finalize());
  EXPECT_EQ(0u, a.frame_size());
}

} // namespace
