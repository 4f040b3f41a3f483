#include "output_packer.h"

#include "gtest/gtest.h"

namespace fiboblink {
namespace {

OutputView activeView() {
    OutputView view;
    view.sequenceActive = true;
    return view;
}

TEST(OutputPackerTest, FlagBits) {
    OutputView view = activeView();
    EXPECT_EQ(pack(view).uoOut, 0x04);
    view.led = true;
    EXPECT_EQ(pack(view).uoOut, 0x05);
    view.tick = true;
    EXPECT_EQ(pack(view).uoOut, 0x07);
    view.newNumberPulse = true;
    EXPECT_EQ(pack(view).uoOut, 0x0F);
}

TEST(OutputPackerTest, ValueSplit) {
    OutputView view = activeView();
    view.value = 0x9A5;
    const OutputWords words = pack(view);
    EXPECT_EQ(words.uoOut >> 4, 0x5);
    EXPECT_EQ(words.uioOut, 0x9A);
    EXPECT_EQ(words.uioOe, 0xFF);
}

TEST(OutputPackerTest, InactiveForcesFlagsLow) {
    OutputView view;
    view.led = true;
    view.tick = true;
    view.newNumberPulse = true;
    view.value = 0x123;
    const OutputWords words = pack(view);
    EXPECT_EQ(words.uoOut & output_bits::kFlagsMask, 0);
    // the held value is still visible
    EXPECT_EQ(words.uoOut >> 4, 0x3);
    EXPECT_EQ(words.uioOut, 0x12);
}

TEST(OutputPackerTest, UnpackReadsFields) {
    const OutputView view = unpack(0x5D, 0x9A);
    EXPECT_TRUE(view.led);
    EXPECT_FALSE(view.tick);
    EXPECT_TRUE(view.sequenceActive);
    EXPECT_TRUE(view.newNumberPulse);
    EXPECT_EQ(view.value, 0x9A5);
    EXPECT_EQ(pack(view), (OutputWords{0x5D, 0x9A, 0xFF}));
}

}  // namespace
}  // namespace fiboblink
