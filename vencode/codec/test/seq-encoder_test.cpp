#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <thread>
#include <vector>

#include "vencode/any.hpp"
#include "vencode/chan.hpp"
#include "vencode/codec-options.hpp"
#include "vencode/encoder.hpp"
#include "vencode/raw-bytes.hpp"
#include "vencode/raw.hpp"
#include "vencode/timedef.hpp"
#include "vencode/trace-handle.hpp"

namespace vencode {

TEST(SeqEncoderTest, Sequences) {
  test::TraceHandle handle;
  EXPECT_EQ(test::TraceOf(handle, std::vector<int>{1, 2, 3}), "[3 i:1 i:2 i:3 ]");
  EXPECT_EQ(test::TraceOf(handle, std::vector<int>{}), "[0 ]");
  EXPECT_EQ(test::TraceOf(handle, std::array<std::string, 2>{"a", "b"}), "[2 s:a s:b ]");
  EXPECT_EQ(test::TraceOf(handle, std::deque<bool>{true, false}), "[2 b:true b:false ]");
  EXPECT_EQ(test::TraceOf(handle, std::vector<std::vector<int>>{{1}, {}}), "[2 [1 i:1 ] [0 ] ]");
  EXPECT_EQ(test::TraceOf(handle, std::vector<Any>{Any(1), Any(), Any(std::string("s"))}), "[3 i:1 nil s:s ]");

  const int values[3] = {4, 5, 6};
  EXPECT_EQ(test::TraceOf(handle, values), "[3 i:4 i:5 i:6 ]");
}

TEST(SeqEncoderTest, ByteSequencesAreRawStrings) {
  test::TraceHandle handle;
  EXPECT_EQ(test::TraceOf(handle, std::vector<std::uint8_t>{0x01, 0xab}), "bin:01ab");
  EXPECT_EQ(test::TraceOf(handle, std::array<std::byte, 2>{std::byte{0xff}, std::byte{0x00}}), "bin:ff00");
  EXPECT_EQ(test::TraceOf(handle, RawBytes(std::string_view("AB"))), "bin:4142");
  EXPECT_EQ(test::TraceOf(handle, std::vector<std::uint8_t>{}), "bin:");
  // char elements are integers
  EXPECT_EQ(test::TraceOf(handle, std::vector<char>{'h', 'i'}), "[2 i:104 i:105 ]");
}

TEST(SeqEncoderTest, MapBySlice) {
  test::TraceHandle handle;
  EXPECT_EQ(test::TraceOf(handle, MapBySlice<Any>{"a", 1, "b", 2}), "{2 s:a i:1 s:b i:2 }");
  EXPECT_EQ(test::TraceOf(handle, MapBySlice<int>{}), "{0 }");

  test::TraceHandle tracked(CodecOptions{}, test::TraceMode::Text, true);
  EXPECT_EQ(test::TraceOf(tracked, MapBySlice<int>{1, 2}), "{1 |k i:1 |v i:2 }");
}

TEST(SeqEncoderTest, MapBySliceWithOddLength) {
  test::TraceHandle handle;
  RawBytes out;
  Encoder enc(handle, out);
  EncodeResult res = enc.encode(MapBySlice<Any>{"a", 1, "b"});
  ASSERT_TRUE(res.hasError());
  EXPECT_EQ(res.error(), EncodeErrc::MalformedFlattenedSequence);
}

TEST(SeqEncoderTest, NilChannel) {
  test::TraceHandle handle;
  EXPECT_EQ(test::TraceOf(handle, Chan<int>()), "nil");
}

TEST(SeqEncoderTest, ChannelDrainDoesNotBlockWithZeroTimeout) {
  test::TraceHandle handle;
  auto chan = Chan<int>::make();

  const SteadyTimePoint start = SteadyClock::now();
  EXPECT_EQ(test::TraceOf(handle, chan), "[0 ]");
  EXPECT_LT(SteadyClock::now() - start, std::chrono::seconds(1));

  chan.send(1);
  chan.send(2);
  EXPECT_EQ(test::TraceOf(handle, chan), "[2 i:1 i:2 ]");
  EXPECT_EQ(chan.size(), 0U);
}

TEST(SeqEncoderTest, ChannelDrainUntilClosed) {
  test::TraceHandle handle(CodecOptions{}.withChanRecvTimeout(std::chrono::milliseconds(-1)));
  auto chan = Chan<int>::make();
  std::jthread producer([chan] {
    for (int value = 1; value <= 3; ++value) {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      chan.send(value);
    }
    chan.close();
  });
  EXPECT_EQ(test::TraceOf(handle, chan.recvOnly()), "[3 i:1 i:2 i:3 ]");
}

TEST(SeqEncoderTest, ChannelDrainStopsAtTimeout) {
  test::TraceHandle handle(CodecOptions{}.withChanRecvTimeout(std::chrono::milliseconds(20)));
  auto chan = Chan<int>::make();
  chan.send(4);

  const SteadyTimePoint start = SteadyClock::now();
  EXPECT_EQ(test::TraceOf(handle, chan), "[1 i:4 ]");
  EXPECT_GE(SteadyClock::now() - start, std::chrono::milliseconds(20));
}

TEST(SeqEncoderTest, ByteChannel) {
  test::TraceHandle handle;
  auto chan = Chan<std::uint8_t>::make();
  chan.send(0x01);
  chan.send(0x02);
  EXPECT_EQ(test::TraceOf(handle, chan), "bin:0102");
}

TEST(SeqEncoderTest, SendOnlyChannel) {
  test::TraceHandle handle;
  auto chan = Chan<int>::make();
  chan.send(1);

  RawBytes out;
  Encoder enc(handle, out);
  EncodeResult res = enc.encode(chan.sendOnly());
  ASSERT_TRUE(res.hasError());
  EXPECT_EQ(res.error(), EncodeErrc::SendOnlyChannel);
  EXPECT_EQ(chan.size(), 1U);
}

}  // namespace vencode
