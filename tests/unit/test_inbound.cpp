/**
 * @file test_inbound.cpp
 * @brief Unit tests for InboundDispatcher
 */

#include <clipsync/inbound.h>
#include <gtest/gtest.h>

using namespace clipsync;

namespace {

Bytes packet_for(const std::string &text) {
  ClipboardMessage msg;
  msg.content = ClipboardContent::text(text);
  msg.timestamp = 1;
  msg.sender_id = "peer";
  return encode_message(msg).value();
}

void append(Bytes &stream, const Bytes &packet) {
  stream.insert(stream.end(), packet.begin(), packet.end());
}

std::string pop_text(MessageQueue &queue) {
  auto msg = queue.try_pop();
  if (!msg) {
    return "<empty>";
  }
  return msg->content.as_text();
}

} // anonymous namespace

class InboundTest : public ::testing::Test {
protected:
  MessageQueue queue;
  InboundDispatcher dispatcher{queue, "test-peer"};
};

TEST_F(InboundTest, ForwardsSingleMessage) {
  Bytes packet = packet_for("hello");
  dispatcher.on_data(packet.data(), packet.size());
  dispatcher.on_end();

  EXPECT_EQ(dispatcher.forwarded(), 1u);
  EXPECT_EQ(dispatcher.discarded(), 0u);
  EXPECT_EQ(pop_text(queue), "hello");
}

TEST_F(InboundTest, ForwardsInStreamOrder) {
  Bytes stream;
  append(stream, packet_for("first"));
  append(stream, packet_for("second"));
  append(stream, packet_for("third"));

  dispatcher.on_data(stream.data(), stream.size());

  EXPECT_EQ(dispatcher.forwarded(), 3u);
  EXPECT_EQ(pop_text(queue), "first");
  EXPECT_EQ(pop_text(queue), "second");
  EXPECT_EQ(pop_text(queue), "third");
}

TEST_F(InboundTest, ReassemblesByteAtATime) {
  Bytes packet = packet_for("split across many reads");
  for (Byte b : packet) {
    dispatcher.on_data(&b, 1);
  }

  EXPECT_EQ(dispatcher.forwarded(), 1u);
  EXPECT_EQ(pop_text(queue), "split across many reads");
}

TEST_F(InboundTest, CorruptPacketBetweenGoodOnesIsSkipped) {
  // Valid header, undecodable payload
  Bytes corrupt = build_packet(MessageType::ClipboardPush, Bytes(5, 0xEE));

  Bytes stream;
  append(stream, packet_for("before"));
  append(stream, corrupt);
  append(stream, packet_for("after"));

  dispatcher.on_data(stream.data(), stream.size());
  dispatcher.on_end();

  EXPECT_EQ(dispatcher.forwarded(), 2u);
  EXPECT_EQ(dispatcher.discarded(), 1u);
  EXPECT_EQ(pop_text(queue), "before");
  EXPECT_EQ(pop_text(queue), "after");
}

TEST_F(InboundTest, NonClipboardPacketIsIgnored) {
  Bytes stream = build_packet(MessageType::Hello, Bytes{1, 2});
  append(stream, packet_for("payload"));

  dispatcher.on_data(stream.data(), stream.size());

  EXPECT_EQ(dispatcher.discarded(), 1u);
  EXPECT_EQ(dispatcher.forwarded(), 1u);
  EXPECT_EQ(pop_text(queue), "payload");
}

TEST_F(InboundTest, TruncatedStreamEndIsDiscarded) {
  Bytes packet = packet_for("never finished");
  dispatcher.on_data(packet.data(), packet.size() - 4);
  dispatcher.on_end();

  EXPECT_EQ(dispatcher.forwarded(), 0u);
  EXPECT_EQ(dispatcher.discarded(), 1u);
  EXPECT_EQ(queue.size(), 0u);
}

TEST_F(InboundTest, StreamErrorDropsPartialData) {
  Bytes packet = packet_for("interrupted");
  dispatcher.on_data(packet.data(), 10);
  dispatcher.on_error(Error(ErrorCode::ConnectionLost, "reset by peer"));

  EXPECT_EQ(dispatcher.forwarded(), 0u);
  EXPECT_EQ(queue.size(), 0u);
}

TEST_F(InboundTest, ClosedQueueCountsAsDiscarded) {
  queue.close();

  Bytes packet = packet_for("too late");
  dispatcher.on_data(packet.data(), packet.size());

  EXPECT_EQ(dispatcher.forwarded(), 0u);
  EXPECT_EQ(dispatcher.discarded(), 1u);
}
