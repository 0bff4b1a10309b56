/**
 * @file inbound.h
 * @brief Decoding of inbound clipboard streams
 */

#ifndef CLIPSYNC_INBOUND_H
#define CLIPSYNC_INBOUND_H

#include "clipsync/event_queue.h"
#include "clipsync/message.h"
#include "clipsync/protocol.h"
#include "clipsync/transport.h"
#include <string>

namespace clipsync {

/// Application-facing queue of decoded remote messages
using MessageQueue = BlockingQueue<ClipboardMessage>;

/**
 * @brief StreamHandler turning one inbound stream into ClipboardMessages
 *
 * One instance per accepted stream. Every complete packet is decoded and
 * pushed to the shared queue in stream order. Malformed packets are logged
 * and dropped without closing the stream.
 */
class CLIPSYNC_API InboundDispatcher : public StreamHandler {
public:
  InboundDispatcher(MessageQueue &queue, std::string remote);

  void on_data(const Byte *data, size_t size) override;
  void on_end() override;
  void on_error(const Error &error) override;

  /// Messages pushed to the queue so far
  size_t forwarded() const { return forwarded_; }

  /// Packets (or trailing fragments) dropped so far
  size_t discarded() const { return discarded_; }

private:
  void drain();

  MessageQueue &queue_;
  std::string remote_;
  PacketParser parser_;
  size_t forwarded_ = 0;
  size_t discarded_ = 0;
};

} // namespace clipsync

#endif // CLIPSYNC_INBOUND_H
