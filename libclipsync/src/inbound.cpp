/**
 * @file inbound.cpp
 * @brief InboundDispatcher implementation
 */

#include "clipsync/inbound.h"
#include <spdlog/spdlog.h>

namespace clipsync {

InboundDispatcher::InboundDispatcher(MessageQueue &queue, std::string remote)
    : queue_(queue), remote_(std::move(remote)) {}

void InboundDispatcher::on_data(const Byte *data, size_t size) {
  parser_.feed(data, size);
  drain();
}

void InboundDispatcher::drain() {
  while (parser_.has_packet()) {
    auto packet = parser_.next_packet();
    if (packet.is_error()) {
      ++discarded_;
      spdlog::warn("Discarding bad packet from {}: {}", remote_,
                   packet.error().to_string());
      continue;
    }

    const PacketHeader &header = packet.value().first;
    if (header.type != static_cast<uint8_t>(MessageType::ClipboardPush)) {
      ++discarded_;
      spdlog::warn("Ignoring {} packet on clipboard stream from {}",
                   message_type_name(static_cast<MessageType>(header.type)),
                   remote_);
      continue;
    }

    auto msg = decode_payload(packet.value().second);
    if (msg.is_error()) {
      ++discarded_;
      spdlog::warn("Discarding undecodable message from {}: {}", remote_,
                   msg.error().to_string());
      continue;
    }

    spdlog::debug("Received {} from {} ({})",
                  msg.value().content.is_text() ? "text" : "image",
                  msg.value().sender_id, remote_);

    if (queue_.push(std::move(msg).value())) {
      ++forwarded_;
    } else {
      ++discarded_;
      spdlog::debug("Message queue closed, dropping message from {}",
                    remote_);
    }
  }
}

void InboundDispatcher::on_end() {
  if (parser_.buffered_size() > 0) {
    ++discarded_;
    spdlog::warn("Stream from {} ended with {} incomplete byte(s)", remote_,
                 parser_.buffered_size());
    parser_.reset();
  }
}

void InboundDispatcher::on_error(const Error &error) {
  spdlog::warn("Inbound stream from {} failed: {}", remote_,
               error.to_string());
  parser_.reset();
}

} // namespace clipsync
