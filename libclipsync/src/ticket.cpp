/**
 * @file ticket.cpp
 * @brief Connection ticket encoding (base64 over JSON)
 */

#include "clipsync/ticket.h"
#include "clipsync/security.h"
#include <nlohmann/json.hpp>

namespace clipsync {

namespace {

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  size_t start = s.find_first_not_of(ws);
  if (start == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(ws);
  return s.substr(start, end - start + 1);
}

Error invalid_ticket(const std::string &details) {
  return Error(ErrorCode::InvalidTicket, "Invalid connection ticket", details);
}

} // anonymous namespace

std::string ConnectionTicket::encode() const {
  nlohmann::json j;
  j["node_id"] = peer_id.to_hex();
  j["addresses"] = nlohmann::json::array();
  for (const auto &addr : addresses) {
    j["addresses"].push_back(addr.to_string());
  }

  std::string text = j.dump();
  return base64_encode(Bytes(text.begin(), text.end()));
}

Result<ConnectionTicket> ConnectionTicket::decode(const std::string &text) {
  auto raw = base64_decode(trim(text));
  if (raw.is_error()) {
    return invalid_ticket("not base64");
  }

  const Bytes &bytes = raw.value();
  auto j = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return invalid_ticket("not a JSON object");
  }

  if (!j.contains("node_id") || !j["node_id"].is_string()) {
    return invalid_ticket("missing node_id");
  }
  auto id = PeerId::from_hex(j["node_id"].get<std::string>());
  if (!id) {
    return invalid_ticket("malformed node_id");
  }

  ConnectionTicket ticket;
  ticket.peer_id = *id;

  // An empty list is fine, a missing one is not
  if (!j.contains("addresses")) {
    return invalid_ticket("missing addresses");
  }
  if (!j["addresses"].is_array()) {
    return invalid_ticket("addresses is not an array");
  }
  for (const auto &entry : j["addresses"]) {
    if (!entry.is_string()) {
      return invalid_ticket("address is not a string");
    }
    auto addr = SocketAddress::parse(entry.get<std::string>());
    if (addr.is_error()) {
      return invalid_ticket(addr.error().message);
    }
    ticket.addresses.push_back(addr.value());
  }

  return ticket;
}

} // namespace clipsync
