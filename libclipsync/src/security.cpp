/**
 * @file security.cpp
 * @brief libsodium wrapper implementation for clipsync
 */

#include "clipsync/security.h"
#include <atomic>
#include <sodium.h>

namespace clipsync {

namespace {
std::atomic<bool> g_initialized{false};
}

// ============================================================================
// Initialization
// ============================================================================

Result<void> security_init() {
  if (g_initialized.load()) {
    return Result<void>::ok();
  }

  if (sodium_init() < 0) {
    return Error(ErrorCode::PlatformError, "Failed to initialize libsodium");
  }

  g_initialized.store(true);
  return Result<void>::ok();
}

bool is_security_initialized() { return g_initialized.load(); }

// Auto-initialize on first use. sodium_init() only fails when the system
// entropy source is unavailable, in which case randombytes_buf aborts anyway.
static inline void ensure_initialized() {
  if (!g_initialized.load()) {
    auto result = security_init();
    CLIPSYNC_UNUSED(result);
  }
}

// ============================================================================
// Random Number Generation
// ============================================================================

Bytes random_bytes(size_t count) {
  ensure_initialized();

  Bytes result(count);
  randombytes_buf(result.data(), count);
  return result;
}

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(const Bytes &data) {
  ensure_initialized();

  const int variant = sodium_base64_VARIANT_ORIGINAL;
  std::string out(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
  sodium_bin2base64(&out[0], out.size(), data.data(), data.size(), variant);

  // Drop the terminating NUL written by libsodium
  out.resize(out.size() - 1);
  return out;
}

Result<Bytes> base64_decode(const std::string &text) {
  ensure_initialized();

  if (text.empty()) {
    return Error(ErrorCode::DecodingError, "Empty base64 input");
  }

  Bytes out(text.size() / 4 * 3 + 3);
  size_t decoded_len = 0;
  const char *end = nullptr;

  int rc = sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                             nullptr, &decoded_len, &end,
                             sodium_base64_VARIANT_ORIGINAL);
  if (rc != 0 || end != text.data() + text.size()) {
    return Error(ErrorCode::DecodingError, "Malformed base64 input");
  }

  out.resize(decoded_len);
  return out;
}

} // namespace clipsync
