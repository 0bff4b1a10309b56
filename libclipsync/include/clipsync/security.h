/**
 * @file security.h
 * @brief libsodium helpers used by clipsync
 *
 * clipsync does not encrypt clipboard traffic itself. libsodium provides:
 * - the CSPRNG behind peer identities
 * - constant-time base64 for connection tickets
 */

#ifndef CLIPSYNC_SECURITY_H
#define CLIPSYNC_SECURITY_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <string>

namespace clipsync {

// ============================================================================
// Initialization
// ============================================================================

/**
 * @brief Initialize libsodium (called automatically on first use)
 * @return Success or error
 */
CLIPSYNC_API Result<void> security_init();

/**
 * @brief Check if security module is initialized
 */
CLIPSYNC_API bool is_security_initialized();

// ============================================================================
// Random Number Generation
// ============================================================================

/**
 * @brief Generate random bytes
 *
 * @param count Number of bytes to generate
 * @return Random bytes
 */
CLIPSYNC_API Bytes random_bytes(size_t count);

// ============================================================================
// Base64
// ============================================================================

/**
 * @brief Encode bytes as standard padded base64
 */
CLIPSYNC_API std::string base64_encode(const Bytes &data);

/**
 * @brief Decode standard base64 (padding required, no whitespace)
 * @return Decoded bytes, or DecodingError on malformed input
 */
CLIPSYNC_API Result<Bytes> base64_decode(const std::string &text);

} // namespace clipsync

#endif // CLIPSYNC_SECURITY_H
