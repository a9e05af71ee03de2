#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pngstash::seal {

using Bytes = std::vector<std::uint8_t>;

// Sealed message layout:
//   "PSS1" | salt (16) | pbkdf2 iterations (u32 BE) | nonce (12) | ciphertext | tag (16)
// Key is PBKDF2-HMAC-SHA256(password, salt, iterations). The header and the
// chunk type are bound as AAD.
Bytes Seal(const std::string& message, const std::string& password, std::string_view chunk_type);
// Throws SealError on a wrong password, tampering or a malformed blob.
std::string Open(const Bytes& sealed, const std::string& password, std::string_view chunk_type);

// True when `data` carries the magic, a full header and tag, and a usable
// iteration count. Plain text starting with the magic does not qualify.
bool IsSealed(const Bytes& data);

}  // namespace pngstash::seal
