#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pngstash::crypto {

using Bytes = std::vector<std::uint8_t>;

enum class GcmMode { Seal, Open };

Bytes RandomBytes(std::size_t size);
Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length);

// AES-256-GCM over `input` with a caller-supplied nonce and AAD.
// Seal fills `tag`; Open verifies it and throws std::runtime_error on mismatch.
Bytes AesGcm(GcmMode mode, const Bytes& key, const Bytes& nonce, const Bytes& aad, const Bytes& input, Bytes& tag);

}  // namespace pngstash::crypto
