#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "pngstash/env.hpp"

namespace pngstash::constants {

// PNG file signature (PNG spec 3.1).
inline constexpr std::array<std::uint8_t, 8> kPngSignature = {
    0x89u, 0x50u, 0x4Eu, 0x47u, 0x0Du, 0x0Au, 0x1Au, 0x0Au
};

inline constexpr std::size_t kChunkTypeLen = 4;
inline constexpr std::size_t kChunkLengthFieldLen = 4;
inline constexpr std::size_t kChunkCrcFieldLen = 4;
inline constexpr std::size_t kChunkOverhead = kChunkLengthFieldLen + kChunkTypeLen + kChunkCrcFieldLen;
inline constexpr std::uint64_t kMaxChunkDataLen = std::numeric_limits<std::uint32_t>::max();

inline constexpr std::size_t kDescribePreviewLen = 64;

inline constexpr std::string_view kSealMagic = "PSS1";
inline constexpr std::size_t kSealSaltSize = 16;
inline constexpr std::size_t kSealIterFieldLen = 4;
inline constexpr std::size_t kSealKeyLen = 32;
inline constexpr std::size_t kAeadNonceLen = 12;
inline constexpr std::size_t kAeadTagLen = 16;
inline constexpr std::size_t kSealHeaderLen =
    kSealMagic.size() + kSealSaltSize + kSealIterFieldLen + kAeadNonceLen;
inline constexpr std::size_t kSealPbkdf2Iterations = 200000;
// Upper bound accepted from a sealed header or the environment.
inline constexpr std::size_t kSealMaxPbkdf2Iterations = 10000000;

inline constexpr std::string_view kEnvNoColor = "PNGSTASH_NO_COLOR";
inline constexpr std::string_view kEnvPbkdf2Iters = "PNGSTASH_PBKDF2_ITERS";
inline constexpr std::string_view kVersion = "1.0.0";

inline std::size_t SealPbkdf2Iterations() {
    auto parsed = pngstash::env::GetPositive(kEnvPbkdf2Iters);
    if (!parsed) {
        return kSealPbkdf2Iterations;
    }
    return static_cast<std::size_t>(std::min<std::uint64_t>(*parsed, kSealMaxPbkdf2Iterations));
}

}  // namespace pngstash::constants
