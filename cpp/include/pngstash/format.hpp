#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace pngstash::format {

using Bytes = std::vector<std::uint8_t>;

// Caller guarantees four readable bytes at `data`.
std::uint32_t ReadU32BE(const std::uint8_t* data);
void AppendU32BE(Bytes& out, std::uint32_t value);

// CRC-32 (zlib) over the concatenation of both ranges.
std::uint32_t Crc32(const std::uint8_t* first, std::size_t first_len,
                    const std::uint8_t* second, std::size_t second_len);

// Returns the offset of the first byte that breaks UTF-8 well-formedness,
// or `size` when the whole range is valid.
std::size_t FindInvalidUtf8(const std::uint8_t* data, std::size_t size);

}  // namespace pngstash::format
