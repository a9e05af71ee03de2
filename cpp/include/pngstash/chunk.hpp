#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pngstash/chunk_type.hpp"

namespace pngstash {

using Bytes = std::vector<std::uint8_t>;

// One length-prefixed, CRC-protected PNG chunk:
//   length (u32 BE) | type (4) | data (length) | crc (u32 BE)
// The CRC covers type and data only.
class Chunk {
public:
    // Throws PayloadTooLarge if data does not fit the 32-bit length field.
    Chunk(const ChunkType& type, Bytes data);

    // Parses exactly one chunk starting at `data`. Bytes past the chunk are
    // ignored; use SerializedSize() to advance.
    static Chunk FromBytes(const std::uint8_t* data, std::size_t size);
    static Chunk FromBytes(const Bytes& data);

    std::uint32_t Length() const noexcept { return length_; }
    const ChunkType& Type() const noexcept { return type_; }
    const Bytes& Data() const noexcept { return data_; }
    std::uint32_t Crc() const noexcept { return crc_; }
    std::size_t SerializedSize() const noexcept;

    // Throws InvalidText when the data is not UTF-8.
    std::string DataAsString() const;
    bool IsText() const noexcept;

    Bytes ToBytes() const;

    bool operator==(const Chunk& other) const noexcept;
    bool operator!=(const Chunk& other) const noexcept { return !(*this == other); }

private:
    Chunk(const ChunkType& type, Bytes data, std::uint32_t crc);

    std::uint32_t length_;
    ChunkType type_;
    Bytes data_;
    std::uint32_t crc_;
};

std::uint32_t ComputeChunkCrc(const ChunkType& type, const Bytes& data);

}  // namespace pngstash
