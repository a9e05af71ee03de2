#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include "pngstash/chunk.hpp"

namespace pngstash {

// A PNG file as its signature plus the ordered list of chunks. Chunk order is
// kept exactly as read so that ToBytes() reproduces the input byte for byte.
// Several chunks may share a type; lookups return the first in file order.
class Png {
public:
    Png() = default;
    explicit Png(std::vector<Chunk> chunks) : chunks_(std::move(chunks)) {}

    // Throws BadSignature, then any error raised by Chunk::FromBytes.
    static Png FromBytes(const std::uint8_t* data, std::size_t size);
    static Png FromBytes(const Bytes& data);

    void AppendChunk(Chunk chunk);
    // Throws ChunkNotFound and leaves the chunk list untouched when no chunk matches.
    Chunk RemoveFirstChunk(std::string_view chunk_type);
    const Chunk* ChunkByType(std::string_view chunk_type) const;

    const std::vector<Chunk>& Chunks() const noexcept { return chunks_; }
    std::size_t SerializedSize() const noexcept;
    Bytes ToBytes() const;

private:
    std::vector<Chunk>::const_iterator FindFirst(std::string_view chunk_type) const;

    std::vector<Chunk> chunks_;
};

}  // namespace pngstash
