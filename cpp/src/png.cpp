#include "pngstash/png.hpp"

#include "pngstash/constants.hpp"
#include "pngstash/errors.hpp"

#include <algorithm>

namespace pngstash {

Png Png::FromBytes(const std::uint8_t* data, std::size_t size) {
    const auto& signature = constants::kPngSignature;
    if (size < signature.size() || !std::equal(signature.begin(), signature.end(), data)) {
        throw BadSignature();
    }
    std::vector<Chunk> chunks;
    std::size_t offset = signature.size();
    while (offset < size) {
        Chunk chunk = Chunk::FromBytes(data + offset, size - offset);
        offset += chunk.SerializedSize();
        chunks.push_back(std::move(chunk));
    }
    return Png(std::move(chunks));
}

Png Png::FromBytes(const Bytes& data) {
    return FromBytes(data.data(), data.size());
}

void Png::AppendChunk(Chunk chunk) {
    chunks_.push_back(std::move(chunk));
}

std::vector<Chunk>::const_iterator Png::FindFirst(std::string_view chunk_type) const {
    return std::find_if(chunks_.begin(), chunks_.end(), [chunk_type](const Chunk& chunk) {
        const ChunkType::Code& code = chunk.Type().Bytes();
        return std::string_view(reinterpret_cast<const char*>(code.data()), code.size()) == chunk_type;
    });
}

Chunk Png::RemoveFirstChunk(std::string_view chunk_type) {
    auto it = FindFirst(chunk_type);
    if (it == chunks_.end()) {
        throw ChunkNotFound(chunk_type);
    }
    Chunk removed = *it;
    chunks_.erase(it);
    return removed;
}

const Chunk* Png::ChunkByType(std::string_view chunk_type) const {
    auto it = FindFirst(chunk_type);
    if (it == chunks_.end()) {
        return nullptr;
    }
    return &*it;
}

std::size_t Png::SerializedSize() const noexcept {
    std::size_t total = constants::kPngSignature.size();
    for (const auto& chunk : chunks_) {
        total += chunk.SerializedSize();
    }
    return total;
}

Bytes Png::ToBytes() const {
    Bytes out;
    out.reserve(SerializedSize());
    out.insert(out.end(), constants::kPngSignature.begin(), constants::kPngSignature.end());
    for (const auto& chunk : chunks_) {
        Bytes encoded = chunk.ToBytes();
        out.insert(out.end(), encoded.begin(), encoded.end());
    }
    return out;
}

}  // namespace pngstash
