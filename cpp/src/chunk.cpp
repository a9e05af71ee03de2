#include "pngstash/chunk.hpp"

#include "pngstash/constants.hpp"
#include "pngstash/errors.hpp"
#include "pngstash/format.hpp"

#include <algorithm>
#include <utility>

namespace pngstash {

namespace {

std::uint32_t CheckedLength(const Bytes& data) {
    if (static_cast<std::uint64_t>(data.size()) > constants::kMaxChunkDataLen) {
        throw PayloadTooLarge(static_cast<std::uint64_t>(data.size()));
    }
    return static_cast<std::uint32_t>(data.size());
}

void Require(const char* field, std::size_t needed, std::size_t available) {
    if (available < needed) {
        throw Truncated(field, needed, available);
    }
}

}  // namespace

std::uint32_t ComputeChunkCrc(const ChunkType& type, const Bytes& data) {
    const ChunkType::Code& code = type.Bytes();
    return format::Crc32(code.data(), code.size(), data.data(), data.size());
}

Chunk::Chunk(const ChunkType& type, Bytes data)
    : length_(CheckedLength(data)), type_(type), data_(std::move(data)), crc_(ComputeChunkCrc(type_, data_)) {}

Chunk::Chunk(const ChunkType& type, Bytes data, std::uint32_t crc)
    : length_(static_cast<std::uint32_t>(data.size())), type_(type), data_(std::move(data)), crc_(crc) {}

Chunk Chunk::FromBytes(const std::uint8_t* data, std::size_t size) {
    std::size_t offset = 0;

    Require("length", constants::kChunkLengthFieldLen, size - offset);
    std::uint32_t length = format::ReadU32BE(data + offset);
    offset += constants::kChunkLengthFieldLen;

    Require("type", constants::kChunkTypeLen, size - offset);
    ChunkType::Code code{};
    std::copy(data + offset, data + offset + code.size(), code.begin());
    ChunkType type = ChunkType::FromBytes(code);
    offset += constants::kChunkTypeLen;

    Require("data", length, size - offset);
    Bytes body(data + offset, data + offset + length);
    offset += length;

    Require("crc", constants::kChunkCrcFieldLen, size - offset);
    std::uint32_t expected = format::ReadU32BE(data + offset);

    std::uint32_t calculated = ComputeChunkCrc(type, body);
    if (calculated != expected) {
        throw ChecksumMismatch(calculated, expected);
    }
    return Chunk(type, std::move(body), expected);
}

Chunk Chunk::FromBytes(const Bytes& data) {
    return FromBytes(data.data(), data.size());
}

std::size_t Chunk::SerializedSize() const noexcept {
    return constants::kChunkOverhead + data_.size();
}

std::string Chunk::DataAsString() const {
    std::size_t bad = format::FindInvalidUtf8(data_.data(), data_.size());
    if (bad != data_.size()) {
        throw InvalidText(bad);
    }
    return std::string(data_.begin(), data_.end());
}

bool Chunk::IsText() const noexcept {
    return format::FindInvalidUtf8(data_.data(), data_.size()) == data_.size();
}

Bytes Chunk::ToBytes() const {
    Bytes out;
    out.reserve(SerializedSize());
    format::AppendU32BE(out, length_);
    const ChunkType::Code& code = type_.Bytes();
    out.insert(out.end(), code.begin(), code.end());
    out.insert(out.end(), data_.begin(), data_.end());
    format::AppendU32BE(out, crc_);
    return out;
}

bool Chunk::operator==(const Chunk& other) const noexcept {
    return length_ == other.length_ && type_ == other.type_ && crc_ == other.crc_ && data_ == other.data_;
}

}  // namespace pngstash
