#include "pngstash/chunk_type.hpp"

#include "pngstash/constants.hpp"
#include "pngstash/errors.hpp"

namespace pngstash {

namespace {

constexpr std::uint8_t kCaseBit = 0x20;

bool IsUpper(std::uint8_t byte) {
    return (byte & kCaseBit) == 0;
}

}  // namespace

bool ChunkType::IsValidByte(std::uint8_t byte) noexcept {
    return (byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z');
}

ChunkType ChunkType::FromBytes(const Code& bytes) {
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (!IsValidByte(bytes[i])) {
            throw InvalidTagByte(i, bytes[i]);
        }
    }
    return ChunkType(bytes);
}

ChunkType ChunkType::FromString(std::string_view text) {
    if (text.size() != constants::kChunkTypeLen) {
        throw InvalidTagLength(text.size());
    }
    Code bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<std::uint8_t>(text[i]);
    }
    try {
        return FromBytes(bytes);
    } catch (const InvalidTagByte& exc) {
        throw TagOutOfRange(exc.Index(), exc.Value());
    }
}

std::string ChunkType::ToString() const {
    return std::string(bytes_.begin(), bytes_.end());
}

bool ChunkType::IsCritical() const noexcept {
    return IsUpper(bytes_[0]);
}

bool ChunkType::IsPublic() const noexcept {
    return IsUpper(bytes_[1]);
}

bool ChunkType::IsReservedBitValid() const noexcept {
    return IsUpper(bytes_[2]);
}

bool ChunkType::IsSafeToCopy() const noexcept {
    return !IsUpper(bytes_[3]);
}

}  // namespace pngstash
