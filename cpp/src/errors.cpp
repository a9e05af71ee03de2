#include "pngstash/errors.hpp"

namespace pngstash {

namespace {

std::string ByteMessage(std::size_t index, std::uint8_t value) {
    return "invalid byte `" + std::to_string(value) + "` at index " + std::to_string(index);
}

std::string RangeMessage(std::uint8_t value) {
    return std::string("invalid value `") + static_cast<char>(value) + "`, acceptable range 'A-Z and a-z'";
}

}  // namespace

InvalidTagByte::InvalidTagByte(std::size_t index, std::uint8_t value)
    : InvalidTagByte(index, value, ByteMessage(index, value)) {}

InvalidTagByte::InvalidTagByte(std::size_t index, std::uint8_t value, const std::string& message)
    : Error(message), index_(index), value_(value) {}

TagOutOfRange::TagOutOfRange(std::size_t index, std::uint8_t value)
    : InvalidTagByte(index, value, RangeMessage(value)) {}

InvalidTagLength::InvalidTagLength(std::size_t length)
    : Error("chunk type length needs to be 4, got " + std::to_string(length)), length_(length) {}

Truncated::Truncated(std::string_view field, std::size_t needed, std::size_t available)
    : Error("truncated chunk " + std::string(field) + ": need " + std::to_string(needed)
            + " bytes, " + std::to_string(available) + " available"),
      field_(field),
      needed_(needed),
      available_(available) {}

ChecksumMismatch::ChecksumMismatch(std::uint32_t calculated, std::uint32_t expected)
    : Error("crc mismatch: calculated " + std::to_string(calculated) + ", expected "
            + std::to_string(expected)),
      calculated_(calculated),
      expected_(expected) {}

BadSignature::BadSignature() : Error("invalid PNG signature") {}

ChunkNotFound::ChunkNotFound(std::string_view chunk_type)
    : Error("chunk type `" + std::string(chunk_type) + "` not found"), type_(chunk_type) {}

InvalidText::InvalidText(std::size_t offset)
    : Error("chunk data is not valid UTF-8 (offset " + std::to_string(offset) + ")"), offset_(offset) {}

PayloadTooLarge::PayloadTooLarge(std::uint64_t size)
    : Error("chunk data of " + std::to_string(size) + " bytes does not fit the 32-bit length field"),
      size_(size) {}

}  // namespace pngstash
