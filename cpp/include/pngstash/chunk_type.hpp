#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace pngstash {

// Four-letter chunk type code. The case of each letter carries one property
// bit (PNG spec 5.4): ancillary, private, reserved, safe-to-copy.
class ChunkType {
public:
    using Code = std::array<std::uint8_t, 4>;

    // Throws InvalidTagByte on the first byte that is not an ASCII letter.
    static ChunkType FromBytes(const Code& bytes);
    // Throws InvalidTagLength or TagOutOfRange.
    static ChunkType FromString(std::string_view text);

    static bool IsValidByte(std::uint8_t byte) noexcept;

    const Code& Bytes() const noexcept { return bytes_; }
    std::string ToString() const;

    bool IsCritical() const noexcept;
    bool IsPublic() const noexcept;
    bool IsReservedBitValid() const noexcept;
    bool IsSafeToCopy() const noexcept;
    bool IsValid() const noexcept { return IsReservedBitValid(); }

    bool operator==(const ChunkType& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const ChunkType& other) const noexcept { return bytes_ != other.bytes_; }

private:
    explicit ChunkType(const Code& bytes) : bytes_(bytes) {}

    Code bytes_;
};

}  // namespace pngstash
