#include "pngstash/format.hpp"

#include <zlib.h>

namespace pngstash::format {

std::uint32_t ReadU32BE(const std::uint8_t* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24)
           | (static_cast<std::uint32_t>(data[1]) << 16)
           | (static_cast<std::uint32_t>(data[2]) << 8)
           | static_cast<std::uint32_t>(data[3]);
}

void AppendU32BE(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

std::uint32_t Crc32(const std::uint8_t* first, std::size_t first_len,
                    const std::uint8_t* second, std::size_t second_len) {
    uLong crc = crc32(0L, Z_NULL, 0);
    if (first_len > 0) {
        crc = crc32(crc, first, static_cast<uInt>(first_len));
    }
    if (second_len > 0) {
        crc = crc32(crc, second, static_cast<uInt>(second_len));
    }
    return static_cast<std::uint32_t>(crc);
}

std::size_t FindInvalidUtf8(const std::uint8_t* data, std::size_t size) {
    std::size_t i = 0;
    while (i < size) {
        std::uint8_t lead = data[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }
        std::size_t extra = 0;
        std::uint32_t min_cp = 0;
        std::uint32_t cp = 0;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            min_cp = 0x80;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            min_cp = 0x800;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            min_cp = 0x10000;
            cp = lead & 0x07;
        } else {
            return i;
        }
        if (size - i <= extra) {
            return i;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            std::uint8_t next = data[i + k];
            if ((next & 0xC0) != 0x80) {
                return i;
            }
            cp = (cp << 6) | (next & 0x3F);
        }
        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return i;
        }
        i += extra + 1;
    }
    return size;
}

}  // namespace pngstash::format
