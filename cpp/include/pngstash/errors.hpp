#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pngstash {

// Base of every error raised by the chunk codec. Callers that only need a
// message can catch std::exception like the rest of the tool does.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// A chunk type byte is not an ASCII letter.
class InvalidTagByte : public Error {
public:
    InvalidTagByte(std::size_t index, std::uint8_t value);

    std::size_t Index() const noexcept { return index_; }
    std::uint8_t Value() const noexcept { return value_; }

protected:
    InvalidTagByte(std::size_t index, std::uint8_t value, const std::string& message);

private:
    std::size_t index_;
    std::uint8_t value_;
};

// Raised when a chunk type is parsed from text and one character is not a letter.
class TagOutOfRange : public InvalidTagByte {
public:
    TagOutOfRange(std::size_t index, std::uint8_t value);

    char Character() const noexcept { return static_cast<char>(Value()); }
};

class InvalidTagLength : public Error {
public:
    explicit InvalidTagLength(std::size_t length);

    std::size_t Length() const noexcept { return length_; }

private:
    std::size_t length_;
};

class Truncated : public Error {
public:
    Truncated(std::string_view field, std::size_t needed, std::size_t available);

    const std::string& Field() const noexcept { return field_; }
    std::size_t Needed() const noexcept { return needed_; }
    std::size_t Available() const noexcept { return available_; }

private:
    std::string field_;
    std::size_t needed_;
    std::size_t available_;
};

class ChecksumMismatch : public Error {
public:
    ChecksumMismatch(std::uint32_t calculated, std::uint32_t expected);

    std::uint32_t Calculated() const noexcept { return calculated_; }
    std::uint32_t Expected() const noexcept { return expected_; }

private:
    std::uint32_t calculated_;
    std::uint32_t expected_;
};

class BadSignature : public Error {
public:
    BadSignature();
};

class ChunkNotFound : public Error {
public:
    explicit ChunkNotFound(std::string_view chunk_type);

    const std::string& Type() const noexcept { return type_; }

private:
    std::string type_;
};

class InvalidText : public Error {
public:
    explicit InvalidText(std::size_t offset);

    std::size_t Offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

class PayloadTooLarge : public Error {
public:
    explicit PayloadTooLarge(std::uint64_t size);

    std::uint64_t Size() const noexcept { return size_; }

private:
    std::uint64_t size_;
};

class SealError : public Error {
public:
    explicit SealError(const std::string& message) : Error(message) {}
};

}  // namespace pngstash
