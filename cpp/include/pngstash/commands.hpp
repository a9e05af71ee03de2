#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "pngstash/chunk.hpp"
#include "pngstash/png.hpp"

namespace pngstash::commands {

struct EncodeOptions {
    std::string output;    // empty: rewrite the input file
    std::string password;  // empty: store the message as plain text
};

struct RemoveOptions {
    std::string output;
};

struct DecodeResult {
    bool found = false;
    bool sealed = false;
    std::string description;
    std::string message;
};

Bytes ReadFile(const std::string& path);
void WriteFile(const std::string& path, const Bytes& data);

Png LoadPng(const std::string& path);
void SavePng(const std::string& path, const Png& png);

// Appends a chunk holding `message` and saves the file. Returns the written path.
std::string Encode(const std::string& path,
                   const std::string& chunk_type,
                   const std::string& message,
                   const EncodeOptions& options = {});
// A sealed chunk is opened when a password is given; otherwise only reported as sealed.
DecodeResult Decode(const std::string& path, const std::string& chunk_type, const std::string& password = {});
// Throws ChunkNotFound without touching the file.
Chunk Remove(const std::string& path, const std::string& chunk_type, const RemoveOptions& options = {});
void Print(const std::string& path, std::ostream& out);

std::string DescribeChunk(const Chunk& chunk);

}  // namespace pngstash::commands
