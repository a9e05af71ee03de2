#include "pngstash/commands.hpp"

#include "pngstash/chunk_type.hpp"
#include "pngstash/constants.hpp"
#include "pngstash/seal.hpp"

#include <filesystem>
#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace pngstash::commands {

namespace {

const char* YesNo(bool value) {
    return value ? "yes" : "no";
}

std::string Preview(const Chunk& chunk) {
    const Bytes& data = chunk.Data();
    if (seal::IsSealed(data)) {
        return "<sealed, " + std::to_string(data.size()) + " bytes>";
    }
    if (!chunk.IsText()) {
        return "<" + std::to_string(data.size()) + " bytes binary>";
    }
    std::string text = chunk.DataAsString();
    if (text.size() > constants::kDescribePreviewLen) {
        // Back off to a UTF-8 lead byte so the preview stays printable.
        std::size_t cut = constants::kDescribePreviewLen;
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        text = text.substr(0, cut) + "...";
    }
    return "\"" + text + "\"";
}

}  // namespace

Bytes ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    input.seekg(0, std::ios::end);
    std::streamoff size = input.tellg();
    if (size < 0) {
        throw std::runtime_error("Failed to read file size: " + path);
    }
    input.seekg(0, std::ios::beg);

    Bytes data;
    data.resize(static_cast<std::size_t>(size));

    if (!data.empty()) {
        input.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!input) {
            throw std::runtime_error("Failed to read file: " + path);
        }
    }
    return data;
}

void WriteFile(const std::string& path, const Bytes& data) {
    std::filesystem::path target(path);
    if (!target.parent_path().empty()) {
        std::filesystem::create_directories(target.parent_path());
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    if (!data.empty()) {
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

Png LoadPng(const std::string& path) {
    return Png::FromBytes(ReadFile(path));
}

void SavePng(const std::string& path, const Png& png) {
    WriteFile(path, png.ToBytes());
}

std::string Encode(const std::string& path,
                   const std::string& chunk_type,
                   const std::string& message,
                   const EncodeOptions& options) {
    ChunkType type = ChunkType::FromString(chunk_type);
    Png png = LoadPng(path);
    Bytes data;
    if (options.password.empty()) {
        data.assign(message.begin(), message.end());
    } else {
        data = seal::Seal(message, options.password, chunk_type);
    }
    png.AppendChunk(Chunk(type, std::move(data)));
    std::string target = options.output.empty() ? path : options.output;
    SavePng(target, png);
    return target;
}

DecodeResult Decode(const std::string& path, const std::string& chunk_type, const std::string& password) {
    Png png = LoadPng(path);
    DecodeResult result;
    const Chunk* chunk = png.ChunkByType(chunk_type);
    if (!chunk) {
        return result;
    }
    result.found = true;
    result.description = DescribeChunk(*chunk);
    result.sealed = seal::IsSealed(chunk->Data());
    if (!result.sealed) {
        result.message = chunk->DataAsString();
    } else if (!password.empty()) {
        result.message = seal::Open(chunk->Data(), password, chunk_type);
    }
    return result;
}

Chunk Remove(const std::string& path, const std::string& chunk_type, const RemoveOptions& options) {
    Png png = LoadPng(path);
    Chunk removed = png.RemoveFirstChunk(chunk_type);
    SavePng(options.output.empty() ? path : options.output, png);
    return removed;
}

void Print(const std::string& path, std::ostream& out) {
    Png png = LoadPng(path);
    for (const auto& chunk : png.Chunks()) {
        out << DescribeChunk(chunk) << "\n";
    }
}

std::string DescribeChunk(const Chunk& chunk) {
    const ChunkType& type = chunk.Type();
    std::ostringstream out;
    out << "Chunk {"
        << "length: " << chunk.Length()
        << ", type: " << type.ToString()
        << ", crc: " << chunk.Crc()
        << ", critical: " << YesNo(type.IsCritical())
        << ", public: " << YesNo(type.IsPublic())
        << ", reserved_valid: " << YesNo(type.IsReservedBitValid())
        << ", safe_to_copy: " << YesNo(type.IsSafeToCopy())
        << ", data: " << Preview(chunk)
        << "}";
    return out.str();
}

}  // namespace pngstash::commands
