#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include "pngstash/commands.hpp"
#include "pngstash/errors.hpp"

namespace fs = std::filesystem;
using pngstash::Bytes;
using pngstash::Chunk;
using pngstash::ChunkType;
using pngstash::Png;

namespace {

bool Fail(const std::string& what) {
    std::cout << "commands test failed: " << what << std::endl;
    return false;
}

// Minimal 1x1 greyscale image: IHDR, IDAT, IEND.
Png SampleImage() {
    Png png;
    png.AppendChunk(Chunk(ChunkType::FromString("IHDR"),
                          Bytes{0, 0, 0, 1, 0, 0, 0, 1, 8, 0, 0, 0, 0}));
    png.AppendChunk(Chunk(ChunkType::FromString("IDAT"),
                          Bytes{0x78, 0x9C, 0x63, 0x60, 0x00, 0x00, 0x00, 0x02, 0x00, 0x01}));
    png.AppendChunk(Chunk(ChunkType::FromString("IEND"), Bytes{}));
    return png;
}

struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("pngstash_test_" + std::to_string(::getpid()));
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

}  // namespace

int main() {
    TempDir tmp;
    const std::string image = (tmp.path / "image.png").string();
    pngstash::commands::SavePng(image, SampleImage());
    const Bytes original = pngstash::commands::ReadFile(image);

    // Test 1: load/save is byte-exact
    {
        Png loaded = pngstash::commands::LoadPng(image);
        if (loaded.ToBytes() != original || loaded.Chunks().size() != 3) {
            Fail("load after save");
            return EXIT_FAILURE;
        }
    }

    // Test 2: encode appends after the existing chunks and decode finds it
    {
        pngstash::commands::Encode(image, "RuSt", "This is where your secret message will be!");
        Png png = pngstash::commands::LoadPng(image);
        if (png.Chunks().size() != 4 || png.Chunks().back().Type().ToString() != "RuSt") {
            Fail("encode did not append");
            return EXIT_FAILURE;
        }
        if (png.Chunks().back().Crc() != 2882656334u) {
            Fail("encoded chunk crc");
            return EXIT_FAILURE;
        }
        auto result = pngstash::commands::Decode(image, "RuSt");
        if (!result.found || result.sealed || result.message != "This is where your secret message will be!") {
            Fail("decode of encoded message");
            return EXIT_FAILURE;
        }
        if (result.description.find("type: RuSt") == std::string::npos
            || result.description.find("length: 42") == std::string::npos) {
            Fail("decode description: " + result.description);
            return EXIT_FAILURE;
        }
    }

    // Test 3: decode of a missing type reports absence
    {
        auto result = pngstash::commands::Decode(image, "nOpe");
        if (result.found || !result.message.empty()) {
            Fail("decode of missing type");
            return EXIT_FAILURE;
        }
    }

    // Test 4: an invalid type is rejected before the file is touched
    {
        Bytes before = pngstash::commands::ReadFile(image);
        try {
            pngstash::commands::Encode(image, "Ru1t", "nope");
            Fail("encode accepted an invalid type");
            return EXIT_FAILURE;
        } catch (const pngstash::TagOutOfRange&) {
        }
        try {
            pngstash::commands::Encode(image, "toolong", "nope");
            Fail("encode accepted a long type");
            return EXIT_FAILURE;
        } catch (const pngstash::InvalidTagLength&) {
        }
        if (pngstash::commands::ReadFile(image) != before) {
            Fail("failed encode changed the file");
            return EXIT_FAILURE;
        }
    }

    // Test 5: encode --out leaves the input alone
    {
        const std::string copy = (tmp.path / "out" / "copy.png").string();
        Bytes before = pngstash::commands::ReadFile(image);
        pngstash::commands::EncodeOptions opts;
        opts.output = copy;
        if (pngstash::commands::Encode(image, "teXt", "hello", opts) != copy) {
            Fail("encode returned the wrong path");
            return EXIT_FAILURE;
        }
        if (pngstash::commands::ReadFile(image) != before) {
            Fail("encode --out modified the input");
            return EXIT_FAILURE;
        }
        if (!pngstash::commands::Decode(copy, "teXt").found) {
            Fail("encode --out did not write the copy");
            return EXIT_FAILURE;
        }
    }

    // Test 6: remove returns the chunk and restores the original bytes
    {
        Chunk removed = pngstash::commands::Remove(image, "RuSt");
        if (removed.Type().ToString() != "RuSt" || removed.DataAsString().size() != 42) {
            Fail("removed chunk");
            return EXIT_FAILURE;
        }
        if (pngstash::commands::ReadFile(image) != original) {
            Fail("remove did not restore the original file");
            return EXIT_FAILURE;
        }
        try {
            pngstash::commands::Remove(image, "RuSt");
            Fail("second remove succeeded");
            return EXIT_FAILURE;
        } catch (const pngstash::ChunkNotFound&) {
        }
        if (pngstash::commands::ReadFile(image) != original) {
            Fail("failed remove changed the file");
            return EXIT_FAILURE;
        }
    }

    // Test 7: print lists every chunk in order
    {
        std::ostringstream out;
        pngstash::commands::Print(image, out);
        std::string text = out.str();
        std::size_t ihdr = text.find("type: IHDR");
        std::size_t idat = text.find("type: IDAT");
        std::size_t iend = text.find("type: IEND");
        if (ihdr == std::string::npos || idat == std::string::npos || iend == std::string::npos
            || !(ihdr < idat && idat < iend)) {
            Fail("print output: " + text);
            return EXIT_FAILURE;
        }
    }

    // Test 8: chunk descriptions
    {
        std::string text = pngstash::commands::DescribeChunk(
            Chunk(ChunkType::FromString("teXt"), Bytes{'h', 'e', 'l', 'l', 'o'}));
        if (text != "Chunk {length: 5, type: teXt, crc: 2750845236, critical: no, public: no, "
                    "reserved_valid: yes, safe_to_copy: yes, data: \"hello\"}") {
            Fail("text description: " + text);
            return EXIT_FAILURE;
        }
        std::string binary = pngstash::commands::DescribeChunk(SampleImage().Chunks()[1]);
        if (binary.find("data: <10 bytes binary>") == std::string::npos
            || binary.find("critical: yes, public: yes, reserved_valid: yes, safe_to_copy: no")
                   == std::string::npos) {
            Fail("binary description: " + binary);
            return EXIT_FAILURE;
        }
        std::string long_text(100, 'x');
        std::string preview = pngstash::commands::DescribeChunk(
            Chunk(ChunkType::FromString("loNg"), Bytes(long_text.begin(), long_text.end())));
        if (preview.find("\"" + std::string(64, 'x') + "...\"") == std::string::npos) {
            Fail("long preview: " + preview);
            return EXIT_FAILURE;
        }
    }

    // Test 9: decoding binary data as a message fails with InvalidText
    try {
        pngstash::commands::Decode(image, "IDAT");
        Fail("binary chunk decoded as text");
        return EXIT_FAILURE;
    } catch (const pngstash::InvalidText&) {
    }

    // Test 10: file errors
    {
        const std::string missing = (tmp.path / "missing.png").string();
        try {
            pngstash::commands::LoadPng(missing);
            Fail("missing file loaded");
            return EXIT_FAILURE;
        } catch (const std::runtime_error&) {
        }
        const std::string not_png = (tmp.path / "note.txt").string();
        pngstash::commands::WriteFile(not_png, Bytes{'h', 'i', '\n'});
        try {
            pngstash::commands::LoadPng(not_png);
            Fail("text file loaded as png");
            return EXIT_FAILURE;
        } catch (const pngstash::BadSignature&) {
        }
    }

    // Test 11: a plain message that starts with the seal magic stays plain
    {
        const std::string noted = (tmp.path / "noted.png").string();
        pngstash::commands::SavePng(noted, SampleImage());
        const std::string note = "PSS1 is my plain note";
        pngstash::commands::Encode(noted, "ruSt", note);

        auto plain = pngstash::commands::Decode(noted, "ruSt");
        if (!plain.found || plain.sealed || plain.message != note) {
            Fail("plain note read as sealed: '" + plain.message + "'");
            return EXIT_FAILURE;
        }
        if (plain.description.find("\"" + note + "\"") == std::string::npos) {
            Fail("plain note description: " + plain.description);
            return EXIT_FAILURE;
        }
        auto with_password = pngstash::commands::Decode(noted, "ruSt", "hunter2");
        if (with_password.sealed || with_password.message != note) {
            Fail("password on a plain note");
            return EXIT_FAILURE;
        }
    }

    std::cout << "All commands tests passed" << std::endl;
    return EXIT_SUCCESS;
}
