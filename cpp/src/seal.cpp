#include "pngstash/seal.hpp"

#include "pngstash/constants.hpp"
#include "pngstash/crypto.hpp"
#include "pngstash/errors.hpp"
#include "pngstash/format.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace pngstash::seal {

namespace {

constexpr std::size_t kSaltOffset = constants::kSealMagic.size();
constexpr std::size_t kIterOffset = kSaltOffset + constants::kSealSaltSize;
constexpr std::size_t kNonceOffset = kIterOffset + constants::kSealIterFieldLen;

bool IterationsUsable(std::uint32_t iterations) {
    return iterations != 0 && iterations <= constants::kSealMaxPbkdf2Iterations;
}

Bytes Aad(const Bytes& header, std::string_view chunk_type) {
    Bytes aad(header.begin(), header.end());
    aad.insert(aad.end(), chunk_type.begin(), chunk_type.end());
    return aad;
}

}  // namespace

bool IsSealed(const Bytes& data) {
    const auto& magic = constants::kSealMagic;
    if (data.size() < constants::kSealHeaderLen + constants::kAeadTagLen) {
        return false;
    }
    if (!std::equal(magic.begin(), magic.end(), data.begin())) {
        return false;
    }
    return IterationsUsable(format::ReadU32BE(data.data() + kIterOffset));
}

Bytes Seal(const std::string& message, const std::string& password, std::string_view chunk_type) {
    if (password.empty()) {
        throw SealError("Password is required to seal a message");
    }
    const std::size_t iterations = constants::SealPbkdf2Iterations();
    Bytes salt = crypto::RandomBytes(constants::kSealSaltSize);
    Bytes nonce = crypto::RandomBytes(constants::kAeadNonceLen);

    Bytes header;
    header.reserve(constants::kSealHeaderLen);
    header.insert(header.end(), constants::kSealMagic.begin(), constants::kSealMagic.end());
    header.insert(header.end(), salt.begin(), salt.end());
    format::AppendU32BE(header, static_cast<std::uint32_t>(iterations));
    header.insert(header.end(), nonce.begin(), nonce.end());

    Bytes key = crypto::Pbkdf2HmacSha256(password, salt, iterations, constants::kSealKeyLen);
    Bytes plaintext(message.begin(), message.end());
    Bytes tag;
    Bytes ciphertext = crypto::AesGcm(crypto::GcmMode::Seal, key, nonce, Aad(header, chunk_type), plaintext, tag);

    Bytes out = std::move(header);
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());
    out.insert(out.end(), tag.begin(), tag.end());
    return out;
}

std::string Open(const Bytes& sealed, const std::string& password, std::string_view chunk_type) {
    const auto& magic = constants::kSealMagic;
    if (sealed.size() < magic.size() || !std::equal(magic.begin(), magic.end(), sealed.begin())) {
        throw SealError("Chunk data is not a sealed message");
    }
    if (sealed.size() < constants::kSealHeaderLen + constants::kAeadTagLen) {
        throw SealError("Sealed message is truncated");
    }
    const std::uint32_t iterations = format::ReadU32BE(sealed.data() + kIterOffset);
    if (!IterationsUsable(iterations)) {
        throw SealError("Sealed message has an invalid iteration count: " + std::to_string(iterations));
    }

    Bytes header(sealed.begin(), sealed.begin() + constants::kSealHeaderLen);
    Bytes salt(sealed.begin() + kSaltOffset, sealed.begin() + kIterOffset);
    Bytes nonce(sealed.begin() + kNonceOffset, sealed.begin() + constants::kSealHeaderLen);
    Bytes ciphertext(sealed.begin() + constants::kSealHeaderLen, sealed.end() - constants::kAeadTagLen);
    Bytes tag(sealed.end() - constants::kAeadTagLen, sealed.end());

    Bytes key = crypto::Pbkdf2HmacSha256(password, salt, iterations, constants::kSealKeyLen);
    Bytes plaintext;
    try {
        plaintext = crypto::AesGcm(crypto::GcmMode::Open, key, nonce, Aad(header, chunk_type), ciphertext, tag);
    } catch (const std::runtime_error& exc) {
        throw SealError(std::string("Failed to open sealed message: ") + exc.what());
    }
    return std::string(plaintext.begin(), plaintext.end());
}

}  // namespace pngstash::seal
