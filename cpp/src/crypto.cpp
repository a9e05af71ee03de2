#include "pngstash/crypto.hpp"

#include "pngstash/constants.hpp"
#include "pngstash/crypto_utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>

namespace pngstash::crypto {

namespace {

using detail::UniqueCipherCtx;

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                             static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha256(),
                             static_cast<int>(out.size()), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

Bytes AesGcm(GcmMode mode, const Bytes& key, const Bytes& nonce, const Bytes& aad, const Bytes& input, Bytes& tag) {
    Ensure(key.size() == constants::kSealKeyLen, "AES-GCM key has the wrong size");
    Ensure(nonce.size() == constants::kAeadNonceLen, "AES-GCM nonce has the wrong size");
    const int enc = mode == GcmMode::Seal ? 1 : 0;
    if (mode == GcmMode::Seal) {
        tag.assign(constants::kAeadTagLen, 0);
    } else {
        Ensure(tag.size() == constants::kAeadTagLen, "AES-GCM tag has the wrong size");
    }

    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    Ensure(ctx != nullptr, "AES-GCM context allocation failed");
    Ensure(EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) == 1,
           "AES-GCM init failed");
    Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) == 1,
           "AES-GCM set iv length failed");
    Ensure(EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) == 1,
           "AES-GCM set key failed");

    int out_len = 0;
    if (!aad.empty()) {
        Ensure(EVP_CipherUpdate(ctx.get(), nullptr, &out_len, aad.data(), static_cast<int>(aad.size())) == 1,
               "AES-GCM aad failed");
    }

    // One spare byte keeps data() valid for an empty message.
    Bytes output(input.size() + 1);
    std::size_t total = 0;
    if (!input.empty()) {
        Ensure(EVP_CipherUpdate(ctx.get(), output.data(), &out_len, input.data(),
                                static_cast<int>(input.size())) == 1,
               "AES-GCM update failed");
        total += static_cast<std::size_t>(out_len);
    }
    if (mode == GcmMode::Open) {
        Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
               "AES-GCM set tag failed");
    }
    Ensure(EVP_CipherFinal_ex(ctx.get(), output.data() + total, &out_len) == 1,
           mode == GcmMode::Open ? "AES-GCM auth failed" : "AES-GCM final failed");
    total += static_cast<std::size_t>(out_len);
    if (mode == GcmMode::Seal) {
        Ensure(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag.size()), tag.data()) == 1,
               "AES-GCM get tag failed");
    }
    output.resize(total);
    return output;
}

}  // namespace pngstash::crypto
