#include "keypair.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>

#include <cstring>

namespace keygrind {

namespace {

// Copy the raw seed and public key out of an Ed25519 EVP_PKEY
bool extract_raw(EVP_PKEY* pkey, Keypair& out) {
    size_t seed_len = SEED_LEN;
    size_t pub_len = PUBLIC_KEY_LEN;

    if (EVP_PKEY_get_raw_private_key(pkey, out.secret_key.data(), &seed_len) <= 0 ||
        seed_len != SEED_LEN) {
        return false;
    }
    if (EVP_PKEY_get_raw_public_key(pkey, out.public_key.data(), &pub_len) <= 0 ||
        pub_len != PUBLIC_KEY_LEN) {
        return false;
    }

    std::memcpy(out.secret_key.data() + SEED_LEN, out.public_key.data(), PUBLIC_KEY_LEN);
    return true;
}

} // namespace

std::string openssl_error_string() {
    std::string result;
    unsigned long code;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!result.empty()) result += "; ";
        result += buf;
    }
    if (result.empty()) {
        result = "unknown OpenSSL error";
    }
    return result;
}

Ed25519Source::Ed25519Source() {
    keygen_ctx_ = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
    if (!keygen_ctx_) {
        error_ = "cannot create Ed25519 keygen context: " + openssl_error_string();
        return;
    }

    if (EVP_PKEY_keygen_init(keygen_ctx_) <= 0) {
        error_ = "cannot initialize Ed25519 keygen: " + openssl_error_string();
        EVP_PKEY_CTX_free(keygen_ctx_);
        keygen_ctx_ = nullptr;
    }
}

Ed25519Source::~Ed25519Source() {
    if (keygen_ctx_) EVP_PKEY_CTX_free(keygen_ctx_);
}

__attribute__((hot))
bool Ed25519Source::next(Keypair& out) {
    if (!keygen_ctx_) {
        return false;
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(keygen_ctx_, &pkey) <= 0) {
        error_ = "Ed25519 key generation failed: " + openssl_error_string();
        return false;
    }

    bool ok = extract_raw(pkey, out);
    if (!ok) {
        error_ = "cannot read raw Ed25519 key: " + openssl_error_string();
    }

    EVP_PKEY_free(pkey);
    return ok;
}

bool keypair_from_seed(const uint8_t* seed, Keypair& out, std::string& error) {
    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed, SEED_LEN);
    if (!pkey) {
        error = "invalid Ed25519 seed: " + openssl_error_string();
        return false;
    }

    bool ok = extract_raw(pkey, out);
    if (!ok) {
        error = "cannot read raw Ed25519 key: " + openssl_error_string();
    }

    EVP_PKEY_free(pkey);
    return ok;
}

bool keypair_from_secret(const uint8_t* secret, Keypair& out, std::string& error) {
    if (!keypair_from_seed(secret, out, error)) {
        return false;
    }

    if (CRYPTO_memcmp(out.public_key.data(), secret + SEED_LEN, PUBLIC_KEY_LEN) != 0) {
        error = "public key does not match the secret seed";
        return false;
    }
    return true;
}

} // namespace keygrind
