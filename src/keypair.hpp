#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <openssl/evp.h>

namespace keygrind {

constexpr size_t PUBLIC_KEY_LEN = 32;
constexpr size_t SEED_LEN = 32;
constexpr size_t SECRET_KEY_LEN = 64;

using PublicKey = std::array<uint8_t, PUBLIC_KEY_LEN>;

/**
 * Ed25519 keypair. secret_key is laid out as seed || public_key,
 * the 64-byte form stored in keypair files.
 */
struct Keypair {
    PublicKey public_key{};
    std::array<uint8_t, SECRET_KEY_LEN> secret_key{};
};

/**
 * Unbounded supply of fresh candidate keypairs.
 * One instance per worker thread; instances are never shared.
 */
class CandidateSource {
public:
    virtual ~CandidateSource() = default;

    /**
     * Draw the next candidate
     * @return false if generation failed (fatal for the calling worker)
     */
    virtual bool next(Keypair& out) = 0;

    /**
     * Description of the last failure
     */
    virtual std::string error() const = 0;
};

/**
 * Random Ed25519 keypairs from OpenSSL's CSPRNG.
 * Reuses one keygen context across iterations.
 */
class Ed25519Source : public CandidateSource {
public:
    Ed25519Source();
    ~Ed25519Source() override;

    // Non-copyable
    Ed25519Source(const Ed25519Source&) = delete;
    Ed25519Source& operator=(const Ed25519Source&) = delete;

    bool next(Keypair& out) override;
    std::string error() const override { return error_; }

private:
    EVP_PKEY_CTX* keygen_ctx_ = nullptr;
    std::string error_;
};

/**
 * Drain the OpenSSL error queue into one message
 */
std::string openssl_error_string();

/**
 * Derive the full keypair from a 32-byte seed
 */
bool keypair_from_seed(const uint8_t* seed, Keypair& out, std::string& error);

/**
 * Rebuild a keypair from its 64-byte secret form, checking that the
 * stored public half matches the one derived from the seed
 */
bool keypair_from_secret(const uint8_t* secret, Keypair& out, std::string& error);

} // namespace keygrind
