#pragma once

#include "keypair.hpp"
#include "pattern.hpp"

#include <string>

namespace keygrind {

/**
 * JSON array of the 64 secret-key bytes: "[12,255,...]"
 */
std::string keypair_to_json(const Keypair& keypair);

/**
 * Parse a JSON byte array back into a keypair and verify it
 */
bool keypair_from_json(const std::string& text, Keypair& keypair, std::string& error);

/**
 * Output file name for a match:
 *   imm32 target   -> <base58 pubkey>.json
 *   vanity target  -> vanity_<pattern>_<base58 pubkey>.json
 */
std::string keypair_file_name(const Pattern& pattern, const PublicKey& public_key);

/**
 * Join a directory and file name ("." or empty directory yields the name)
 */
std::string join_path(const std::string& dir, const std::string& name);

/**
 * Write a keypair file
 */
bool save_keypair(const std::string& path, const Keypair& keypair, std::string& error);

/**
 * Read and verify a keypair file
 */
bool load_keypair(const std::string& path, Keypair& keypair, std::string& error);

} // namespace keygrind
