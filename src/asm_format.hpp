#pragma once

#include "keypair.hpp"

#include <string>

namespace keygrind {

/**
 * Render the public key as assembly constants plus comparison code
 *
 * Segments that hold a sign-extended 32-bit immediate become 8-digit
 * constants compared directly with jne; the others become 64-bit constants
 * loaded with lddw first.
 *
 * @param public_key Key to render
 * @param constant_prefix Name stem of the .equ constants
 */
std::string render_assembly(const PublicKey& public_key,
                            const std::string& constant_prefix = "EXPECTED_ADMIN_KEY");

/**
 * Full report for the address command: base58 and hex public key,
 * then render_assembly
 */
std::string render_address_report(const Keypair& keypair);

} // namespace keygrind
