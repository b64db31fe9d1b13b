#include "asm_format.hpp"
#include "base58.hpp"
#include "format.hpp"
#include "pattern.hpp"

#include <iomanip>
#include <sstream>

namespace keygrind {

std::string render_assembly(const PublicKey& public_key, const std::string& constant_prefix) {
    const uint8_t* key = public_key.data();
    std::ostringstream out;

    bool imm32[NUM_SEGMENTS];
    for (int segment = 0; segment < NUM_SEGMENTS; segment++) {
        imm32[segment] = is_imm32_segment(key, segment);
    }

    out << "=== Assembly Constants ===\n";
    for (int segment = 0; segment < NUM_SEGMENTS; segment++) {
        out << ".equ " << constant_prefix << "_" << segment << ", 0x" << std::hex << std::setfill('0');
        if (imm32[segment]) {
            out << std::setw(8) << static_cast<uint32_t>(segment_i32(key, segment));
        } else {
            out << std::setw(16) << segment_u64(key, segment);
        }
        out << std::dec << std::setfill(' ') << "\n";
    }

    out << "\n=== Assembly Comparison Code ===\n";
    for (int segment = 0; segment < NUM_SEGMENTS; segment++) {
        out << "  ldxdw r2, [r1+" << segment * SEGMENT_LEN << "]\n";
        if (imm32[segment]) {
            out << "  jne r2, " << constant_prefix << "_" << segment << ", abort\n";
        } else {
            out << "  lddw r3, " << constant_prefix << "_" << segment << "\n";
            out << "  jne r2, r3, abort\n";
        }
        out << "\n";
    }

    return out.str();
}

std::string render_address_report(const Keypair& keypair) {
    const PublicKey& pub = keypair.public_key;
    std::ostringstream out;
    out << "Public Key: " << base58_encode(pub.data(), pub.size()) << "\n";
    out << "\nPublic Key (hex): " << to_hex(pub.data(), pub.size()) << "\n\n";
    out << render_assembly(pub);
    return out.str();
}

} // namespace keygrind
