#include "result_sink.hpp"
#include "base58.hpp"
#include "format.hpp"
#include "keyfile.hpp"

#include <exception>
#include <iomanip>
#include <sstream>

namespace keygrind {

KeyFileSink::KeyFileSink(std::string output_dir, std::ostream& out, std::ostream& err, std::mutex& console_mutex)
    : output_dir_(std::move(output_dir)), out_(out), err_(err), console_mutex_(console_mutex) {}

std::string KeyFileSink::describe(const SearchTarget& target, const MatchRecord& record) {
    const uint8_t* key = record.keypair.public_key.data();
    std::ostringstream out;

    out << "FOUND MATCHING KEYPAIR #" << record.sequence << "/" << target.requested
        << " for " << pattern_label(target.pattern) << "\n";
    out << "Thread: " << record.worker_id << "\n";
    out << "Public Key: " << to_hex(key, PUBLIC_KEY_LEN) << "\n";
    out << "Public Key (base58): " << base58_encode(key, PUBLIC_KEY_LEN) << "\n";

    if (target.pattern.kind == PatternKind::ImmediateSegment) {
        const int segment = record.info.segment;
        const size_t offset = record.info.offset;
        out << "Matched Segment: " << segment << " (bytes " << offset << "-" << offset + 7 << ")\n";

        out << "Segment " << segment << " bytes (hex): ";
        for (size_t i = 0; i < SEGMENT_LEN; i++) {
            out << to_hex(key + offset + i, 1);
            if (i == 3) {
                out << " | ";
            } else if (i < SEGMENT_LEN - 1) {
                out << " ";
            }
        }
        out << "\n";

        int32_t i32_value = segment_i32(key, segment);
        int64_t i64_value = i32_value;
        std::ostringstream i32_hex, i64_hex;
        i32_hex << std::hex << std::setfill('0') << std::setw(8) << static_cast<uint32_t>(i32_value);
        i64_hex << std::hex << std::setfill('0') << std::setw(16) << static_cast<uint64_t>(i64_value);
        out << "  i32 value: " << i32_value << " (0x" << i32_hex.str() << ")\n";
        out << "  i64 value: " << i64_value << " (0x" << i64_hex.str() << ")\n";
    } else {
        out << "Matched " << target.pattern.bytes.size() << " byte(s) at offset "
            << record.info.offset << ": " << to_hex(target.pattern.bytes.data(), target.pattern.bytes.size())
            << "\n";
    }
    return out.str();
}

void KeyFileSink::accept(const SearchTarget& target, const MatchRecord& record) {
    // Runs on worker threads: nothing may escape into the worker loop
    bool counted = false;
    try {
        std::string text = describe(target, record);

        std::string path = join_path(output_dir_, keypair_file_name(target.pattern, record.keypair.public_key));
        std::string error;
        bool saved = save_keypair(path, record.keypair, error);
        if (saved) {
            written_.fetch_add(1, std::memory_order_relaxed);
        } else {
            failed_.fetch_add(1, std::memory_order_relaxed);
        }
        counted = true;

        std::lock_guard<std::mutex> lock(console_mutex_);
        out_ << "\n\n" << text;
        if (saved) {
            out_ << "Keypair saved to: " << path << "\n" << std::flush;
        } else {
            out_ << std::flush;
            // The secret key is still printed so the find is not lost
            err_ << "Warning: " << error << "\n"
                 << "Warning: keypair not saved, secret key bytes: " << keypair_to_json(record.keypair) << "\n"
                 << std::flush;
        }
    } catch (const std::exception& e) {
        if (!counted) {
            failed_.fetch_add(1, std::memory_order_relaxed);
        }
        std::lock_guard<std::mutex> lock(console_mutex_);
        err_ << "Warning: cannot report match #" << record.sequence << " for target " << target.id + 1
             << ": " << e.what() << "\n" << std::flush;
    }
}

} // namespace keygrind
