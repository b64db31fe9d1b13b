#include "keyfile.hpp"
#include "base58.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <nlohmann/json.hpp>

namespace keygrind {

using json = nlohmann::json;

std::string keypair_to_json(const Keypair& keypair) {
    std::vector<int> bytes(keypair.secret_key.begin(), keypair.secret_key.end());
    return json(bytes).dump();
}

bool keypair_from_json(const std::string& text, Keypair& keypair, std::string& error) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        error = std::string("invalid JSON: ") + e.what();
        return false;
    }

    if (!doc.is_array()) {
        error = "expected a JSON array of 64 bytes";
        return false;
    }
    if (doc.size() != SECRET_KEY_LEN) {
        error = "keypair array has " + std::to_string(doc.size()) + " entries (expected 64)";
        return false;
    }

    uint8_t secret[SECRET_KEY_LEN];
    for (size_t i = 0; i < SECRET_KEY_LEN; i++) {
        const json& value = doc[i];
        if (!value.is_number_integer() || value.get<int64_t>() < 0 || value.get<int64_t>() > 255) {
            error = "entry " + std::to_string(i) + " is not a byte value (0-255)";
            return false;
        }
        secret[i] = static_cast<uint8_t>(value.get<int64_t>());
    }

    return keypair_from_secret(secret, keypair, error);
}

std::string keypair_file_name(const Pattern& pattern, const PublicKey& public_key) {
    std::string address = base58_encode(public_key.data(), public_key.size());
    if (pattern.kind == PatternKind::ImmediateSegment) {
        return address + ".json";
    }
    return "vanity_" + pattern.text + "_" + address + ".json";
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty() || dir == ".") {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

bool save_keypair(const std::string& path, const Keypair& keypair, std::string& error) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        error = "cannot open " + path + ": " + std::strerror(errno);
        return false;
    }

    file << keypair_to_json(keypair);
    file.flush();
    if (!file) {
        error = "cannot write " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool load_keypair(const std::string& path, Keypair& keypair, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open " + path + ": " + std::strerror(errno);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!keypair_from_json(buffer.str(), keypair, error)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

} // namespace keygrind
