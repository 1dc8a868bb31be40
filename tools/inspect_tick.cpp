#include "cipher.hpp"
#include "errors.hpp"
#include "secure_memory.hpp"
#include "secure_random.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using namespace tr;

namespace {

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("Unable to open payload file: " + path);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return nlohmann::json::parse(buffer.str());
}

// Accepts a bare payload or a whole priceTick message ({"payload": ...} or
// {"event": "priceTick", "data": {"payload": ...}}).
EncryptedPayload extractPayload(const nlohmann::json& doc) {
    if (doc.contains("data") && doc["data"].is_object()) {
        return extractPayload(doc["data"]);
    }
    if (doc.contains("payload")) {
        return doc["payload"].get<EncryptedPayload>();
    }
    return doc.get<EncryptedPayload>();
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: inspect_tick <base64-session-key> <payload.json> [maxAgeMs]\n";
        return 1;
    }

    std::int64_t maxAgeMs = 30000;
    if (argc >= 4) {
        try {
            maxAgeMs = std::stoll(argv[3]);
        } catch (const std::exception&) {
            std::cerr << "maxAgeMs must be an integer\n";
            return 1;
        }
    }

    EncryptedPayload payload;
    try {
        payload = extractPayload(readJsonFile(argv[2]));
    } catch (const std::exception& ex) {
        std::cerr << "Payload parse error: " << ex.what() << "\n";
        return 1;
    }

    SessionKey key;
    try {
        ensureSodiumReady();
        auto raw = decodeBase64(argv[1]);
        if (raw.size() != kSessionKeyBytes) {
            secureZero(raw.data(), raw.size());
            std::cerr << "Session key must be " << kSessionKeyBytes << " bytes (base64 encoded)\n";
            return 1;
        }
        key.key = SecureKey(raw.size());
        std::memcpy(key.key.data(), raw.data(), raw.size());
        secureZero(raw.data(), raw.size());
        key.suite = suiteFromTag(payload.alg.empty() ? "XC20P" : payload.alg);
    } catch (const std::exception& ex) {
        std::cerr << "Session key error: " << ex.what() << "\n";
        return 1;
    }

    nlohmann::json prices;
    try {
        prices = decrypt(payload, key);
    } catch (const DecryptionError& ex) {
        std::cerr << "Decryption failed: " << ex.what() << "\n";
        return 2;
    }

    const bool fresh = isPayloadFresh(payload, maxAgeMs);
    nlohmann::json report{ { "alg", payload.alg },
                           { "ts", payload.ts },
                           { "fresh", fresh },
                           { "maxAgeMs", maxAgeMs },
                           { "prices", prices } };
    std::cout << report.dump(2) << "\n";
    return fresh ? 0 : 3;
}
