#include "room_keys.hpp"

#include "errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace tr {

const char* keyStateName(KeyState state) {
    switch (state) {
    case KeyState::Uninitialized:
        return "uninitialized";
    case KeyState::Ready:
        return "ready";
    case KeyState::Failed:
        return "failed";
    }
    return "unknown";
}

RoomKeyRegistry::RoomKeyRegistry(CipherSuite suite) : suite_(suite) {}

RoomKeyRegistry::~RoomKeyRegistry() {
    cleanupAll();
}

const RoomKeys& RoomKeyRegistry::initializeRoomKeys(const std::string& roomId,
                                                    std::vector<std::string> symbols) {
    std::sort(symbols.begin(), symbols.end());
    symbols.erase(std::unique(symbols.begin(), symbols.end()), symbols.end());

    RoomKeys fresh;
    fresh.sessionKey = generateSessionKey(roomId, suite_);
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        fresh.assetIndexMap.emplace(symbols[i], static_cast<int>(i));
    }
    fresh.symbols = std::move(symbols);

    keys_.erase(roomId);
    failures_.erase(roomId);
    auto inserted = keys_.emplace(roomId, std::move(fresh));
    spdlog::info("Room {}: session key ready ({} symbols, {})",
                 roomId,
                 inserted.first->second.symbols.size(),
                 cipherTag(suite_));
    return inserted.first->second;
}

std::optional<EncryptedPayload> RoomKeyRegistry::encryptPriceData(const std::string& roomId,
                                                                  const PriceSnapshot& snapshot) const {
    auto it = keys_.find(roomId);
    if (it == keys_.end()) {
        return std::nullopt;
    }

    const RoomKeys& keys = it->second;
    std::vector<double> dense(keys.symbols.size(), 0.0);
    for (const auto& entry : snapshot) {
        auto idx = keys.assetIndexMap.find(entry.first);
        if (idx != keys.assetIndexMap.end()) {
            dense[static_cast<std::size_t>(idx->second)] = entry.second;
        }
    }
    return encrypt(nlohmann::json(dense), keys.sessionKey);
}

std::vector<double> RoomKeyRegistry::decryptPriceData(const std::string& roomId,
                                                      const EncryptedPayload& payload) const {
    auto it = keys_.find(roomId);
    if (it == keys_.end()) {
        throw std::invalid_argument("no session key for room " + roomId);
    }
    nlohmann::json value = decrypt(payload, it->second.sessionKey);
    if (!value.is_array()) {
        throw DecryptionError("price payload is not an array");
    }
    std::vector<double> prices;
    prices.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_number()) {
            throw DecryptionError("price payload holds a non-numeric entry");
        }
        prices.push_back(item.get<double>());
    }
    return prices;
}

std::optional<std::string> RoomKeyRegistry::sessionKeyForExchange(const std::string& roomId) const {
    auto it = keys_.find(roomId);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    const SecureKey& key = it->second.sessionKey.key;
    return encodeBase64(key.data(), key.size());
}

std::optional<std::map<std::string, int>> RoomKeyRegistry::assetIndexMapping(const std::string& roomId) const {
    auto it = keys_.find(roomId);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second.assetIndexMap;
}

std::optional<std::vector<std::string>> RoomKeyRegistry::roomSymbols(const std::string& roomId) const {
    auto it = keys_.find(roomId);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second.symbols;
}

bool RoomKeyRegistry::hasRoomKeys(const std::string& roomId) const {
    return keys_.count(roomId) != 0;
}

void RoomKeyRegistry::markFailed(const std::string& roomId, const std::string& reason) {
    if (keys_.erase(roomId) != 0) {
        spdlog::warn("Room {}: discarded session key after failure", roomId);
    }
    failures_[roomId] = reason;
}

KeyStatus RoomKeyRegistry::status(const std::string& roomId) const {
    KeyStatus out;
    if (keys_.count(roomId) != 0) {
        out.state = KeyState::Ready;
        return out;
    }
    auto failed = failures_.find(roomId);
    if (failed != failures_.end()) {
        out.state = KeyState::Failed;
        out.reason = failed->second;
    }
    return out;
}

bool RoomKeyRegistry::cleanupRoomKeys(const std::string& roomId) {
    failures_.erase(roomId);
    auto it = keys_.find(roomId);
    if (it == keys_.end()) {
        return false;
    }
    it->second.sessionKey.key.wipe();
    keys_.erase(it);
    spdlog::info("Room {}: session key destroyed", roomId);
    return true;
}

void RoomKeyRegistry::cleanupAll() {
    for (auto& entry : keys_) {
        entry.second.sessionKey.key.wipe();
    }
    if (!keys_.empty()) {
        spdlog::info("Destroyed session keys for {} room(s)", keys_.size());
    }
    keys_.clear();
    failures_.clear();
}

} // namespace tr
