#pragma once

#include "portfolio.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tr {

struct SessionRecord {
    std::string logId; // YYYYMMDDHHMMSS-XXXXX, assigned by the store
    std::string roomId;
    std::string playerId;
    std::string playerName;
    double finalNetworth = 0.0;
    PortfolioBreakdown breakdown;
    nlohmann::json adminSettings;
    std::int64_t completedAtMs = 0;
};

void to_json(nlohmann::json& j, const SessionRecord& record);
void from_json(const nlohmann::json& j, SessionRecord& record);

// UTC timestamp of nowMs followed by five random characters.
std::string generateLogId(std::int64_t nowMs);

// Game history store. Implementations throw DependencyError when the
// backing store is unavailable.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    // Persists the record and returns its log id.
    virtual std::string finalizeSession(SessionRecord record) = 0;

    // Latest record per player for the room, highest net worth first.
    virtual std::vector<SessionRecord> readLatestByPlayer(const std::string& roomId) = 0;
};

// Append-only JSON-lines file.
class JsonlSessionStore : public SessionStore {
public:
    explicit JsonlSessionStore(std::string path);

    std::string finalizeSession(SessionRecord record) override;
    std::vector<SessionRecord> readLatestByPlayer(const std::string& roomId) override;

private:
    std::string path_;
};

class InMemorySessionStore : public SessionStore {
public:
    std::string finalizeSession(SessionRecord record) override;
    std::vector<SessionRecord> readLatestByPlayer(const std::string& roomId) override;

    void setAvailable(bool available) { available_ = available; }
    const std::vector<SessionRecord>& records() const { return records_; }

private:
    std::vector<SessionRecord> records_;
    bool available_ = true;
};

// Keeps the newest record per player (later entries win ties) and orders by
// net worth descending.
std::vector<SessionRecord> latestByPlayer(const std::vector<SessionRecord>& records, const std::string& roomId);

} // namespace tr
