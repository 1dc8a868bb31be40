#include "session_store.hpp"

#include "clock.hpp"
#include "errors.hpp"
#include "secure_random.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <map>
#include <utility>

#include <spdlog/spdlog.h>

namespace tr {

namespace {

constexpr const char* kLogIdAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr std::uint32_t kLogIdAlphabetSize = 36;
constexpr std::size_t kLogIdSuffixLength = 5;

} // namespace

void to_json(nlohmann::json& j, const SessionRecord& record) {
    j = nlohmann::json{ { "logId", record.logId },
                        { "roomId", record.roomId },
                        { "playerId", record.playerId },
                        { "playerName", record.playerName },
                        { "finalNetworth", record.finalNetworth },
                        { "portfolioBreakdown", record.breakdown },
                        { "adminSettings", record.adminSettings },
                        { "completedAt", record.completedAtMs } };
}

void from_json(const nlohmann::json& j, SessionRecord& record) {
    record.logId = j.at("logId").get<std::string>();
    record.roomId = j.at("roomId").get<std::string>();
    record.playerId = j.at("playerId").get<std::string>();
    record.playerName = j.value("playerName", std::string{});
    record.finalNetworth = j.at("finalNetworth").get<double>();
    record.breakdown = j.value("portfolioBreakdown", nlohmann::json::object()).get<PortfolioBreakdown>();
    record.adminSettings = j.value("adminSettings", nlohmann::json());
    record.completedAtMs = j.value("completedAt", std::int64_t{ 0 });
}

std::string generateLogId(std::int64_t nowMs) {
    std::time_t seconds = static_cast<std::time_t>(nowMs / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", &utc);

    std::string id(stamp);
    id.push_back('-');
    for (std::size_t i = 0; i < kLogIdSuffixLength; ++i) {
        id.push_back(kLogIdAlphabet[secureRandomBelow(kLogIdAlphabetSize)]);
    }
    return id;
}

std::vector<SessionRecord> latestByPlayer(const std::vector<SessionRecord>& records, const std::string& roomId) {
    std::map<std::string, SessionRecord> latest;
    std::vector<std::string> order;
    for (const auto& record : records) {
        if (record.roomId != roomId) {
            continue;
        }
        auto it = latest.find(record.playerId);
        if (it == latest.end()) {
            order.push_back(record.playerId);
            latest.emplace(record.playerId, record);
        } else if (record.completedAtMs >= it->second.completedAtMs) {
            it->second = record;
        }
    }

    std::vector<SessionRecord> out;
    out.reserve(order.size());
    for (const auto& playerId : order) {
        out.push_back(latest.at(playerId));
    }
    std::stable_sort(out.begin(), out.end(), [](const SessionRecord& a, const SessionRecord& b) {
        return a.finalNetworth > b.finalNetworth;
    });
    return out;
}

JsonlSessionStore::JsonlSessionStore(std::string path) : path_(std::move(path)) {}

std::string JsonlSessionStore::finalizeSession(SessionRecord record) {
    if (record.completedAtMs == 0) {
        record.completedAtMs = nowMillis();
    }
    record.logId = generateLogId(record.completedAtMs);

    std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw DependencyError("cannot create session log directory: " + ec.message());
        }
    }

    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw DependencyError("session log is not writable: " + path_);
    }
    out << nlohmann::json(record).dump() << '\n';
    out.flush();
    if (!out) {
        throw DependencyError("failed to append to session log: " + path_);
    }
    return record.logId;
}

std::vector<SessionRecord> JsonlSessionStore::readLatestByPlayer(const std::string& roomId) {
    std::vector<SessionRecord> records;
    std::ifstream in(path_);
    if (!in) {
        if (std::filesystem::exists(path_)) {
            throw DependencyError("session log is not readable: " + path_);
        }
        return records;
    }

    std::size_t skipped = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        nlohmann::json parsed = nlohmann::json::parse(line, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            ++skipped;
            continue;
        }
        try {
            records.push_back(parsed.get<SessionRecord>());
        } catch (const nlohmann::json::exception&) {
            ++skipped;
        }
    }
    if (skipped != 0) {
        spdlog::warn("Session log {}: skipped {} unreadable line(s)", path_, skipped);
    }
    return latestByPlayer(records, roomId);
}

std::string InMemorySessionStore::finalizeSession(SessionRecord record) {
    if (!available_) {
        throw DependencyError("session store unavailable");
    }
    if (record.completedAtMs == 0) {
        record.completedAtMs = nowMillis();
    }
    record.logId = generateLogId(record.completedAtMs);
    records_.push_back(record);
    return record.logId;
}

std::vector<SessionRecord> InMemorySessionStore::readLatestByPlayer(const std::string& roomId) {
    if (!available_) {
        throw DependencyError("session store unavailable");
    }
    return latestByPlayer(records_, roomId);
}

} // namespace tr
