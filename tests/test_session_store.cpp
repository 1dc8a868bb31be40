#include "errors.hpp"
#include "session_store.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "session_store_test failure: " << msg << std::endl;
    std::exit(1);
}

tr::SessionRecord record(const std::string& room, const std::string& player, double networth, std::int64_t at) {
    tr::SessionRecord r;
    r.roomId = room;
    r.playerId = player;
    r.playerName = "Player " + player;
    r.finalNetworth = networth;
    r.breakdown.cash = networth;
    r.adminSettings = nlohmann::json{ { "gameStartYear", 2005 } };
    r.completedAtMs = at;
    return r;
}

} // namespace

int main() {
    using namespace tr;

    // 2024-03-05T07:08:09Z
    const std::string logId = generateLogId(1709622489000LL);
    if (logId.size() != 20 || logId.substr(0, 15) != "20240305070809-") {
        fail("log id timestamp is wrong: " + logId);
    }
    for (std::size_t i = 15; i < logId.size(); ++i) {
        const char c = logId[i];
        if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))) {
            fail("log id suffix has an unexpected character");
        }
    }

    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "tickroom_session_store_test";
    std::filesystem::remove_all(dir);
    const std::string path = (dir / "logs" / "sessions.jsonl").string();

    JsonlSessionStore store(path);
    if (!store.readLatestByPlayer("ROOM01").empty()) {
        fail("a missing log must read as empty");
    }

    store.finalizeSession(record("ROOM01", "a", 120000.0, 1000));
    store.finalizeSession(record("ROOM01", "b", 180000.0, 1000));
    store.finalizeSession(record("ROOM02", "c", 999999.0, 1000));
    store.finalizeSession(record("ROOM01", "a", 130000.0, 2000));
    {
        std::ofstream corrupt(path, std::ios::app);
        corrupt << "{not json\n";
    }

    auto latest = store.readLatestByPlayer("ROOM01");
    if (latest.size() != 2) {
        fail("expected one record per player in the room");
    }
    if (latest[0].playerId != "b" || latest[1].playerId != "a" || latest[1].finalNetworth != 130000.0) {
        fail("records must be the latest per player, highest net worth first");
    }
    if (latest[0].logId.empty() || latest[0].adminSettings.at("gameStartYear") != 2005 ||
        latest[0].breakdown.cash != 180000.0) {
        fail("record fields were lost in the log");
    }

    InMemorySessionStore memory;
    memory.finalizeSession(record("ROOM01", "a", 1.0, 0));
    if (memory.records().size() != 1 || memory.records()[0].completedAtMs == 0) {
        fail("in-memory store did not stamp the completion time");
    }
    memory.setAvailable(false);
    try {
        memory.finalizeSession(record("ROOM01", "b", 2.0, 0));
        fail("an unavailable store accepted a record");
    } catch (const DependencyError&) {
    }

    std::filesystem::remove_all(dir);
    std::cout << "session_store_test passed" << std::endl;
    return 0;
}
