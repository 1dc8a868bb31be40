#include "errors.hpp"
#include "life_events.hpp"
#include "random_source.hpp"
#include "room_registry.hpp"

#include <cstdlib>
#include <deque>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "room_registry_test failure: " << msg << std::endl;
    std::exit(1);
}

// Replays a fixed list of draws, then repeats the last one.
class ScriptedRandom : public tr::RandomSource {
public:
    explicit ScriptedRandom(std::deque<std::uint32_t> draws) : draws_(std::move(draws)) {}

    double uniform01() override { return 0.0; }
    std::uint32_t below(std::uint32_t upperBound) override {
        std::uint32_t value = draws_.front();
        if (draws_.size() > 1) {
            draws_.pop_front();
        }
        return value % upperBound;
    }

private:
    std::deque<std::uint32_t> draws_;
};

// One event at year 1 month 2 for every player; throws for the call
// numbered failOnCall.
class FixedLifeEvents : public tr::LifeEventGenerator {
public:
    explicit FixedLifeEvents(int failOnCall = -1) : failOnCall_(failOnCall) {}

    std::vector<tr::LifeEvent> generate(int count, const nlohmann::json&) override {
        lastCount = count;
        if (calls_++ == failOnCall_) {
            throw std::runtime_error("generator exploded");
        }
        tr::LifeEvent ev;
        ev.id = "ev-" + std::to_string(calls_);
        ev.type = tr::LifeEventType::Loss;
        ev.message = "Car repair";
        ev.amount = -2500.0;
        ev.gameYear = 1;
        ev.gameMonth = 2;
        return { ev };
    }

    int lastCount = 0;

private:
    int failOnCall_;
    int calls_ = 0;
};

tr::PortfolioBreakdown cashOnly(double cash) {
    tr::PortfolioBreakdown breakdown;
    breakdown.cash = cash;
    return breakdown;
}

std::deque<std::uint32_t> repeated(std::uint32_t value, std::size_t times) {
    return std::deque<std::uint32_t>(times, value);
}

} // namespace

int main() {
    using namespace tr;

    // Room code collisions are retried until a free code is drawn.
    {
        std::deque<std::uint32_t> draws = repeated(0, kRoomCodeLength * 2);
        for (std::size_t i = 0; i < kRoomCodeLength; ++i) {
            draws.push_back(1);
        }
        ScriptedRandom rng(draws);
        FixedLifeEvents events;
        RoomRegistry rooms(rng, events);

        auto first = rooms.createRoom("host-1", "Host One");
        auto second = rooms.createRoom("host-2", "Host Two");
        if (!first || !second) {
            fail("room creation failed");
        }
        if (first.value() == second.value()) {
            fail("two live rooms share a code");
        }
        if (first.value() != "AAAAAA" || second.value() != "BBBBBB") {
            fail("unexpected room codes " + first.value() + " / " + second.value());
        }
        if (rooms.createRoom("host-1", "Again").error() != RoomError::PlayerAlreadyPresent) {
            fail("a player in a room created a second room");
        }
    }

    // Code space exhaustion surfaces as an error instead of looping forever.
    {
        ScriptedRandom rng(repeated(0, 1));
        FixedLifeEvents events;
        RoomRegistry rooms(rng, events);
        rooms.createRoom("host-1", "Host");
        try {
            rooms.createRoom("host-2", "Host");
            fail("exhausted code space returned a room");
        } catch (const std::runtime_error&) {
        }
    }

    InsecureTestRng rng(7);
    FixedLifeEvents events(1);
    RoomRegistry rooms(rng, events, 100000.0, 2);

    std::vector<std::string> deleted;
    rooms.setRoomDeletedListener([&](const std::string& code) { deleted.push_back(code); });

    const std::string code = rooms.createRoom("host", "Host").value();
    if (rooms.joinRoom("NOPE00", "a", "A").error() != RoomError::RoomNotFound) {
        fail("joining a missing room did not report RoomNotFound");
    }
    auto joinA = rooms.joinRoom(code, "a", "Alice");
    if (!joinA) {
        fail("join failed");
    }
    const PlayerInfo* alice = joinA.value().findPlayer("a");
    if (alice == nullptr || alice->portfolioBreakdown.cash != 100000.0 || alice->networth != 100000.0) {
        fail("joining player was not seeded with starting cash");
    }
    if (rooms.joinRoom(code, "a", "Alice").error() != RoomError::PlayerAlreadyPresent) {
        fail("duplicate join accepted");
    }

    if (rooms.validateStart(code, "host") != RoomError::NotEnoughPlayers) {
        fail("a room with one player may not start");
    }
    rooms.joinRoom(code, "b", "Bob");
    rooms.joinRoom(code, "c", "Carol");
    if (rooms.validateStart(code, "a") != RoomError::NotHost) {
        fail("a non-host passed start validation");
    }
    if (rooms.togglePause(code)) {
        fail("toggling pause before the game started succeeded");
    }

    AdminSettings settings;
    settings.gameStartYear = 2005;
    settings.initialPocketCash = 50000.0;
    if (rooms.startGame(code, settings) != RoomError::None) {
        fail("startGame failed");
    }
    const Room* room = rooms.findRoom(code);
    if (!room->gameState.started || room->gameState.currentYear != 1 || room->gameState.currentMonth != 1) {
        fail("started room is not at year 1 month 1");
    }
    if (room->findPlayer("b")->portfolioBreakdown.cash != 50000.0 || room->findPlayer("host")->networth != 0.0) {
        fail("initial pocket cash not applied to non-host players only");
    }
    if (rooms.joinRoom(code, "d", "Dave").error() != RoomError::GameAlreadyStarted) {
        fail("joined a running game");
    }

    // The generator throws for Alice; her schedule is empty and the others
    // are unaffected.
    rooms.generateLifeEventsForRoom(code, 4);
    if (events.lastCount != 4) {
        fail("events count not passed through");
    }
    room = rooms.findRoom(code);
    if (room->gameState.lifeEvents.at("a").size() != 0 || room->gameState.lifeEvents.at("b").size() != 1) {
        fail("a generator failure for one player leaked to others");
    }
    nlohmann::json visible = room->gameState;
    if (visible.contains("lifeEvents")) {
        fail("serialized game state exposes private life events");
    }

    // Leaderboard: stable on ties, host excluded.
    rooms.updatePlayerState("a", 150000.0, cashOnly(150000.0));
    rooms.updatePlayerState("b", 150000.0, cashOnly(150000.0));
    rooms.updatePlayerState("c", 90000.0, cashOnly(90000.0));
    auto board = rooms.getLeaderboard(code);
    if (board.size() != 3 || board[0].id != "a" || board[1].id != "b" || board[2].id != "c") {
        fail("leaderboard is not a stable descending order without the host");
    }

    // Quiz barrier: pause holds until the last waiting player finishes.
    if (!rooms.markQuizStarted("a", "stocks") || !rooms.markQuizStarted("b", "gold")) {
        fail("quiz start rejected");
    }
    room = rooms.findRoom(code);
    if (!room->gameState.paused || room->gameState.pauseReason != PauseReason::Quiz ||
        room->gameState.playersWaitingForQuiz.size() != 2) {
        fail("quiz start did not gate the room");
    }
    if (rooms.togglePause(code)) {
        fail("manual toggle overrode a quiz pause");
    }
    if (rooms.markQuizCompleted("c", "stocks")) {
        fail("a player not in the wait list resumed the room");
    }
    if (rooms.markQuizCompleted("a", "stocks")) {
        fail("room resumed before the wait list emptied");
    }
    if (!rooms.findRoom(code)->gameState.paused) {
        fail("room unpaused with a player still in a quiz");
    }
    if (!rooms.markQuizCompleted("b", "gold")) {
        fail("the last quiz completion did not resume the room");
    }
    if (rooms.markQuizCompleted("b", "gold")) {
        fail("resumption fired twice");
    }
    room = rooms.findRoom(code);
    if (room->gameState.paused || room->gameState.pauseReason != PauseReason::None) {
        fail("room still paused after the quiz barrier cleared");
    }

    // Manual pause toggles both ways.
    if (!rooms.togglePause(code) || rooms.findRoom(code)->gameState.pauseReason != PauseReason::Manual) {
        fail("manual pause failed");
    }
    if (!rooms.togglePause(code) || rooms.findRoom(code)->gameState.paused) {
        fail("manual resume failed");
    }

    // A player leaving mid-quiz releases the barrier.
    rooms.markQuizStarted("c", "crypto");
    auto left = rooms.leaveRoom("c");
    if (!left || !left->resumed || left->roomDeleted || rooms.findRoom(code)->gameState.paused) {
        fail("leaving the quiz wait list did not resume the room");
    }
    if (rooms.roomOf("c")) {
        fail("departed player still indexed");
    }

    // Life events fire once, at their month, and only for their owner.
    ClockStep step = rooms.advanceClock(code);
    if (step.outcome != ClockOutcome::Advanced || step.year != 1 || step.month != 2) {
        fail("clock did not advance to year 1 month 2");
    }
    // Host and Bob hold an event for this month; Alice's schedule is empty.
    auto fired = rooms.applyLifeEvents(code, 1, 2);
    if (fired.size() != 2) {
        fail("expected two life events to fire");
    }
    for (const auto& f : fired) {
        if (f.playerId == "a") {
            fail("a life event fired for a player without one");
        }
        if (f.playerId == "b" && f.postPocketCash != 150000.0 - 2500.0) {
            fail("life event amount not applied to the owner's cash");
        }
    }
    if (rooms.findRoom(code)->findPlayer("a")->networth != 150000.0) {
        fail("another player's life event changed Alice");
    }
    if (!rooms.applyLifeEvents(code, 1, 2).empty()) {
        fail("a life event fired twice");
    }

    // Two-year game: months 3..12 of year 1 and all of year 2, then terminal.
    int advanced = 0;
    while (rooms.advanceClock(code).outcome == ClockOutcome::Advanced) {
        ++advanced;
    }
    if (advanced != 22) {
        fail("expected 22 more advances, got " + std::to_string(advanced));
    }
    room = rooms.findRoom(code);
    if (room->gameState.currentYear != 2 || room->gameState.currentMonth != 12) {
        fail("terminal step moved the clock");
    }
    step = rooms.advanceClock(code);
    if (step.outcome != ClockOutcome::Terminal || step.year != 2 || step.month != 12) {
        fail("terminal step reported the wrong final date");
    }
    if (!rooms.endGame(code) || rooms.endGame(code)) {
        fail("endGame is not idempotent");
    }
    if (rooms.advanceClock(code).outcome != ClockOutcome::NotRunning) {
        fail("ended room still advances");
    }
    if (rooms.updatePlayerState("a", 1.0, cashOnly(1.0))) {
        fail("ended room accepted a state update");
    }
    if (rooms.joinRoom(code, "e", "Eve").error() != RoomError::GameEnded) {
        fail("joined an ended room");
    }

    // Host departure deletes the room and purges the reverse index.
    auto hostLeft = rooms.leaveRoom("host");
    if (!hostLeft || !hostLeft->wasHost || !hostLeft->roomDeleted || hostLeft->remaining.size() != 2) {
        fail("host departure did not delete the room");
    }
    if (rooms.findRoom(code) != nullptr || rooms.roomOf("a") || rooms.roomOf("b")) {
        fail("deleted room still reachable");
    }
    if (deleted.size() != 1 || deleted[0] != code) {
        fail("deletion listener not notified");
    }
    if (rooms.leaveRoom("a")) {
        fail("leaving after deletion reported a room");
    }

    // Idle rooms are swept; started ones are not.
    const std::string idle = rooms.createRoom("h2", "Idle host").value();
    const Room* idleRoom = rooms.findRoom(idle);
    if (rooms.cleanupOldRooms(1000, idleRoom->createdAtMs + 500) != 0) {
        fail("swept a fresh room");
    }
    if (rooms.cleanupOldRooms(1000, idleRoom->createdAtMs + 5000) != 1 || rooms.roomCount() != 0) {
        fail("did not sweep an idle room");
    }

    // Intro gate: every non-host player must finish the intro.
    const std::string introCode = rooms.createRoom("h3", "Host").value();
    rooms.joinRoom(introCode, "x", "X");
    rooms.joinRoom(introCode, "y", "Y");
    AdminSettings intro;
    intro.gameStartYear = 2010;
    intro.enableIntro = true;
    rooms.startGame(introCode, intro);
    if (rooms.findRoom(introCode)->gameState.pauseReason != PauseReason::Intro) {
        fail("intro gate not applied at start");
    }
    if (rooms.markIntroCompleted("x") || !rooms.markIntroCompleted("y")) {
        fail("intro gate did not resume on the last completion");
    }

    std::cout << "room_registry_test passed" << std::endl;
    return 0;
}
