#include "room.hpp"

#include "config.hpp"

namespace tr {

namespace {

// Requests above kMaxEventsCount are accepted and clamped at start.
constexpr int kMaxEventsRequested = 1000;

template <typename T>
void readOptional(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

nlohmann::json passThrough(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return it == j.end() ? nlohmann::json() : *it;
}

} // namespace

const char* pauseReasonName(PauseReason reason) {
    switch (reason) {
    case PauseReason::Quiz:
        return "quiz";
    case PauseReason::Manual:
        return "manual";
    case PauseReason::Intro:
        return "intro";
    case PauseReason::None:
        return nullptr;
    }
    return nullptr;
}

const PlayerInfo* Room::findPlayer(const std::string& playerId) const {
    for (const auto& p : players) {
        if (p.id == playerId) {
            return &p;
        }
    }
    return nullptr;
}

PlayerInfo* Room::findPlayer(const std::string& playerId) {
    for (auto& p : players) {
        if (p.id == playerId) {
            return &p;
        }
    }
    return nullptr;
}

void to_json(nlohmann::json& j, const QuizStatus& status) {
    j = nlohmann::json{ { "currentQuiz", nullptr }, { "isCompleted", status.isCompleted } };
    if (status.currentQuiz) {
        j["currentQuiz"] = *status.currentQuiz;
    }
}

void to_json(nlohmann::json& j, const PlayerInfo& player) {
    j = nlohmann::json{ { "id", player.id },
                        { "name", player.name },
                        { "isHost", player.isHost },
                        { "isReady", player.isReady },
                        { "networth", player.networth },
                        { "portfolioBreakdown", player.portfolioBreakdown },
                        { "quizStatus", player.quizStatus } };
}

void to_json(nlohmann::json& j, const AdminSettings& settings) {
    j = nlohmann::json{ { "selectedCategories", settings.selectedCategories },
                        { "gameStartYear", settings.gameStartYear },
                        { "hideCurrentYear", settings.hideCurrentYear },
                        { "initialPocketCash", settings.initialPocketCash },
                        { "recurringIncome", settings.recurringIncome },
                        { "enableQuiz", settings.enableQuiz },
                        { "enableIntro", settings.enableIntro } };
    if (settings.eventsCount) {
        j["eventsCount"] = *settings.eventsCount;
    }
    if (settings.monthDurationMs) {
        j["monthDuration"] = *settings.monthDurationMs;
    }
}

void from_json(const nlohmann::json& j, AdminSettings& settings) {
    settings = AdminSettings{};
    readOptional(j, "selectedCategories", settings.selectedCategories);
    auto year = j.find("gameStartYear");
    if (year != j.end() && !year->is_null()) {
        settings.gameStartYear = static_cast<int>(readBoundedInteger(*year, "gameStartYear", 0, kMaxCalendarYear));
    }
    readOptional(j, "hideCurrentYear", settings.hideCurrentYear);
    readOptional(j, "initialPocketCash", settings.initialPocketCash);
    readOptional(j, "recurringIncome", settings.recurringIncome);
    readOptional(j, "enableQuiz", settings.enableQuiz);
    readOptional(j, "enableIntro", settings.enableIntro);

    auto events = j.find("eventsCount");
    if (events != j.end() && !events->is_null()) {
        settings.eventsCount = static_cast<int>(readBoundedInteger(*events, "eventsCount", 0, kMaxEventsRequested));
    }
    auto duration = j.find("monthDuration");
    if (duration != j.end() && !duration->is_null()) {
        settings.monthDurationMs = readBoundedInteger(*duration, "monthDuration", 1, kMaxDurationMs);
    }
}

void to_json(nlohmann::json& j, const LifeEvent& event) {
    j = nlohmann::json{ { "id", event.id },
                        { "type", event.type == LifeEventType::Gain ? "gain" : "loss" },
                        { "message", event.message },
                        { "amount", event.amount },
                        { "gameYear", event.gameYear },
                        { "gameMonth", event.gameMonth },
                        { "triggered", event.triggered } };
}

void to_json(nlohmann::json& j, const GameState& state) {
    j = nlohmann::json{ { "isStarted", state.started },
                        { "isEnded", state.ended },
                        { "isPaused", state.paused },
                        { "pauseReason", nullptr },
                        { "currentYear", state.currentYear },
                        { "currentMonth", state.currentMonth },
                        { "playersWaitingForQuiz", state.playersWaitingForQuiz },
                        { "playersWaitingForIntro", state.playersWaitingForIntro } };
    if (const char* reason = pauseReasonName(state.pauseReason)) {
        j["pauseReason"] = reason;
    }
    if (!state.selectedAssets.is_null()) {
        j["selectedAssets"] = state.selectedAssets;
    }
    if (!state.assetUnlockSchedule.is_null()) {
        j["assetUnlockSchedule"] = state.assetUnlockSchedule;
    }
    if (!state.yearlyQuotes.is_null()) {
        j["yearlyQuotes"] = state.yearlyQuotes;
    }
    if (!state.quizQuestionIndices.is_null()) {
        j["quizQuestionIndices"] = state.quizQuestionIndices;
    }
}

void from_json(const nlohmann::json& j, InitialGameState& initial) {
    initial = InitialGameState{};
    if (!j.is_object()) {
        return;
    }
    initial.selectedAssets = passThrough(j, "selectedAssets");
    initial.assetUnlockSchedule = passThrough(j, "assetUnlockSchedule");
    initial.yearlyQuotes = passThrough(j, "yearlyQuotes");
    initial.quizQuestionIndices = passThrough(j, "quizQuestionIndices");
}

} // namespace tr
