#include "message_router.hpp"

#include "cipher.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace tr {

namespace {

std::string requireString(const nlohmann::json& data, const char* field) {
    auto it = data.find(field);
    if (it == data.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("missing string field: ") + field);
    }
    std::string value = trim(it->get<std::string>());
    if (value.empty()) {
        throw std::invalid_argument(std::string("empty field: ") + field);
    }
    return value;
}

std::string optionalString(const nlohmann::json& data, const char* field) {
    auto it = data.find(field);
    if (it == data.end() || it->is_null()) {
        return std::string();
    }
    return it->get<std::string>();
}

PortfolioBreakdown breakdownOf(const nlohmann::json& data) {
    auto it = data.find("portfolioBreakdown");
    if (it == data.end() || it->is_null()) {
        return PortfolioBreakdown{};
    }
    return it->get<PortfolioBreakdown>();
}

double requireNumber(const nlohmann::json& data, const char* field) {
    auto it = data.find(field);
    if (it == data.end() || !it->is_number()) {
        throw std::invalid_argument(std::string("missing numeric field: ") + field);
    }
    return it->get<double>();
}

} // namespace

NetworthClaim parseNetworthClaim(const nlohmann::json& data) {
    NetworthClaim claim;
    claim.networth = requireNumber(data, "networth");
    claim.breakdown = breakdownOf(data);

    auto holdings = data.find("holdings");
    if (holdings != data.end() && holdings->is_object()) {
        claim.hasHoldings = true;
        claim.holdings = holdings->get<Holdings>();
        claim.pocketCash = data.value("pocketCash", 0.0);
        claim.savingsBalance = data.value("savingsBalance", 0.0);
        auto deposits = data.find("fixedDeposits");
        if (deposits != data.end() && deposits->is_array()) {
            claim.fixedDeposits = deposits->get<std::vector<FixedDeposit>>();
        }
    }
    return claim;
}

MessageRouter::MessageRouter(SessionCoordinator& coordinator) : coordinator_(coordinator) {}

void MessageRouter::disconnect(const std::string& playerId) {
    coordinator_.disconnect(playerId);
}

std::optional<nlohmann::json> MessageRouter::dispatchText(const std::string& playerId, const std::string& line) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& ex) {
        spdlog::debug("Unparseable message from {}: {}", hashForLogging(playerId), ex.what());
        return nlohmann::json{ { "id", nullptr }, { "response", errorResponse(RoomError::InvalidRequest) } };
    }
    return dispatch(playerId, message);
}

std::optional<nlohmann::json> MessageRouter::dispatch(const std::string& playerId, const nlohmann::json& message) {
    nlohmann::json id;
    nlohmann::json response;

    if (!message.is_object() || !message.contains("event") || !message["event"].is_string()) {
        response = errorResponse(RoomError::InvalidRequest);
    } else {
        id = message.value("id", nlohmann::json());
        const std::string event = message["event"].get<std::string>();
        const nlohmann::json data = message.value("data", nlohmann::json::object());
        try {
            response = handle(playerId, event, data.is_object() ? data : nlohmann::json::object());
        } catch (const std::invalid_argument& ex) {
            spdlog::debug("Rejected {} from {}: {}", event, hashForLogging(playerId), ex.what());
            response = errorResponse(RoomError::InvalidRequest);
        } catch (const nlohmann::json::exception& ex) {
            spdlog::debug("Malformed {} payload from {}: {}", event, hashForLogging(playerId), ex.what());
            response = errorResponse(RoomError::InvalidRequest);
        } catch (const std::exception& ex) {
            spdlog::error("Handler for {} failed: {}", event, ex.what());
            response = errorResponse(RoomError::Internal);
        }
    }

    if (id.is_null()) {
        return std::nullopt;
    }
    return nlohmann::json{ { "id", id }, { "response", response } };
}

nlohmann::json MessageRouter::handle(const std::string& playerId, const std::string& event, const nlohmann::json& data) {
    if (event == "createRoom") {
        return coordinator_.createRoom(playerId, requireString(data, "playerName"));
    }
    if (event == "joinRoom") {
        return coordinator_.joinRoom(playerId, requireString(data, "roomId"), requireString(data, "playerName"));
    }
    if (event == "leaveRoom") {
        return coordinator_.leaveRoom(playerId);
    }
    if (event == "startGame") {
        auto settings = data.find("adminSettings");
        if (settings == data.end() || !settings->is_object()) {
            throw std::invalid_argument("startGame requires adminSettings");
        }
        std::optional<InitialGameState> initial;
        auto init = data.find("initialGameState");
        if (init != data.end() && init->is_object()) {
            initial = init->get<InitialGameState>();
        }
        return coordinator_.startGame(playerId, settings->get<AdminSettings>(), initial);
    }
    if (event == "togglePause") {
        return coordinator_.togglePause(playerId);
    }
    if (event == "updatePlayerState") {
        return coordinator_.updatePlayerState(playerId, requireNumber(data, "networth"), breakdownOf(data));
    }
    if (event == "quizStarted") {
        return coordinator_.quizStarted(playerId, optionalString(data, "quizCategory"));
    }
    if (event == "quizFinished") {
        return coordinator_.quizFinished(playerId, optionalString(data, "quizCategory"));
    }
    if (event == "introCompleted") {
        return coordinator_.introCompleted(playerId);
    }
    if (event == "requestKeyExchange") {
        return coordinator_.requestKeyExchange(playerId);
    }
    if (event == "submitNetworth") {
        return coordinator_.submitNetworth(playerId, parseNetworthClaim(data));
    }
    throw std::invalid_argument("unknown event: " + event);
}

} // namespace tr
