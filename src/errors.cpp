#include "errors.hpp"

namespace tr {

const char* describe(RoomError error) {
    switch (error) {
    case RoomError::None:
        return "OK";
    case RoomError::RoomNotFound:
        return "Room not found";
    case RoomError::GameAlreadyStarted:
        return "Game already in progress";
    case RoomError::GameEnded:
        return "Game has already ended";
    case RoomError::PlayerAlreadyPresent:
        return "Player already in room";
    case RoomError::NotEnoughPlayers:
        return "Need at least 2 players to start";
    case RoomError::NotInRoom:
        return "Not in a room";
    case RoomError::NotHost:
        return "Only the host can do that";
    case RoomError::InvalidConfiguration:
        return "Invalid game configuration - missing asset selection or start year";
    case RoomError::MarketDataUnavailable:
        return "Market data is unavailable. Please try starting the game again.";
    case RoomError::GameNotRunning:
        return "Game is not running";
    case RoomError::PauseLocked:
        return "Game cannot be paused or resumed right now";
    case RoomError::KeysUnavailable:
        return "Price encryption is not ready for this room";
    case RoomError::InvalidRequest:
        return "Invalid request";
    case RoomError::Internal:
        return "Internal server error";
    }
    return "Unknown error";
}

} // namespace tr
