#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tr {

// Raised when an encrypted payload fails authentication or cannot be parsed.
// Never caught to substitute a fallback value.
class DecryptionError : public std::runtime_error {
public:
    explicit DecryptionError(const std::string& message) : std::runtime_error(message) {}
};

// Raised by external collaborators (price repository, session store) when the
// backing store cannot serve a request.
class DependencyError : public std::runtime_error {
public:
    explicit DependencyError(const std::string& message) : std::runtime_error(message) {}
};

enum class RoomError {
    None,
    RoomNotFound,
    GameAlreadyStarted,
    GameEnded,
    PlayerAlreadyPresent,
    NotEnoughPlayers,
    NotInRoom,
    NotHost,
    InvalidConfiguration,
    MarketDataUnavailable,
    GameNotRunning,
    PauseLocked,
    KeysUnavailable,
    InvalidRequest,
    Internal,
};

// User-visible text for a room error. Contains no internal identifiers.
const char* describe(RoomError error);

// Value-or-error result for room operations that fail on bad input.
template <typename T>
class Outcome {
public:
    static Outcome success(T value) { return Outcome(std::move(value), RoomError::None); }
    static Outcome failure(RoomError error) { return Outcome(std::nullopt, error); }

    bool ok() const { return error_ == RoomError::None; }
    explicit operator bool() const { return ok(); }

    RoomError error() const { return error_; }
    const T& value() const {
        if (!value_) {
            throw std::logic_error(std::string("Outcome holds an error: ") + describe(error_));
        }
        return *value_;
    }

private:
    Outcome(std::optional<T> value, RoomError error) : value_(std::move(value)), error_(error) {}

    std::optional<T> value_;
    RoomError error_;
};

} // namespace tr
