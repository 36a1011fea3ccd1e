#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace coil {

/*
 * Raised by replay and verification. Every kind is terminal for the run that
 * raised it: replay is deterministic, so a retry reproduces the same error.
 */
class VerificationError : public std::runtime_error {
public:
    enum Kind {
        WallCollision,
        SelfCollision,
        IllegalReversal,
        ScoreMismatch,
        LengthMismatch,
        HashMismatch,
        InvalidClaim,
    };

    VerificationError(Kind kind, std::string const& message, std::optional<std::size_t> tick = {});

    Kind kind() const { return kind_; }

    /*
     * Index of the move being replayed when the error was raised, if any.
     */
    std::optional<std::size_t> tick() const { return tick_; }

    static std::string_view name(Kind kind);

private:
    Kind kind_;
    std::optional<std::size_t> tick_;
};

} // namespace coil
