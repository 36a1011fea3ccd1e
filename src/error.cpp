#include <coil/error.hpp>

namespace coil {

VerificationError::VerificationError(Kind kind, std::string const& message, std::optional<std::size_t> tick)
: std::runtime_error(message), kind_(kind), tick_(tick)
{ }

std::string_view VerificationError::name(Kind kind)
{
    switch (kind) {
    case WallCollision:
        return "WallCollision";
    case SelfCollision:
        return "SelfCollision";
    case IllegalReversal:
        return "IllegalReversal";
    case ScoreMismatch:
        return "ScoreMismatch";
    case LengthMismatch:
        return "LengthMismatch";
    case HashMismatch:
        return "HashMismatch";
    case InvalidClaim:
        return "InvalidClaim";
    }
    return "Unknown";
}

} // namespace coil
