#pragma once

#include <coil/verifier.hpp>

#include <boost/json/object.hpp>

#include <string_view>

namespace coil {

class Game;

/*
 * Event log: one JSON object per line in .coil/logs/<launch time>.log under
 * the project directory. The file is opened on first use, so writing throws
 * std::invalid_argument outside a project and std::runtime_error when the
 * file cannot be opened.
 */
class Log {
public:
    // adds "ts", seconds since the epoch with millisecond precision
    static void log(boost::json::object event);

    /*
     * {"event":"verify", "source", "accepted", "message"} plus "kind" and
     * "tick" when the verdict carries them.
     */
    static void verdict(std::string_view source, Verdict const& verdict);

    /*
     * {"event":"record", "width", "height", "score", "length", "moves",
     * "hash"} plus "end" and "end_tick" once the game is over.
     */
    static void recording(Game const& game);

    static std::string_view path();
};

} // namespace coil
