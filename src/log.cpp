#include <coil/log.hpp>
#include <coil/commitment.hpp>
#include <coil/configuration.hpp>
#include <coil/game.hpp>

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace coil {

namespace {

using std::chrono::system_clock;

// every line a process writes lands in the file named by its launch
system_clock::time_point const launched = system_clock::now();

boost::json::string_view json_view(std::string_view sv)
{
    return boost::json::string_view(sv.data(), sv.size());
}

class LogFile {
public:
    LogFile()
    {
        std::time_t launched_t = system_clock::to_time_t(launched);
        std::tm utc;
        gmtime_r(&launched_t, &utc);
        std::ostringstream name;
        name << std::put_time(&utc, "%FT%TZ.log");

        path_ = Configuration::path_local(coil::span<std::string_view>({"logs", name.str()}));
        out_.open(path_, std::ios::app);
        if (!out_) {
            throw std::runtime_error("could not open log file " + path_);
        }
    }

    void write(boost::json::object const& event)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        out_ << boost::json::serialize(event) << std::endl;
    }

    std::string const& path() const { return path_; }

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mtx_;
};

LogFile & log_file()
{
    static LogFile file;
    return file;
}

}

void Log::log(boost::json::object event)
{
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        system_clock::now().time_since_epoch()).count();
    event["ts"] = now_ms / 1000.0;
    log_file().write(event);
}

void Log::verdict(std::string_view source, Verdict const& verdict)
{
    boost::json::object event;
    event["event"] = "verify";
    event["source"] = json_view(source);
    event["accepted"] = verdict.accepted;
    if (verdict.error) {
        event["kind"] = json_view(VerificationError::name(*verdict.error));
    }
    if (verdict.tick) {
        event["tick"] = std::uint64_t(*verdict.tick);
    }
    event["message"] = json_view(verdict.message);
    log(std::move(event));
}

void Log::recording(Game const& game)
{
    std::string moves = to_letters(game.witness().moves);
    std::string hash = to_hex(game.claim().final_state_hash);

    boost::json::object event;
    event["event"] = "record";
    event["width"] = game.grid().width;
    event["height"] = game.grid().height;
    event["score"] = std::uint64_t(game.score());
    event["length"] = std::uint64_t(game.length());
    event["moves"] = json_view(moves);
    event["hash"] = json_view(hash);
    if (auto const& end = game.end_reason()) {
        event["end"] = json_view(VerificationError::name(end->kind()));
        if (end->tick()) {
            event["end_tick"] = std::uint64_t(*end->tick());
        }
    }
    log(std::move(event));
}

std::string_view Log::path()
{
    return log_file().path();
}

} // namespace coil
