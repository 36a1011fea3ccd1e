#include <coil/codec.hpp>

#include <boost/json.hpp>

#include <limits>
#include <stdexcept>

namespace coil {

namespace {

boost::json::value const& field(boost::json::object const& obj, std::string_view key, std::string_view where)
{
    auto const* value = obj.if_contains(boost::json::string_view(key.data(), key.size()));
    if (!value) {
        throw std::invalid_argument(std::string(where) + ": missing \"" + std::string(key) + "\"");
    }
    return *value;
}

boost::json::object const& object_of(boost::json::value const& value, std::string_view where)
{
    auto const* obj = value.if_object();
    if (!obj) {
        throw std::invalid_argument(std::string(where) + ": expected an object");
    }
    return *obj;
}

std::int64_t integer_of(boost::json::value const& value, std::string_view where)
{
    if (auto const* i = value.if_int64()) {
        return *i;
    }
    if (auto const* u = value.if_uint64()) {
        if (*u <= (std::uint64_t)std::numeric_limits<std::int64_t>::max()) {
            return (std::int64_t)*u;
        }
    }
    throw std::invalid_argument(std::string(where) + ": expected an integer");
}

int coordinate_of(boost::json::value const& value, std::string_view where)
{
    auto i = integer_of(value, where);
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(std::string(where) + ": out of range");
    }
    return (int)i;
}

std::size_t count_of(boost::json::value const& value, std::string_view where)
{
    auto i = integer_of(value, where);
    if (i < 0) {
        throw std::invalid_argument(std::string(where) + ": must not be negative");
    }
    return (std::size_t)i;
}

std::string_view string_of(boost::json::value const& value, std::string_view where)
{
    auto const* str = value.if_string();
    if (!str) {
        throw std::invalid_argument(std::string(where) + ": expected a string");
    }
    return std::string_view(str->data(), str->size());
}

std::vector<Position> positions_of(boost::json::value const& value, std::string_view where)
{
    auto const* arr = value.if_array();
    if (!arr) {
        throw std::invalid_argument(std::string(where) + ": expected an array of [x, y] pairs");
    }
    std::vector<Position> positions;
    positions.reserve(arr->size());
    for (auto & elem : *arr) {
        auto const* pair = elem.if_array();
        if (!pair || pair->size() != 2) {
            throw std::invalid_argument(std::string(where) + ": expected an [x, y] pair");
        }
        positions.push_back({coordinate_of((*pair)[0], where), coordinate_of((*pair)[1], where)});
    }
    return positions;
}

boost::json::array encode_positions(std::vector<Position> const& positions)
{
    boost::json::array arr;
    arr.reserve(positions.size());
    for (auto & pos : positions) {
        arr.push_back(boost::json::array{pos.x, pos.y});
    }
    return arr;
}

Submission submission_of(boost::json::value const& value)
{
    auto const& root = object_of(value, "submission");
    auto const& claim = object_of(field(root, "claim", "submission"), "claim");
    auto const& witness = object_of(field(root, "witness", "submission"), "witness");

    Submission submission;
    submission.claim.grid = {
        coordinate_of(field(claim, "width", "claim"), "claim.width"),
        coordinate_of(field(claim, "height", "claim"), "claim.height"),
    };
    submission.claim.initial_snake = positions_of(field(claim, "snake", "claim"), "claim.snake");
    submission.claim.final_state_hash = digest_from_hex(string_of(field(claim, "hash", "claim"), "claim.hash"));
    submission.claim.score = count_of(field(claim, "score", "claim"), "claim.score");
    submission.claim.final_length = count_of(field(claim, "length", "claim"), "claim.length");

    submission.witness.food = positions_of(field(witness, "food", "witness"), "witness.food");
    submission.witness.moves = from_letters(string_of(field(witness, "moves", "witness"), "witness.moves"));
    return submission;
}

boost::json::value parse(std::string_view json)
{
    boost::system::error_code ec;
    auto value = boost::json::parse(boost::json::string_view(json.data(), json.size()), ec);
    if (ec) {
        throw std::invalid_argument("invalid JSON: " + ec.message());
    }
    return value;
}

}

Submission decode_submission(std::string_view json)
{
    return submission_of(parse(json));
}

std::vector<Submission> decode_submissions(std::string_view json)
{
    auto value = parse(json);
    std::vector<Submission> submissions;
    if (auto const* arr = value.if_array()) {
        submissions.reserve(arr->size());
        for (auto & elem : *arr) {
            submissions.push_back(submission_of(elem));
        }
    } else {
        submissions.push_back(submission_of(value));
    }
    return submissions;
}

std::string encode_submission(Submission const& submission)
{
    auto const& claim = submission.claim;
    auto const& witness = submission.witness;

    boost::json::object obj;
    obj["claim"] = boost::json::object{
        {"width", claim.grid.width},
        {"height", claim.grid.height},
        {"snake", encode_positions(claim.initial_snake)},
        {"hash", to_hex(claim.final_state_hash)},
        {"score", claim.score},
        {"length", claim.final_length},
    };
    obj["witness"] = boost::json::object{
        {"food", encode_positions(witness.food)},
        {"moves", to_letters(witness.moves)},
    };
    return boost::json::serialize(obj);
}

} // namespace coil
