#pragma once

#include <coil/verifier.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace coil {

/*
 * JSON submission records:
 *
 *   {"claim": {"width": 10, "height": 10, "snake": [[5,5],[4,5],[3,5]],
 *              "hash": "<64 hex digits>", "score": 10, "length": 4},
 *    "witness": {"food": [[6,5]], "moves": "R"}}
 *
 * Malformed documents throw std::invalid_argument.
 */
Submission decode_submission(std::string_view json);

// Accepts a single record or an array of records.
std::vector<Submission> decode_submissions(std::string_view json);

std::string encode_submission(Submission const& submission);

} // namespace coil
