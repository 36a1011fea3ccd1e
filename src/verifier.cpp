#include <coil/verifier.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <thread>

namespace coil {

void verify(GameClaim const& claim, ReplayOutcome const& outcome)
{
    if (claim.score % POINTS_PER_FOOD != 0) {
        throw VerificationError(VerificationError::InvalidClaim,
            "claimed score " + std::to_string(claim.score) + " is not a multiple of " + std::to_string(POINTS_PER_FOOD));
    }
    if (outcome.score != claim.score) {
        throw VerificationError(VerificationError::ScoreMismatch,
            "claimed score " + std::to_string(claim.score) + ", replay scored " + std::to_string(outcome.score));
    }
    if (outcome.final_length != claim.final_length) {
        throw VerificationError(VerificationError::LengthMismatch,
            "claimed length " + std::to_string(claim.final_length) + ", replay ended at " + std::to_string(outcome.final_length));
    }
    if (commit(outcome.snake, claim.grid) != claim.final_state_hash) {
        throw VerificationError(VerificationError::HashMismatch,
            "final state hash does not match the commitment");
    }
}

Verdict check(GameClaim const& claim, Witness const& witness)
{
    Replayer replayer(claim.grid, claim.initial_snake, witness.food, witness.moves);
    try {
        verify(claim, replayer.run());
    } catch (VerificationError const& e) {
        return {false, e.kind(), e.what(), e.tick()};
    }
    return {true, {}, "accepted", {}};
}

std::vector<Verdict> check_all(std::span<Submission const> submissions, unsigned threads)
{
    std::vector<Verdict> verdicts(submissions.size());
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    threads = (unsigned)std::min<std::size_t>(threads, submissions.size());

    std::atomic<std::size_t> next{0};
    std::vector<std::exception_ptr> faults(threads);
    auto work = [&](unsigned t) {
        try {
            for (std::size_t i; (i = next.fetch_add(1)) < submissions.size(); ) {
                verdicts[i] = check(submissions[i].claim, submissions[i].witness);
            }
        } catch (...) {
            // not a rejection: the hash backend itself failed
            faults[t] = std::current_exception();
            next = submissions.size();
        }
    };

    if (threads <= 1) {
        for (std::size_t i = 0; i < submissions.size(); ++ i) {
            verdicts[i] = check(submissions[i].claim, submissions[i].witness);
        }
        return verdicts;
    }

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (unsigned t = 0; t < threads; ++ t) {
        workers.emplace_back(work, t);
    }
    for (auto & worker : workers) {
        worker.join();
    }
    for (auto & fault : faults) {
        if (fault) {
            std::rethrow_exception(fault);
        }
    }
    return verdicts;
}

} // namespace coil
