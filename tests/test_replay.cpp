#define BOOST_TEST_MODULE ReplayTest
#include <boost/test/unit_test.hpp>
#include <coil/replay.hpp>
#include <coil/snake.hpp>

#include <random>
#include <vector>

using namespace coil;

namespace {

std::vector<Position> const START{{5,5},{4,5},{3,5}};

VerificationError::Kind replay_error(
    std::vector<Position> const& snake,
    std::vector<Position> const& food,
    std::string_view moves,
    int width = 10, int height = 10,
    std::optional<std::size_t> * tick = nullptr)
{
    try {
        replay(snake, food, from_letters(moves), width, height);
    } catch (VerificationError const& e) {
        if (tick) {
            *tick = e.tick();
        }
        return e.kind();
    }
    BOOST_FAIL("replay did not raise");
    return VerificationError::InvalidClaim;
}

}

BOOST_AUTO_TEST_SUITE(Scenarios)

BOOST_AUTO_TEST_CASE(eating_grows_the_snake) {
    auto outcome = replay(START, std::vector<Position>{{6,5}}, from_letters("R"), 10, 10);
    BOOST_TEST(outcome.final_length == 4u);
    BOOST_TEST(outcome.score == 10u);
    BOOST_TEST(outcome.foods_eaten == 1u);
    BOOST_TEST(outcome.ticks == 1u);
    BOOST_TEST((outcome.snake.front() == Position{6,5}));
    BOOST_TEST((outcome.snake == std::vector<Position>{{6,5},{5,5},{4,5},{3,5}}));
}

BOOST_AUTO_TEST_CASE(moving_drops_the_tail) {
    auto outcome = replay(START, {}, from_letters("RR"), 10, 10);
    BOOST_TEST(outcome.final_length == 3u);
    BOOST_TEST(outcome.score == 0u);
    BOOST_TEST((outcome.snake == std::vector<Position>{{7,5},{6,5},{5,5}}));
}

BOOST_AUTO_TEST_CASE(reversing_into_the_neck) {
    std::optional<std::size_t> tick;
    BOOST_TEST(replay_error(START, {}, "L", 10, 10, &tick) == VerificationError::IllegalReversal);
    BOOST_TEST((tick == std::optional<std::size_t>(0)));

    // a run of lefts from a right-facing start is rejected on its first move
    BOOST_TEST(replay_error(START, {}, "LLLLLL") == VerificationError::IllegalReversal);

    // with two segments the neck is also the vacating tail, still a reversal
    BOOST_TEST(replay_error({{5,5},{4,5}}, {}, "L") == VerificationError::IllegalReversal);
}

BOOST_AUTO_TEST_CASE(walking_off_the_left_edge) {
    std::optional<std::size_t> tick;
    BOOST_TEST(replay_error(START, {}, "ULLLLLL", 10, 10, &tick) == VerificationError::WallCollision);
    BOOST_TEST((tick == std::optional<std::size_t>(6)));
}

BOOST_AUTO_TEST_CASE(every_wall_collides) {
    BOOST_TEST(replay_error({{0,0}}, {}, "U", 3, 3) == VerificationError::WallCollision);
    BOOST_TEST(replay_error({{0,0}}, {}, "L", 3, 3) == VerificationError::WallCollision);
    BOOST_TEST(replay_error({{2,2}}, {}, "D", 3, 3) == VerificationError::WallCollision);
    BOOST_TEST(replay_error({{2,2}}, {}, "R", 3, 3) == VerificationError::WallCollision);
    // history does not matter
    BOOST_TEST(replay_error({{1,1}}, {}, "RDLUUU", 3, 3) == VerificationError::WallCollision);
}

BOOST_AUTO_TEST_CASE(head_may_enter_the_vacating_tail) {
    std::vector<Position> loop{{1,1},{2,1},{2,2},{1,2}};
    auto outcome = replay(loop, {}, from_letters("D"), 4, 4);
    BOOST_TEST((outcome.snake == std::vector<Position>{{1,2},{1,1},{2,1},{2,2}}));

    // and keep chasing it
    outcome = replay(loop, {}, from_letters("DRUL"), 4, 4);
    BOOST_TEST((outcome.snake == loop));
}

BOOST_AUTO_TEST_CASE(head_into_the_body) {
    std::vector<Position> hook{{1,1},{2,1},{2,2},{1,2},{0,2}};
    std::optional<std::size_t> tick;
    BOOST_TEST(replay_error(hook, {}, "D", 4, 4, &tick) == VerificationError::SelfCollision);
    BOOST_TEST((tick == std::optional<std::size_t>(0)));
}

BOOST_AUTO_TEST_CASE(growing_keeps_the_tail_occupied) {
    std::vector<Position> snake{{0,0},{0,1},{0,2}};

    // without food the third move lands on a cell the tail has already left
    BOOST_CHECK_NO_THROW(replay(snake, {}, from_letters("RDL"), 3, 3));

    // two foods keep (0,1) under the body
    std::optional<std::size_t> tick;
    BOOST_TEST(replay_error(snake, {{1,0},{1,1}}, "RDL", 3, 3, &tick) == VerificationError::SelfCollision);
    BOOST_TEST((tick == std::optional<std::size_t>(2)));
}

BOOST_AUTO_TEST_CASE(several_foods) {
    std::vector<Position> snake{{2,2},{1,2},{0,2}};
    std::vector<Position> food{{3,2},{4,2},{4,4}};
    auto outcome = replay(snake, food, from_letters("RRDD"), 10, 10);
    BOOST_TEST(outcome.foods_eaten == 3u);
    BOOST_TEST(outcome.score == 30u);
    BOOST_TEST(outcome.final_length == 6u);
    BOOST_TEST((outcome.snake == std::vector<Position>{{4,4},{4,3},{4,2},{3,2},{2,2},{1,2}}));
}

BOOST_AUTO_TEST_CASE(single_segment_can_turn_around) {
    auto outcome = replay(std::vector<Position>{{5,5}}, {}, from_letters("RL"), 10, 10);
    BOOST_TEST((outcome.snake == std::vector<Position>{{5,5}}));
}

BOOST_AUTO_TEST_CASE(no_moves) {
    auto outcome = replay(START, std::vector<Position>{{0,0}}, {}, 10, 10);
    BOOST_TEST((outcome.snake == START));
    BOOST_TEST(outcome.ticks == 0u);
    BOOST_TEST(outcome.score == 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Food)

BOOST_AUTO_TEST_CASE(first_food_on_the_snake) {
    Replayer replayer({10, 10}, START, std::vector<Position>{{4,5}}, from_letters("R"));
    BOOST_TEST(replayer.state() == Replayer::Failed);
    BOOST_TEST(replayer.error().kind() == VerificationError::InvalidClaim);
    BOOST_TEST(!replayer.error().tick().has_value());
}

BOOST_AUTO_TEST_CASE(later_food_spawning_on_the_snake) {
    std::optional<std::size_t> tick;
    BOOST_TEST(replay_error(START, {{6,5},{5,5}}, "RR", 10, 10, &tick) == VerificationError::InvalidClaim);
    BOOST_TEST((tick == std::optional<std::size_t>(0)));
}

BOOST_AUTO_TEST_CASE(later_food_on_a_cell_the_snake_left) {
    // (3,5) was the initial tail; by the time the second food appears it is free
    auto outcome = replay(START, std::vector<Position>{{7,5},{3,5}}, from_letters("RR"), 10, 10);
    BOOST_TEST(outcome.foods_eaten == 1u);
}

BOOST_AUTO_TEST_CASE(food_outside_the_grid) {
    BOOST_TEST(replay_error(START, {{6,5},{10,0}}, "R") == VerificationError::InvalidClaim);
}

BOOST_AUTO_TEST_CASE(only_the_pending_food_counts) {
    // the second food sits on the path but is not pending until the first is eaten
    auto outcome = replay(START, std::vector<Position>{{9,9},{6,5}}, from_letters("R"), 10, 10);
    BOOST_TEST(outcome.foods_eaten == 0u);
    BOOST_TEST(outcome.final_length == 3u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(InvalidInput)

BOOST_AUTO_TEST_CASE(rejected_before_replay) {
    BOOST_TEST(replay_error(START, {}, "R", 0, 10) == VerificationError::InvalidClaim);
    BOOST_TEST(replay_error(START, {}, "R", 10, -1) == VerificationError::InvalidClaim);
    BOOST_TEST(replay_error({}, {}, "R") == VerificationError::InvalidClaim);
    BOOST_TEST(replay_error({{5,5},{3,5}}, {}, "R") == VerificationError::InvalidClaim);
    BOOST_TEST(replay_error({{5,5},{4,5},{5,5}}, {}, "R") == VerificationError::InvalidClaim);
    BOOST_TEST(replay_error({{9,5},{10,5}}, {}, "L") == VerificationError::InvalidClaim);
    BOOST_TEST(replay_error(START, {}, "R", 1 << 20, 1 << 20) == VerificationError::InvalidClaim);
}

BOOST_AUTO_TEST_CASE(grid_cell_limit) {
    static_assert(Snake::MAX_CELLS == 1024 * 1024);
    auto outcome = replay(START, std::vector<Position>{}, from_letters("R"), 1024, 1024);
    BOOST_TEST(outcome.ticks == 1u);
    BOOST_TEST(replay_error(START, {}, "R", 1025, 1024) == VerificationError::InvalidClaim);
    BOOST_TEST(replay_error(START, {}, "R", 1, 1024 * 1024 + 1) == VerificationError::InvalidClaim);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(StateMachine)

BOOST_AUTO_TEST_CASE(runs_one_move_per_step) {
    auto moves = from_letters("RR");
    Replayer replayer({10, 10}, START, {}, moves);
    BOOST_TEST(replayer.state() == Replayer::NotStarted);
    BOOST_CHECK_THROW(replayer.outcome(), std::logic_error);
    BOOST_CHECK_THROW(replayer.error(), std::logic_error);

    BOOST_TEST(replayer.step() == Replayer::Running);
    BOOST_TEST(replayer.tick() == 1u);
    BOOST_TEST(replayer.step() == Replayer::Completed);
    BOOST_TEST(replayer.tick() == 2u);
    BOOST_TEST(replayer.step() == Replayer::Completed);
    BOOST_TEST(replayer.outcome().ticks == 2u);
}

BOOST_AUTO_TEST_CASE(no_moves_complete_on_first_step) {
    Replayer replayer({10, 10}, START, {}, {});
    BOOST_TEST(replayer.step() == Replayer::Completed);
}

BOOST_AUTO_TEST_CASE(failure_is_terminal) {
    auto moves = from_letters("RLR");
    Replayer replayer({10, 10}, START, {}, moves);
    BOOST_TEST(replayer.step() == Replayer::Running);
    BOOST_TEST(replayer.step() == Replayer::Failed);
    BOOST_TEST(replayer.error().kind() == VerificationError::IllegalReversal);
    BOOST_TEST((replayer.error().tick() == std::optional<std::size_t>(1)));
    BOOST_TEST(replayer.step() == Replayer::Failed);
    BOOST_TEST(replayer.tick() == 1u);
    BOOST_CHECK_THROW(replayer.run(), VerificationError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(Properties)

BOOST_AUTO_TEST_CASE(length_and_score_follow_food_exactly) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> dir(0, 3);
    std::uniform_int_distribution<int> cell(0, 11);
    std::vector<Position> snake{{6,6},{5,6},{4,6}};

    int completed = 0;
    for (int game = 0; game < 500; ++ game) {
        // random walk that never points back into the neck
        std::vector<Direction> moves;
        Position heading = offset(Direction::Right);
        while (moves.size() < 10) {
            auto next = (Direction)dir(rng);
            if (offset(next) + heading == Position{0, 0}) {
                continue;
            }
            heading = offset(next);
            moves.push_back(next);
        }
        std::vector<Position> food;
        for (int i = 0; i < 10; ++ i) {
            food.push_back({cell(rng), cell(rng)});
        }

        Replayer replayer({12, 12}, snake, food, moves);
        while (replayer.step() == Replayer::Running)
            ;
        if (replayer.state() != Replayer::Completed) {
            BOOST_TEST(replayer.error().kind() != VerificationError::IllegalReversal);
            continue;
        }
        ++ completed;
        auto const& outcome = replayer.outcome();
        BOOST_TEST(outcome.final_length == snake.size() + outcome.foods_eaten);
        BOOST_TEST(outcome.score == outcome.foods_eaten * POINTS_PER_FOOD);
        BOOST_TEST(outcome.snake.size() == outcome.final_length);

        // deterministic
        BOOST_TEST((replay(snake, food, moves, 12, 12) == outcome));
    }
    BOOST_TEST(completed > 100);
}

BOOST_AUTO_TEST_SUITE_END()
