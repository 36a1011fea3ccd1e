#include <coil/codec.hpp>
#include <coil/configuration.hpp>
#include <coil/game.hpp>
#include <coil/log.hpp>

#include <iostream>
#include <random>
#include <sstream>

using namespace coil;

int main(int argc, char **argv) {
    std::string letters;
    for (int i = 1; i < argc; ++ i) {
        letters += argv[i];
    }

    if (letters.empty()) {
        std::cerr << "No arguments provided. Consuming stdin." << std::endl;
        std::stringstream ss;
        ss << std::cin.rdbuf();
        letters = ss.str();
    }

    try {
        Configuration::init();
        Configuration config(coil::span<std::string_view>({"coil.ini"}));

        auto & width_str = config[coil::span<std::string_view>({"grid", "width"})];
        auto & height_str = config[coil::span<std::string_view>({"grid", "height"})];
        auto & seed_str = config[coil::span<std::string_view>({"food", "seed"})];
        int width = width_str.empty() ? 30 : std::stoi(width_str);
        int height = height_str.empty() ? width : std::stoi(height_str);
        std::mt19937 rng(seed_str.empty() ? 0 : (std::mt19937::result_type)std::stoul(seed_str));

        Game game(width, height);
        for (auto dir : from_letters(letters)) {
            if (game.can_place_food()) {
                game.spawn_food(rng);
            }
            if (!game.step(dir)) {
                std::cerr << "game over after " << game.history().size() << " moves: "
                          << game.end_reason()->what() << std::endl;
                break;
            }
        }

        std::string submission = encode_submission({game.claim(), game.witness()});
        std::cout << submission << std::endl;

        auto & high_score = config[coil::span<std::string_view>({"record", "high_score"})];
        if (high_score.empty() || game.score() > std::stoul(high_score)) {
            high_score = std::to_string(game.score());
            std::cerr << "new high score: " << high_score << std::endl;
        }

        Log::recording(game);
    } catch (std::exception const& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    return 0;
}
