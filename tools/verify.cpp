#include <coil/codec.hpp>
#include <coil/configuration.hpp>
#include <coil/log.hpp>
#include <coil/verifier.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace coil;

static std::string slurp(std::istream & in)
{
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// the project directory, if any; verification never creates one
static bool in_project()
{
    try {
        Configuration::path_local();
    } catch (std::invalid_argument const&) {
        return false;
    }
    return true;
}

int main(int argc, char **argv) {
    try {
        std::vector<Submission> submissions;
        std::vector<std::string> sources;

        if (argc < 2) {
            std::cerr << "No arguments provided. Consuming stdin." << std::endl;
            for (auto && submission : decode_submissions(slurp(std::cin))) {
                sources.emplace_back("stdin#" + std::to_string(sources.size()));
                submissions.emplace_back(std::move(submission));
            }
        }
        for (int i = 1; i < argc; ++ i) {
            std::ifstream file(argv[i]);
            if (!file) {
                throw std::runtime_error(std::string("cannot open ") + argv[i]);
            }
            size_t n = 0;
            for (auto && submission : decode_submissions(slurp(file))) {
                sources.emplace_back(std::string(argv[i]) + "#" + std::to_string(n ++));
                submissions.emplace_back(std::move(submission));
            }
        }

        bool logging = in_project();
        unsigned threads = 0;
        if (logging) {
            Configuration config(coil::span<std::string_view>({"coil.ini"}));
            auto & value = config[coil::span<std::string_view>({"verify", "threads"})];
            if (!value.empty()) {
                threads = (unsigned)std::stoul(value);
            }
        }

        auto verdicts = check_all(submissions, threads);

        bool all_accepted = true;
        for (size_t i = 0; i < verdicts.size(); ++ i) {
            auto & verdict = verdicts[i];
            if (verdict) {
                std::cout << sources[i] << ": accepted" << std::endl;
            } else {
                all_accepted = false;
                std::cout << sources[i] << ": rejected: " << VerificationError::name(*verdict.error)
                          << ": " << verdict.message;
                if (verdict.tick) {
                    std::cout << " (move " << *verdict.tick << ")";
                }
                std::cout << std::endl;
            }
            if (logging) {
                Log::verdict(sources[i], verdict);
            }
        }

        return all_accepted ? 0 : 1;
    } catch (std::exception const& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }
}
