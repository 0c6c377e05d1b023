// Example usage: best play for a rack from the command line
//
//   rackplay_example WORDS.txt "(qu)otecat" [options]
//
// Options:
//   --no-discard            keep every tile (no end-of-round discard)
//   --longest N             longest-word length to beat (0 = none)
//   --most N                word count to beat (0 = none)
//   --longest-bonus N       points for the longest-word bonus
//   --most-bonus N          points for the most-words bonus
//   --freq FILE             frequency corpus for --common
//   --common                only play common words
//   --gate-mode MODE        zipf | rank | either | both
//   --min-zipf X            Zipf threshold
//   --top-k N               rank threshold
//   --short-words           admit all 2-3 letter words under --common
//   --online                check the chosen words against the dictionary API
//   --candidates            list candidate words instead of solving

#include "../include/rackplay/dictionary.hpp"
#include "../include/rackplay/optimizer.hpp"
#include "../include/rackplay/word_oracle.hpp"
#include <iostream>
#include <iomanip>
#include <memory>
#include <stdexcept>
#include <string>

using namespace rackplay;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " WORDS.txt TILES [--no-discard] [--longest N] [--most N]\n"
              << "       [--longest-bonus N] [--most-bonus N] [--freq FILE] [--common]\n"
              << "       [--gate-mode MODE] [--min-zipf X] [--top-k N] [--short-words]\n"
              << "       [--online] [--candidates]" << std::endl;
}

void print_play(const BestPlay& play) {
    std::cout << "\n=== Best Play ===" << std::endl;
    if (!play.found) {
        std::cout << "No legal play found" << std::endl;
        return;
    }

    if (play.words.empty()) {
        std::cout << "Words: (none)" << std::endl;
    } else {
        std::cout << "Words:" << std::endl;
        for (const auto& w : play.words) {
            std::cout << "  " << std::left << std::setw(14) << w.word
                      << std::right << std::setw(4) << w.score << " pts" << std::endl;
        }
    }

    std::cout << "Base score: " << play.base_score << std::endl;
    std::cout << "Leftover penalty: " << play.leftover_penalty << std::endl;
    std::cout << "Discard: " << (play.discard_tile ? to_display_token(*play.discard_tile) : "-") << std::endl;

    std::cout << "Unused tiles: ";
    if (play.unused_tiles.empty()) {
        std::cout << "-";
    }
    for (size_t i = 0; i < play.unused_tiles.size(); ++i) {
        std::cout << to_display_token(play.unused_tiles[i]);
        if (i < play.unused_tiles.size() - 1) std::cout << " ";
    }
    std::cout << std::endl;

    std::cout << "Longest word: " << play.longest_word_length
              << ", word count: " << play.word_count << std::endl;
    std::cout << "Bonuses: longest=" << play.bonus.longest << " most=" << play.bonus.most << std::endl;
    std::cout << "Total: " << play.total_score << std::endl;

    if (play.refinement.passes > 0) {
        std::cout << "\nOnline check: " << play.refinement.passes << " pass(es), "
                  << (play.refinement.converged ? "converged" : "pass limit reached") << std::endl;
        for (const auto& w : play.refinement.rejected_words) {
            std::cout << "  rejected: " << w << std::endl;
        }
    }
}

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 2;
    }

    std::string words_path = argv[1];
    OptimizeOptions options;
    options.tiles = argv[2];
    std::string freq_path;
    bool list_candidates = false;

    try {
        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--no-discard") {
                options.no_discard = true;
            } else if (arg == "--longest") {
                options.current_longest = std::stoi(next());
            } else if (arg == "--most") {
                options.current_most = std::stoi(next());
            } else if (arg == "--longest-bonus") {
                options.longest_bonus = std::stoi(next());
            } else if (arg == "--most-bonus") {
                options.most_bonus = std::stoi(next());
            } else if (arg == "--freq") {
                freq_path = next();
            } else if (arg == "--common") {
                options.common_only = true;
            } else if (arg == "--gate-mode") {
                std::string name = next();
                auto mode = parse_gate_mode(name);
                if (!mode) {
                    throw std::invalid_argument("Unknown gate mode: " + name);
                }
                options.gate.mode = *mode;
            } else if (arg == "--min-zipf") {
                options.gate.min_zipf = std::stod(next());
            } else if (arg == "--top-k") {
                options.gate.top_k = std::stoi(next());
            } else if (arg == "--short-words") {
                options.gate.override_short_words = true;
            } else if (arg == "--online") {
                options.validate_online = true;
            } else if (arg == "--candidates") {
                list_candidates = true;
            } else {
                throw std::invalid_argument("Unknown option: " + arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    try {
        auto words = std::make_shared<const std::vector<std::string>>(load_word_list(words_path));
        std::cout << "Loaded " << words->size() << " words from " << words_path << std::endl;

        Optimizer optimizer(words);

        if (!freq_path.empty()) {
            auto entries = load_frequency_entries(freq_path);
            std::cout << "Loaded " << entries.size() << " frequency records from " << freq_path << std::endl;
            optimizer.set_frequency_corpus(std::move(entries));
        }

        if (options.validate_online) {
            optimizer.set_word_oracle(std::make_shared<CachingWordOracle>(
                std::make_shared<HttpDictionaryLookup>()));
        }

        // Validate before running
        auto validation = optimizer.validate_options(options);
        if (!validation.valid) {
            std::cerr << "Invalid options: " << validation.error_message << std::endl;
            return 2;
        }

        std::cout << "Rack: " << join_display(parse_tiles(options.tiles)) << std::endl;

        if (list_candidates) {
            auto candidates = optimizer.candidates(options);
            std::cout << "\n=== Candidates (" << candidates.size() << ") ===" << std::endl;
            for (const auto& c : candidates) {
                std::cout << "  " << std::left << std::setw(14) << c.display
                          << std::right << std::setw(4) << c.score << " pts, "
                          << c.length << " letters" << std::endl;
            }
            return 0;
        }

        print_play(optimizer.optimize(options));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
