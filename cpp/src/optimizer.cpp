/**
 * @file optimizer.cpp
 * @brief Implementation of the top-level optimizer.
 *
 * Key operations:
 *   - optimize(): rack text -> best play, with optional oracle refinement
 *   - validate_options(): human-readable errors for bad options
 *   - candidates(): the candidate list for inspection
 *
 * Refinement:
 *   Oracle checks run strictly between complete search passes. Each pass
 *   removes every candidate whose plain word was rejected, so a word is
 *   never offered to the oracle twice within one call.
 */

#include "../include/rackplay/optimizer.hpp"
#include "../include/rackplay/rack.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace rackplay {

PlayParams make_play_params(const OptimizeOptions& options) {
    PlayParams params;
    params.no_discard = options.no_discard;
    params.current_longest = options.current_longest == 0 ? NO_BONUS_THRESHOLD : options.current_longest;
    params.current_most = options.current_most == 0 ? NO_BONUS_THRESHOLD : options.current_most;
    params.longest_bonus = options.longest_bonus;
    params.most_bonus = options.most_bonus;
    params.require_discard_tile = options.require_discard_tile;
    return params;
}

Optimizer::Optimizer(const TileTable& table, std::shared_ptr<const std::vector<std::string>> dictionary)
    : table_(table), dictionary_(std::move(dictionary)) {
    if (!dictionary_) {
        dictionary_ = std::make_shared<const std::vector<std::string>>();
    }
    trie_cache_ = std::make_shared<TrieCache>(dictionary_);
}

Optimizer::Optimizer(std::shared_ptr<const std::vector<std::string>> dictionary)
    : Optimizer(standard_tile_table(), std::move(dictionary)) {}

void Optimizer::set_frequency_corpus(std::vector<FrequencyEntry> entries,
                                     std::shared_ptr<const Lemmatizer> lemmatizer) {
    common_gate_ = std::make_shared<const CommonWordGate>(entries, GateConfig(), std::move(lemmatizer));
}

void Optimizer::set_word_oracle(std::shared_ptr<WordOracle> oracle) {
    oracle_ = std::move(oracle);
}

OptionsValidationResult Optimizer::validate_options(const OptimizeOptions& options) const {
    if (options.longest_bonus < 0 || options.most_bonus < 0) {
        return OptionsValidationResult(false, "Bonus points must not be negative");
    }

    if (options.current_longest < 0 || options.current_most < 0) {
        return OptionsValidationResult(false, "Bonus thresholds must not be negative");
    }

    if (options.min_word_length < 1) {
        std::ostringstream oss;
        oss << "min_word_length must be at least 1 (got " << options.min_word_length << ")";
        return OptionsValidationResult(false, oss.str());
    }

    if (options.max_word_length < options.min_word_length) {
        std::ostringstream oss;
        oss << "max_word_length (" << options.max_word_length
            << ") is shorter than min_word_length (" << options.min_word_length << ")";
        return OptionsValidationResult(false, oss.str());
    }

    if (options.max_refinement_passes < 0) {
        return OptionsValidationResult(false, "max_refinement_passes must not be negative");
    }

    if (options.validate_online && !oracle_) {
        return OptionsValidationResult(false, "validate_online requested but no word oracle is set");
    }

    return OptionsValidationResult(true, "");
}

WordGate Optimizer::make_gate(const OptimizeOptions& options) const {
    // No corpus, or an empty one, means no filtering
    if (!options.common_only || !has_frequency_corpus()) {
        return WordGate();
    }
    return common_gate_->with_config(options.gate);
}

std::vector<CandidateWord> Optimizer::candidates(const OptimizeOptions& options) const {
    auto validation = validate_options(options);
    if (!validation.valid) {
        throw std::invalid_argument(validation.error_message);
    }

    TileCounts rack = count_rack(parse_tiles(options.tiles), table_);
    auto trie = trie_cache_->get(options.max_word_length);
    return generate_candidates(*trie, table_, rack, options.min_word_length, make_gate(options));
}

BestPlay Optimizer::optimize(const OptimizeOptions& options) const {
    auto validation = validate_options(options);
    if (!validation.valid) {
        throw std::invalid_argument(validation.error_message);
    }

    TileCounts rack = count_rack(parse_tiles(options.tiles), table_);
    auto trie = trie_cache_->get(options.max_word_length);
    std::vector<CandidateWord> pool =
        generate_candidates(*trie, table_, rack, options.min_word_length, make_gate(options));

    PlayParams params = make_play_params(options);
    BestPlay play = choose_best_play(pool, table_, rack, params);

    if (!options.validate_online) {
        return play;
    }
    return refine(std::move(play), std::move(pool), rack, params, options.max_refinement_passes);
}

BestPlay Optimizer::refine(BestPlay play, std::vector<CandidateWord> pool,
                           const TileCounts& rack, const PlayParams& params,
                           int max_passes) const {
    RefinementReport report;
    report.converged = play.words.empty();

    while (report.passes < max_passes && !play.words.empty()) {
        std::vector<std::string> plain;
        for (const auto& w : play.words) {
            plain.push_back(w.plain);
        }

        OracleVerdict verdict = oracle_->check_batch(plain);
        report.passes++;

        if (verdict.invalid_plain.empty()) {
            report.converged = true;
            break;
        }

        for (const auto& w : verdict.invalid_plain) {
            report.rejected_words.push_back(w);
        }

        pool.erase(std::remove_if(pool.begin(), pool.end(), [&](const CandidateWord& c) {
            return verdict.invalid_plain.count(c.plain) > 0;
        }), pool.end());

        if (pool.empty()) {
            play = empty_play(table_, rack, params);
            report.converged = true;
            break;
        }

        play = choose_best_play(pool, table_, rack, params);
        report.converged = play.words.empty();
    }

    play.refinement = report;
    return play;
}

std::future<BestPlay> Optimizer::optimize_async(const OptimizeOptions& options) const {
    return std::async(std::launch::async, [this, options]() {
        return optimize(options);
    });
}

} // namespace rackplay
