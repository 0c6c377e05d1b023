/**
 * @file optimizer.hpp
 * @brief Top-level optimizer interface for the example program and Python bindings.
 *
 * Wires the pieces together for one rack:
 *   1. Parse the rack text and count its tiles
 *   2. Fetch (or build once) the trie for the configured word length
 *   3. Optionally build the common-word gate
 *   4. Generate candidates and choose the best play
 *   5. Optionally refine the play against an external word oracle
 *
 * Refinement loop (at most max_refinement_passes oracle checks):
 *   - check the plain words of the current play
 *   - if some are rejected, drop every candidate spelling one of them and
 *     search again
 *   - stop when the oracle accepts the play, when no candidates are left
 *     (the result is then an empty play with every tile unused), or when
 *     the pass limit is reached
 *
 * Usage from Python (via pybind11):
 * @code
 *   opt = _rackplay_core.Optimizer.from_word_list("words.txt")
 *   options = _rackplay_core.OptimizeOptions()
 *   options.tiles = "(qu)ote"
 *   options.no_discard = True
 *   play = opt.optimize(options)
 *   print(play.total_score, [w.word for w in play.words])
 * @endcode
 */

#pragma once

#include "best_play.hpp"
#include "candidates.hpp"
#include "common_gate.hpp"
#include "tile.hpp"
#include "trie.hpp"
#include "word_oracle.hpp"
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace rackplay {

/** @brief Default maximum word length (the largest rack of a game) */
constexpr int DEFAULT_MAX_WORD_LENGTH = 10;

/** @brief Default cap on oracle refinement passes */
constexpr int DEFAULT_MAX_REFINEMENT_PASSES = 5;

/**
 * @brief Everything one optimize() call needs to know about the rack and game.
 *
 * Threshold convention: current_longest / current_most of 0 mean "no
 * opponent value entered" and make that bonus unreachable.
 */
struct OptimizeOptions {
    std::string tiles;          ///< Rack text, e.g. "(qu)ote"
    bool no_discard;            ///< Disallow the end-of-round discard
    bool common_only;           ///< Restrict to common words (ignored without a corpus)
    GateConfig gate;            ///< Common-word thresholds
    int current_longest;        ///< Longest-word length to beat (0 = none)
    int current_most;           ///< Word count to beat (0 = none)
    int longest_bonus;          ///< Longest-word bonus points
    int most_bonus;             ///< Most-words bonus points
    int min_word_length;        ///< Shortest word to play
    int max_word_length;        ///< Trie depth
    bool validate_online;       ///< Run the oracle refinement loop
    int max_refinement_passes;  ///< Oracle check limit
    bool require_discard_tile;  ///< See PlayParams::require_discard_tile

    OptimizeOptions()
        : no_discard(false), common_only(false),
          current_longest(0), current_most(0),
          longest_bonus(0), most_bonus(0),
          min_word_length(DEFAULT_MIN_WORD_LENGTH),
          max_word_length(DEFAULT_MAX_WORD_LENGTH),
          validate_online(false),
          max_refinement_passes(DEFAULT_MAX_REFINEMENT_PASSES),
          require_discard_tile(true) {}
};

/**
 * @brief Result of options validation with human-readable error.
 */
struct OptionsValidationResult {
    bool valid;                ///< True if the options can be used
    std::string error_message; ///< Error description if invalid, empty if valid

    /** @brief Default constructor: valid options */
    OptionsValidationResult() : valid(true), error_message("") {}

    OptionsValidationResult(bool v, const std::string& msg) : valid(v), error_message(msg) {}
};

/**
 * @brief Translate optimize options into selector parameters.
 *
 * Applies the "0 means no threshold" convention.
 */
PlayParams make_play_params(const OptimizeOptions& options);

/**
 * @brief Rack-constrained word-play optimizer for one dictionary.
 *
 * The dictionary, tile table and cached tries are shared read-only state;
 * every optimize() call builds its own rack counts, so concurrent calls
 * on one Optimizer are safe. Configure the corpus and oracle before
 * issuing concurrent calls.
 */
class Optimizer {
public:
    /**
     * @param table Tile point table
     * @param dictionary Valid words (any case)
     */
    Optimizer(const TileTable& table, std::shared_ptr<const std::vector<std::string>> dictionary);

    /** @brief Optimizer over the standard tile table */
    explicit Optimizer(std::shared_ptr<const std::vector<std::string>> dictionary);

    /**
     * @brief Provide the frequency corpus used when common_only is set.
     * @param entries Corpus records
     * @param lemmatizer Optional base-form lookup
     */
    void set_frequency_corpus(std::vector<FrequencyEntry> entries,
                              std::shared_ptr<const Lemmatizer> lemmatizer = nullptr);

    /** @brief Provide the oracle used when validate_online is set */
    void set_word_oracle(std::shared_ptr<WordOracle> oracle);

    /**
     * @brief Validate options with a detailed error message.
     *
     * Useful for callers that want to report problems instead of catching:
     * e.g. "max_word_length (1) is shorter than min_word_length (2)".
     */
    OptionsValidationResult validate_options(const OptimizeOptions& options) const;

    /**
     * @brief Find the best play for a rack.
     * @throws std::invalid_argument with the validation message for bad options
     *
     * Finding no playable word is a normal result, not an error.
     */
    BestPlay optimize(const OptimizeOptions& options) const;

    /**
     * @brief optimize() on a background thread.
     *
     * The Optimizer must outlive the returned future.
     */
    std::future<BestPlay> optimize_async(const OptimizeOptions& options) const;

    /**
     * @brief Candidate words for a rack, before any selection.
     * @throws std::invalid_argument for bad options
     */
    std::vector<CandidateWord> candidates(const OptimizeOptions& options) const;

    const TileTable& tile_table() const { return table_; }
    const std::vector<std::string>& dictionary() const { return *dictionary_; }
    TrieCache& trie_cache() const { return *trie_cache_; }
    bool has_frequency_corpus() const { return common_gate_ && common_gate_->corpus_size() > 0; }
    bool has_word_oracle() const { return static_cast<bool>(oracle_); }

private:
    /** @brief Gate for the options, empty if common_only is off or no corpus is loaded */
    WordGate make_gate(const OptimizeOptions& options) const;

    /** @brief Run the oracle loop over an initial play */
    BestPlay refine(BestPlay play, std::vector<CandidateWord> pool,
                    const TileCounts& rack, const PlayParams& params,
                    int max_passes) const;

    TileTable table_;
    std::shared_ptr<const std::vector<std::string>> dictionary_;
    std::shared_ptr<TrieCache> trie_cache_;
    std::shared_ptr<const CommonWordGate> common_gate_; ///< Corpus + lemmatizer, default thresholds
    std::shared_ptr<WordOracle> oracle_;
};

} // namespace rackplay
