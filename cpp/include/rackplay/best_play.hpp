/**
 * @file best_play.hpp
 * @brief Branch-and-bound selection of the best set of non-overlapping words.
 *
 * Given the candidate words for a rack, choose the subset whose tiles do
 * not overlap and whose end-of-round total is highest (see scoring.hpp for
 * the formula).
 *
 * Search:
 *   - Candidates are pre-sorted by points per letter, then points, then
 *     length (all descending). The order only speeds up pruning.
 *   - Each candidate is first included (if its tiles still fit), then
 *     excluded, so every valid subset is reachable.
 *   - Bound: current base score + value of every unused tile + both bonus
 *     amounts. No completion can beat that, so a branch whose bound does
 *     not exceed the best total found so far is cut.
 *   - A leaf (every candidate decided) is scored:
 *       no_discard:        every unused tile is penalty
 *       discard allowed:   the highest-value unused tile is discarded and
 *                          the rest are penalty
 *       discard allowed, nothing unused: skipped when require_discard_tile
 *                          is set (the round must end on a discard)
 *   - A leaf replaces the best only with a strictly higher total, so the
 *     first optimum found is kept.
 */

#pragma once

#include "candidates.hpp"
#include "rack.hpp"
#include "scoring.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rackplay {

/**
 * @brief One word of the chosen play.
 */
struct ChosenWord {
    std::string word;  ///< Display form, e.g. "(qu)ote"
    std::string plain; ///< Plain letters, e.g. "quote"
    int score;         ///< Tile points
    int length;        ///< Letter count
    TileCounts usage;  ///< Tiles consumed

    ChosenWord() : score(0), length(0) {}
};

/**
 * @brief Outcome of the oracle refinement loop (see optimizer.hpp).
 */
struct RefinementReport {
    int passes;                              ///< Oracle checks performed
    std::vector<std::string> rejected_words; ///< Plain words the oracle rejected
    bool converged;                          ///< True if the final play passed the oracle

    RefinementReport() : passes(0), converged(true) {}
};

/**
 * @brief The best play found for a rack.
 *
 * Resource conservation: the usages of all words, plus discard_tile,
 * plus unused_tiles, add up to exactly the rack searched.
 */
struct BestPlay {
    std::vector<ChosenWord> words;           ///< Words played
    int base_score;                          ///< Sum of word scores
    int leftover_penalty;                    ///< Points of penalized unused tiles
    std::optional<std::string> discard_tile; ///< Tile discarded, if any
    std::vector<std::string> unused_tiles;   ///< Penalized tiles (discard excluded)
    int longest_word_length;                 ///< Longest word played (0 if none)
    int word_count;                          ///< Number of words played
    PlayBonus bonus;                         ///< Bonuses awarded
    int total_score;                         ///< max(base - penalty, 0) + bonuses
    bool found;                              ///< False if no legal end state was reached
    RefinementReport refinement;             ///< Filled in by the optimizer

    /** @brief Default constructor: empty play, all zero */
    BestPlay()
        : base_score(0), leftover_penalty(0), longest_word_length(0),
          word_count(0), total_score(0), found(false) {}
};

/**
 * @brief Choose the highest-scoring non-overlapping word set.
 * @param candidates Candidate words (copied; sorted internally)
 * @param table Tile table the rack and usages are shaped for
 * @param rack Tiles available
 * @param params Discard rule, thresholds and bonus points
 * @return The best play; an empty play with found = false if no leaf
 *         was legal (e.g. an empty rack while a discard is required)
 *
 * Complexity: exponential in the number of candidates in the worst case,
 * bounded in practice by rack size and pruning.
 */
BestPlay choose_best_play(std::vector<CandidateWord> candidates,
                          const TileTable& table,
                          const TileCounts& rack,
                          const PlayParams& params);

/**
 * @brief Play with no words: every rack tile unused and penalized.
 *
 * Used when the candidate pool is exhausted. No discard is taken.
 */
BestPlay empty_play(const TileTable& table, const TileCounts& rack, const PlayParams& params);

/**
 * @brief Order used by the search: points per letter, points, length (desc).
 */
void sort_candidates(std::vector<CandidateWord>& candidates);

} // namespace rackplay
