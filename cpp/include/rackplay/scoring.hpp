/**
 * @file scoring.hpp
 * @brief Word scores and the end-of-round play total.
 *
 * Scoring Formula:
 * @code
 *   total = max(base_score - leftover_penalty, 0) + longest_bonus + most_bonus
 * @endcode
 *
 * Where:
 *   - base_score: sum of tile points over every word played
 *   - leftover_penalty: points of the tiles left unused (minus the one
 *     discarded tile when a discard is allowed)
 *   - longest_bonus: awarded only if the longest word played is strictly
 *     longer than the opponent threshold
 *   - most_bonus: awarded only if strictly more words were played than
 *     the opponent threshold
 *
 * The pre-bonus part is floored at zero: a big leftover can wipe out the
 * words' points but never drives the play negative.
 *
 * Example: "(qu)ote" + "at" with an unused "x", no discard
 *   - base_score = (9 + 2 + 3 + 2) + (2 + 3) = 21
 *   - leftover_penalty = 12
 *   - Total: max(21 - 12, 0) = 9 (+ any bonuses)
 */

#pragma once

#include "tile.hpp"
#include <climits>
#include <string>
#include <vector>

namespace rackplay {

/** @brief Threshold value meaning "this bonus cannot be won" */
constexpr int NO_BONUS_THRESHOLD = INT_MAX;

/** @brief Default points for each bonus when calling the selector directly */
constexpr int DEFAULT_BONUS_POINTS = 10;

/**
 * @brief Game parameters for one best-play search.
 */
struct PlayParams {
    bool no_discard;           ///< True if no tile may be discarded
    int current_longest;       ///< Longest-word length to beat (strictly)
    int current_most;          ///< Word count to beat (strictly)
    int longest_bonus;         ///< Points for the longest-word bonus
    int most_bonus;            ///< Points for the most-words bonus
    bool require_discard_tile; ///< With discard allowed, skip plays that leave nothing to discard

    /** @brief Defaults: discard allowed, no bonus reachable, 10-point bonuses */
    PlayParams()
        : no_discard(false),
          current_longest(NO_BONUS_THRESHOLD),
          current_most(NO_BONUS_THRESHOLD),
          longest_bonus(DEFAULT_BONUS_POINTS),
          most_bonus(DEFAULT_BONUS_POINTS),
          require_discard_tile(true) {}
};

/**
 * @brief Bonus points awarded to a play.
 */
struct PlayBonus {
    int longest; ///< Longest-word bonus (0 if not awarded)
    int most;    ///< Most-words bonus (0 if not awarded)

    PlayBonus() : longest(0), most(0) {}
    PlayBonus(int l, int m) : longest(l), most(m) {}

    int total() const { return longest + most; }
};

/**
 * @brief Sum the point values of a list of tokens.
 * @param table Point table
 * @param tokens Normalized tokens; unknown tokens score 0
 */
int score_tokens(const TileTable& table, const std::vector<std::string>& tokens);

/**
 * @brief Number of letters spelled by a token list (a digraph counts as 2).
 */
int letter_length(const std::vector<std::string>& tokens);

/**
 * @brief Decide which bonuses a play earns.
 * @param longest_word Longest word length in the play
 * @param word_count Number of words in the play
 * @param params Thresholds and bonus points
 *
 * Both comparisons are strict: tying the threshold earns nothing.
 */
PlayBonus award_bonuses(int longest_word, int word_count, const PlayParams& params);

/**
 * @brief Final total for a play: max(base - penalty, 0) + bonuses.
 */
int play_total(int base_score, int leftover_penalty, const PlayBonus& bonus);

} // namespace rackplay
