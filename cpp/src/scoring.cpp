/**
 * @file scoring.cpp
 * @brief Implementation of word scoring and the play total.
 *
 * Scoring Formula: total = max(base - penalty, 0) + bonuses
 *
 * Standard table examples:
 *   | Play                    | Base | Penalty | Total |
 *   |-------------------------|------|---------|-------|
 *   | (qu)ote                 | 16   | 0       | 16    |
 *   | cat + dog               | 26   | 0       | 26    |
 *   | (no words), a a a       | 0    | 6       | 0     |
 */

#include "../include/rackplay/scoring.hpp"
#include <algorithm>

namespace rackplay {

int score_tokens(const TileTable& table, const std::vector<std::string>& tokens) {
    int score = 0;
    for (const auto& t : tokens) {
        score += table.points(normalize_token(t));
    }
    return score;
}

int letter_length(const std::vector<std::string>& tokens) {
    int length = 0;
    for (const auto& t : tokens) {
        length += static_cast<int>(normalize_token(t).size());
    }
    return length;
}

PlayBonus award_bonuses(int longest_word, int word_count, const PlayParams& params) {
    PlayBonus bonus;
    bonus.longest = longest_word > params.current_longest ? params.longest_bonus : 0;
    bonus.most = word_count > params.current_most ? params.most_bonus : 0;
    return bonus;
}

int play_total(int base_score, int leftover_penalty, const PlayBonus& bonus) {
    // Formula: max(base - penalty, 0) + bonuses
    return std::max(base_score - leftover_penalty, 0) + bonus.total();
}

} // namespace rackplay
