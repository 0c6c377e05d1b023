/**
 * @file best_play.cpp
 * @brief Implementation of the branch-and-bound best-play search.
 *
 * Search state:
 *   - ledger:     unused tiles (commit on include, rollback on backtrack)
 *   - current:    indices of included candidates
 *   - base/longest: running base score and longest word length
 *   - best:       best play recorded so far, with best_total as the bar
 *                 the bound must beat
 *
 * Bound (admissible because tile points and bonuses are non-negative):
 *   ub = base + ledger.remaining_value() + longest_bonus + most_bonus
 * Any completion can at most score every remaining tile and win both
 * bonuses, so when ub <= best_total the branch is dropped.
 */

#include "../include/rackplay/best_play.hpp"
#include <algorithm>
#include <climits>
#include <functional>
#include <utility>

namespace rackplay {

void sort_candidates(std::vector<CandidateWord>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const CandidateWord& a, const CandidateWord& b) {
        double da = static_cast<double>(a.score) / std::max(1, a.length);
        double db = static_cast<double>(b.score) / std::max(1, b.length);
        if (da != db) return da > db;
        if (a.score != b.score) return a.score > b.score;
        return a.length > b.length;
    });
}

BestPlay empty_play(const TileTable& table, const TileCounts& rack, const PlayParams& params) {
    RackLedger ledger(table, rack);

    BestPlay play;
    play.leftover_penalty = ledger.remaining_value();
    play.unused_tiles = ledger.list_remaining_tiles();
    play.bonus = award_bonuses(0, 0, params);
    play.total_score = play_total(0, play.leftover_penalty, play.bonus);
    play.found = true;
    return play;
}

BestPlay choose_best_play(std::vector<CandidateWord> candidates,
                          const TileTable& table,
                          const TileCounts& rack,
                          const PlayParams& params) {
    sort_candidates(candidates);

    RackLedger ledger(table, rack);
    const int n = static_cast<int>(candidates.size());
    const int max_bonus = std::max(params.longest_bonus, 0) + std::max(params.most_bonus, 0);

    BestPlay best;
    int best_total = INT_MIN;

    std::vector<int> current;
    int base = 0;
    int longest = 0;

    // Score the current selection and keep it if strictly better
    auto evaluate_leaf = [&]() {
        int remaining_count = ledger.total_remaining_count();
        if (!params.no_discard && remaining_count == 0 && params.require_discard_tile) {
            return; // Nothing left to discard
        }

        int penalty = ledger.remaining_value();
        std::optional<DiscardChoice> choice;
        if (!params.no_discard) {
            choice = ledger.best_discard_candidate();
            if (choice) penalty -= choice->points;
        }

        int count = static_cast<int>(current.size());
        PlayBonus bonus = award_bonuses(longest, count, params);
        int total = play_total(base, penalty, bonus);

        if (total > best_total) {
            best_total = total;

            std::vector<std::string> unused = ledger.list_remaining_tiles();
            if (choice) {
                // Drop one copy of the discarded tile from the unused list
                auto it = std::find(unused.begin(), unused.end(), choice->token);
                if (it != unused.end()) unused.erase(it);
            }

            best = BestPlay();
            for (int idx : current) {
                const CandidateWord& c = candidates[idx];
                ChosenWord w;
                w.word = c.display;
                w.plain = c.plain;
                w.score = c.score;
                w.length = c.length;
                w.usage = c.usage;
                best.words.push_back(std::move(w));
            }
            best.base_score = base;
            best.leftover_penalty = penalty;
            if (choice) best.discard_tile = choice->token;
            best.unused_tiles = std::move(unused);
            best.longest_word_length = longest;
            best.word_count = count;
            best.bonus = bonus;
            best.total_score = total;
            best.found = true;
        }
    };

    std::function<void(int)> search = [&](int i) {
        int upper_bound = base + ledger.remaining_value() + max_bonus;
        if (best.found && upper_bound <= best_total) return;

        if (i == n) {
            evaluate_leaf();
            return;
        }

        const CandidateWord& w = candidates[i];

        // Include
        if (ledger.fits(w.usage)) {
            ledger.commit(w.usage);
            current.push_back(i);
            int prev_longest = longest;
            longest = std::max(longest, w.length);
            base += w.score;

            search(i + 1);

            base -= w.score;
            longest = prev_longest;
            current.pop_back();
            ledger.rollback(w.usage);
        }

        // Exclude
        search(i + 1);
    };

    search(0);
    return best;
}

} // namespace rackplay
