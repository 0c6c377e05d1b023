#include <gtest/gtest.h>
#include "rackplay/scoring.hpp"

using namespace rackplay;

TEST(ScoringTest, QuoteWithDigraph) {
    // (qu) o t e
    std::vector<std::string> tokens = {"qu", "o", "t", "e"};
    int score = score_tokens(standard_tile_table(), tokens);

    // 9 + 2 + 3 + 2 = 16
    EXPECT_EQ(score, 16);
    EXPECT_EQ(letter_length(tokens), 5);
}

TEST(ScoringTest, QuoteFromSingles) {
    std::vector<std::string> tokens = {"q", "u", "o", "t", "e"};
    int score = score_tokens(standard_tile_table(), tokens);

    // 15 + 4 + 2 + 3 + 2 = 26
    EXPECT_EQ(score, 26);
    EXPECT_EQ(letter_length(tokens), 5);
}

TEST(ScoringTest, DisplayTokensAccepted) {
    std::vector<std::string> tokens = {"(th)", "e"};
    // 9 + 2 = 11
    EXPECT_EQ(score_tokens(standard_tile_table(), tokens), 11);
    EXPECT_EQ(letter_length(tokens), 3);
}

TEST(ScoringTest, BonusThresholdsAreStrict) {
    PlayParams params;
    params.current_longest = 5;
    params.current_most = 2;
    params.longest_bonus = 10;
    params.most_bonus = 10;

    // Equal is not enough
    PlayBonus tie = award_bonuses(5, 2, params);
    EXPECT_EQ(tie.longest, 0);
    EXPECT_EQ(tie.most, 0);
    EXPECT_EQ(tie.total(), 0);

    PlayBonus beat = award_bonuses(6, 3, params);
    EXPECT_EQ(beat.longest, 10);
    EXPECT_EQ(beat.most, 10);
    EXPECT_EQ(beat.total(), 20);
}

TEST(ScoringTest, NoThresholdNeverAwards) {
    PlayParams params; // thresholds default to NO_BONUS_THRESHOLD
    PlayBonus bonus = award_bonuses(10, 10, params);
    EXPECT_EQ(bonus.total(), 0);
}

TEST(ScoringTest, TotalClampsAtZero) {
    // No words, three a tiles penalized: max(0 - 6, 0) = 0
    EXPECT_EQ(play_total(0, 6, PlayBonus()), 0);

    // Bonuses are added after the clamp: max(4 - 10, 0) + 10 = 10
    EXPECT_EQ(play_total(4, 10, PlayBonus(10, 0)), 10);

    // cat + dog, nothing left: 13 + 13 = 26
    EXPECT_EQ(play_total(26, 0, PlayBonus()), 26);
}
