#include <gtest/gtest.h>
#include "rackplay/optimizer.hpp"
#include <algorithm>
#include <stdexcept>

using namespace rackplay;

// Oracle that rejects a fixed set of words and records each batch
class FakeOracle : public WordOracle {
public:
    std::set<std::string> rejected;
    std::vector<std::vector<std::string>> batches;

    OracleVerdict check_batch(const std::vector<std::string>& plain_words) override {
        batches.push_back(plain_words);
        OracleVerdict verdict;
        for (const auto& w : plain_words) {
            if (rejected.count(w)) {
                verdict.invalid_plain.insert(w);
            } else {
                verdict.valid_plain.insert(w);
            }
        }
        return verdict;
    }
};

// Lemmatizer that strips a plural "s"
class PluralLemmatizer : public Lemmatizer {
public:
    std::optional<std::string> noun(const std::string& word) const override {
        if (word.size() > 3 && word.back() == 's') return word.substr(0, word.size() - 1);
        return std::nullopt;
    }
};

// Helper to create an optimizer over a word list
Optimizer make_optimizer(const std::vector<std::string>& words) {
    return Optimizer(std::make_shared<const std::vector<std::string>>(words));
}

OptimizeOptions options_for(const std::string& tiles) {
    OptimizeOptions options;
    options.tiles = tiles;
    options.no_discard = true;
    return options;
}

std::vector<std::string> chosen_words(const BestPlay& play) {
    std::vector<std::string> out;
    for (const auto& w : play.words) out.push_back(w.plain);
    std::sort(out.begin(), out.end());
    return out;
}

TEST(OptimizerTest, BasicPlay) {
    Optimizer opt = make_optimizer({"cat", "dog"});
    BestPlay play = opt.optimize(options_for("catdog"));

    EXPECT_EQ(chosen_words(play), (std::vector<std::string>{"cat", "dog"}));
    EXPECT_EQ(play.total_score, 26);
    EXPECT_EQ(play.refinement.passes, 0);
}

TEST(OptimizerTest, DictionaryCaseIgnored) {
    Optimizer opt = make_optimizer({"QUOTE"});
    BestPlay play = opt.optimize(options_for("(QU)OTE"));

    ASSERT_EQ(play.words.size(), 1u);
    EXPECT_EQ(play.words[0].word, "(qu)ote");
    EXPECT_EQ(play.total_score, 16);
}

TEST(OptimizerTest, ZeroThresholdMeansNone) {
    OptimizeOptions options;
    EXPECT_EQ(make_play_params(options).current_longest, NO_BONUS_THRESHOLD);
    EXPECT_EQ(make_play_params(options).current_most, NO_BONUS_THRESHOLD);

    options.current_longest = 4;
    options.current_most = 1;
    options.longest_bonus = 10;
    options.most_bonus = 5;
    options.no_discard = true;
    PlayParams params = make_play_params(options);
    EXPECT_EQ(params.current_longest, 4);
    EXPECT_EQ(params.current_most, 1);
    EXPECT_EQ(params.longest_bonus, 10);
    EXPECT_EQ(params.most_bonus, 5);
    EXPECT_TRUE(params.no_discard);
}

TEST(OptimizerTest, BonusesFlowThrough) {
    Optimizer opt = make_optimizer({"cat", "dog"});
    OptimizeOptions options = options_for("catdog");
    options.current_most = 1;
    options.most_bonus = 10;

    BestPlay play = opt.optimize(options);
    EXPECT_EQ(play.bonus.most, 10);
    // 26 + 10
    EXPECT_EQ(play.total_score, 36);

    // Bonus points entered but no opponent value: no bonus
    options.current_most = 0;
    play = opt.optimize(options);
    EXPECT_EQ(play.bonus.most, 0);
}

TEST(OptimizerTest, MaxWordLengthLimitsTrie) {
    Optimizer opt = make_optimizer({"cat", "dogs"});
    OptimizeOptions options = options_for("catdogs");

    options.max_word_length = 3;
    auto cands = opt.candidates(options);
    ASSERT_EQ(cands.size(), 1u);
    EXPECT_EQ(cands[0].plain, "cat");

    options.max_word_length = 10;
    EXPECT_EQ(opt.candidates(options).size(), 2u);
    EXPECT_EQ(opt.trie_cache().size(), 2u);
}

TEST(OptimizerTest, EmptyRack) {
    Optimizer opt = make_optimizer({"cat"});
    BestPlay play = opt.optimize(options_for(""));
    EXPECT_TRUE(play.found);
    EXPECT_TRUE(play.words.empty());
    EXPECT_EQ(play.total_score, 0);
}

TEST(OptimizerTest, CustomTable) {
    TileTable table({{"c", 1}, {"a", 1}, {"t", 1}, {"at", 10}});
    Optimizer opt(table, std::make_shared<const std::vector<std::string>>(std::vector<std::string>{"cat"}));

    BestPlay play = opt.optimize(options_for("c(at)"));
    ASSERT_EQ(play.words.size(), 1u);
    EXPECT_EQ(play.words[0].word, "c(at)");
    // 1 + 10
    EXPECT_EQ(play.total_score, 11);
}

TEST(OptimizerValidationTest, RejectsBadOptions) {
    Optimizer opt = make_optimizer({"cat"});

    OptimizeOptions options;
    EXPECT_TRUE(opt.validate_options(options).valid);

    options.longest_bonus = -1;
    EXPECT_FALSE(opt.validate_options(options).valid);

    options = OptimizeOptions();
    options.current_most = -2;
    EXPECT_FALSE(opt.validate_options(options).valid);

    options = OptimizeOptions();
    options.min_word_length = 0;
    EXPECT_FALSE(opt.validate_options(options).valid);

    options = OptimizeOptions();
    options.max_word_length = 1;
    auto result = opt.validate_options(options);
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error_message, "max_word_length (1) is shorter than min_word_length (2)");

    options = OptimizeOptions();
    options.max_refinement_passes = -1;
    EXPECT_FALSE(opt.validate_options(options).valid);
}

TEST(OptimizerValidationTest, MissingCollaborators) {
    Optimizer opt = make_optimizer({"cat"});

    OptimizeOptions online;
    online.validate_online = true;
    EXPECT_FALSE(opt.validate_options(online).valid);
    EXPECT_THROW(opt.optimize(online), std::invalid_argument);

    // A missing corpus is not an error
    OptimizeOptions common;
    common.common_only = true;
    EXPECT_TRUE(opt.validate_options(common).valid);

    opt.set_word_oracle(std::make_shared<FakeOracle>());
    EXPECT_TRUE(opt.validate_options(online).valid);
}

TEST(OptimizerCommonTest, MissingCorpusMeansNoFiltering) {
    Optimizer opt = make_optimizer({"cat"});
    OptimizeOptions options;
    options.tiles = "catz";
    options.common_only = true;

    BestPlay play = opt.optimize(options);
    EXPECT_EQ(chosen_words(play), std::vector<std::string>{"cat"});
    ASSERT_TRUE(play.discard_tile.has_value());
    EXPECT_EQ(*play.discard_tile, "z");
    // 8 + 2 + 3 = 13, z discarded so nothing is penalized
    EXPECT_EQ(play.total_score, 13);

    // An empty corpus behaves the same
    opt.set_frequency_corpus({});
    EXPECT_FALSE(opt.has_frequency_corpus());
    EXPECT_EQ(opt.optimize(options).total_score, 13);
}

TEST(OptimizerCommonTest, GateRestrictsCandidates) {
    Optimizer opt = make_optimizer({"cat", "act", "at"});
    opt.set_frequency_corpus({{"cat", 5.0, 2500}, {"act", 2.0, 40000}});

    OptimizeOptions options = options_for("cat");
    options.common_only = true;
    auto cands = opt.candidates(options);
    ASSERT_EQ(cands.size(), 1u);
    EXPECT_EQ(cands[0].plain, "cat");

    // Short-word override admits "at" and "act" by length
    options.gate.override_short_words = true;
    EXPECT_EQ(opt.candidates(options).size(), 3u);

    // Looser threshold admits "act"
    options.gate.override_short_words = false;
    options.gate.min_zipf = 1.5;
    EXPECT_EQ(opt.candidates(options).size(), 2u);
}

TEST(OptimizerCommonTest, LemmatizerReachesGate) {
    Optimizer opt = make_optimizer({"cats"});
    OptimizeOptions options = options_for("cats");
    options.common_only = true;

    opt.set_frequency_corpus({{"cat", 5.0, 2500}});
    EXPECT_TRUE(opt.candidates(options).empty());

    // "cats" is looked up under its lemma "cat"
    opt.set_frequency_corpus({{"cat", 5.0, 2500}}, std::make_shared<PluralLemmatizer>());
    auto cands = opt.candidates(options);
    ASSERT_EQ(cands.size(), 1u);
    EXPECT_EQ(cands[0].plain, "cats");
}

TEST(OptimizerRefinementTest, ReplacesRejectedWord) {
    Optimizer opt = make_optimizer({"act", "cat", "dog"});
    auto oracle = std::make_shared<FakeOracle>();
    oracle->rejected = {"act"};
    opt.set_word_oracle(oracle);

    OptimizeOptions options = options_for("catdog");
    options.validate_online = true;
    BestPlay play = opt.optimize(options);

    EXPECT_EQ(chosen_words(play), (std::vector<std::string>{"cat", "dog"}));
    EXPECT_EQ(play.total_score, 26);
    EXPECT_TRUE(play.refinement.converged);
    EXPECT_EQ(play.refinement.passes, 2);
    EXPECT_EQ(play.refinement.rejected_words, std::vector<std::string>{"act"});

    // A rejected word is never offered again
    ASSERT_EQ(oracle->batches.size(), 2u);
    const auto& second = oracle->batches[1];
    EXPECT_EQ(std::count(second.begin(), second.end(), "act"), 0);
}

TEST(OptimizerRefinementTest, AcceptedOnFirstPass) {
    Optimizer opt = make_optimizer({"cat", "dog"});
    auto oracle = std::make_shared<FakeOracle>();
    opt.set_word_oracle(oracle);

    OptimizeOptions options = options_for("catdog");
    options.validate_online = true;
    BestPlay play = opt.optimize(options);

    EXPECT_EQ(play.refinement.passes, 1);
    EXPECT_TRUE(play.refinement.converged);
    EXPECT_TRUE(play.refinement.rejected_words.empty());
}

TEST(OptimizerRefinementTest, ExhaustedPoolGivesEmptyPlay) {
    Optimizer opt = make_optimizer({"cat"});
    auto oracle = std::make_shared<FakeOracle>();
    oracle->rejected = {"cat"};
    opt.set_word_oracle(oracle);

    OptimizeOptions options = options_for("cat");
    options.validate_online = true;
    BestPlay play = opt.optimize(options);

    EXPECT_TRUE(play.found);
    EXPECT_TRUE(play.words.empty());
    EXPECT_FALSE(play.discard_tile.has_value());
    EXPECT_EQ(play.unused_tiles, (std::vector<std::string>{"a", "c", "t"}));
    // 2 + 8 + 3 = 13 penalized, max(0 - 13, 0) = 0
    EXPECT_EQ(play.leftover_penalty, 13);
    EXPECT_EQ(play.total_score, 0);
    EXPECT_EQ(play.refinement.passes, 1);
}

TEST(OptimizerRefinementTest, PassLimit) {
    Optimizer opt = make_optimizer({"act", "cat", "dog"});
    auto oracle = std::make_shared<FakeOracle>();
    oracle->rejected = {"act"};
    opt.set_word_oracle(oracle);

    OptimizeOptions options = options_for("catdog");
    options.validate_online = true;
    options.max_refinement_passes = 1;
    BestPlay play = opt.optimize(options);

    // Re-selected after the only check, never confirmed
    EXPECT_EQ(chosen_words(play), (std::vector<std::string>{"cat", "dog"}));
    EXPECT_EQ(play.refinement.passes, 1);
    EXPECT_FALSE(play.refinement.converged);
    EXPECT_EQ(oracle->batches.size(), 1u);
}

TEST(OptimizerAsyncTest, MatchesSynchronousResult) {
    Optimizer opt = make_optimizer({"cat", "dog", "god", "act"});
    OptimizeOptions options = options_for("catdog");

    auto f1 = opt.optimize_async(options);
    auto f2 = opt.optimize_async(options);
    BestPlay sync = opt.optimize(options);

    EXPECT_EQ(f1.get().total_score, sync.total_score);
    EXPECT_EQ(f2.get().total_score, sync.total_score);
    // Both calls shared one cached trie
    EXPECT_EQ(opt.trie_cache().size(), 1u);
}
