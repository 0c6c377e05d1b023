#include <gtest/gtest.h>
#include "rackplay/common_gate.hpp"

using namespace rackplay;

// Test lemmatizer: strips a plural "s" (noun) and an "ing" ending (verb)
class SuffixLemmatizer : public Lemmatizer {
public:
    std::optional<std::string> noun(const std::string& word) const override {
        if (word.size() > 3 && word.back() == 's') return word.substr(0, word.size() - 1);
        return std::nullopt;
    }
    std::optional<std::string> verb(const std::string& word) const override {
        if (word.size() > 5 && word.compare(word.size() - 3, 3, "ing") == 0) {
            return word.substr(0, word.size() - 3);
        }
        return std::nullopt;
    }
};

std::vector<FrequencyEntry> corpus() {
    return {
        {"the", 7.73, 1},
        {"cat", 4.90, 2500},
        {"quote", 4.61, 3120},
        {"zax", 1.20, 90000},
        {"jump", 4.20, 14000},
    };
}

TEST(GateModeTest, NamesRoundTrip) {
    EXPECT_STREQ(gate_mode_name(GateMode::EITHER), "either");
    EXPECT_EQ(parse_gate_mode("BOTH"), GateMode::BOTH);
    EXPECT_EQ(parse_gate_mode("rank"), GateMode::RANK);
    EXPECT_FALSE(parse_gate_mode("sometimes").has_value());
}

TEST(CommonWordGateTest, ZipfMode) {
    GateConfig config; // ZIPF, min_zipf 3.8
    CommonWordGate gate(corpus(), config);

    EXPECT_TRUE(gate("cat"));
    EXPECT_TRUE(gate("jump"));
    EXPECT_FALSE(gate("zax"));
    // Unknown words are rejected
    EXPECT_FALSE(gate("qat"));
}

TEST(CommonWordGateTest, RankMode) {
    GateConfig config;
    config.mode = GateMode::RANK;
    config.top_k = 10000;
    CommonWordGate gate(corpus(), config);

    EXPECT_TRUE(gate("quote"));
    // zipf 4.2 is fine, rank 14000 is not
    EXPECT_FALSE(gate("jump"));
}

TEST(CommonWordGateTest, EitherAndBoth) {
    GateConfig config;
    config.min_zipf = 4.5;
    config.top_k = 20000;

    // jump: zipf 4.2 < 4.5, rank 14000 <= 20000
    config.mode = GateMode::EITHER;
    EXPECT_TRUE(CommonWordGate(corpus(), config)("jump"));

    config.mode = GateMode::BOTH;
    EXPECT_FALSE(CommonWordGate(corpus(), config)("jump"));
    EXPECT_TRUE(CommonWordGate(corpus(), config)("cat"));
}

TEST(CommonWordGateTest, ShortWordOverride) {
    GateConfig config;
    config.override_short_words = true;
    CommonWordGate gate(corpus(), config);

    // 2-3 letters pass without a record
    EXPECT_TRUE(gate("qi"));
    EXPECT_TRUE(gate("zax"));
    // Longer words still need one
    EXPECT_FALSE(gate("qoph"));
}

TEST(CommonWordGateTest, LemmaUsesShortestForm) {
    CommonWordGate gate(corpus(), GateConfig(), std::make_shared<SuffixLemmatizer>());

    EXPECT_EQ(gate.lemma("cats"), "cat");
    EXPECT_EQ(gate.lemma("jumping"), "jump");
    EXPECT_EQ(gate.lemma("quote"), "quote");

    EXPECT_TRUE(gate("cats"));
    EXPECT_TRUE(gate("jumping"));
}

TEST(CommonWordGateTest, NoLemmatizerMeansIdentity) {
    CommonWordGate gate(corpus(), GateConfig());
    EXPECT_EQ(gate.lemma("cats"), "cats");
    EXPECT_FALSE(gate("cats"));
}

TEST(CommonWordGateTest, LastDuplicateWins) {
    std::vector<FrequencyEntry> entries = {{"cat", 5.0, 100}, {"cat", 1.0, 99999}};
    CommonWordGate gate(entries, GateConfig());
    EXPECT_EQ(gate.corpus_size(), 1u);
    EXPECT_FALSE(gate("cat"));
}

TEST(CommonWordGateTest, WithConfigSharesCorpus) {
    CommonWordGate strict(corpus(), GateConfig());
    GateConfig loose;
    loose.min_zipf = 1.0;
    CommonWordGate relaxed = strict.with_config(loose);

    EXPECT_FALSE(strict("zax"));
    EXPECT_TRUE(relaxed("zax"));
    EXPECT_EQ(relaxed.corpus_size(), strict.corpus_size());
    EXPECT_DOUBLE_EQ(relaxed.config().min_zipf, 1.0);
}
