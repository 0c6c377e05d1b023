#include <gtest/gtest.h>
#include "rackplay/dictionary.hpp"
#include <sstream>
#include <stdexcept>

using namespace rackplay;

TEST(WordListTest, FirstFieldLowercased) {
    std::istringstream in(
        "# Collins excerpt\n"
        "QUOTE to repeat the words of [v -D, -S]\n"
        "\n"
        "cat\n"
        "   \n"
        "Dog\tan animal\n");

    auto words = read_word_list(in);
    std::vector<std::string> expected = {"quote", "cat", "dog"};
    EXPECT_EQ(words, expected);
}

TEST(WordListTest, MissingFileThrows) {
    EXPECT_THROW(load_word_list("/nonexistent/rackplay/words.txt"), std::runtime_error);
}

TEST(FrequencyCorpusTest, ParsesRecords) {
    std::istringstream in(
        "# lemma zipf rank\n"
        "the\t7.73\t1\n"
        "Quote 4.61 3120\n");

    auto entries = read_frequency_entries(in);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].lemma, "the");
    EXPECT_DOUBLE_EQ(entries[0].zipf, 7.73);
    EXPECT_EQ(entries[0].rank, 1);
    EXPECT_EQ(entries[1].lemma, "quote");
    EXPECT_EQ(entries[1].rank, 3120);
}

TEST(FrequencyCorpusTest, MalformedLineNamesLine) {
    std::istringstream in(
        "the 7.73 1\n"
        "cat not-a-number 2500\n");

    try {
        read_frequency_entries(in);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
}

TEST(FrequencyCorpusTest, MissingFileThrows) {
    EXPECT_THROW(load_frequency_entries("/nonexistent/rackplay/freq.tsv"), std::runtime_error);
}
