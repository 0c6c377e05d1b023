/**
 * @file dictionary.cpp
 * @brief Implementation of the word-list and frequency-corpus loaders.
 */

#include "../include/rackplay/dictionary.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace rackplay {

namespace {

bool is_skippable(const std::string& line) {
    for (char c : line) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        return c == '#';
    }
    return true; // blank
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

} // anonymous namespace

std::vector<std::string> read_word_list(std::istream& in) {
    std::vector<std::string> words;
    std::string line;
    while (std::getline(in, line)) {
        if (is_skippable(line)) continue;
        std::istringstream fields(line);
        std::string word;
        if (fields >> word) {
            words.push_back(to_lower(word));
        }
    }
    return words;
}

std::vector<std::string> load_word_list(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open word list: " + path);
    }
    return read_word_list(in);
}

std::vector<FrequencyEntry> read_frequency_entries(std::istream& in) {
    std::vector<FrequencyEntry> entries;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (is_skippable(line)) continue;

        std::istringstream fields(line);
        FrequencyEntry entry;
        if (!(fields >> entry.lemma >> entry.zipf >> entry.rank)) {
            std::ostringstream oss;
            oss << "Malformed frequency record on line " << line_no
                << " (expected: lemma zipf rank)";
            throw std::runtime_error(oss.str());
        }
        entry.lemma = to_lower(entry.lemma);
        entries.push_back(entry);
    }
    return entries;
}

std::vector<FrequencyEntry> load_frequency_entries(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open frequency corpus: " + path);
    }
    return read_frequency_entries(in);
}

} // namespace rackplay
