/**
 * @file dictionary.hpp
 * @brief Loading the word list and the word-frequency corpus from text files.
 *
 * Word list format (one entry per line):
 * @code
 *   # comment
 *   QUOTE
 *   CAT a small domesticated feline [n -S]
 * @endcode
 * The first whitespace-delimited field is the word; anything after it (a
 * Collins-style definition, say) is ignored. Words are lowercased.
 *
 * Frequency corpus format (tab- or space-separated):
 * @code
 *   # lemma  zipf  rank
 *   the      7.73  1
 *   quote    4.61  3120
 * @endcode
 */

#pragma once

#include "common_gate.hpp"
#include <istream>
#include <string>
#include <vector>

namespace rackplay {

/**
 * @brief Read a word list from a stream.
 * @return Lowercased words in file order (duplicates kept)
 */
std::vector<std::string> read_word_list(std::istream& in);

/**
 * @brief Read a word list from a file.
 * @throws std::runtime_error if the file cannot be opened
 */
std::vector<std::string> load_word_list(const std::string& path);

/**
 * @brief Read frequency records from a stream.
 * @throws std::runtime_error naming the line of a malformed record
 */
std::vector<FrequencyEntry> read_frequency_entries(std::istream& in);

/**
 * @brief Read frequency records from a file.
 * @throws std::runtime_error if the file cannot be opened or is malformed
 */
std::vector<FrequencyEntry> load_frequency_entries(const std::string& path);

} // namespace rackplay
