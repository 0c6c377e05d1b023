/**
 * @file candidates.hpp
 * @brief Rack-constrained generation of every playable dictionary word.
 *
 * Algorithm (depth-first over the trie, consuming a copy of the rack):
 *   1. At a node marked end-of-word whose path is at least min_len letters
 *      long, record the current word
 *   2. For each single-letter tile with count > 0 and a matching trie
 *      child: take the tile, descend, put it back
 *   3. For each digraph tile with count > 0 whose letters form a chain
 *      in the trie: take it, descend by all its letters, put it back
 *
 * The same word can be reachable through different tile decompositions,
 * e.g. "quit" from q+u+i+t or from (qu)+i+t. Those consume different
 * tiles, so each distinct usage signature is kept as its own candidate.
 * A word spelled by exactly one digraph tile (e.g. "qu") is not a word play
 * and is never recorded.
 */

#pragma once

#include "rack.hpp"
#include "tile.hpp"
#include "trie.hpp"
#include <functional>
#include <string>
#include <vector>

namespace rackplay {

/** @brief Shortest word the optimizer plays by default */
constexpr int DEFAULT_MIN_WORD_LENGTH = 2;

/**
 * @brief Predicate deciding whether a plain word may be played.
 *
 * An empty WordGate admits everything. CommonWordGate converts to it.
 */
using WordGate = std::function<bool(const std::string&)>;

/**
 * @brief One playable word together with the tiles that spell it.
 */
struct CandidateWord {
    std::string plain;               ///< Lowercase letters, e.g. "quote"
    std::string display;             ///< Tiles with digraphs marked, e.g. "(qu)ote"
    std::vector<std::string> tokens; ///< Tile tokens in spelling order
    int score;                       ///< Sum of tile points
    int length;                      ///< Letter count (digraphs count their letters)
    TileCounts usage;                ///< Exact tiles consumed

    /** @brief Default constructor: empty word */
    CandidateWord() : score(0), length(0) {}
};

/**
 * @brief Generate every distinct (word, usage) pair playable from a rack.
 * @param trie Dictionary trie
 * @param table Tile table used to count the rack
 * @param rack Tile counts available
 * @param min_len Shortest word length to record
 * @param gate Optional admission filter on the plain word
 * @return Candidates grouped by plain word; order is not meaningful
 *
 * An empty rack or a rack that spells nothing yields an empty list.
 */
std::vector<CandidateWord> generate_candidates(const Trie& trie,
                                               const TileTable& table,
                                               const TileCounts& rack,
                                               int min_len = DEFAULT_MIN_WORD_LENGTH,
                                               const WordGate& gate = WordGate());

} // namespace rackplay
