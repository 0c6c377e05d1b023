/**
 * @file trie.hpp
 * @brief Depth-limited prefix tree over the dictionary, plus a per-depth cache.
 *
 * Nodes live in a flat vector and refer to their children by index, so a
 * Trie is cheap to copy around behind a shared_ptr and has no pointer
 * ownership to manage. Node 0 is the root.
 *
 * Depth limit:
 *   The trie only needs words that can be spelled from one rack, so it is
 *   built with a maximum depth (the largest rack size). Longer dictionary
 *   words are inserted only up to that depth and are never marked as
 *   complete words.
 *
 * Words containing anything other than 'a'..'z' (after lowercasing) cannot
 * be spelled from tiles and are skipped.
 */

#pragma once

#include "tile.hpp"
#include <array>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rackplay {

/** @brief Child slot value for "no child" */
constexpr int NO_CHILD = -1;

/**
 * @brief One node of the trie.
 */
struct TrieNode {
    std::array<int, ALPHABET_SIZE> children; ///< Child node index per letter, or NO_CHILD
    bool end_of_word;                        ///< True if the path to this node is a word

    TrieNode() : end_of_word(false) { children.fill(NO_CHILD); }
};

/**
 * @brief Read-only-after-build prefix tree.
 *
 * Thread Safety: const member functions may be called concurrently.
 */
class Trie {
public:
    /** @brief Index of the root node */
    static constexpr int ROOT = 0;

    /**
     * @brief Construct an empty trie (root only).
     * @param max_depth Longest word that can be marked complete (>= 1)
     * @throws std::invalid_argument if max_depth < 1
     */
    explicit Trie(int max_depth);

    /**
     * @brief Insert one dictionary word.
     * @param word Word in any case
     *
     * Walks at most max_depth letters; the end flag is set only when the
     * whole word fits within max_depth.
     */
    void insert(const std::string& word);

    /** @brief True if the word was inserted and marked complete */
    bool contains(const std::string& word) const;

    /**
     * @brief Child of a node along a letter.
     * @return Child index, or NO_CHILD (also for non-letters)
     */
    int child(int node, char letter) const;

    /**
     * @brief Follow a multi-letter chain, e.g. the two letters of a digraph.
     * @return Node reached, or NO_CHILD if the chain breaks
     */
    int walk(int node, const std::string& letters) const;

    /** @brief True if the node ends a complete word */
    bool is_end(int node) const { return nodes_[node].end_of_word; }

    int max_depth() const { return max_depth_; }
    int node_count() const { return static_cast<int>(nodes_.size()); }

    /** @brief Number of nodes marked end-of-word */
    int word_count() const { return word_count_; }

private:
    std::vector<TrieNode> nodes_;
    int max_depth_;
    int word_count_; ///< Distinct complete words
};

/**
 * @brief Build a trie from a word list.
 * @param words Dictionary words (any case)
 * @param max_depth Maximum word length the trie keeps complete
 */
Trie build_trie(const std::vector<std::string>& words, int max_depth);

/**
 * @brief Lazily built tries for one dictionary, memoized by depth.
 *
 * Owned by whoever owns the dictionary (normally the Optimizer). Separate
 * caches never share state, so tests and multiple dictionaries can coexist.
 *
 * Thread Safety: get(), size() and clear() may be called concurrently.
 * Tries handed out stay valid after clear().
 */
class TrieCache {
public:
    /** @param dictionary Word list shared with the owner */
    explicit TrieCache(std::shared_ptr<const std::vector<std::string>> dictionary);

    /**
     * @brief Trie for a depth, building it on first use.
     * @param max_depth Maximum word length
     */
    std::shared_ptr<const Trie> get(int max_depth);

    /** @brief Number of depths currently cached */
    size_t size() const;

    /** @brief Drop all cached tries */
    void clear();

private:
    std::shared_ptr<const std::vector<std::string>> dictionary_;
    std::map<int, std::shared_ptr<const Trie>> tries_;
    mutable std::mutex mutex_;
};

} // namespace rackplay
