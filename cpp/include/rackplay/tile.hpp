/**
 * @file tile.hpp
 * @brief Tile tokens, the point-value table, and rack text parsing.
 *
 * A tile is either a single lowercase letter ("a".."z") or a registered
 * multi-letter digraph ("qu", "th", ...). Digraphs are atomic: they are
 * consumed and scored as one unit and never split into their letters.
 *
 * Rack text notation:
 *   - Single letters are written as-is: "cat"
 *   - Digraph tiles are wrapped in parentheses: "(qu)ote"
 *   - Parsing is case-insensitive; anything that is not a letter is ignored
 *
 * The TileTable keeps singles and digraphs in two ordered lists. Table order
 * is insertion order and is significant: it decides iteration order during
 * candidate generation and breaks ties when choosing a discard tile.
 */

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace rackplay {

/** @brief Number of letters a trie node can branch on ('a'..'z') */
constexpr int ALPHABET_SIZE = 26;

/**
 * @brief One entry of the point-value table.
 */
struct Tile {
    std::string token; ///< Lowercase letter or digraph string
    int points;        ///< Points the tile contributes to a word

    Tile() : points(0) {}
    Tile(const std::string& t, int p) : token(t), points(p) {}
};

/**
 * @brief Immutable token -> points table with digraph identification.
 *
 * Tokens of length 1 are singles, longer tokens are digraphs. Indices
 * returned by single_index() / digraph_index() address TileCounts vectors.
 *
 * Usage:
 * @code
 *   TileTable table({{"a", 2}, {"t", 3}, {"qu", 9}});
 *   table.points("qu");        // 9
 *   table.is_digraph("qu");    // true
 *   table.single_index('t');   // 1
 * @endcode
 */
class TileTable {
public:
    /** @brief Construct an empty table */
    TileTable();

    /**
     * @brief Build a table from an ordered tile list.
     * @param tiles Tiles in table order (case-insensitive tokens)
     * @throws std::invalid_argument on an empty or non-alphabetic token,
     *         a duplicate token, or negative points
     */
    explicit TileTable(const std::vector<Tile>& tiles);

    /**
     * @brief Point value of a token.
     * @param token Lowercase token
     * @return Points, or 0 for tokens not in the table
     */
    int points(const std::string& token) const;

    /** @brief True if the token is a registered multi-letter tile */
    bool is_digraph(const std::string& token) const;

    /** @brief True if the token is registered at all */
    bool contains(const std::string& token) const;

    /**
     * @brief Position of a single letter in singles().
     * @return Index, or -1 if the letter is not registered
     */
    int single_index(char letter) const;

    /**
     * @brief Position of a digraph in digraphs().
     * @return Index, or -1 if the token is not a registered digraph
     */
    int digraph_index(const std::string& token) const;

    const std::vector<Tile>& singles() const { return singles_; }
    const std::vector<Tile>& digraphs() const { return digraphs_; }

    int num_singles() const { return static_cast<int>(singles_.size()); }
    int num_digraphs() const { return static_cast<int>(digraphs_.size()); }

private:
    std::vector<Tile> singles_;  ///< Length-1 tiles in table order
    std::vector<Tile> digraphs_; ///< Multi-letter tiles in table order
    int letter_index_[ALPHABET_SIZE];                 ///< 'a'+i -> singles_ index
    std::unordered_map<std::string, int> digraph_lookup_; ///< token -> digraphs_ index
};

/**
 * @brief The standard Quiddler point table (26 letters + cl, er, in, qu, th).
 */
const TileTable& standard_tile_table();

/**
 * @brief Lowercase a token and strip digraph parentheses: "(QU)" -> "qu".
 */
std::string normalize_token(const std::string& token);

/**
 * @brief Split rack text into normalized tokens.
 * @param text Rack text such as "(qu)ote" or "C A T"
 * @return Tokens in order of appearance, e.g. {"qu", "o", "t", "e"}
 *
 * A parenthesized run of letters becomes one token. An unmatched '('
 * is ignored and the letters after it are read as singles.
 */
std::vector<std::string> parse_tiles(const std::string& text);

/** @brief Display form of a token: digraphs are wrapped as "(qu)" */
std::string to_display_token(const std::string& token);

/** @brief Join tokens into display text: {"qu","o","t","e"} -> "(qu)ote" */
std::string join_display(const std::vector<std::string>& tokens);

/** @brief Join tokens into plain lowercase letters: -> "quote" */
std::string plain_word(const std::vector<std::string>& tokens);

} // namespace rackplay
