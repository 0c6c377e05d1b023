/**
 * @file tile.cpp
 * @brief Implementation of the tile table and rack text parsing.
 *
 * Provides:
 *   - TileTable construction with token validation
 *   - The standard Quiddler point table
 *   - Parsing of rack text with parenthesized digraphs
 *   - Display and plain-text joins for token lists
 */

#include "../include/rackplay/tile.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace rackplay {

namespace {

bool is_alpha_token(const std::string& token) {
    if (token.empty()) return false;
    for (char c : token) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // anonymous namespace

TileTable::TileTable() {
    std::fill(std::begin(letter_index_), std::end(letter_index_), -1);
}

TileTable::TileTable(const std::vector<Tile>& tiles) : TileTable() {
    for (const Tile& raw : tiles) {
        if (!is_alpha_token(raw.token)) {
            throw std::invalid_argument("Tile token must be alphabetic: '" + raw.token + "'");
        }
        if (raw.points < 0) {
            throw std::invalid_argument("Tile '" + raw.token + "' has negative points");
        }

        std::string token = to_lower(raw.token);
        if (contains(token)) {
            throw std::invalid_argument("Duplicate tile token: '" + token + "'");
        }

        if (token.size() == 1) {
            letter_index_[token[0] - 'a'] = static_cast<int>(singles_.size());
            singles_.emplace_back(token, raw.points);
        } else {
            digraph_lookup_[token] = static_cast<int>(digraphs_.size());
            digraphs_.emplace_back(token, raw.points);
        }
    }
}

int TileTable::points(const std::string& token) const {
    if (token.size() == 1) {
        int idx = single_index(token[0]);
        return idx >= 0 ? singles_[idx].points : 0;
    }
    int idx = digraph_index(token);
    return idx >= 0 ? digraphs_[idx].points : 0;
}

bool TileTable::is_digraph(const std::string& token) const {
    return digraph_index(token) >= 0;
}

bool TileTable::contains(const std::string& token) const {
    if (token.size() == 1) return single_index(token[0]) >= 0;
    return is_digraph(token);
}

int TileTable::single_index(char letter) const {
    if (letter < 'a' || letter > 'z') return -1;
    return letter_index_[letter - 'a'];
}

int TileTable::digraph_index(const std::string& token) const {
    auto it = digraph_lookup_.find(token);
    return it != digraph_lookup_.end() ? it->second : -1;
}

const TileTable& standard_tile_table() {
    static const TileTable table({
        {"a", 2},  {"b", 8},  {"c", 8},  {"d", 5},  {"e", 2},  {"f", 6},
        {"g", 6},  {"h", 7},  {"i", 2},  {"j", 13}, {"k", 8},  {"l", 3},
        {"m", 5},  {"n", 5},  {"o", 2},  {"p", 6},  {"q", 15}, {"r", 5},
        {"s", 3},  {"t", 3},  {"u", 4},  {"v", 11}, {"w", 10}, {"x", 12},
        {"y", 4},  {"z", 14},
        // Digraph tiles
        {"cl", 10}, {"er", 7}, {"in", 7}, {"qu", 9}, {"th", 9}
    });
    return table;
}

std::string normalize_token(const std::string& token) {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '(' || c == ')') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::vector<std::string> parse_tiles(const std::string& text) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (c == '(') {
            // Look for "(letters)"
            size_t j = i + 1;
            while (j < text.size() && std::isalpha(static_cast<unsigned char>(text[j]))) ++j;
            if (j > i + 1 && j < text.size() && text[j] == ')') {
                tokens.push_back(to_lower(text.substr(i + 1, j - i - 1)));
                i = j + 1;
                continue;
            }
            ++i; // Unmatched: read what follows as singles
            continue;
        }

        if (std::isalpha(c)) {
            tokens.push_back(std::string(1, static_cast<char>(std::tolower(c))));
        }
        ++i;
    }
    return tokens;
}

std::string to_display_token(const std::string& token) {
    return token.size() > 1 ? "(" + token + ")" : token;
}

std::string join_display(const std::vector<std::string>& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        out += to_display_token(t);
    }
    return out;
}

std::string plain_word(const std::vector<std::string>& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        out += normalize_token(t);
    }
    return out;
}

} // namespace rackplay
