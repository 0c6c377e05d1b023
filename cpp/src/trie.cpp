/**
 * @file trie.cpp
 * @brief Implementation of the depth-limited trie and its cache.
 */

#include "../include/rackplay/trie.hpp"
#include <cctype>
#include <stdexcept>
#include <utility>

namespace rackplay {

namespace {

// Maps a letter to its child slot (0-25), or -1
int letter_slot(char c) {
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'z') return lower - 'a';
    return -1;
}

bool is_spellable(const std::string& word) {
    if (word.empty()) return false;
    for (char c : word) {
        if (letter_slot(c) < 0) return false;
    }
    return true;
}

} // anonymous namespace

Trie::Trie(int max_depth) : max_depth_(max_depth), word_count_(0) {
    if (max_depth < 1) {
        throw std::invalid_argument("Trie max_depth must be at least 1");
    }
    nodes_.emplace_back();
}

void Trie::insert(const std::string& word) {
    if (!is_spellable(word)) return;

    int curr = ROOT;
    int depth = 0;
    for (char c : word) {
        if (depth >= max_depth_) break;
        int slot = letter_slot(c);
        if (nodes_[curr].children[slot] == NO_CHILD) {
            nodes_[curr].children[slot] = static_cast<int>(nodes_.size());
            nodes_.emplace_back();
        }
        curr = nodes_[curr].children[slot];
        depth++;
    }

    // Truncated words can never be played whole
    if (static_cast<int>(word.size()) <= max_depth_ && !nodes_[curr].end_of_word) {
        nodes_[curr].end_of_word = true;
        word_count_++;
    }
}

bool Trie::contains(const std::string& word) const {
    if (!is_spellable(word)) return false;
    int node = walk(ROOT, word);
    return node != NO_CHILD && is_end(node);
}

int Trie::child(int node, char letter) const {
    int slot = letter_slot(letter);
    if (slot < 0) return NO_CHILD;
    return nodes_[node].children[slot];
}

int Trie::walk(int node, const std::string& letters) const {
    for (char c : letters) {
        node = child(node, c);
        if (node == NO_CHILD) return NO_CHILD;
    }
    return node;
}

Trie build_trie(const std::vector<std::string>& words, int max_depth) {
    Trie trie(max_depth);
    for (const auto& w : words) {
        trie.insert(w);
    }
    return trie;
}

TrieCache::TrieCache(std::shared_ptr<const std::vector<std::string>> dictionary)
    : dictionary_(std::move(dictionary)) {
    if (!dictionary_) {
        dictionary_ = std::make_shared<const std::vector<std::string>>();
    }
}

std::shared_ptr<const Trie> TrieCache::get(int max_depth) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tries_.find(max_depth);
    if (it != tries_.end()) {
        return it->second;
    }

    auto trie = std::make_shared<const Trie>(build_trie(*dictionary_, max_depth));
    tries_[max_depth] = trie;
    return trie;
}

size_t TrieCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tries_.size();
}

void TrieCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    tries_.clear();
}

} // namespace rackplay
