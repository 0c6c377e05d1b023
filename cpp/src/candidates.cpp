/**
 * @file candidates.cpp
 * @brief Implementation of rack-constrained candidate generation.
 *
 * The search keeps three pieces of state that grow and shrink together:
 *   - path:   letters spelled so far (the trie position)
 *   - tokens: tiles used so far, one entry per tile (a digraph is one entry)
 *   - ledger: the rack, with each tile committed while it is in use
 *
 * Results go into one bucket per plain word; a bucket holds one candidate
 * per distinct usage signature, the first one found.
 */

#include "../include/rackplay/candidates.hpp"
#include "../include/rackplay/scoring.hpp"
#include <map>
#include <utility>

namespace rackplay {

namespace {

// Usage signature of a token list
TileCounts usage_from_tokens(const std::vector<std::string>& tokens, const TileTable& table) {
    TileCounts usage(table);
    for (const auto& t : tokens) {
        if (t.size() == 1) {
            usage.singles[table.single_index(t[0])]++;
        } else {
            usage.digraphs[table.digraph_index(t)]++;
        }
    }
    return usage;
}

} // anonymous namespace

std::vector<CandidateWord> generate_candidates(const Trie& trie,
                                               const TileTable& table,
                                               const TileCounts& rack,
                                               int min_len,
                                               const WordGate& gate) {
    // The ledger shapes the counts for the table (hand-built racks may be short)
    RackLedger ledger(table, rack);

    // One-tile usages, committed and rolled back as the search moves
    std::vector<TileCounts> single_units(table.num_singles(), TileCounts(table));
    for (int i = 0; i < table.num_singles(); ++i) single_units[i].singles[i] = 1;
    std::vector<TileCounts> digraph_units(table.num_digraphs(), TileCounts(table));
    for (int i = 0; i < table.num_digraphs(); ++i) digraph_units[i].digraphs[i] = 1;

    std::string path;
    std::vector<std::string> tokens;
    std::map<std::string, std::vector<CandidateWord>> per_word;

    auto record = [&]() {
        // A lone digraph tile is not a word play
        if (tokens.size() == 1 && tokens[0].size() > 1) return;

        if (gate && !gate(path)) return;

        TileCounts usage = usage_from_tokens(tokens, table);
        auto& bucket = per_word[path];
        for (const auto& existing : bucket) {
            if (existing.usage == usage) return;
        }

        CandidateWord cand;
        cand.plain = path;
        cand.display = join_display(tokens);
        cand.tokens = tokens;
        cand.score = score_tokens(table, tokens);
        cand.length = static_cast<int>(path.size());
        cand.usage = std::move(usage);
        bucket.push_back(std::move(cand));
    };

    std::function<void(int)> dfs = [&](int node) {
        if (trie.is_end(node) && static_cast<int>(path.size()) >= min_len) {
            record();
        }

        // Single-letter tiles
        for (int i = 0; i < table.num_singles(); ++i) {
            if (ledger.counts().singles[i] <= 0) continue;
            const std::string& letter = table.singles()[i].token;
            int next = trie.child(node, letter[0]);
            if (next == NO_CHILD) continue;

            ledger.commit(single_units[i]);
            path.push_back(letter[0]);
            tokens.push_back(letter);

            dfs(next);

            tokens.pop_back();
            path.pop_back();
            ledger.rollback(single_units[i]);
        }

        // Digraph tiles advance the trie by all their letters at once
        for (int i = 0; i < table.num_digraphs(); ++i) {
            if (ledger.counts().digraphs[i] <= 0) continue;
            const std::string& digraph = table.digraphs()[i].token;
            int next = trie.walk(node, digraph);
            if (next == NO_CHILD) continue;

            ledger.commit(digraph_units[i]);
            path += digraph;
            tokens.push_back(digraph);

            dfs(next);

            tokens.pop_back();
            path.resize(path.size() - digraph.size());
            ledger.rollback(digraph_units[i]);
        }
    };

    dfs(Trie::ROOT);

    std::vector<CandidateWord> out;
    for (auto& entry : per_word) {
        for (auto& cand : entry.second) {
            out.push_back(std::move(cand));
        }
    }
    return out;
}

} // namespace rackplay
