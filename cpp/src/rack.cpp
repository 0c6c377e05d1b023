/**
 * @file rack.cpp
 * @brief Implementation of rack counting and the search ledger.
 */

#include "../include/rackplay/rack.hpp"
#include <stdexcept>

namespace rackplay {

namespace {

// Checks that counts - sign * usage stays within [0, limit]
void check_update(const std::vector<int>& counts, const std::vector<int>& usage,
                  const std::vector<int>& limit, int sign, const char* kind) {
    for (size_t i = 0; i < usage.size(); ++i) {
        int next = counts[i] - sign * usage[i];
        if (next < 0) {
            throw std::logic_error(std::string("RackLedger: ") + kind +
                                   " count would go negative");
        }
        if (next > limit[i]) {
            throw std::logic_error(std::string("RackLedger: ") + kind +
                                   " rollback exceeds starting count");
        }
    }
}

void update_counts(std::vector<int>& counts, const std::vector<int>& usage, int sign) {
    for (size_t i = 0; i < usage.size(); ++i) {
        counts[i] -= sign * usage[i];
    }
}

} // anonymous namespace

int TileCounts::total() const {
    int n = 0;
    for (int c : singles) n += c;
    for (int c : digraphs) n += c;
    return n;
}

TileCounts count_rack(const std::vector<std::string>& tokens, const TileTable& table) {
    TileCounts counts(table);
    for (const auto& raw : tokens) {
        std::string token = normalize_token(raw);

        int dg = table.digraph_index(token);
        if (dg >= 0) {
            counts.digraphs[dg]++;
            continue;
        }

        for (char c : token) {
            int idx = table.single_index(c);
            if (idx >= 0) counts.singles[idx]++;
        }
    }
    return counts;
}

std::vector<std::string> expand_tiles(const TileCounts& counts, const TileTable& table) {
    std::vector<std::string> tiles;
    for (size_t i = 0; i < counts.singles.size(); ++i) {
        for (int k = 0; k < counts.singles[i]; ++k) {
            tiles.push_back(table.singles()[i].token);
        }
    }
    for (size_t i = 0; i < counts.digraphs.size(); ++i) {
        for (int k = 0; k < counts.digraphs[i]; ++k) {
            tiles.push_back(table.digraphs()[i].token);
        }
    }
    return tiles;
}

RackLedger::RackLedger(const TileTable& table, const TileCounts& rack)
    : table_(table), initial_(rack), remaining_(rack) {
    // Racks built by hand may be unsized; shape them for the table
    initial_.singles.resize(table.num_singles(), 0);
    initial_.digraphs.resize(table.num_digraphs(), 0);
    remaining_ = initial_;
}

int RackLedger::remaining_value() const {
    int sum = 0;
    for (int i = 0; i < table_.num_singles(); ++i) {
        sum += table_.singles()[i].points * remaining_.singles[i];
    }
    for (int i = 0; i < table_.num_digraphs(); ++i) {
        sum += table_.digraphs()[i].points * remaining_.digraphs[i];
    }
    return sum;
}

int RackLedger::total_remaining_count() const {
    return remaining_.total();
}

std::vector<std::string> RackLedger::list_remaining_tiles() const {
    return expand_tiles(remaining_, table_);
}

std::optional<DiscardChoice> RackLedger::best_discard_candidate() const {
    std::optional<DiscardChoice> best;

    for (int i = 0; i < table_.num_singles(); ++i) {
        if (remaining_.singles[i] <= 0) continue;
        const Tile& tile = table_.singles()[i];
        if (!best || tile.points > best->points) {
            best = DiscardChoice{tile.token, tile.points};
        }
    }
    for (int i = 0; i < table_.num_digraphs(); ++i) {
        if (remaining_.digraphs[i] <= 0) continue;
        const Tile& tile = table_.digraphs()[i];
        if (!best || tile.points > best->points) {
            best = DiscardChoice{tile.token, tile.points};
        }
    }
    return best;
}

bool RackLedger::fits(const TileCounts& usage) const {
    for (size_t i = 0; i < usage.singles.size(); ++i) {
        if (usage.singles[i] > 0 &&
            (i >= remaining_.singles.size() || remaining_.singles[i] < usage.singles[i])) {
            return false;
        }
    }
    for (size_t i = 0; i < usage.digraphs.size(); ++i) {
        if (usage.digraphs[i] > 0 &&
            (i >= remaining_.digraphs.size() || remaining_.digraphs[i] < usage.digraphs[i])) {
            return false;
        }
    }
    return true;
}

void RackLedger::apply(const TileCounts& usage, LedgerDirection direction) {
    if (usage.singles.size() > remaining_.singles.size() ||
        usage.digraphs.size() > remaining_.digraphs.size()) {
        throw std::logic_error("RackLedger: usage shaped for a different tile table");
    }

    int sign = (direction == LedgerDirection::COMMIT) ? 1 : -1;

    // Validate everything first so a rejected update leaves the ledger intact
    check_update(remaining_.singles, usage.singles, initial_.singles, sign, "single");
    check_update(remaining_.digraphs, usage.digraphs, initial_.digraphs, sign, "digraph");

    update_counts(remaining_.singles, usage.singles, sign);
    update_counts(remaining_.digraphs, usage.digraphs, sign);
}

} // namespace rackplay
