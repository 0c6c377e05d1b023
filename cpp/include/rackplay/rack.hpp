/**
 * @file rack.hpp
 * @brief Rack tile counts and the commit/rollback ledger used during search.
 *
 * A rack is a multiset of tiles stored as two parallel count vectors, one
 * for single letters and one for digraphs, indexed by the tile's position
 * in the TileTable. The same TileCounts type doubles as a candidate word's
 * usage signature: the exact tiles the word consumes.
 *
 * RackLedger owns a private copy of the counts and is mutated during the
 * recursive searches:
 *   1. fits(usage)   - can the word still be played?
 *   2. commit(usage) - take its tiles out of the rack
 *   3. ... recurse ...
 *   4. rollback(usage) - put them back
 *
 * Counts never go negative. A commit that does not fit, or a rollback that
 * would exceed the starting counts, means the search lost track of its own
 * state and throws std::logic_error.
 */

#pragma once

#include "tile.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rackplay {

/**
 * @brief Per-tile counts split into singles and digraphs.
 *
 * singles[i] counts TileTable::singles()[i]; digraphs[j] counts
 * TileTable::digraphs()[j]. Equality and ordering compare all counts,
 * which makes TileCounts usable as a usage signature.
 */
struct TileCounts {
    std::vector<int> singles;  ///< Count per single-letter tile
    std::vector<int> digraphs; ///< Count per digraph tile

    /** @brief Default constructor: no tiles (sized lazily) */
    TileCounts() {}

    /** @brief All-zero counts shaped for a table */
    explicit TileCounts(const TileTable& table)
        : singles(table.num_singles(), 0), digraphs(table.num_digraphs(), 0) {}

    /** @brief Total number of tiles counted */
    int total() const;

    /** @brief True if no tile is counted */
    bool empty() const { return total() == 0; }

    bool operator==(const TileCounts& other) const {
        return singles == other.singles && digraphs == other.digraphs;
    }
    bool operator!=(const TileCounts& other) const { return !(*this == other); }
    bool operator<(const TileCounts& other) const {
        if (singles != other.singles) return singles < other.singles;
        return digraphs < other.digraphs;
    }
};

/**
 * @brief Count rack tokens into singles and digraphs.
 * @param tokens Normalized rack tokens (see parse_tiles())
 * @param table Tile table that identifies digraphs
 * @return Counts shaped for the table
 *
 * Registered digraphs count as one digraph tile. Any other token is
 * treated as a run of single letters; letters missing from the table
 * are skipped.
 */
TileCounts count_rack(const std::vector<std::string>& tokens, const TileTable& table);

/**
 * @brief Expand counts into a flat token list (singles first, table order).
 */
std::vector<std::string> expand_tiles(const TileCounts& counts, const TileTable& table);

/**
 * @brief Tile chosen for the end-of-round discard.
 */
struct DiscardChoice {
    std::string token; ///< Tile token
    int points;        ///< Its point value
};

/** @brief Direction of a ledger update */
enum class LedgerDirection {
    COMMIT = 0,  ///< Remove a usage from the remaining tiles
    ROLLBACK = 1 ///< Return a usage to the remaining tiles
};

/**
 * @brief Mutable view of the unused tiles during a search.
 *
 * Thread Safety: Not thread-safe. Each search pass owns its own ledger.
 */
class RackLedger {
public:
    /**
     * @brief Start a ledger from a rack.
     * @param table Tile table (must outlive the ledger)
     * @param rack Starting counts; copied
     */
    RackLedger(const TileTable& table, const TileCounts& rack);

    /** @brief Sum of point values of all unused tiles */
    int remaining_value() const;

    /** @brief Number of unused tiles */
    int total_remaining_count() const;

    /**
     * @brief Unused tiles as a flat list, singles first then digraphs,
     *        each in table order. For reporting only.
     */
    std::vector<std::string> list_remaining_tiles() const;

    /**
     * @brief Highest-value unused tile.
     * @return The tile, or std::nullopt when nothing remains
     *
     * Ties go to the first maximum in table order (singles before digraphs).
     */
    std::optional<DiscardChoice> best_discard_candidate() const;

    /** @brief True if every tile of the usage is still available */
    bool fits(const TileCounts& usage) const;

    /**
     * @brief Add or remove a usage.
     * @throws std::logic_error if a count would leave [0, starting count]
     */
    void apply(const TileCounts& usage, LedgerDirection direction);

    void commit(const TileCounts& usage) { apply(usage, LedgerDirection::COMMIT); }
    void rollback(const TileCounts& usage) { apply(usage, LedgerDirection::ROLLBACK); }

    /** @brief Current unused counts */
    const TileCounts& counts() const { return remaining_; }

    /** @brief Counts the ledger started from */
    const TileCounts& initial() const { return initial_; }

    const TileTable& table() const { return table_; }

private:
    const TileTable& table_;
    TileCounts initial_;   ///< Rack as given
    TileCounts remaining_; ///< Tiles not yet committed
};

} // namespace rackplay
