/**
 * @file common_gate.hpp
 * @brief Frequency-based "common word" admission filter.
 *
 * The gate is a predicate object handed to the candidate generator. It
 * admits a word when its lemma is frequent enough in a word-frequency
 * corpus, so the optimizer can restrict itself to words a casual player
 * would recognise.
 *
 * Policy:
 *   1. If override_short_words is set, words of 2-3 letters pass outright
 *      (short common words are often missing from frequency tables)
 *   2. Otherwise the word is reduced to its lemma via the Lemmatizer
 *   3. Unknown lemmas are rejected
 *   4. Known lemmas are judged by the configured GateMode:
 *        ZIPF:   zipf >= min_zipf
 *        RANK:   rank <= top_k
 *        EITHER: either test passes
 *        BOTH:   both tests pass
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rackplay {

/**
 * @brief One corpus record.
 */
struct FrequencyEntry {
    std::string lemma; ///< Base form, lowercase
    double zipf;       ///< Zipf frequency score (higher = more common)
    int rank;          ///< Frequency rank (1 = most common)

    FrequencyEntry() : zipf(0.0), rank(0) {}
    FrequencyEntry(const std::string& l, double z, int r) : lemma(l), zipf(z), rank(r) {}
};

/** @brief How a corpus record is judged */
enum class GateMode {
    ZIPF = 0,   ///< Minimum Zipf score only
    RANK = 1,   ///< Maximum rank only
    EITHER = 2, ///< Zipf or rank
    BOTH = 3    ///< Zipf and rank
};

/**
 * @brief Get human-readable name for a gate mode ("zipf", "rank", ...).
 */
const char* gate_mode_name(GateMode mode);

/**
 * @brief Parse a gate mode name.
 * @return The mode, or std::nullopt for an unknown name
 */
std::optional<GateMode> parse_gate_mode(const std::string& name);

/**
 * @brief Gate thresholds.
 */
struct GateConfig {
    GateMode mode;             ///< Acceptance rule
    double min_zipf;           ///< Zipf threshold
    int top_k;                 ///< Rank threshold
    bool override_short_words; ///< Admit all 2-3 letter words

    GateConfig() : mode(GateMode::ZIPF), min_zipf(3.8), top_k(10000), override_short_words(false) {}
};

/**
 * @brief Base-form lookup by part of speech.
 *
 * Each method returns the base form of the word for that part of speech,
 * or std::nullopt when it has none. The default implementations know no
 * base forms, so a plain Lemmatizer leaves every word unchanged.
 */
class Lemmatizer {
public:
    virtual ~Lemmatizer() = default;

    virtual std::optional<std::string> noun(const std::string& word) const;
    virtual std::optional<std::string> verb(const std::string& word) const;
    virtual std::optional<std::string> adjective(const std::string& word) const;
    virtual std::optional<std::string> adverb(const std::string& word) const;
};

/**
 * @brief Predicate admitting sufficiently common words.
 *
 * Usage:
 * @code
 *   GateConfig config;
 *   config.min_zipf = 4.0;
 *   CommonWordGate gate(entries, config);
 *   auto candidates = generate_candidates(trie, table, rack, 2, gate);
 * @endcode
 *
 * Thread Safety: immutable after construction; safe to share.
 */
class CommonWordGate {
public:
    /**
     * @param entries Corpus records; a repeated lemma keeps its last record
     * @param config Thresholds
     * @param lemmatizer Optional base-form lookup (nullptr = identity)
     */
    CommonWordGate(const std::vector<FrequencyEntry>& entries, const GateConfig& config,
                   std::shared_ptr<const Lemmatizer> lemmatizer = nullptr);

    /** @brief True if the plain word is admitted */
    bool operator()(const std::string& word) const;

    /**
     * @brief Lemma used for the corpus lookup.
     *
     * Of the word itself and the lemmatizer's noun/verb/adjective/adverb
     * forms, the shortest wins; on equal length the earlier one is kept.
     */
    std::string lemma(const std::string& word) const;

    /**
     * @brief Same corpus and lemmatizer under different thresholds.
     *
     * The corpus is shared, not copied.
     */
    CommonWordGate with_config(const GateConfig& config) const;

    const GateConfig& config() const { return config_; }

    /** @brief Number of distinct lemmas in the corpus */
    size_t corpus_size() const { return records_->size(); }

private:
    struct Record {
        double zipf;
        int rank;
    };

    std::shared_ptr<const std::unordered_map<std::string, Record>> records_;
    GateConfig config_;
    std::shared_ptr<const Lemmatizer> lemmatizer_;
};

} // namespace rackplay
