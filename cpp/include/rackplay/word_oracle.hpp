/**
 * @file word_oracle.hpp
 * @brief External word-validity checks used to refine a best play.
 *
 * The optimizer trusts its own dictionary; an oracle is a second opinion
 * (normally an online dictionary) consulted between search passes. Three
 * layers:
 *
 *   WordOracle          - batch interface the optimizer talks to
 *   CachingWordOracle   - WordOracle over a per-word WordLookup, with a
 *                         shared result cache and coalesced lookups
 *   WordLookup          - one word, one request; HttpDictionaryLookup
 *                         queries the Free Dictionary API with libcurl
 *
 * Failure policy:
 *   - FOUND / NOT_FOUND are authoritative and cached
 *   - ERROR (timeout, network failure, unexpected HTTP status) counts as
 *     valid so a flaky connection never throws away a good play; it is
 *     not cached, so a later batch asks again
 */

#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace rackplay {

/** @brief Default per-request timeout for HTTP lookups */
constexpr long DEFAULT_LOOKUP_TIMEOUT_MS = 8000;

/** @brief Default Free Dictionary API endpoint (word is appended) */
constexpr const char* DEFAULT_DICTIONARY_API_URL = "https://api.dictionaryapi.dev/api/v2/entries/en/";

/**
 * @brief Result of checking a batch of plain words.
 */
struct OracleVerdict {
    std::set<std::string> valid_plain;   ///< Accepted words (includes optimistic fallbacks)
    std::set<std::string> invalid_plain; ///< Words definitively rejected
};

/**
 * @brief Batch word-validity interface.
 */
class WordOracle {
public:
    virtual ~WordOracle() = default;

    /**
     * @brief Check plain words.
     * @param plain_words Lowercase words; duplicates allowed
     * @return Every input word lands in exactly one of the two sets
     */
    virtual OracleVerdict check_batch(const std::vector<std::string>& plain_words) = 0;
};

/** @brief Outcome of a single lookup */
enum class LookupStatus {
    FOUND = 0,     ///< The word exists
    NOT_FOUND = 1, ///< Definitive miss
    ERROR = 2      ///< Lookup failed; no verdict
};

/**
 * @brief Result of a single lookup with a diagnostic for ERROR.
 */
struct LookupResult {
    LookupStatus status;
    std::string error_message; ///< Empty unless status == ERROR

    LookupResult() : status(LookupStatus::ERROR) {}
    LookupResult(LookupStatus s, const std::string& msg = "") : status(s), error_message(msg) {}
};

/**
 * @brief Single-word lookup backend.
 *
 * Implementations must be safe to call from several threads at once.
 */
class WordLookup {
public:
    virtual ~WordLookup() = default;
    virtual LookupResult lookup(const std::string& word) = 0;
};

/**
 * @brief Free Dictionary API lookup over libcurl.
 *
 * Status mapping:
 *   - transport failure or timeout -> ERROR
 *   - HTTP 404                     -> NOT_FOUND
 *   - other non-200                -> ERROR
 *   - 200 with a non-empty JSON array body -> FOUND, otherwise NOT_FOUND
 */
class HttpDictionaryLookup : public WordLookup {
public:
    /**
     * @param base_url URL prefix; the escaped lowercase word is appended
     * @param timeout_ms Whole-request timeout
     */
    explicit HttpDictionaryLookup(const std::string& base_url = DEFAULT_DICTIONARY_API_URL,
                                  long timeout_ms = DEFAULT_LOOKUP_TIMEOUT_MS);

    LookupResult lookup(const std::string& word) override;

    const std::string& base_url() const { return base_url_; }
    long timeout_ms() const { return timeout_ms_; }

private:
    std::string base_url_;
    long timeout_ms_;
};

/**
 * @brief WordOracle with a shared cache over a WordLookup backend.
 *
 * Words are normalized to lowercase. Concurrent requests for a word that
 * is already being looked up wait on the same pending result instead of
 * issuing a second request. Uncached words of one batch are looked up in
 * parallel.
 *
 * Thread Safety: check_batch() may be called concurrently; one instance
 * can be shared by several optimizers.
 */
class CachingWordOracle : public WordOracle {
public:
    explicit CachingWordOracle(std::shared_ptr<WordLookup> lookup);

    OracleVerdict check_batch(const std::vector<std::string>& plain_words) override;

    /** @brief Check one word (cached) */
    bool is_valid(const std::string& plain_word);

    /** @brief Number of words with a definitive cached verdict */
    size_t cached_count() const;

    /** @brief Forget all cached verdicts */
    void clear_cache();

private:
    /**
     * @brief Cached or pending verdict for a word, starting a lookup if needed.
     * @param word Normalized word
     * @param owner Set to true if the caller must run the lookup
     * @param promise Receives the promise to fulfil when owner is true
     */
    std::shared_future<bool> acquire(const std::string& word, bool& owner,
                                     std::shared_ptr<std::promise<bool>>& promise);

    /** @brief Run the backend and publish the result */
    void resolve(const std::string& word, const std::shared_ptr<std::promise<bool>>& promise);

    /** @brief Verdict for a word plus the promise that produces it */
    struct CacheEntry {
        std::shared_future<bool> verdict;
        std::shared_ptr<std::promise<bool>> source;
    };

    std::shared_ptr<WordLookup> lookup_;
    std::unordered_map<std::string, CacheEntry> cache_;
    mutable std::mutex mutex_;
};

} // namespace rackplay
