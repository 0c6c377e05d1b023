/**
 * @file word_oracle.cpp
 * @brief Implementation of the HTTP dictionary lookup and the caching oracle.
 *
 * HTTP lookups use the libcurl easy interface, one handle per request, so
 * concurrent lookups never share a handle. curl_global_init() runs once
 * per process before the first handle is created.
 */

#include "../include/rackplay/word_oracle.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace rackplay {

namespace {

std::once_flag curl_init_flag;

void ensure_curl_initialized() {
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

// Append the incoming chunk to the std::string passed as userdata
size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// The API answers a hit with a JSON array of entries: "[{...}, ...]"
bool is_non_empty_json_array(const std::string& body) {
    size_t i = 0;
    while (i < body.size() && std::isspace(static_cast<unsigned char>(body[i]))) ++i;
    if (i >= body.size() || body[i] != '[') return false;
    ++i;
    while (i < body.size() && std::isspace(static_cast<unsigned char>(body[i]))) ++i;
    return i < body.size() && body[i] != ']';
}

} // anonymous namespace

// ============================================================================
// HttpDictionaryLookup
// ============================================================================

HttpDictionaryLookup::HttpDictionaryLookup(const std::string& base_url, long timeout_ms)
    : base_url_(base_url), timeout_ms_(timeout_ms) {
    ensure_curl_initialized();
}

LookupResult HttpDictionaryLookup::lookup(const std::string& word) {
    std::string w = to_lower(word);
    if (w.empty()) {
        return LookupResult(LookupStatus::NOT_FOUND);
    }

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return LookupResult(LookupStatus::ERROR, "curl_easy_init failed");
    }

    char* escaped = curl_easy_escape(curl.get(), w.c_str(), static_cast<int>(w.size()));
    if (!escaped) {
        return LookupResult(LookupStatus::ERROR, "curl_easy_escape failed");
    }
    std::string url = base_url_ + escaped;
    curl_free(escaped);

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, static_cast<void*>(&body));
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    // Required for timeouts in multi-threaded programs
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "rackplay/0.1");

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return LookupResult(LookupStatus::ERROR, curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code == 404) {
        return LookupResult(LookupStatus::NOT_FOUND);
    }
    if (http_code != 200) {
        return LookupResult(LookupStatus::ERROR, "HTTP status " + std::to_string(http_code));
    }

    return LookupResult(is_non_empty_json_array(body) ? LookupStatus::FOUND : LookupStatus::NOT_FOUND);
}

// ============================================================================
// CachingWordOracle
// ============================================================================

CachingWordOracle::CachingWordOracle(std::shared_ptr<WordLookup> lookup)
    : lookup_(std::move(lookup)) {
    if (!lookup_) {
        throw std::invalid_argument("CachingWordOracle requires a lookup backend");
    }
}

std::shared_future<bool> CachingWordOracle::acquire(const std::string& word, bool& owner,
                                                    std::shared_ptr<std::promise<bool>>& promise) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(word);
    if (it != cache_.end()) {
        owner = false;
        return it->second.verdict;
    }

    promise = std::make_shared<std::promise<bool>>();
    std::shared_future<bool> future = promise->get_future().share();
    cache_[word] = CacheEntry{future, promise};
    owner = true;
    return future;
}

void CachingWordOracle::resolve(const std::string& word,
                                const std::shared_ptr<std::promise<bool>>& promise) {
    LookupResult result;
    try {
        result = lookup_->lookup(word);
    } catch (const std::exception& e) {
        result = LookupResult(LookupStatus::ERROR, e.what());
    }

    if (result.status == LookupStatus::ERROR) {
        // Not authoritative: let the next caller ask again. After a
        // clear_cache() the slot may hold a newer lookup; leave that one.
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(word);
        if (it != cache_.end() && it->second.source == promise) {
            cache_.erase(it);
        }
    }

    promise->set_value(result.status != LookupStatus::NOT_FOUND);
}

bool CachingWordOracle::is_valid(const std::string& plain_word) {
    std::string word = to_lower(plain_word);
    if (word.empty()) return false;

    bool owner = false;
    std::shared_ptr<std::promise<bool>> promise;
    std::shared_future<bool> future = acquire(word, owner, promise);
    if (owner) {
        resolve(word, promise);
    }
    return future.get();
}

OracleVerdict CachingWordOracle::check_batch(const std::vector<std::string>& plain_words) {
    std::set<std::string> words;
    for (const auto& w : plain_words) {
        words.insert(to_lower(w));
    }

    std::vector<std::pair<std::string, std::shared_future<bool>>> pending;
    std::vector<std::future<void>> lookups;

    for (const auto& word : words) {
        if (word.empty()) continue;

        bool owner = false;
        std::shared_ptr<std::promise<bool>> promise;
        std::shared_future<bool> future = acquire(word, owner, promise);
        if (owner) {
            lookups.push_back(std::async(std::launch::async, [this, word, promise]() {
                resolve(word, promise);
            }));
        }
        pending.emplace_back(word, future);
    }

    for (auto& f : lookups) {
        f.get();
    }

    OracleVerdict verdict;
    for (const auto& w : plain_words) {
        if (to_lower(w).empty()) verdict.invalid_plain.insert(w);
    }
    for (auto& entry : pending) {
        if (entry.second.get()) {
            verdict.valid_plain.insert(entry.first);
        } else {
            verdict.invalid_plain.insert(entry.first);
        }
    }
    return verdict;
}

size_t CachingWordOracle::cached_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& entry : cache_) {
        if (entry.second.verdict.wait_for(std::chrono::seconds(0)) == std::future_status::ready) n++;
    }
    return n;
}

void CachingWordOracle::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

} // namespace rackplay
