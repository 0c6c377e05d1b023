#include <gtest/gtest.h>
#include "rackplay/word_oracle.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace rackplay;

// Scripted backend that counts calls per word
class FakeLookup : public WordLookup {
public:
    std::map<std::string, LookupStatus> script;
    std::atomic<int> calls{0};
    int delay_ms = 0;

    LookupResult lookup(const std::string& word) override {
        calls++;
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        if (word == "boom") {
            throw std::runtime_error("backend exploded");
        }
        auto it = script.find(word);
        if (it == script.end()) return LookupResult(LookupStatus::NOT_FOUND);
        if (it->second == LookupStatus::ERROR) return LookupResult(LookupStatus::ERROR, "timeout");
        return LookupResult(it->second);
    }
};

// Backend whose calls block until released; the first call fails, later ones succeed
class GatedLookup : public WordLookup {
public:
    LookupResult lookup(const std::string&) override {
        std::unique_lock<std::mutex> lock(mutex_);
        int call = ++entered_;
        cv_.notify_all();
        cv_.wait(lock, [&]() { return released_ >= call; });
        if (call == 1) return LookupResult(LookupStatus::ERROR, "timeout");
        return LookupResult(LookupStatus::FOUND);
    }

    void wait_for_calls(int n) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]() { return entered_ >= n; });
    }

    void release_through(int call) {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = call;
        cv_.notify_all();
    }

    int calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entered_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int entered_ = 0;
    int released_ = 0;
};

std::shared_ptr<FakeLookup> make_fake() {
    auto fake = std::make_shared<FakeLookup>();
    fake->script["cat"] = LookupStatus::FOUND;
    fake->script["dog"] = LookupStatus::FOUND;
    fake->script["zzz"] = LookupStatus::NOT_FOUND;
    fake->script["flaky"] = LookupStatus::ERROR;
    return fake;
}

TEST(CachingWordOracleTest, SplitsValidAndInvalid) {
    auto fake = make_fake();
    CachingWordOracle oracle(fake);

    OracleVerdict verdict = oracle.check_batch({"cat", "ZZZ", "dog"});

    EXPECT_EQ(verdict.valid_plain, (std::set<std::string>{"cat", "dog"}));
    EXPECT_EQ(verdict.invalid_plain, std::set<std::string>{"zzz"});
}

TEST(CachingWordOracleTest, DefinitiveResultsAreCached) {
    auto fake = make_fake();
    CachingWordOracle oracle(fake);

    oracle.check_batch({"cat", "zzz"});
    EXPECT_EQ(fake->calls.load(), 2);
    EXPECT_EQ(oracle.cached_count(), 2u);

    oracle.check_batch({"cat", "zzz", "cat"});
    EXPECT_TRUE(oracle.is_valid("CAT"));
    EXPECT_EQ(fake->calls.load(), 2);

    oracle.clear_cache();
    EXPECT_EQ(oracle.cached_count(), 0u);
    EXPECT_FALSE(oracle.is_valid("zzz"));
    EXPECT_EQ(fake->calls.load(), 3);
}

TEST(CachingWordOracleTest, ErrorsCountAsValidAndAreRetried) {
    auto fake = make_fake();
    CachingWordOracle oracle(fake);

    OracleVerdict verdict = oracle.check_batch({"flaky", "boom"});
    EXPECT_EQ(verdict.valid_plain, (std::set<std::string>{"boom", "flaky"}));
    EXPECT_TRUE(verdict.invalid_plain.empty());
    EXPECT_EQ(oracle.cached_count(), 0u);

    oracle.check_batch({"flaky"});
    EXPECT_EQ(fake->calls.load(), 3);
}

TEST(CachingWordOracleTest, ConcurrentRequestsShareOneLookup) {
    auto fake = make_fake();
    fake->delay_ms = 50;
    CachingWordOracle oracle(fake);

    std::vector<std::thread> threads;
    std::atomic<int> valid{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (oracle.is_valid("cat")) valid++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(valid.load(), 8);
    EXPECT_EQ(fake->calls.load(), 1);
}

TEST(CachingWordOracleTest, StaleErrorKeepsNewerLookup) {
    auto gated = std::make_shared<GatedLookup>();
    CachingWordOracle oracle(gated);

    std::thread first([&]() { EXPECT_TRUE(oracle.is_valid("cat")); });
    gated->wait_for_calls(1);

    // Cleared mid-lookup, then a fresh request takes the slot
    oracle.clear_cache();
    std::thread second([&]() { EXPECT_TRUE(oracle.is_valid("cat")); });
    gated->wait_for_calls(2);

    // The first lookup fails while the second is still pending
    gated->release_through(1);
    first.join();
    gated->release_through(2);
    second.join();

    EXPECT_EQ(oracle.cached_count(), 1u);
    EXPECT_TRUE(oracle.is_valid("cat"));
    EXPECT_EQ(gated->calls(), 2);
}

TEST(CachingWordOracleTest, EmptyBatch) {
    CachingWordOracle oracle(make_fake());
    OracleVerdict verdict = oracle.check_batch({});
    EXPECT_TRUE(verdict.valid_plain.empty());
    EXPECT_TRUE(verdict.invalid_plain.empty());
}

TEST(CachingWordOracleTest, RequiresBackend) {
    EXPECT_THROW(CachingWordOracle(nullptr), std::invalid_argument);
}

TEST(HttpDictionaryLookupTest, UnreachableServerIsError) {
    // Nothing listens on port 1
    HttpDictionaryLookup lookup("http://127.0.0.1:1/", 2000);
    LookupResult result = lookup.lookup("cat");

    EXPECT_EQ(result.status, LookupStatus::ERROR);
    EXPECT_FALSE(result.error_message.empty());
}

TEST(HttpDictionaryLookupTest, Defaults) {
    HttpDictionaryLookup lookup;
    EXPECT_EQ(lookup.base_url(), DEFAULT_DICTIONARY_API_URL);
    EXPECT_EQ(lookup.timeout_ms(), DEFAULT_LOOKUP_TIMEOUT_MS);

    // Empty words never reach the network
    EXPECT_EQ(lookup.lookup("").status, LookupStatus::NOT_FOUND);
}
