/**
 * @file common_gate.cpp
 * @brief Implementation of the frequency-based common-word gate.
 */

#include "../include/rackplay/common_gate.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace rackplay {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // anonymous namespace

const char* gate_mode_name(GateMode mode) {
    static const char* names[] = {"zipf", "rank", "either", "both"};
    return names[static_cast<int>(mode)];
}

std::optional<GateMode> parse_gate_mode(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "zipf") return GateMode::ZIPF;
    if (lower == "rank") return GateMode::RANK;
    if (lower == "either") return GateMode::EITHER;
    if (lower == "both") return GateMode::BOTH;
    return std::nullopt;
}

std::optional<std::string> Lemmatizer::noun(const std::string&) const { return std::nullopt; }
std::optional<std::string> Lemmatizer::verb(const std::string&) const { return std::nullopt; }
std::optional<std::string> Lemmatizer::adjective(const std::string&) const { return std::nullopt; }
std::optional<std::string> Lemmatizer::adverb(const std::string&) const { return std::nullopt; }

CommonWordGate::CommonWordGate(const std::vector<FrequencyEntry>& entries, const GateConfig& config,
                               std::shared_ptr<const Lemmatizer> lemmatizer)
    : config_(config), lemmatizer_(std::move(lemmatizer)) {
    auto records = std::make_shared<std::unordered_map<std::string, Record>>();
    records->reserve(entries.size());
    for (const auto& e : entries) {
        (*records)[to_lower(e.lemma)] = Record{e.zipf, e.rank};
    }
    records_ = records;
}

CommonWordGate CommonWordGate::with_config(const GateConfig& config) const {
    CommonWordGate gate(*this);
    gate.config_ = config;
    return gate;
}

std::string CommonWordGate::lemma(const std::string& word) const {
    std::string best = to_lower(word);
    if (!lemmatizer_) return best;

    std::string lower = best;
    const std::optional<std::string> forms[] = {
        lemmatizer_->noun(lower),
        lemmatizer_->verb(lower),
        lemmatizer_->adjective(lower),
        lemmatizer_->adverb(lower)
    };
    for (const auto& form : forms) {
        if (form && !form->empty() && form->size() < best.size()) {
            best = to_lower(*form);
        }
    }
    return best;
}

bool CommonWordGate::operator()(const std::string& word) const {
    if (config_.override_short_words && word.size() >= 2 && word.size() <= 3) {
        return true;
    }

    auto it = records_->find(lemma(word));
    if (it == records_->end()) return false;

    const Record& rec = it->second;
    bool zipf_ok = rec.zipf >= config_.min_zipf;
    bool rank_ok = rec.rank <= config_.top_k;

    switch (config_.mode) {
        case GateMode::ZIPF:   return zipf_ok;
        case GateMode::RANK:   return rank_ok;
        case GateMode::EITHER: return zipf_ok || rank_ok;
        case GateMode::BOTH:   return zipf_ok && rank_ok;
    }
    return false;
}

} // namespace rackplay
