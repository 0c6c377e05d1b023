#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "rackplay/dictionary.hpp"
#include "rackplay/optimizer.hpp"
#include "rackplay/word_oracle.hpp"

namespace py = pybind11;

// Trampolines so Python subclasses can stand in for the C++ interfaces
class PyLemmatizer : public rackplay::Lemmatizer {
public:
    using rackplay::Lemmatizer::Lemmatizer;

    std::optional<std::string> noun(const std::string& word) const override {
        PYBIND11_OVERRIDE(std::optional<std::string>, rackplay::Lemmatizer, noun, word);
    }
    std::optional<std::string> verb(const std::string& word) const override {
        PYBIND11_OVERRIDE(std::optional<std::string>, rackplay::Lemmatizer, verb, word);
    }
    std::optional<std::string> adjective(const std::string& word) const override {
        PYBIND11_OVERRIDE(std::optional<std::string>, rackplay::Lemmatizer, adjective, word);
    }
    std::optional<std::string> adverb(const std::string& word) const override {
        PYBIND11_OVERRIDE(std::optional<std::string>, rackplay::Lemmatizer, adverb, word);
    }
};

class PyWordOracle : public rackplay::WordOracle {
public:
    using rackplay::WordOracle::WordOracle;

    rackplay::OracleVerdict check_batch(const std::vector<std::string>& plain_words) override {
        PYBIND11_OVERRIDE_PURE(rackplay::OracleVerdict, rackplay::WordOracle, check_batch, plain_words);
    }
};

class PyWordLookup : public rackplay::WordLookup {
public:
    using rackplay::WordLookup::WordLookup;

    rackplay::LookupResult lookup(const std::string& word) override {
        PYBIND11_OVERRIDE_PURE(rackplay::LookupResult, rackplay::WordLookup, lookup, word);
    }
};

PYBIND11_MODULE(_rackplay_core, m) {
    m.doc() = "Rack-constrained word-play optimizer core module";

    // Expose constants
    m.attr("DEFAULT_MIN_WORD_LENGTH") = rackplay::DEFAULT_MIN_WORD_LENGTH;
    m.attr("DEFAULT_MAX_WORD_LENGTH") = rackplay::DEFAULT_MAX_WORD_LENGTH;
    m.attr("DEFAULT_MAX_REFINEMENT_PASSES") = rackplay::DEFAULT_MAX_REFINEMENT_PASSES;
    m.attr("DEFAULT_DICTIONARY_API_URL") = rackplay::DEFAULT_DICTIONARY_API_URL;

    // Tile and tile table
    py::class_<rackplay::Tile>(m, "Tile")
        .def(py::init<>())
        .def(py::init<const std::string&, int>(), py::arg("token"), py::arg("points"))
        .def_readwrite("token", &rackplay::Tile::token)
        .def_readwrite("points", &rackplay::Tile::points)
        .def("__repr__", [](const rackplay::Tile& t) {
            return "<Tile " + t.token + "=" + std::to_string(t.points) + ">";
        });

    py::class_<rackplay::TileTable>(m, "TileTable")
        .def(py::init<>())
        .def(py::init<const std::vector<rackplay::Tile>&>(), py::arg("tiles"))
        .def("points", &rackplay::TileTable::points, py::arg("token"))
        .def("is_digraph", &rackplay::TileTable::is_digraph, py::arg("token"))
        .def("contains", &rackplay::TileTable::contains, py::arg("token"))
        .def_property_readonly("singles", &rackplay::TileTable::singles)
        .def_property_readonly("digraphs", &rackplay::TileTable::digraphs)
        .def("__repr__", [](const rackplay::TileTable& t) {
            return "<TileTable singles=" + std::to_string(t.num_singles()) +
                   " digraphs=" + std::to_string(t.num_digraphs()) + ">";
        });

    m.def("standard_tile_table", &rackplay::standard_tile_table,
          py::return_value_policy::reference,
          "The standard 26-letter + 5-digraph point table");
    m.def("parse_tiles", &rackplay::parse_tiles, py::arg("text"),
          "Split rack text into tile tokens, e.g. '(qu)ote' -> ['qu', 'o', 't', 'e']");
    m.def("load_word_list", &rackplay::load_word_list, py::arg("path"));

    // Tile counts (usage signatures)
    py::class_<rackplay::TileCounts>(m, "TileCounts")
        .def_readonly("singles", &rackplay::TileCounts::singles)
        .def_readonly("digraphs", &rackplay::TileCounts::digraphs)
        .def("total", &rackplay::TileCounts::total);

    // Common-word gate
    py::enum_<rackplay::GateMode>(m, "GateMode")
        .value("ZIPF", rackplay::GateMode::ZIPF)
        .value("RANK", rackplay::GateMode::RANK)
        .value("EITHER", rackplay::GateMode::EITHER)
        .value("BOTH", rackplay::GateMode::BOTH)
        .export_values();

    py::class_<rackplay::GateConfig>(m, "GateConfig")
        .def(py::init<>())
        .def_readwrite("mode", &rackplay::GateConfig::mode)
        .def_readwrite("min_zipf", &rackplay::GateConfig::min_zipf)
        .def_readwrite("top_k", &rackplay::GateConfig::top_k)
        .def_readwrite("override_short_words", &rackplay::GateConfig::override_short_words);

    py::class_<rackplay::FrequencyEntry>(m, "FrequencyEntry")
        .def(py::init<>())
        .def(py::init<const std::string&, double, int>(),
             py::arg("lemma"), py::arg("zipf"), py::arg("rank"))
        .def_readwrite("lemma", &rackplay::FrequencyEntry::lemma)
        .def_readwrite("zipf", &rackplay::FrequencyEntry::zipf)
        .def_readwrite("rank", &rackplay::FrequencyEntry::rank);

    m.def("load_frequency_entries", &rackplay::load_frequency_entries, py::arg("path"));

    py::class_<rackplay::Lemmatizer, PyLemmatizer, std::shared_ptr<rackplay::Lemmatizer>>(m, "Lemmatizer")
        .def(py::init<>())
        .def("noun", &rackplay::Lemmatizer::noun, py::arg("word"))
        .def("verb", &rackplay::Lemmatizer::verb, py::arg("word"))
        .def("adjective", &rackplay::Lemmatizer::adjective, py::arg("word"))
        .def("adverb", &rackplay::Lemmatizer::adverb, py::arg("word"));

    // Options
    py::class_<rackplay::OptimizeOptions>(m, "OptimizeOptions")
        .def(py::init<>())
        .def_readwrite("tiles", &rackplay::OptimizeOptions::tiles)
        .def_readwrite("no_discard", &rackplay::OptimizeOptions::no_discard)
        .def_readwrite("common_only", &rackplay::OptimizeOptions::common_only)
        .def_readwrite("gate", &rackplay::OptimizeOptions::gate)
        .def_readwrite("current_longest", &rackplay::OptimizeOptions::current_longest)
        .def_readwrite("current_most", &rackplay::OptimizeOptions::current_most)
        .def_readwrite("longest_bonus", &rackplay::OptimizeOptions::longest_bonus)
        .def_readwrite("most_bonus", &rackplay::OptimizeOptions::most_bonus)
        .def_readwrite("min_word_length", &rackplay::OptimizeOptions::min_word_length)
        .def_readwrite("max_word_length", &rackplay::OptimizeOptions::max_word_length)
        .def_readwrite("validate_online", &rackplay::OptimizeOptions::validate_online)
        .def_readwrite("max_refinement_passes", &rackplay::OptimizeOptions::max_refinement_passes)
        .def_readwrite("require_discard_tile", &rackplay::OptimizeOptions::require_discard_tile);

    py::class_<rackplay::OptionsValidationResult>(m, "OptionsValidationResult")
        .def(py::init<>())
        .def_readonly("valid", &rackplay::OptionsValidationResult::valid)
        .def_readonly("error_message", &rackplay::OptionsValidationResult::error_message)
        .def("__repr__", [](const rackplay::OptionsValidationResult& result) {
            if (result.valid) {
                return std::string("<OptionsValidationResult valid=True>");
            } else {
                return std::string("<OptionsValidationResult valid=False error='") +
                       result.error_message + std::string("'>");
            }
        });

    // Results
    py::class_<rackplay::CandidateWord>(m, "CandidateWord")
        .def_readonly("plain", &rackplay::CandidateWord::plain)
        .def_readonly("display", &rackplay::CandidateWord::display)
        .def_readonly("tokens", &rackplay::CandidateWord::tokens)
        .def_readonly("score", &rackplay::CandidateWord::score)
        .def_readonly("length", &rackplay::CandidateWord::length)
        .def_readonly("usage", &rackplay::CandidateWord::usage)
        .def("__repr__", [](const rackplay::CandidateWord& c) {
            return "<CandidateWord " + c.display + " score=" + std::to_string(c.score) + ">";
        });

    py::class_<rackplay::ChosenWord>(m, "ChosenWord")
        .def_readonly("word", &rackplay::ChosenWord::word)
        .def_readonly("plain", &rackplay::ChosenWord::plain)
        .def_readonly("score", &rackplay::ChosenWord::score)
        .def_readonly("length", &rackplay::ChosenWord::length)
        .def("__repr__", [](const rackplay::ChosenWord& w) {
            return "<ChosenWord " + w.word + " score=" + std::to_string(w.score) + ">";
        });

    py::class_<rackplay::PlayBonus>(m, "PlayBonus")
        .def_readonly("longest", &rackplay::PlayBonus::longest)
        .def_readonly("most", &rackplay::PlayBonus::most)
        .def("total", &rackplay::PlayBonus::total);

    py::class_<rackplay::RefinementReport>(m, "RefinementReport")
        .def_readonly("passes", &rackplay::RefinementReport::passes)
        .def_readonly("rejected_words", &rackplay::RefinementReport::rejected_words)
        .def_readonly("converged", &rackplay::RefinementReport::converged);

    py::class_<rackplay::BestPlay>(m, "BestPlay")
        .def_readonly("words", &rackplay::BestPlay::words)
        .def_readonly("base_score", &rackplay::BestPlay::base_score)
        .def_readonly("leftover_penalty", &rackplay::BestPlay::leftover_penalty)
        .def_readonly("discard_tile", &rackplay::BestPlay::discard_tile)
        .def_readonly("unused_tiles", &rackplay::BestPlay::unused_tiles)
        .def_readonly("longest_word_length", &rackplay::BestPlay::longest_word_length)
        .def_readonly("word_count", &rackplay::BestPlay::word_count)
        .def_readonly("bonus", &rackplay::BestPlay::bonus)
        .def_readonly("total_score", &rackplay::BestPlay::total_score)
        .def_readonly("found", &rackplay::BestPlay::found)
        .def_readonly("refinement", &rackplay::BestPlay::refinement)
        .def("__repr__", [](const rackplay::BestPlay& play) {
            return "<BestPlay words=" + std::to_string(play.word_count) +
                   " total=" + std::to_string(play.total_score) + ">";
        });

    // Word oracle
    py::class_<rackplay::OracleVerdict>(m, "OracleVerdict")
        .def(py::init<>())
        .def_readwrite("valid_plain", &rackplay::OracleVerdict::valid_plain)
        .def_readwrite("invalid_plain", &rackplay::OracleVerdict::invalid_plain);

    py::class_<rackplay::WordOracle, PyWordOracle, std::shared_ptr<rackplay::WordOracle>>(m, "WordOracle")
        .def(py::init<>())
        .def("check_batch", &rackplay::WordOracle::check_batch, py::arg("plain_words"));

    py::enum_<rackplay::LookupStatus>(m, "LookupStatus")
        .value("FOUND", rackplay::LookupStatus::FOUND)
        .value("NOT_FOUND", rackplay::LookupStatus::NOT_FOUND)
        .value("ERROR", rackplay::LookupStatus::ERROR)
        .export_values();

    py::class_<rackplay::LookupResult>(m, "LookupResult")
        .def(py::init<>())
        .def(py::init<rackplay::LookupStatus, const std::string&>(),
             py::arg("status"), py::arg("error_message") = std::string())
        .def_readwrite("status", &rackplay::LookupResult::status)
        .def_readwrite("error_message", &rackplay::LookupResult::error_message);

    py::class_<rackplay::WordLookup, PyWordLookup, std::shared_ptr<rackplay::WordLookup>>(m, "WordLookup")
        .def(py::init<>())
        .def("lookup", &rackplay::WordLookup::lookup, py::arg("word"));

    py::class_<rackplay::HttpDictionaryLookup, rackplay::WordLookup,
               std::shared_ptr<rackplay::HttpDictionaryLookup>>(m, "HttpDictionaryLookup")
        .def(py::init<const std::string&, long>(),
             py::arg("base_url") = std::string(rackplay::DEFAULT_DICTIONARY_API_URL),
             py::arg("timeout_ms") = rackplay::DEFAULT_LOOKUP_TIMEOUT_MS);

    py::class_<rackplay::CachingWordOracle, rackplay::WordOracle,
               std::shared_ptr<rackplay::CachingWordOracle>>(m, "CachingWordOracle")
        .def(py::init<std::shared_ptr<rackplay::WordLookup>>(), py::arg("lookup"),
             py::keep_alive<1, 2>())
        .def("is_valid", &rackplay::CachingWordOracle::is_valid, py::arg("plain_word"),
             py::call_guard<py::gil_scoped_release>())
        .def("cached_count", &rackplay::CachingWordOracle::cached_count)
        .def("clear_cache", &rackplay::CachingWordOracle::clear_cache);

    // Optimizer class
    py::class_<rackplay::Optimizer>(m, "Optimizer")
        .def(py::init([](const std::vector<std::string>& words) {
                 return new rackplay::Optimizer(
                     std::make_shared<const std::vector<std::string>>(words));
             }),
             py::arg("words"))
        .def(py::init([](const rackplay::TileTable& table, const std::vector<std::string>& words) {
                 return new rackplay::Optimizer(
                     table, std::make_shared<const std::vector<std::string>>(words));
             }),
             py::arg("table"), py::arg("words"))
        .def_static("from_word_list", [](const std::string& path) {
                 return new rackplay::Optimizer(
                     std::make_shared<const std::vector<std::string>>(rackplay::load_word_list(path)));
             },
             py::arg("path"),
             "Build an optimizer from a word-list file",
             py::return_value_policy::take_ownership)
        .def("set_frequency_corpus",
             [](rackplay::Optimizer& opt, std::vector<rackplay::FrequencyEntry> entries,
                std::shared_ptr<rackplay::Lemmatizer> lemmatizer) {
                 opt.set_frequency_corpus(std::move(entries), std::move(lemmatizer));
             },
             py::arg("entries"), py::arg("lemmatizer") = nullptr,
             py::keep_alive<1, 3>())
        .def("set_word_oracle", &rackplay::Optimizer::set_word_oracle, py::arg("oracle"),
             py::keep_alive<1, 2>())
        .def("validate_options", &rackplay::Optimizer::validate_options,
             py::arg("options"),
             "Validate options before optimizing")
        .def("optimize", &rackplay::Optimizer::optimize,
             py::arg("options"),
             py::call_guard<py::gil_scoped_release>(),
             "Find the best play for a rack")
        .def("candidates", &rackplay::Optimizer::candidates,
             py::arg("options"),
             py::call_guard<py::gil_scoped_release>(),
             "Candidate words for a rack")
        .def_property_readonly("has_frequency_corpus", &rackplay::Optimizer::has_frequency_corpus)
        .def_property_readonly("has_word_oracle", &rackplay::Optimizer::has_word_oracle)
        .def("__repr__", [](const rackplay::Optimizer& opt) {
            return "<Optimizer words=" + std::to_string(opt.dictionary().size()) + ">";
        });
}
