#pragma once
// SignalMapper: text becoming a number the core can feel
//
// The core only accepts numeric signals. Whatever turns words (or sensor
// readings) into that number lives here, outside the engine, and can be
// swapped without touching it.

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace spanda {

class SignalMapper {
public:
    virtual ~SignalMapper() = default;

    // Map text to a signal, nominally in [-1,1] (the engine clamps anyway)
    virtual double map(const std::string& text) = 0;
};

// SilentMapper: every utterance is neutral
class SilentMapper : public SignalMapper {
public:
    double map(const std::string&) override { return 0.0; }
};

// KeywordMapper: sentiment by keyword tables
//
// Any positive word → positive_signal; else any negative word →
// negative_signal; else neutral_signal. Matches whole words, ignoring case.
class KeywordMapper : public SignalMapper {
public:
    struct Tables {
        std::vector<std::string> positive = {"good", "great", "love", "thanks", "smart"};
        std::vector<std::string> negative = {"bad", "hate", "stupid", "ugly", "wrong"};
        double positive_signal = 1.0;
        double negative_signal = -1.0;
        double neutral_signal = 0.0;
    };

    KeywordMapper() : KeywordMapper(Tables{}) {}

    explicit KeywordMapper(Tables tables)
        : positive_signal_(tables.positive_signal)
        , negative_signal_(tables.negative_signal)
        , neutral_signal_(tables.neutral_signal)
    {
        for (const auto& w : tables.positive) positive_.insert(lower(w));
        for (const auto& w : tables.negative) negative_.insert(lower(w));
    }

    // High-intensity profile: ±1.5, and unmatched text still nudges the
    // core by +0.5 so every utterance is felt
    static KeywordMapper high_intensity() {
        Tables t;
        t.positive_signal = 1.5;
        t.negative_signal = -1.5;
        t.neutral_signal = 0.5;
        return KeywordMapper(std::move(t));
    }

    double map(const std::string& text) override {
        bool pos = false, neg = false;
        for (const auto& word : split_words(text)) {
            if (positive_.count(word)) pos = true;
            if (negative_.count(word)) neg = true;
        }
        if (pos) return positive_signal_;
        if (neg) return negative_signal_;
        return neutral_signal_;
    }

private:
    static std::string lower(const std::string& s) {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    static std::vector<std::string> split_words(const std::string& text) {
        std::vector<std::string> words;
        std::string current;
        for (unsigned char c : text) {
            if (std::isalnum(c) || c == '\'') {
                current += static_cast<char>(std::tolower(c));
            } else if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        }
        if (!current.empty()) words.push_back(std::move(current));
        return words;
    }

    std::unordered_set<std::string> positive_;
    std::unordered_set<std::string> negative_;
    double positive_signal_;
    double negative_signal_;
    double neutral_signal_;
};

// HashMapper: stable pseudo-signal from the text itself
// (djb2, so the same text maps the same way on every platform)
class HashMapper : public SignalMapper {
public:
    double map(const std::string& text) override {
        if (text.empty()) return 0.0;
        uint32_t hash = 5381;
        for (char c : text) {
            hash = ((hash << 5) + hash) + static_cast<unsigned char>(c);
        }
        return (static_cast<double>(hash % 1000) - 500.0) / 500.0;
    }
};

} // namespace spanda
