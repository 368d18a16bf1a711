#include "text_scorer.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace {

const std::map<std::string, double>& default_lexicon() {
    static const std::map<std::string, double> lexicon = {
        // general
        {"good", 1.9}, {"great", 3.1}, {"strong", 2.3}, {"gain", 2.4}, {"gains", 2.4},
        {"win", 2.8}, {"profit", 2.1}, {"love", 3.2}, {"bad", -2.5}, {"weak", -1.9},
        {"loss", -2.2}, {"losses", -2.2}, {"terrible", -2.1}, {"fear", -2.2},
        {"crash", -3.0}, {"panic", -2.7}, {"hate", -2.7},
        // crypto
        {"moon", 3.0}, {"mooning", 3.0}, {"pump", 2.5}, {"pumping", 2.5},
        {"bullish", 2.5}, {"long", 2.0}, {"buy", 2.0}, {"undervalued", 2.5},
        {"breakout", 2.5}, {"partnership", 2.8}, {"listing", 2.5}, {"upgrade", 2.0},
        {"hodl", 2.0}, {"to the moon", 3.5}, {"diamond hands", 3.5},
        {"dump", -2.5}, {"dumping", -2.5}, {"bearish", -2.5}, {"short", -2.0},
        {"sell", -2.0}, {"overvalued", -2.5}, {"scam", -3.5}, {"hack", -3.0},
        {"rug pull", -4.0}, {"bubble", -2.5}, {"correction", -2.0},
        {"paper hands", -3.0}, {"fud", -2.0},
    };
    return lexicon;
}

const std::set<std::string>& negators() {
    static const std::set<std::string> words = {
        "not", "no", "never", "isnt", "dont", "doesnt", "wont", "cant", "aint", "without"
    };
    return words;
}

constexpr double kNegationScale = -0.74;
constexpr double kNormalizationAlpha = 15.0;

} // namespace

LexiconScorer::LexiconScorer() : LexiconScorer(std::map<std::string, double>{}) {}

LexiconScorer::LexiconScorer(std::map<std::string, double> extra_terms) {
    for (const auto& [term, valence] : default_lexicon()) add_term(term, valence);
    for (const auto& [term, valence] : extra_terms) add_term(util::to_lower(term), valence);

    // Longest phrases first so "to the moon" wins over "moon"
    std::sort(phrases_.begin(), phrases_.end(), [](const auto& a, const auto& b) {
        return a.first.size() > b.first.size();
    });
}

void LexiconScorer::add_term(const std::string& term, double valence) {
    auto tokens = tokenize(term);
    if (tokens.empty()) return;
    if (tokens.size() == 1) {
        words_[tokens[0]] = valence;
        return;
    }
    auto it = std::find_if(phrases_.begin(), phrases_.end(),
                           [&tokens](const auto& p) { return p.first == tokens; });
    if (it != phrases_.end()) {
        it->second = valence;
    } else {
        phrases_.emplace_back(tokens, valence);
    }
}

std::vector<std::string> LexiconScorer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (c == '\'') {
            // fold contractions: "don't" -> "dont"
            continue;
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

TextScore LexiconScorer::score(const std::string& text) const {
    auto tokens = tokenize(text);
    std::vector<bool> consumed(tokens.size(), false);

    double sum = 0.0;
    int matched = 0;

    auto negated = [&tokens](size_t pos) {
        for (size_t back = 1; back <= 2 && back <= pos; ++back) {
            if (negators().count(tokens[pos - back])) return true;
        }
        return false;
    };

    for (const auto& [phrase, valence] : phrases_) {
        if (phrase.size() > tokens.size()) continue;
        for (size_t i = 0; i + phrase.size() <= tokens.size(); ++i) {
            bool hit = true;
            for (size_t j = 0; j < phrase.size(); ++j) {
                if (consumed[i + j] || tokens[i + j] != phrase[j]) {
                    hit = false;
                    break;
                }
            }
            if (!hit) continue;
            for (size_t j = 0; j < phrase.size(); ++j) consumed[i + j] = true;
            sum += negated(i) ? valence * kNegationScale : valence;
            ++matched;
        }
    }

    for (size_t i = 0; i < tokens.size(); ++i) {
        if (consumed[i]) continue;
        auto it = words_.find(tokens[i]);
        if (it == words_.end()) continue;
        sum += negated(i) ? it->second * kNegationScale : it->second;
        ++matched;
    }

    TextScore result;
    result.matched_terms = matched;
    if (matched == 0) return result;

    result.score = sum / std::sqrt(sum * sum + kNormalizationAlpha);
    result.score = std::clamp(result.score, -1.0, 1.0);
    result.confidence = std::fabs(result.score);
    return result;
}

SymbolMapper::SymbolMapper()
    : SymbolMapper(std::map<std::string, std::string>{
          {"bitcoin", "BTCUSDT"}, {"btc", "BTCUSDT"},
          {"ethereum", "ETHUSDT"}, {"eth", "ETHUSDT"},
          {"solana", "SOLUSDT"}, {"sol", "SOLUSDT"},
          {"ripple", "XRPUSDT"}, {"xrp", "XRPUSDT"},
          {"dogecoin", "DOGEUSDT"}, {"doge", "DOGEUSDT"},
      }) {}

SymbolMapper::SymbolMapper(std::map<std::string, std::string> keywords) {
    for (const auto& [kw, sym] : keywords) add_keyword(kw, sym);
}

void SymbolMapper::add_keyword(const std::string& keyword, const std::string& symbol) {
    keywords_[util::to_lower(keyword)] = symbol;
}

std::optional<std::string> SymbolMapper::map_text(const std::string& text) const {
    // Cashtags take priority: "$SOL" -> SOLUSDT
    std::string lower = util::to_lower(text);
    for (size_t pos = lower.find('$'); pos != std::string::npos; pos = lower.find('$', pos + 1)) {
        size_t end = pos + 1;
        while (end < lower.size() && std::isalnum(static_cast<unsigned char>(lower[end]))) ++end;
        auto it = keywords_.find(lower.substr(pos + 1, end - pos - 1));
        if (it != keywords_.end()) return it->second;
    }

    // Then whole-word keywords, longest first
    auto tokens = LexiconScorer::tokenize(text);
    std::optional<std::string> best;
    size_t best_len = 0;
    for (const auto& tok : tokens) {
        auto it = keywords_.find(tok);
        if (it != keywords_.end() && tok.size() > best_len) {
            best = it->second;
            best_len = tok.size();
        }
    }
    return best;
}
