#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>

struct TextScore {
    double score = 0.0;         // [-1,1]
    double confidence = 0.0;    // [0,1]
    int matched_terms = 0;
};

// Pluggable sentiment scorer for raw text events
class SentimentScorer {
public:
    virtual ~SentimentScorer() = default;
    virtual TextScore score(const std::string& text) const = 0;
};

// Lexicon scorer tuned for crypto chatter.
// Multi-word phrases are matched before single words; a negator within
// the previous two tokens flips and dampens a term.
class LexiconScorer : public SentimentScorer {
public:
    LexiconScorer();
    explicit LexiconScorer(std::map<std::string, double> extra_terms);

    TextScore score(const std::string& text) const override;

    static std::vector<std::string> tokenize(const std::string& text);

private:
    std::map<std::string, double> words_;
    std::vector<std::pair<std::vector<std::string>, double>> phrases_;

    void add_term(const std::string& term, double valence);
};

// Maps cashtags and keywords in free text to exchange symbols
class SymbolMapper {
public:
    SymbolMapper();
    explicit SymbolMapper(std::map<std::string, std::string> keywords);

    std::optional<std::string> map_text(const std::string& text) const;
    void add_keyword(const std::string& keyword, const std::string& symbol);

private:
    std::map<std::string, std::string> keywords_;   // lowercase keyword -> symbol
};
