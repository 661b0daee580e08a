// BalancerConfig.h : Run configuration (key=value file), keyword force/block
// rules and the keyword pair predictor.

#pragma once

#include "Journal_Balancer.h"
#include "TransactionDecoder.h"

#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

enum class SideScope { Debit, Credit, Both };

// Accepts "debit", "credit" and "both" (case-insensitive).
bool parseSideScope(const std::string& text, SideScope& out);

// rule=<pattern>,<force|block>,<debit|credit|both>,<account>
// Matches when pattern is a case-insensitive substring of the description.
// An empty pattern matches every transaction.
struct KeywordRule {
    std::string pattern;
    bool force = true;
    SideScope scope = SideScope::Both;
    std::string accountId;
};

// pair=<keyword>,<debit account>,<credit account>
struct KeywordPair {
    std::string keyword;
    std::string debitAccountId;
    std::string creditAccountId;
};

struct BalancerConfig {
    double thresholdDebit = 0.4;
    double thresholdCredit = 0.4;
    int maxKPerSide = 4;
    double blendExternalWeight = 0.0;
    DecoderKind decoder = DecoderKind::Greedy;
    long long minLineAmount = 1;
    int topSuggestions = 3;
    long long solverTimeBudgetMs = 250;
    unsigned workers = 1;
    bool verbose = false;
    std::vector<KeywordRule> rules;
    std::vector<KeywordPair> pairs;
};

// Malformed configuration. The message starts with "line <n>: " when it
// refers to a line of the file.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

BalancerConfig loadConfig(std::istream& in);
BalancerConfig loadConfigFile(const std::string& path);

DecoderSettings decoderSettings(const BalancerConfig& config);

// Unions the force/block sets of every rule matching request.description
// into the request's side rules. Conflicts are left for the decoder to reject.
void applyKeywordRules(DecodeRequest& request, const std::vector<KeywordRule>& rules);

// First pair whose keyword is a case-insensitive substring of the description.
class KeywordPairPredictor : public PairwisePredictor {
public:
    explicit KeywordPairPredictor(std::vector<KeywordPair> pairs);
    std::optional<PairPrediction> predict(const DecodeRequest& transaction) const override;

private:
    std::vector<KeywordPair> pairs_;
};
