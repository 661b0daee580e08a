// BalancerConfig.cpp : key=value configuration loader, keyword rules and
// the keyword pair predictor.
//

#include "BalancerConfig.h"
#include "CsvFields.h"

#include <fstream>
#include <istream>
#include <utility>

bool parseSideScope(const std::string& text, SideScope& out)
{
    const std::string s = toLower(trim(text));
    if (s == "debit") { out = SideScope::Debit; return true; }
    if (s == "credit") { out = SideScope::Credit; return true; }
    if (s == "both") { out = SideScope::Both; return true; }
    return false;
}

static ConfigError lineError(int lineNo, const std::string& message)
{
    return ConfigError("line " + std::to_string(lineNo) + ": " + message);
}

static double readProbability(int lineNo, const std::string& key, const std::string& value)
{
    double v = 0.0;
    if (!parseNumber(value, v) || v < 0.0 || v > 1.0) {
        throw lineError(lineNo, key + " must be a number in [0, 1], got '" + value + "'");
    }
    return v;
}

static long long readInteger(int lineNo, const std::string& key, const std::string& value,
                             long long lo, long long hi)
{
    long long v = 0;
    if (!parseInteger(value, v) || v < lo || v > hi) {
        throw lineError(lineNo, key + " must be an integer in [" + std::to_string(lo) + ", " +
            std::to_string(hi) + "], got '" + value + "'");
    }
    return v;
}

static KeywordRule readRule(int lineNo, const std::string& value)
{
    auto cols = splitCsv(value);
    if (cols.size() != 4) {
        throw lineError(lineNo, "rule needs <pattern>,<force|block>,<debit|credit|both>,<account>");
    }
    for (auto& c : cols) c = trim(c);

    KeywordRule rule;
    rule.pattern = cols[0];

    const std::string action = toLower(cols[1]);
    if (action == "force") rule.force = true;
    else if (action == "block") rule.force = false;
    else throw lineError(lineNo, "rule action must be force or block, got '" + cols[1] + "'");

    if (!parseSideScope(cols[2], rule.scope)) {
        throw lineError(lineNo, "rule side must be debit, credit or both, got '" + cols[2] + "'");
    }
    if (cols[3].empty()) throw lineError(lineNo, "rule account is empty");
    rule.accountId = cols[3];
    return rule;
}

static KeywordPair readPair(int lineNo, const std::string& value)
{
    auto cols = splitCsv(value);
    if (cols.size() != 3) {
        throw lineError(lineNo, "pair needs <keyword>,<debit account>,<credit account>");
    }
    for (auto& c : cols) c = trim(c);
    if (cols[0].empty() || cols[1].empty() || cols[2].empty()) {
        throw lineError(lineNo, "pair fields must not be empty");
    }
    return { cols[0], cols[1], cols[2] };
}

BalancerConfig loadConfig(std::istream& in)
{
    BalancerConfig config;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;

        const auto eq = s.find('=');
        if (eq == std::string::npos) throw lineError(lineNo, "expected key=value");
        const std::string key = toLower(trim(s.substr(0, eq)));
        const std::string value = trim(s.substr(eq + 1));

        if (key == "threshold_debit") {
            config.thresholdDebit = readProbability(lineNo, key, value);
        } else if (key == "threshold_credit") {
            config.thresholdCredit = readProbability(lineNo, key, value);
        } else if (key == "max_k_per_side") {
            config.maxKPerSide = static_cast<int>(readInteger(lineNo, key, value, 1, 64));
        } else if (key == "blend_external_weight") {
            config.blendExternalWeight = readProbability(lineNo, key, value);
        } else if (key == "decoder") {
            if (!parseDecoderKind(value, config.decoder)) {
                throw lineError(lineNo, "decoder must be greedy or combinatorial, got '" + value + "'");
            }
        } else if (key == "min_line_amount") {
            config.minLineAmount = readInteger(lineNo, key, value, 1, 1000000000000LL);
        } else if (key == "top_suggestions") {
            config.topSuggestions = static_cast<int>(readInteger(lineNo, key, value, 1, 100));
        } else if (key == "solver_time_budget_ms") {
            config.solverTimeBudgetMs = readInteger(lineNo, key, value, 0, 3600000);
        } else if (key == "workers") {
            config.workers = static_cast<unsigned>(readInteger(lineNo, key, value, 1, 256));
        } else if (key == "verbose") {
            config.verbose = readInteger(lineNo, key, value, 0, 1) != 0;
        } else if (key == "rule") {
            config.rules.push_back(readRule(lineNo, value));
        } else if (key == "pair") {
            config.pairs.push_back(readPair(lineNo, value));
        } else {
            throw lineError(lineNo, "unknown key '" + key + "'");
        }
    }
    return config;
}

BalancerConfig loadConfigFile(const std::string& path)
{
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open configuration file " + path);
    try {
        return loadConfig(in);
    } catch (const ConfigError& ex) {
        throw ConfigError(path + ": " + ex.what());
    }
}

DecoderSettings decoderSettings(const BalancerConfig& config)
{
    DecoderSettings settings;
    settings.topSuggestions = config.topSuggestions;
    settings.solverBudget = std::chrono::milliseconds(config.solverTimeBudgetMs);
    settings.workers = config.workers;
    return settings;
}

static bool containsIgnoreCase(const std::string& text, const std::string& needle)
{
    if (needle.empty()) return true;
    return toLower(text).find(toLower(needle)) != std::string::npos;
}

void applyKeywordRules(DecodeRequest& request, const std::vector<KeywordRule>& rules)
{
    for (const auto& rule : rules) {
        if (!containsIgnoreCase(request.description, rule.pattern)) continue;

        auto apply = [&](SideRules& side) {
            if (rule.force) side.forced.insert(rule.accountId);
            else side.blocked.insert(rule.accountId);
        };
        if (rule.scope != SideScope::Credit) apply(request.debitRules);
        if (rule.scope != SideScope::Debit) apply(request.creditRules);
    }
}

KeywordPairPredictor::KeywordPairPredictor(std::vector<KeywordPair> pairs)
    : pairs_(std::move(pairs))
{
}

std::optional<PairPrediction> KeywordPairPredictor::predict(const DecodeRequest& transaction) const
{
    for (const auto& pair : pairs_) {
        if (containsIgnoreCase(transaction.description, pair.keyword)) {
            return PairPrediction{ pair.debitAccountId, pair.creditAccountId };
        }
    }
    return std::nullopt;
}
