// Journal_Balancer.h : Data model, error types and the decoding stages
// (filter, normalizer, greedy rounding, external blend, alternative ranking).

#pragma once

#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// Shares are carried as integers in units of 1/scale; a normalized side always
// sums to exactly scale. The scale is kShareScale, or the total itself when the
// total is larger, so a unit of share is never coarser than a minor unit.
constexpr long long kShareScale = 1000000000LL;

long long shareScaleFor(long long total);

enum class Side { Debit, Credit };

const char* sideName(Side side);

enum class DecoderKind { Greedy, Combinatorial };

const char* decoderKindName(DecoderKind kind);

// Accepts "greedy" and "combinatorial" (case-insensitive). Returns false otherwise.
bool parseDecoderKind(const std::string& text, DecoderKind& out);

struct ScoredCandidate {
    std::string accountId;
    double probability = 0.0;
    double share = 0.0;
};

struct SideRules {
    std::set<std::string> forced;
    std::set<std::string> blocked;
};

struct ExternalPrediction {
    std::string debitAccountId;
    std::string creditAccountId;
    double weight = 0.0;
};

// A user-fixed line. Its amount is kept as given and only the rest of the
// total is decoded on that side.
struct PinnedLine {
    std::string accountId;
    long long amount = 0;
};

struct DecodeRequest {
    std::string transactionId;
    std::string description;
    long long total = 0;
    std::vector<ScoredCandidate> debitCandidates;
    std::vector<ScoredCandidate> creditCandidates;
    int predictedKDebit = 1;
    int predictedKCredit = 1;
    int maxKPerSide = 4;
    double thresholdDebit = 0.4;
    double thresholdCredit = 0.4;
    SideRules debitRules;
    SideRules creditRules;
    std::optional<ExternalPrediction> externalPrediction;
    DecoderKind decoder = DecoderKind::Greedy;
    long long minLineAmount = 1;
    std::vector<PinnedLine> pinnedDebit;
    std::vector<PinnedLine> pinnedCredit;
};

// A candidate that survived filtering. Order of a filtered list is probability
// descending, account id ascending.
struct FilteredCandidate {
    std::string accountId;
    double probability = 0.0;
    double share = 0.0;
    bool forced = false;
};

struct NormalizedShare {
    std::string accountId;
    double probability = 0.0;
    double share = 0.0;
    long long units = 0;
    bool forced = false;
};

struct DecodedLine {
    FilteredCandidate candidate;
    long long amount = 0;
};

struct Allocation {
    std::string accountId;
    Side side = Side::Debit;
    long long amount = 0;
};

struct AlternateAllocation {
    std::vector<Allocation> lines;
    double jointProbability = 0.0;
};

enum class AuditStatus { FilteredOut, Candidate, Selected, Pinned };

const char* auditStatusName(AuditStatus status);

struct CandidateAudit {
    std::string accountId;
    Side side = Side::Debit;
    double probability = 0.0;
    double share = 0.0;
    AuditStatus status = AuditStatus::FilteredOut;
};

struct DecisionDebug {
    std::vector<CandidateAudit> candidates;
    std::string decoderUsed;
    std::string fallbackReason;
    double primaryJointProbability = 0.0;
};

struct Decision {
    std::string transactionId;
    std::vector<Allocation> primary;
    std::vector<AlternateAllocation> alternates;
    DecisionDebug debug;
};

// --- Errors ---

// Base for every per-transaction failure. kind() is the stable name written to reports.
class DecodeError : public std::runtime_error {
public:
    DecodeError(const char* kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    const char* kind() const noexcept { return kind_; }

private:
    const char* kind_;
};

class EmptyCandidateError : public DecodeError {
public:
    explicit EmptyCandidateError(const std::string& message)
        : DecodeError("EmptyCandidateError", message) {}
};

class InvalidTotalError : public DecodeError {
public:
    explicit InvalidTotalError(const std::string& message)
        : DecodeError("InvalidTotalError", message) {}
};

class InfeasibleForceBlockError : public DecodeError {
public:
    explicit InfeasibleForceBlockError(const std::string& message)
        : DecodeError("InfeasibleForceBlockError", message) {}
};

// Recovered inside FlowStrategy, never surfaced to callers.
class SolverUnavailableError : public DecodeError {
public:
    explicit SolverUnavailableError(const std::string& message)
        : DecodeError("SolverUnavailableError", message) {}
};

class SolverTimeoutError : public DecodeError {
public:
    explicit SolverTimeoutError(const std::string& message)
        : DecodeError("SolverTimeoutError", message) {}
};

class BalanceInvariantError : public DecodeError {
public:
    explicit BalanceInvariantError(const std::string& message)
        : DecodeError("BalanceInvariantError", message) {}
};

// --- Stage 1: external blend ---

struct PairPrediction {
    std::string debitAccountId;
    std::string creditAccountId;
};

// Single-pair (one debit, one credit) predictor wired in by the caller.
class PairwisePredictor {
public:
    virtual ~PairwisePredictor() = default;
    virtual std::optional<PairPrediction> predict(const DecodeRequest& transaction) const = 0;
};

// Fills request.externalPrediction from the predictor when the request has none
// and weight > 0. Leaves the request untouched when the predictor has no verdict.
void attachExternalPrediction(DecodeRequest& request, const PairwisePredictor& predictor, double weight);

// p' = (1-w)p + w for the predicted account, p' = (1-w)p for the rest.
// w is clamped to [0,1]; w == 0 returns the pool unchanged, w == 1 returns only
// the predicted account.
std::vector<ScoredCandidate> blendExternalPrediction(
    const std::vector<ScoredCandidate>& candidates,
    const std::string& predictedAccount,
    double weight);

// --- Stage 2: candidate filter ---

// Throws InfeasibleForceBlockError when forced and blocked overlap (checked
// first) or forced > maxK, and EmptyCandidateError when the pool is empty or
// entirely blocked.
std::vector<FilteredCandidate> filterCandidates(
    const std::vector<ScoredCandidate>& candidates,
    double threshold,
    const SideRules& rules,
    int maxK,
    Side side);

// Top k of a filtered list, keeping every forced account (k is raised to the
// forced count when smaller). Filtered order is preserved.
std::vector<FilteredCandidate> selectTopK(const std::vector<FilteredCandidate>& filtered, int k);

// Removes the lowest-probability non-forced candidate, or the last forced one
// when only forced candidates remain. No-op on lists of size <= 1.
void dropWeakestCandidate(std::vector<FilteredCandidate>& candidates);

// --- Stage 3: share normalizer ---

std::vector<NormalizedShare> normalizeShares(
    const std::vector<FilteredCandidate>& candidates,
    long long scale = kShareScale);

// --- Stage 4: greedy rounding ---

struct ScaledTarget {
    long long whole = 0;      // floor(units * total / scale)
    long long remainder = 0;  // fractional part, in 1/scale
};

// total must not exceed scale unless scale is kShareScale.
ScaledTarget scaledTarget(long long units, long long total, long long scale = kShareScale);

// Largest-remainder split of total by integer share units summing to scale.
// Ties go to the earlier entry. Sum of the result is exactly total.
std::vector<long long> allocateLargestRemainder(
    const std::vector<long long>& units,
    long long total,
    long long scale = kShareScale);

// Decodes one side: shrinks the candidate list until every line carries at
// least max(minLine, 1), down to a single line carrying the whole total.
std::vector<DecodedLine> decodeSide(
    const std::vector<FilteredCandidate>& candidates,
    long long total,
    long long minLine);

// --- Balancing strategies ---

struct BalancedLines {
    std::vector<DecodedLine> debit;
    std::vector<DecodedLine> credit;
    std::string decoderUsed;
    std::string fallbackReason;
};

class BalanceStrategy {
public:
    virtual ~BalanceStrategy() = default;
    virtual BalancedLines balance(
        const std::vector<FilteredCandidate>& debit,
        const std::vector<FilteredCandidate>& credit,
        long long total,
        long long minLine) const = 0;
};

class GreedyStrategy : public BalanceStrategy {
public:
    BalancedLines balance(
        const std::vector<FilteredCandidate>& debit,
        const std::vector<FilteredCandidate>& credit,
        long long total,
        long long minLine) const override;
};

// --- Stage 5: alternatives ---

double jointProbability(const std::vector<DecodedLine>& debit, const std::vector<DecodedLine>& credit);

// Account-set key used to deduplicate allocations: sorted debit ids, '|', sorted credit ids.
std::string allocationKey(const std::vector<DecodedLine>& debit, const std::vector<DecodedLine>& credit);

// Enumerates (k_debit, k_credit) selections plus weakest-candidate swaps,
// decodes each greedily and returns at most limit - 1 of them ranked by joint
// probability. Allocations whose key equals primaryKey are skipped.
std::vector<AlternateAllocation> rankAlternatives(
    const std::vector<FilteredCandidate>& debit,
    const std::vector<FilteredCandidate>& credit,
    long long total,
    long long minLine,
    int maxK,
    int limit,
    const std::string& primaryKey);

// Per-side form. A side whose total is zero has no decoded lines in any
// alternate.
std::vector<AlternateAllocation> rankAlternatives(
    const std::vector<FilteredCandidate>& debit,
    const std::vector<FilteredCandidate>& credit,
    long long debitTotal,
    long long creditTotal,
    long long minLine,
    int maxKDebit,
    int maxKCredit,
    int limit,
    const std::string& primaryKey);

std::vector<Allocation> toAllocations(const std::vector<DecodedLine>& lines, Side side);
