// TransactionDecoder.cpp : Runs one transaction through blend, filter,
// balance and ranking, and fans a batch out over worker threads.
//

#include "TransactionDecoder.h"

#include <algorithm>
#include <set>
#include <thread>
#include <utility>

TransactionDecoder::TransactionDecoder(const DecoderSettings& settings,
                                       std::shared_ptr<const MinCostFlowSolver> solver)
    : settings_(settings), flow_(std::move(solver), settings.solverBudget)
{
}

// One side after its pinned lines are taken out: the pinned allocations, the
// amount still to decode, and the rules and line budget for decoding it.
struct SidePlan {
    std::vector<Allocation> pinned;
    long long remainder = 0;
    SideRules rules;
    int maxK = 1;
};

static SidePlan planSide(
    const std::vector<PinnedLine>& pins,
    const SideRules& rules,
    long long total,
    int maxK,
    Side side)
{
    const std::string label = sideName(side);
    SidePlan plan;
    plan.rules = rules;

    long long pinnedSum = 0;
    for (const auto& pin : pins) {
        if (pin.amount < 1) {
            throw InvalidTotalError("pinned " + label + " line " + pin.accountId +
                " must carry a positive amount, got " + std::to_string(pin.amount));
        }
        if (rules.blocked.count(pin.accountId)) {
            throw InfeasibleForceBlockError(pin.accountId + " is both pinned and blocked on the " + label + " side");
        }
        if (pin.amount > total - pinnedSum) {
            throw InvalidTotalError("pinned " + label + " lines exceed total " + std::to_string(total));
        }
        pinnedSum += pin.amount;

        auto it = std::find_if(plan.pinned.begin(), plan.pinned.end(),
            [&](const Allocation& a) { return a.accountId == pin.accountId; });
        if (it == plan.pinned.end()) plan.pinned.push_back({ pin.accountId, side, pin.amount });
        else it->amount += pin.amount;
    }

    const int pinnedCount = static_cast<int>(plan.pinned.size());
    if (pinnedCount > maxK) {
        throw InfeasibleForceBlockError(std::to_string(pinnedCount) + " pinned " + label +
            " accounts exceed max_k_per_side=" + std::to_string(maxK));
    }

    plan.remainder = total - pinnedSum;
    plan.maxK = maxK - pinnedCount;

    // A pinned account is never decoded a second time on its side
    for (const auto& a : plan.pinned) {
        plan.rules.forced.erase(a.accountId);
        plan.rules.blocked.insert(a.accountId);
    }

    if (plan.remainder > 0 && plan.maxK < 1) {
        throw InfeasibleForceBlockError(std::to_string(pinnedCount) + " pinned " + label +
            " lines leave no line for the remaining " + std::to_string(plan.remainder));
    }
    if (plan.remainder == 0 && !plan.rules.forced.empty()) {
        throw InfeasibleForceBlockError("forced " + label + " account " + *plan.rules.forced.begin() +
            " has no room, pinned lines cover the total");
    }
    return plan;
}

// A prediction naming an account blocked on the side leaves that side's pool as it is.
static std::vector<ScoredCandidate> blendSide(
    const std::vector<ScoredCandidate>& candidates,
    const std::string& predictedAccount,
    double weight,
    const SideRules& rules)
{
    if (rules.blocked.count(predictedAccount)) return candidates;
    return blendExternalPrediction(candidates, predictedAccount, weight);
}

// Sides with the same remainder are balanced together. Otherwise each side is
// balanced alone (against a copy of itself) and a fully pinned side gets no lines.
static BalancedLines balanceRemainders(
    const BalanceStrategy& strategy,
    const std::vector<FilteredCandidate>& debit,
    const std::vector<FilteredCandidate>& credit,
    long long debitRemainder,
    long long creditRemainder,
    long long minLine)
{
    if (debitRemainder > 0 && debitRemainder == creditRemainder) {
        return strategy.balance(debit, credit, debitRemainder, minLine);
    }

    BalancedLines out;
    out.decoderUsed = "pinned";
    auto note = [&out](const BalancedLines& part) {
        if (!part.fallbackReason.empty()) {
            out.decoderUsed = part.decoderUsed;
            out.fallbackReason = part.fallbackReason;
        } else if (out.fallbackReason.empty()) {
            out.decoderUsed = part.decoderUsed;
        }
    };
    if (debitRemainder > 0) {
        BalancedLines part = strategy.balance(debit, debit, debitRemainder, minLine);
        out.debit = std::move(part.debit);
        note(part);
    }
    if (creditRemainder > 0) {
        BalancedLines part = strategy.balance(credit, credit, creditRemainder, minLine);
        out.credit = std::move(part.credit);
        note(part);
    }
    return out;
}

static void appendSide(std::vector<Allocation>& out, const SidePlan& plan, const std::vector<Allocation>& decoded)
{
    out.insert(out.end(), plan.pinned.begin(), plan.pinned.end());
    out.insert(out.end(), decoded.begin(), decoded.end());
}

static void auditSide(
    std::vector<CandidateAudit>& out,
    const std::vector<ScoredCandidate>& pool,
    const std::vector<FilteredCandidate>& filtered,
    const std::vector<DecodedLine>& lines,
    const SidePlan& plan,
    Side side)
{
    std::set<std::string> selected;
    for (const auto& line : lines) selected.insert(line.candidate.accountId);

    std::set<std::string> listed;
    for (const auto& p : plan.pinned) {
        CandidateAudit a;
        a.accountId = p.accountId;
        a.side = side;
        a.probability = 1.0;
        a.status = AuditStatus::Pinned;
        out.push_back(a);
        listed.insert(p.accountId);
    }

    for (const auto& s : normalizeShares(filtered)) {
        CandidateAudit a;
        a.accountId = s.accountId;
        a.side = side;
        a.probability = s.probability;
        a.share = s.share;
        a.status = selected.count(s.accountId) ? AuditStatus::Selected : AuditStatus::Candidate;
        out.push_back(a);
        listed.insert(s.accountId);
    }

    for (const auto& c : pool) {
        if (!listed.insert(c.accountId).second) continue;
        CandidateAudit a;
        a.accountId = c.accountId;
        a.side = side;
        a.probability = c.probability;
        a.status = AuditStatus::FilteredOut;
        out.push_back(a);
    }
}

static std::set<std::string> pinnedAccounts(const std::vector<PinnedLine>& pins)
{
    std::set<std::string> accounts;
    for (const auto& pin : pins) accounts.insert(pin.accountId);
    return accounts;
}

void validateDecision(const DecodeRequest& request, const Decision& decision)
{
    long long debitSum = 0;
    long long creditSum = 0;
    int debitLines = 0;
    int creditLines = 0;

    for (const auto& a : decision.primary) {
        if (a.amount < 1) {
            throw BalanceInvariantError(a.accountId + " carries non-positive amount " + std::to_string(a.amount));
        }
        if (a.side == Side::Debit) { debitSum += a.amount; ++debitLines; }
        else { creditSum += a.amount; ++creditLines; }
    }

    if (debitSum != request.total || creditSum != request.total) {
        throw BalanceInvariantError("debits " + std::to_string(debitSum) + " and credits " +
            std::to_string(creditSum) + " do not both equal total " + std::to_string(request.total));
    }

    const int maxK = std::max(1, request.maxKPerSide);
    if (debitLines < 1 || debitLines > maxK || creditLines < 1 || creditLines > maxK) {
        throw BalanceInvariantError("line counts " + std::to_string(debitLines) + "/" +
            std::to_string(creditLines) + " outside [1, " + std::to_string(maxK) + "]");
    }

    // Pinned lines keep their amounts. A decoded line may carry less than the
    // minimum only when it is the one decoded line of its side.
    const std::set<std::string> pinnedDebit = pinnedAccounts(request.pinnedDebit);
    const std::set<std::string> pinnedCredit = pinnedAccounts(request.pinnedCredit);
    int decodedDebit = 0;
    int decodedCredit = 0;
    for (const auto& a : decision.primary) {
        if (a.side == Side::Debit && !pinnedDebit.count(a.accountId)) ++decodedDebit;
        if (a.side == Side::Credit && !pinnedCredit.count(a.accountId)) ++decodedCredit;
    }

    const long long floorAmount = std::max(request.minLineAmount, 1LL);
    for (const auto& a : decision.primary) {
        const bool pinned = a.side == Side::Debit ? pinnedDebit.count(a.accountId) != 0
                                                  : pinnedCredit.count(a.accountId) != 0;
        const int decoded = a.side == Side::Debit ? decodedDebit : decodedCredit;
        if (!pinned && decoded > 1 && a.amount < floorAmount) {
            throw BalanceInvariantError(a.accountId + " carries " + std::to_string(a.amount) +
                ", below the line minimum " + std::to_string(floorAmount));
        }
    }
}

Decision TransactionDecoder::decode(const DecodeRequest& request) const
{
    if (request.total <= 0) {
        throw InvalidTotalError("total must be a positive number of minor units, got " +
            std::to_string(request.total));
    }

    const int maxK = std::max(1, request.maxKPerSide);

    // Step 0: pinned lines, the rest of each side is decoded
    const SidePlan debitPlan = planSide(request.pinnedDebit, request.debitRules, request.total, maxK, Side::Debit);
    const SidePlan creditPlan = planSide(request.pinnedCredit, request.creditRules, request.total, maxK, Side::Credit);

    // Step 1: external blend
    std::vector<ScoredCandidate> debitPool = request.debitCandidates;
    std::vector<ScoredCandidate> creditPool = request.creditCandidates;
    if (request.externalPrediction) {
        const ExternalPrediction& ext = *request.externalPrediction;
        debitPool = blendSide(request.debitCandidates, ext.debitAccountId, ext.weight, debitPlan.rules);
        creditPool = blendSide(request.creditCandidates, ext.creditAccountId, ext.weight, creditPlan.rules);
    }

    // Step 2: filter
    std::vector<FilteredCandidate> debitFiltered;
    std::vector<FilteredCandidate> creditFiltered;
    if (debitPlan.remainder > 0) {
        debitFiltered = filterCandidates(debitPool, request.thresholdDebit, debitPlan.rules, debitPlan.maxK, Side::Debit);
    }
    if (creditPlan.remainder > 0) {
        creditFiltered = filterCandidates(creditPool, request.thresholdCredit, creditPlan.rules, creditPlan.maxK, Side::Credit);
    }

    // Step 3: primary selection at the predicted line counts
    std::vector<FilteredCandidate> debitSelection;
    std::vector<FilteredCandidate> creditSelection;
    if (debitPlan.remainder > 0) {
        debitSelection = selectTopK(debitFiltered, std::min(std::max(request.predictedKDebit, 1), debitPlan.maxK));
    }
    if (creditPlan.remainder > 0) {
        creditSelection = selectTopK(creditFiltered, std::min(std::max(request.predictedKCredit, 1), creditPlan.maxK));
    }

    // Step 4: balance
    const BalanceStrategy& strategy = request.decoder == DecoderKind::Combinatorial
        ? static_cast<const BalanceStrategy&>(flow_)
        : static_cast<const BalanceStrategy&>(greedy_);
    const BalancedLines lines = balanceRemainders(strategy, debitSelection, creditSelection,
        debitPlan.remainder, creditPlan.remainder, request.minLineAmount);

    Decision decision;
    decision.transactionId = request.transactionId;
    appendSide(decision.primary, debitPlan, toAllocations(lines.debit, Side::Debit));
    appendSide(decision.primary, creditPlan, toAllocations(lines.credit, Side::Credit));

    // Step 5: alternatives from the same filtered pools, pinned lines kept as they are
    const auto ranked = rankAlternatives(debitFiltered, creditFiltered,
        debitPlan.remainder, creditPlan.remainder, request.minLineAmount,
        std::max(1, debitPlan.maxK), std::max(1, creditPlan.maxK),
        settings_.topSuggestions, allocationKey(lines.debit, lines.credit));
    for (const auto& alt : ranked) {
        std::vector<Allocation> debits;
        std::vector<Allocation> credits;
        for (const auto& a : alt.lines) (a.side == Side::Debit ? debits : credits).push_back(a);

        AlternateAllocation merged;
        merged.jointProbability = alt.jointProbability;
        appendSide(merged.lines, debitPlan, debits);
        appendSide(merged.lines, creditPlan, credits);
        decision.alternates.push_back(std::move(merged));
    }

    decision.debug.decoderUsed = lines.decoderUsed;
    decision.debug.fallbackReason = lines.fallbackReason;
    decision.debug.primaryJointProbability = jointProbability(lines.debit, lines.credit);
    auditSide(decision.debug.candidates, debitPool, debitFiltered, lines.debit, debitPlan, Side::Debit);
    auditSide(decision.debug.candidates, creditPool, creditFiltered, lines.credit, creditPlan, Side::Credit);

    validateDecision(request, decision);
    return decision;
}

DecodeOutcome TransactionDecoder::decodeOne(const DecodeRequest& request) const
{
    DecodeOutcome outcome;
    outcome.transactionId = request.transactionId;
    try {
        outcome.decision = decode(request);
        outcome.ok = true;
    } catch (const DecodeError& ex) {
        outcome.errorKind = ex.kind();
        outcome.errorMessage = ex.what();
    } catch (const std::exception& ex) {
        outcome.errorKind = "InternalError";
        outcome.errorMessage = ex.what();
    }
    return outcome;
}

std::vector<DecodeOutcome> TransactionDecoder::decodeBatch(const std::vector<DecodeRequest>& requests) const
{
    const size_t n = requests.size();
    std::vector<DecodeOutcome> outcomes(n);

    const size_t workers = std::max<size_t>(1, std::min<size_t>(settings_.workers, n));
    if (workers == 1) {
        for (size_t i = 0; i < n; ++i) outcomes[i] = decodeOne(requests[i]);
        return outcomes;
    }

    // Each worker owns a fixed stride of slots; no slot is written twice.
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        pool.emplace_back([this, &requests, &outcomes, w, workers, n]() {
            for (size_t i = w; i < n; i += workers) outcomes[i] = decodeOne(requests[i]);
        });
    }
    for (auto& t : pool) t.join();
    return outcomes;
}
