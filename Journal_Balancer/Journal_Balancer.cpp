// Journal_Balancer.cpp : Candidate filtering, share normalization, greedy
// largest-remainder rounding, external blending and alternative ranking.
//

#include "Journal_Balancer.h"
#include "CsvFields.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <numeric>

const char* sideName(Side side)
{
    return side == Side::Debit ? "Debit" : "Credit";
}

const char* decoderKindName(DecoderKind kind)
{
    return kind == DecoderKind::Combinatorial ? "combinatorial" : "greedy";
}

bool parseDecoderKind(const std::string& text, DecoderKind& out)
{
    const std::string lower = toLower(text);
    if (lower == "greedy") { out = DecoderKind::Greedy; return true; }
    if (lower == "combinatorial") { out = DecoderKind::Combinatorial; return true; }
    return false;
}

const char* auditStatusName(AuditStatus status)
{
    switch (status) {
    case AuditStatus::Selected: return "selected";
    case AuditStatus::Candidate: return "candidate";
    case AuditStatus::Pinned: return "pinned";
    default: return "filtered_out";
    }
}

// Filtered order: probability descending, account id ascending
static bool strongerCandidate(const FilteredCandidate& a, const FilteredCandidate& b)
{
    if (a.probability != b.probability) return a.probability > b.probability;
    return a.accountId < b.accountId;
}

static bool hasShareEstimate(double share)
{
    return std::isfinite(share) && share > 0.0;
}

// --- External blend ---

void attachExternalPrediction(DecodeRequest& request, const PairwisePredictor& predictor, double weight)
{
    if (request.externalPrediction || weight <= 0.0) return;

    auto verdict = predictor.predict(request);
    if (!verdict) return;

    ExternalPrediction prediction;
    prediction.debitAccountId = verdict->debitAccountId;
    prediction.creditAccountId = verdict->creditAccountId;
    prediction.weight = weight;
    request.externalPrediction = prediction;
}

std::vector<ScoredCandidate> blendExternalPrediction(
    const std::vector<ScoredCandidate>& candidates,
    const std::string& predictedAccount,
    double weight)
{
    const double w = std::min(1.0, std::max(0.0, weight));
    if (w <= 0.0 || predictedAccount.empty()) return candidates;

    if (w >= 1.0) {
        ScoredCandidate only;
        only.accountId = predictedAccount;
        only.probability = 1.0;
        only.share = 1.0;
        return { only };
    }

    std::vector<ScoredCandidate> blended;
    blended.reserve(candidates.size() + 1);
    bool found = false;
    double shareSum = 0.0;
    for (const auto& c : candidates) {
        ScoredCandidate b = c;
        if (c.accountId == predictedAccount) {
            b.probability = (1.0 - w) * c.probability + w;
            found = true;
        } else {
            b.probability = (1.0 - w) * c.probability;
        }
        if (hasShareEstimate(c.share)) shareSum += c.share;
        blended.push_back(b);
    }

    if (!found) {
        ScoredCandidate added;
        added.accountId = predictedAccount;
        added.probability = w;
        added.share = shareSum > 0.0 ? w * shareSum : w;
        blended.push_back(added);
    }
    return blended;
}

// --- Candidate filter ---

// Forced accounts without a share estimate borrow the mean share of the side
static void lendSharesToForced(std::vector<FilteredCandidate>& kept)
{
    double sum = 0.0;
    int counted = 0;
    for (const auto& c : kept) {
        if (hasShareEstimate(c.share)) { sum += c.share; ++counted; }
    }
    if (counted == 0) return;

    const double mean = sum / static_cast<double>(counted);
    for (auto& c : kept) {
        if (c.forced && !hasShareEstimate(c.share)) c.share = mean;
    }
}

std::vector<FilteredCandidate> filterCandidates(
    const std::vector<ScoredCandidate>& candidates,
    double threshold,
    const SideRules& rules,
    int maxK,
    Side side)
{
    const std::string label = sideName(side);
    for (const auto& account : rules.forced) {
        if (rules.blocked.count(account)) {
            throw InfeasibleForceBlockError(account + " is both forced and blocked on the " + label + " side");
        }
    }
    if (candidates.empty()) {
        throw EmptyCandidateError("no scored " + label + " candidates");
    }
    if (maxK < 1) maxK = 1;

    // Collapse duplicate ids, keeping the most probable entry
    std::map<std::string, ScoredCandidate> unique;
    for (const auto& c : candidates) {
        ScoredCandidate clean = c;
        if (!std::isfinite(clean.probability)) clean.probability = 0.0;
        auto it = unique.find(clean.accountId);
        if (it == unique.end()) {
            unique.emplace(clean.accountId, clean);
        } else if (clean.probability > it->second.probability) {
            it->second = clean;
        }
    }

    std::vector<FilteredCandidate> kept;
    kept.reserve(unique.size() + rules.forced.size());
    for (const auto& [account, c] : unique) {
        if (rules.blocked.count(account)) continue;
        const bool forced = rules.forced.count(account) != 0;
        if (forced || c.probability >= threshold) {
            kept.push_back({ account, c.probability, c.share, forced });
        }
    }
    for (const auto& account : rules.forced) {
        if (unique.count(account) == 0) kept.push_back({ account, 1.0, 0.0, true });
    }
    std::sort(kept.begin(), kept.end(), strongerCandidate);

    const auto forcedCount = std::count_if(kept.begin(), kept.end(),
        [](const FilteredCandidate& c) { return c.forced; });
    if (forcedCount > maxK) {
        throw InfeasibleForceBlockError(std::to_string(forcedCount) + " forced " + label +
            " accounts exceed max_k_per_side=" + std::to_string(maxK));
    }

    while (kept.size() > static_cast<size_t>(maxK)) dropWeakestCandidate(kept);

    if (kept.empty()) {
        // Nothing passed the threshold: keep the most probable unblocked candidate
        const ScoredCandidate* best = nullptr;
        for (const auto& [account, c] : unique) {
            if (rules.blocked.count(account)) continue;
            if (best == nullptr || c.probability > best->probability) best = &c;
        }
        if (best == nullptr) {
            throw EmptyCandidateError("every " + label + " candidate is blocked");
        }
        kept.push_back({ best->accountId, best->probability, best->share, false });
    }

    lendSharesToForced(kept);
    return kept;
}

std::vector<FilteredCandidate> selectTopK(const std::vector<FilteredCandidate>& filtered, int k)
{
    int forcedCount = 0;
    for (const auto& c : filtered) if (c.forced) ++forcedCount;

    int room = std::max(std::max(k, 1), forcedCount) - forcedCount;
    std::vector<FilteredCandidate> chosen;
    chosen.reserve(filtered.size());
    for (const auto& c : filtered) {
        if (c.forced) {
            chosen.push_back(c);
        } else if (room > 0) {
            chosen.push_back(c);
            --room;
        }
    }
    return chosen;
}

void dropWeakestCandidate(std::vector<FilteredCandidate>& candidates)
{
    if (candidates.size() <= 1) return;

    for (auto it = candidates.rbegin(); it != candidates.rend(); ++it) {
        if (!it->forced) {
            candidates.erase(std::next(it).base());
            return;
        }
    }
    candidates.pop_back();
}

// --- Share normalizer ---

long long shareScaleFor(long long total)
{
    return std::max(kShareScale, total);
}

std::vector<NormalizedShare> normalizeShares(const std::vector<FilteredCandidate>& candidates, long long scale)
{
    std::vector<NormalizedShare> out;
    const size_t n = candidates.size();
    if (n == 0) return out;
    if (scale < 1) scale = kShareScale;

    std::vector<long double> raw(n, 0.0L);
    long double sum = 0.0L;
    for (size_t i = 0; i < n; ++i) {
        raw[i] = hasShareEstimate(candidates[i].share) ? static_cast<long double>(candidates[i].share) : 0.0L;
        sum += raw[i];
    }

    out.resize(n);
    for (size_t i = 0; i < n; ++i) {
        out[i].accountId = candidates[i].accountId;
        out[i].probability = candidates[i].probability;
        out[i].forced = candidates[i].forced;
    }

    const long long count = static_cast<long long>(n);
    if (!(sum > 0.0L) || !std::isfinite(static_cast<double>(sum))) {
        // No usable estimate: uniform split, spare units to the earliest entries
        long long spare = scale - (scale / count) * count;
        for (size_t i = 0; i < n; ++i) {
            out[i].share = 1.0 / static_cast<double>(n);
            out[i].units = scale / count + (spare > 0 ? 1 : 0);
            if (spare > 0) --spare;
        }
        return out;
    }

    std::vector<long double> frac(n, 0.0L);
    long long assigned = 0;
    for (size_t i = 0; i < n; ++i) {
        out[i].share = static_cast<double>(raw[i] / sum);
        const long double exact = raw[i] / sum * static_cast<long double>(scale);
        long long units = static_cast<long long>(std::floor(exact));
        units = std::min(scale, std::max(0LL, units));
        out[i].units = units;
        frac[i] = exact - static_cast<long double>(units);
        assigned += units;
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return frac[a] > frac[b]; });

    long long deficit = scale - assigned;
    for (size_t d = 0; deficit > 0; ++d, --deficit) {
        out[order[d % n]].units += 1;
    }
    // Rounding overshoot: take back from the smallest fractions first
    for (size_t d = 0; deficit < 0; ++d) {
        NormalizedShare& s = out[order[n - 1 - (d % n)]];
        if (s.units > 0) { s.units -= 1; ++deficit; }
    }
    return out;
}

// --- Greedy rounding ---

ScaledTarget scaledTarget(long long units, long long total, long long scale)
{
    // total = q * S + r with r < S. Either S is kShareScale, so r * units < S * S
    // fits in 64 bits, or S == total and r is zero.
    const long long q = total / scale;
    const long long r = total % scale;
    ScaledTarget t;
    t.whole = q * units + (r * units) / scale;
    t.remainder = (r * units) % scale;
    return t;
}

std::vector<long long> allocateLargestRemainder(const std::vector<long long>& units, long long total, long long scale)
{
    const size_t n = units.size();
    std::vector<long long> amounts(n, 0);
    if (n == 0) return amounts;

    const long long unitSum = std::accumulate(units.begin(), units.end(), 0LL);
    if (unitSum != scale) {
        throw std::invalid_argument("share units sum to " + std::to_string(unitSum) +
            ", expected " + std::to_string(scale));
    }

    // Step 1-2: floor of each exact target, remainder kept in 1/S units
    std::vector<long long> remainders(n, 0);
    long long assigned = 0;
    for (size_t i = 0; i < n; ++i) {
        const ScaledTarget t = scaledTarget(units[i], total, scale);
        amounts[i] = t.whole;
        remainders[i] = t.remainder;
        assigned += t.whole;
    }

    // Step 3-4: drift < n, one unit each to the largest remainders
    long long drift = total - assigned;
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
        [&](size_t a, size_t b) { return remainders[a] > remainders[b]; });

    for (size_t d = 0; drift > 0; ++d, --drift) {
        amounts[order[d % n]] += 1;
    }
    return amounts;
}

std::vector<DecodedLine> decodeSide(
    const std::vector<FilteredCandidate>& candidates,
    long long total,
    long long minLine)
{
    if (candidates.empty()) throw EmptyCandidateError("no candidates left to decode");

    const long long floorAmount = std::max(minLine, 1LL);
    const long long scale = shareScaleFor(total);
    std::vector<FilteredCandidate> working = candidates;

    for (;;) {
        const auto shares = normalizeShares(working, scale);
        std::vector<long long> units;
        units.reserve(shares.size());
        for (const auto& s : shares) units.push_back(s.units);

        const auto amounts = allocateLargestRemainder(units, total, scale);
        const bool fits = working.size() == 1 ||
            std::all_of(amounts.begin(), amounts.end(), [&](long long a) { return a >= floorAmount; });

        if (fits) {
            std::vector<DecodedLine> lines;
            lines.reserve(working.size());
            for (size_t i = 0; i < working.size(); ++i) lines.push_back({ working[i], amounts[i] });
            return lines;
        }

        // Step 5: more lines than the total can carry, drop the weakest and re-run
        dropWeakestCandidate(working);
    }
}

BalancedLines GreedyStrategy::balance(
    const std::vector<FilteredCandidate>& debit,
    const std::vector<FilteredCandidate>& credit,
    long long total,
    long long minLine) const
{
    BalancedLines result;
    result.debit = decodeSide(debit, total, minLine);
    result.credit = decodeSide(credit, total, minLine);
    result.decoderUsed = "greedy";
    return result;
}

// --- Alternatives ---

double jointProbability(const std::vector<DecodedLine>& debit, const std::vector<DecodedLine>& credit)
{
    double p = 1.0;
    for (const auto& line : debit) p *= line.candidate.probability;
    for (const auto& line : credit) p *= line.candidate.probability;
    return p;
}

static std::string sortedIds(const std::vector<DecodedLine>& lines)
{
    std::vector<std::string> ids;
    ids.reserve(lines.size());
    for (const auto& line : lines) ids.push_back(line.candidate.accountId);
    std::sort(ids.begin(), ids.end());

    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) out.push_back(',');
        out += ids[i];
    }
    return out;
}

std::string allocationKey(const std::vector<DecodedLine>& debit, const std::vector<DecodedLine>& credit)
{
    return sortedIds(debit) + "|" + sortedIds(credit);
}

std::vector<Allocation> toAllocations(const std::vector<DecodedLine>& lines, Side side)
{
    std::vector<Allocation> out;
    out.reserve(lines.size());
    for (const auto& line : lines) out.push_back({ line.candidate.accountId, side, line.amount });
    return out;
}

// Replace the weakest non-forced chosen candidate with the strongest one left out.
static std::optional<std::vector<FilteredCandidate>> swapWeakest(
    const std::vector<FilteredCandidate>& chosen,
    const std::vector<FilteredCandidate>& pool)
{
    int weakest = -1;
    for (int i = static_cast<int>(chosen.size()) - 1; i >= 0; --i) {
        if (!chosen[static_cast<size_t>(i)].forced) { weakest = i; break; }
    }
    if (weakest < 0) return std::nullopt;

    std::set<std::string> taken;
    for (const auto& c : chosen) taken.insert(c.accountId);

    for (const auto& c : pool) {
        if (taken.count(c.accountId)) continue;
        auto swapped = chosen;
        swapped[static_cast<size_t>(weakest)] = c;
        std::stable_sort(swapped.begin(), swapped.end(), strongerCandidate);
        return swapped;
    }
    return std::nullopt;
}

// Selections for every k on one side: top-k, then its swap variant.
static std::vector<std::vector<FilteredCandidate>> selectionVariants(
    const std::vector<FilteredCandidate>& pool,
    int maxK)
{
    std::vector<std::vector<FilteredCandidate>> variants;
    int forcedCount = 0;
    for (const auto& c : pool) if (c.forced) ++forcedCount;

    const int kMax = std::min(maxK, static_cast<int>(pool.size()));
    for (int k = std::max(1, forcedCount); k <= kMax; ++k) {
        auto top = selectTopK(pool, k);
        if (auto swapped = swapWeakest(top, pool)) {
            variants.push_back(std::move(top));
            variants.push_back(std::move(*swapped));
        } else {
            variants.push_back(std::move(top));
        }
    }
    return variants;
}

std::vector<AlternateAllocation> rankAlternatives(
    const std::vector<FilteredCandidate>& debit,
    const std::vector<FilteredCandidate>& credit,
    long long total,
    long long minLine,
    int maxK,
    int limit,
    const std::string& primaryKey)
{
    return rankAlternatives(debit, credit, total, total, minLine, maxK, maxK, limit, primaryKey);
}

// Decoded lines of every selection variant on one side. A side with nothing
// left to decode has a single empty variant.
static std::vector<std::vector<DecodedLine>> decodedVariants(
    const std::vector<FilteredCandidate>& pool,
    long long total,
    long long minLine,
    int maxK)
{
    std::vector<std::vector<DecodedLine>> lines;
    if (total <= 0) {
        lines.emplace_back();
        return lines;
    }
    for (const auto& v : selectionVariants(pool, maxK)) lines.push_back(decodeSide(v, total, minLine));
    return lines;
}

std::vector<AlternateAllocation> rankAlternatives(
    const std::vector<FilteredCandidate>& debit,
    const std::vector<FilteredCandidate>& credit,
    long long debitTotal,
    long long creditTotal,
    long long minLine,
    int maxKDebit,
    int maxKCredit,
    int limit,
    const std::string& primaryKey)
{
    std::vector<AlternateAllocation> out;
    if (limit <= 1) return out;
    if ((debitTotal > 0 && debit.empty()) || (creditTotal > 0 && credit.empty())) return out;

    struct Ranked {
        std::vector<DecodedLine> debit;
        std::vector<DecodedLine> credit;
        double joint = 0.0;
        size_t lineCount = 0;
        std::string key;
    };

    // Decoding depends only on the selection, so each side is decoded once per variant
    const auto debitLines = decodedVariants(debit, debitTotal, minLine, maxKDebit);
    const auto creditLines = decodedVariants(credit, creditTotal, minLine, maxKCredit);

    std::vector<Ranked> ranked;
    std::set<std::string> seen;
    seen.insert(primaryKey);
    for (const auto& d : debitLines) {
        for (const auto& c : creditLines) {
            std::string key = allocationKey(d, c);
            if (!seen.insert(key).second) continue;
            ranked.push_back({ d, c, jointProbability(d, c), d.size() + c.size(), std::move(key) });
        }
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        if (a.joint != b.joint) return a.joint > b.joint;
        if (a.lineCount != b.lineCount) return a.lineCount < b.lineCount;
        return a.key < b.key;
    });

    const size_t keep = std::min(ranked.size(), static_cast<size_t>(limit - 1));
    for (size_t i = 0; i < keep; ++i) {
        AlternateAllocation alt;
        alt.lines = toAllocations(ranked[i].debit, Side::Debit);
        const auto credits = toAllocations(ranked[i].credit, Side::Credit);
        alt.lines.insert(alt.lines.end(), credits.begin(), credits.end());
        alt.jointProbability = ranked[i].joint;
        out.push_back(std::move(alt));
    }
    return out;
}
