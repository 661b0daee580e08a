#include "../Journal_Balancer.h"

#include <iostream>
#include <string>
#include <vector>

static int fail(const char* msg) { std::cout << "FAIL: " << msg << "\n"; return 1; }

static std::vector<std::string> ids(const std::vector<FilteredCandidate>& v)
{
    std::vector<std::string> out;
    for (const auto& c : v) out.push_back(c.accountId);
    return out;
}

int main()
{
    // Threshold keeps candidates at or above it, strongest first
    {
        std::vector<ScoredCandidate> pool = { {"C", 0.2, 0.1}, {"A", 0.9, 0.6}, {"B", 0.4, 0.3} };
        auto kept = filterCandidates(pool, 0.4, SideRules(), 4, Side::Debit);
        if (ids(kept) != std::vector<std::string>{"A", "B"}) return fail("threshold filter kept wrong set");
    }

    // Nothing passes: the most probable unblocked candidate survives
    {
        std::vector<ScoredCandidate> pool = { {"A", 0.3, 0.5}, {"B", 0.2, 0.5} };
        auto kept = filterCandidates(pool, 0.5, SideRules(), 4, Side::Credit);
        if (ids(kept) != std::vector<std::string>{"A"}) return fail("fallback should keep the strongest candidate");
        if (kept[0].forced) return fail("fallback candidate must not be marked forced");
    }

    // Forced account below threshold is kept and flagged
    {
        std::vector<ScoredCandidate> pool = { {"Cash", 0.9, 0.9}, {"Tax", 0.01, 0.1} };
        SideRules rules;
        rules.forced.insert("Tax");
        auto kept = filterCandidates(pool, 0.5, rules, 4, Side::Debit);
        if (ids(kept) != std::vector<std::string>{"Cash", "Tax"}) return fail("forced low-probability account missing");
        if (!kept[1].forced || kept[0].forced) return fail("forced flag mismatch");
    }

    // Forced account absent from the pool is added and borrows the mean share
    {
        std::vector<ScoredCandidate> pool = { {"A", 0.9, 0.6}, {"B", 0.8, 0.2} };
        SideRules rules;
        rules.forced.insert("Z");
        auto kept = filterCandidates(pool, 0.5, rules, 4, Side::Debit);
        bool found = false;
        for (const auto& c : kept) {
            if (c.accountId == "Z") {
                found = true;
                if (!c.forced) return fail("added account not flagged forced");
                if (c.share < 0.39 || c.share > 0.41) return fail("added forced account should borrow mean share 0.4");
            }
        }
        if (!found) return fail("forced account absent from pool was not added");
    }

    // Blocked accounts never survive
    {
        std::vector<ScoredCandidate> pool = { {"A", 0.9, 0.5}, {"B", 0.8, 0.5} };
        SideRules rules;
        rules.blocked.insert("A");
        auto kept = filterCandidates(pool, 0.5, rules, 4, Side::Debit);
        if (ids(kept) != std::vector<std::string>{"B"}) return fail("blocked account survived");
    }

    // Every candidate blocked
    {
        std::vector<ScoredCandidate> pool = { {"A", 0.9, 0.5} };
        SideRules rules;
        rules.blocked.insert("A");
        bool threw = false;
        try { (void)filterCandidates(pool, 0.5, rules, 4, Side::Debit); }
        catch (const EmptyCandidateError&) { threw = true; }
        if (!threw) return fail("all-blocked pool should raise EmptyCandidateError");
    }

    // Empty pool
    {
        bool threw = false;
        try { (void)filterCandidates({}, 0.5, SideRules(), 4, Side::Credit); }
        catch (const EmptyCandidateError&) { threw = true; }
        if (!threw) return fail("empty pool should raise EmptyCandidateError");
    }

    // Forced and blocked on the same side
    {
        std::vector<ScoredCandidate> pool = { {"A", 0.9, 0.5} };
        SideRules rules;
        rules.forced.insert("A");
        rules.blocked.insert("A");
        bool threw = false;
        try { (void)filterCandidates(pool, 0.5, rules, 4, Side::Debit); }
        catch (const InfeasibleForceBlockError&) { threw = true; }
        if (!threw) return fail("force/block overlap should raise InfeasibleForceBlockError");

        threw = false;
        try { (void)filterCandidates({}, 0.5, rules, 4, Side::Debit); }
        catch (const InfeasibleForceBlockError&) { threw = true; }
        if (!threw) return fail("force/block overlap should be reported before an empty pool");
    }

    // More forced accounts than max k
    {
        std::vector<ScoredCandidate> pool = { {"A", 0.9, 0.5}, {"B", 0.9, 0.5} };
        SideRules rules;
        rules.forced = { "A", "B", "C" };
        bool threw = false;
        try { (void)filterCandidates(pool, 0.5, rules, 2, Side::Debit); }
        catch (const InfeasibleForceBlockError&) { threw = true; }
        if (!threw) return fail("forced count above max k should raise InfeasibleForceBlockError");
    }

    // Collapse to max k drops the weakest non-forced candidate first
    {
        std::vector<ScoredCandidate> pool = { {"A", 0.9, 0.3}, {"B", 0.8, 0.3}, {"C", 0.7, 0.3}, {"T", 0.01, 0.1} };
        SideRules rules;
        rules.forced.insert("T");
        auto kept = filterCandidates(pool, 0.5, rules, 3, Side::Debit);
        if (ids(kept) != std::vector<std::string>{"A", "B", "T"}) return fail("collapse should drop C, not forced T");
    }

    // Duplicates collapse to the most probable entry; ties order by id
    {
        std::vector<ScoredCandidate> pool = { {"B", 0.5, 0.5}, {"A", 0.3, 0.1}, {"A", 0.5, 0.5} };
        auto kept = filterCandidates(pool, 0.4, SideRules(), 4, Side::Debit);
        if (ids(kept) != std::vector<std::string>{"A", "B"}) return fail("duplicate collapse or tie order wrong");
        if (kept[0].probability != 0.5) return fail("duplicate should keep the higher probability");
    }

    // selectTopK keeps forced accounts and fills the rest by strength
    {
        std::vector<FilteredCandidate> filtered = { {"A", 0.9, 0.5, false}, {"B", 0.8, 0.3, false}, {"T", 0.01, 0.2, true} };
        if (ids(selectTopK(filtered, 2)) != std::vector<std::string>{"A", "T"}) return fail("selectTopK(2) mismatch");
        if (ids(selectTopK(filtered, 1)) != std::vector<std::string>{"T"}) return fail("selectTopK(1) must keep forced");
        if (ids(selectTopK(filtered, 0)) != std::vector<std::string>{"T"}) return fail("selectTopK(0) behaves as k=1");
        if (ids(selectTopK(filtered, 9)).size() != 3) return fail("selectTopK above size keeps all");
    }

    // dropWeakestCandidate
    {
        std::vector<FilteredCandidate> v = { {"A", 0.9, 0.5, false}, {"T", 0.1, 0.2, true} };
        dropWeakestCandidate(v);
        if (ids(v) != std::vector<std::string>{"T"}) return fail("dropWeakest should remove non-forced first");
        dropWeakestCandidate(v);
        if (v.size() != 1) return fail("dropWeakest must not empty a list");
    }

    std::cout << "CandidateFilterTests: All tests passed.\n";
    return 0;
}
