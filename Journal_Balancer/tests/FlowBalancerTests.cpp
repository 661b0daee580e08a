#include "../FlowBalancer.h"
#include "../TransactionDecoder.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

static int fail(const char* msg) { std::cout << "FAIL: " << msg << "\n"; return 1; }

static long long sum(const std::vector<DecodedLine>& lines)
{
    long long s = 0;
    for (const auto& l : lines) s += l.amount;
    return s;
}

static std::atomic<int> liveSolves{ 0 };

struct LiveSolve {
    LiveSolve() { ++liveSolves; }
    ~LiveSolve() { --liveSolves; }
};

class ThrowingSolver : public MinCostFlowSolver {
public:
    FlowSolution solve(const FlowNetwork&, const SolveControl&) const override { throw std::runtime_error("solver crashed"); }
};

class SlowSolver : public MinCostFlowSolver {
public:
    FlowSolution solve(const FlowNetwork& network, const SolveControl&) const override
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        SolveControl fresh;
        return BoostFlowSolver().solve(network, fresh);
    }
};

// Never looks at the cancel flag
class StubbornSolver : public MinCostFlowSolver {
public:
    FlowSolution solve(const FlowNetwork& network, const SolveControl&) const override
    {
        LiveSolve live;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        SolveControl fresh;
        return BoostFlowSolver().solve(network, fresh);
    }
};

// Stops at the first check after cancellation
class PollingSolver : public MinCostFlowSolver {
public:
    FlowSolution solve(const FlowNetwork& network, const SolveControl& control) const override
    {
        LiveSolve live;
        for (int i = 0; i < 5000; ++i) {
            if (control.cancelled.load()) throw SolverTimeoutError("cancelled");
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return BoostFlowSolver().solve(network, control);
    }
};

class EmptySolver : public MinCostFlowSolver {
public:
    FlowSolution solve(const FlowNetwork&, const SolveControl&) const override { return FlowSolution(); }
};

int main()
{
    const std::vector<FilteredCandidate> cashBank = { {"Cash", 0.9, 0.7, false}, {"Bank", 0.4, 0.3, false} };
    const std::vector<FilteredCandidate> sales = { {"Sales", 0.95, 1.0, false} };

    // Boost solver on a hand-built network: cheap parallel arc first
    {
        FlowNetwork n;
        n.nodeCount = 3;
        n.source = 0;
        n.sink = 2;
        n.arcs = { {0, 1, 4, 1}, {1, 2, 3, 1}, {1, 2, 3, 5} };
        SolveControl control;
        FlowSolution s = BoostFlowSolver().solve(n, control);
        if (s.totalFlow != 4) return fail("max flow should be 4");
        if (s.arcFlow != std::vector<long long>{4, 3, 1}) return fail("min-cost arc flows mismatch");

        control.cancelled.store(true);
        bool threw = false;
        try { (void)BoostFlowSolver().solve(n, control); }
        catch (const SolverTimeoutError&) { threw = true; }
        if (!threw) return fail("cancelled solve should raise SolverTimeoutError");
    }

    // Negative costs are not accepted
    {
        FlowNetwork n;
        n.nodeCount = 2;
        n.source = 0;
        n.sink = 1;
        n.arcs = { {0, 1, 1, -1} };
        SolveControl control;
        bool threw = false;
        try { (void)BoostFlowSolver().solve(n, control); }
        catch (const SolverUnavailableError&) { threw = true; }
        if (!threw) return fail("negative cost arc should be rejected");
    }

    // Network layout
    {
        TransportProblem p = buildTransportProblem(cashBank, sales, 100, 1);
        if (p.network.nodeCount != 6 || p.network.source != 0 || p.network.sink != 5) return fail("node layout mismatch");
        const FlowArc& cap = p.network.arcs[0];
        if (cap.from != 0 || cap.to != 1 || cap.capacity != 100 || cap.cost != 0) return fail("super source arc mismatch");
        if (p.debit.arcIndex.size() != 2 || p.credit.arcIndex.size() != 1) return fail("arc index per candidate mismatch");

        TransportProblem tiny = buildTransportProblem(
            { {"A", 0.9, 1.0, false}, {"B", 0.8, 1.0, false}, {"C", 0.7, 1.0, false} }, sales, 1, 1);
        if (tiny.debit.candidates.size() != 1 || tiny.debit.candidates[0].accountId != "A")
            return fail("total=1 network should keep only the strongest debit");
    }

    // Flow decode matches the exact split
    {
        FlowStrategy flow(std::make_shared<BoostFlowSolver>(), std::chrono::milliseconds(0));
        BalancedLines out = flow.balance(cashBank, sales, 100, 1);
        if (out.decoderUsed != "combinatorial") return fail("expected combinatorial decoder");
        if (out.debit.size() != 2 || out.debit[0].amount != 70 || out.debit[1].amount != 30) return fail("flow split 70/30 mismatch");
        if (out.credit.size() != 1 || out.credit[0].amount != 100) return fail("flow credit should carry the total");
    }

    // Round-up unit goes to the largest remainder
    {
        FlowStrategy flow(std::make_shared<BoostFlowSolver>(), std::chrono::milliseconds(0));
        std::vector<FilteredCandidate> thirds = { {"A", 0.9, 1.0, false}, {"B", 0.8, 1.0, false}, {"C", 0.7, 1.0, false} };
        BalancedLines out = flow.balance(thirds, sales, 7, 1);
        if (sum(out.debit) != 7 || sum(out.credit) != 7) return fail("flow thirds must sum to 7");
        if (out.debit.size() != 3 || out.debit[0].amount != 3 || out.debit[1].amount != 2 || out.debit[2].amount != 2)
            return fail("flow thirds of 7 should be 3,2,2");
    }

    // Large totals
    {
        FlowStrategy flow(std::make_shared<BoostFlowSolver>(), std::chrono::milliseconds(0));
        BalancedLines out = flow.balance(cashBank, sales, 1000000000000LL, 1);
        if (out.debit[0].amount != 700000000000LL || out.debit[1].amount != 300000000000LL) return fail("large total split mismatch");

        std::vector<FilteredCandidate> thirds = { {"A", 0.9, 1.0, false}, {"B", 0.8, 1.0, false}, {"C", 0.7, 1.0, false} };
        BalancedLines split = flow.balance(thirds, sales, 1000000000000LL, 1);
        if (split.decoderUsed != "combinatorial" || split.debit.size() != 3) return fail("large thirds should decode by flow");
        if (split.debit[0].amount != 333333333334LL || split.debit[1].amount != 333333333333LL ||
            split.debit[2].amount != 333333333333LL) return fail("flow thirds of 1e12 should be exact to the minor unit");

        TransportProblem p = buildTransportProblem(thirds, sales, 1000000000000LL, 1);
        const FlowArc& target = p.network.arcs[p.debit.arcIndex[1][1]];
        if (target.capacity != 333333333332LL) return fail("target arc should stop at floor(share * total) minus the floor");
    }

    // Budgeted solve on the worker thread
    {
        FlowStrategy flow(std::make_shared<BoostFlowSolver>(), std::chrono::milliseconds(2000));
        BalancedLines out = flow.balance(cashBank, sales, 100, 1);
        if (out.decoderUsed != "combinatorial" || sum(out.debit) != 100) return fail("budgeted solve should succeed");
    }

    // Solver failure falls back to greedy
    {
        FlowStrategy flow(std::make_shared<ThrowingSolver>(), std::chrono::milliseconds(0));
        BalancedLines out = flow.balance(cashBank, sales, 100, 1);
        if (out.decoderUsed != "greedy_fallback") return fail("throwing solver should fall back");
        if (out.fallbackReason.find("SolverUnavailableError") == std::string::npos) return fail("fallback reason should name the error");
        if (out.debit[0].amount != 70 || out.debit[1].amount != 30) return fail("fallback should decode greedily");

        FlowStrategy threaded(std::make_shared<ThrowingSolver>(), std::chrono::milliseconds(1000));
        if (threaded.balance(cashBank, sales, 100, 1).decoderUsed != "greedy_fallback") return fail("threaded failure should fall back");
    }

    // Solver overrun falls back to greedy
    {
        FlowStrategy flow(std::make_shared<SlowSolver>(), std::chrono::milliseconds(20));
        BalancedLines out = flow.balance(cashBank, sales, 100, 1);
        if (out.decoderUsed != "greedy_fallback") return fail("slow solver should fall back");
        if (out.fallbackReason.find("SolverTimeoutError") == std::string::npos) return fail("timeout reason missing");
        if (sum(out.debit) != 100 || sum(out.credit) != 100) return fail("timeout fallback must stay balanced");
    }

    // Timed-out solves that ignore cancellation are capped and joined
    {
        {
            FlowStrategy flow(std::make_shared<StubbornSolver>(), std::chrono::milliseconds(1));
            for (int i = 0; i < 40; ++i) {
                BalancedLines out = flow.balance(cashBank, sales, 100, 1);
                if (out.decoderUsed != "greedy_fallback" || sum(out.debit) != 100) return fail("overrun should fall back to greedy");
            }
            if (liveSolves.load() > static_cast<int>(kMaxPendingSolves)) return fail("running solves should stay under the cap");
            if (flow.pendingSolves() > kMaxPendingSolves) return fail("pending solves above the cap");
        }
        if (liveSolves.load() != 0) return fail("destroying the strategy should join every solve");
    }

    // Cancelled solves that poll the flag finish on their own
    {
        FlowStrategy flow(std::make_shared<PollingSolver>(), std::chrono::milliseconds(1));
        for (int i = 0; i < 40; ++i) {
            if (flow.balance(cashBank, sales, 100, 1).decoderUsed != "greedy_fallback") return fail("polling overrun should fall back");
        }
        for (int i = 0; i < 200 && flow.pendingSolves() > 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (flow.pendingSolves() != 0 || liveSolves.load() != 0) return fail("cancelled solves should stop and be joined");
    }

    // A batch of overruns leaves no solver thread behind
    {
        std::vector<DecodeRequest> requests(40);
        for (size_t i = 0; i < requests.size(); ++i) {
            requests[i].transactionId = "T" + std::to_string(i);
            requests[i].total = 100;
            requests[i].debitCandidates = { {"Cash", 0.9, 0.7}, {"Bank", 0.8, 0.3} };
            requests[i].creditCandidates = { {"Sales", 0.95, 1.0} };
            requests[i].predictedKDebit = 2;
            requests[i].decoder = DecoderKind::Combinatorial;
        }
        DecoderSettings settings;
        settings.solverBudget = std::chrono::milliseconds(1);
        settings.workers = 4;
        {
            const TransactionDecoder decoder(settings, std::make_shared<StubbornSolver>());
            const auto outcomes = decoder.decodeBatch(requests);
            for (const auto& o : outcomes) {
                if (!o.ok || o.decision.debug.decoderUsed != "greedy_fallback") return fail("batch overrun should fall back per transaction");
            }
        }
        if (liveSolves.load() != 0) return fail("batch decoder should join its solver threads");
    }

    // Missing or broken solver
    {
        FlowStrategy none(nullptr, std::chrono::milliseconds(0));
        if (none.balance(cashBank, sales, 100, 1).decoderUsed != "greedy_fallback") return fail("null solver should fall back");

        FlowStrategy empty(std::make_shared<EmptySolver>(), std::chrono::milliseconds(0));
        if (empty.balance(cashBank, sales, 100, 1).decoderUsed != "greedy_fallback") return fail("short solution should fall back");
    }

    std::cout << "FlowBalancerTests: All tests passed.\n";
    return 0;
}
