// FlowBalancer.h : Min-cost flow formulation of the debit/credit split,
// with a bounded solve and greedy fallback.

#pragma once

#include "Journal_Balancer.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

struct FlowArc {
    int from = 0;
    int to = 0;
    long long capacity = 0;
    long long cost = 0;
};

struct FlowNetwork {
    int nodeCount = 0;
    int source = 0;
    int sink = 0;
    std::vector<FlowArc> arcs;
};

struct FlowSolution {
    std::vector<long long> arcFlow;  // one entry per FlowNetwork::arcs
    long long totalFlow = 0;
};

// Set by the caller once a solve is no longer wanted. Solvers check it between
// their phases and give up with SolverTimeoutError.
struct SolveControl {
    std::atomic<bool> cancelled{ false };
};

class MinCostFlowSolver {
public:
    virtual ~MinCostFlowSolver() = default;
    virtual FlowSolution solve(const FlowNetwork& network, const SolveControl& control) const = 0;
};

// Successive shortest paths from the Boost Graph Library. Arc costs must be non-negative.
class BoostFlowSolver : public MinCostFlowSolver {
public:
    FlowSolution solve(const FlowNetwork& network, const SolveControl& control) const override;
};

// Cost scale: confidence cost per nat of -log(p), and the full penalty for a
// round-up unit whose fractional remainder is zero.
constexpr long long kConfidenceCostScale = 10000;
constexpr long long kRoundUpPenalty = 100000;

// Timed-out solves still running before new bounded solves are refused.
constexpr size_t kMaxPendingSolves = 8;

struct SideArcs {
    std::vector<FilteredCandidate> candidates;
    std::vector<std::vector<size_t>> arcIndex;  // arcs carrying each candidate's amount
};

struct TransportProblem {
    FlowNetwork network;
    SideArcs debit;
    SideArcs credit;
};

// Builds the transportation network for the given selections. Each side is
// first shrunk (weakest non-forced first) until total covers every floor arc.
TransportProblem buildTransportProblem(
    const std::vector<FilteredCandidate>& debit,
    const std::vector<FilteredCandidate>& credit,
    long long total,
    long long minLine);

class FlowStrategy : public BalanceStrategy {
public:
    // A null solver makes every solve unavailable. A budget of zero solves inline
    // without a time limit.
    FlowStrategy(std::shared_ptr<const MinCostFlowSolver> solver, std::chrono::milliseconds budget);

    // Cancels every timed-out solve and waits for its thread.
    ~FlowStrategy() override;

    FlowStrategy(const FlowStrategy&) = delete;
    FlowStrategy& operator=(const FlowStrategy&) = delete;

    BalancedLines balance(
        const std::vector<FilteredCandidate>& debit,
        const std::vector<FilteredCandidate>& credit,
        long long total,
        long long minLine) const override;

    // Timed-out solves whose threads have not been joined yet.
    size_t pendingSolves() const;

private:
    struct PendingSolve {
        std::thread worker;
        std::shared_ptr<SolveControl> control;
        std::shared_ptr<std::atomic<bool>> finished;
    };
    // Throws SolverUnavailableError or SolverTimeoutError.
    BalancedLines solveTransport(
        const std::vector<FilteredCandidate>& debit,
        const std::vector<FilteredCandidate>& credit,
        long long total,
        long long minLine) const;

    FlowSolution runBounded(const FlowNetwork& network) const;

    // Joins the pending solves that have finished. Caller holds pendingMutex_.
    void reapFinished() const;

    std::shared_ptr<const MinCostFlowSolver> solver_;
    std::chrono::milliseconds budget_;
    GreedyStrategy greedy_;

    mutable std::mutex pendingMutex_;
    mutable std::vector<PendingSolve> pending_;
    mutable size_t running_ = 0;  // bounded solves currently waited on
};
