// FlowBalancer.cpp : Transportation network for the debit/credit split,
// solved with Boost's successive shortest path min-cost flow.
//
// Node layout: 0 super source, 1 source, debit candidates, credit candidates, sink.
// Every candidate is fed by three parallel arcs:
//   floor    capacity min line, cost 0
//   target   up to floor(share * total), cost confidence + 1
//   round-up capacity 1, cost confidence + 1 + penalty * (1 - remainder)
// Debit and credit nodes are fully connected at cost 0. The super source arc
// caps the flow at total.

#include "FlowBalancer.h"

#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/successive_shortest_path_nonnegative_weights.hpp>

#include <algorithm>
#include <cmath>
#include <future>
#include <string>
#include <system_error>
#include <thread>

typedef boost::adjacency_list_traits<boost::vecS, boost::vecS, boost::directedS> FlowTraits;
typedef boost::adjacency_list<boost::vecS, boost::vecS, boost::directedS,
    boost::no_property,
    boost::property<boost::edge_capacity_t, long long,
        boost::property<boost::edge_residual_capacity_t, long long,
            boost::property<boost::edge_reverse_t, FlowTraits::edge_descriptor,
                boost::property<boost::edge_weight_t, long long>>>>> FlowGraph;

static void stopIfCancelled(const SolveControl& control)
{
    if (control.cancelled.load()) throw SolverTimeoutError("min-cost flow cancelled");
}

FlowSolution BoostFlowSolver::solve(const FlowNetwork& network, const SolveControl& control) const
{
    if (network.nodeCount <= 0) throw SolverUnavailableError("empty flow network");
    stopIfCancelled(control);

    FlowGraph g(static_cast<size_t>(network.nodeCount));
    auto capacity = boost::get(boost::edge_capacity, g);
    auto residual = boost::get(boost::edge_residual_capacity, g);
    auto reverse = boost::get(boost::edge_reverse, g);
    auto weight = boost::get(boost::edge_weight, g);

    std::vector<FlowTraits::edge_descriptor> forward;
    forward.reserve(network.arcs.size());
    for (const auto& arc : network.arcs) {
        if (arc.cost < 0) throw SolverUnavailableError("negative arc cost in flow network");
        if (arc.from < 0 || arc.to < 0 || arc.from >= network.nodeCount || arc.to >= network.nodeCount) {
            throw SolverUnavailableError("flow arc references a missing node");
        }

        const auto e = boost::add_edge(static_cast<size_t>(arc.from), static_cast<size_t>(arc.to), g).first;
        const auto r = boost::add_edge(static_cast<size_t>(arc.to), static_cast<size_t>(arc.from), g).first;
        capacity[e] = arc.capacity;
        capacity[r] = 0;
        weight[e] = arc.cost;
        weight[r] = -arc.cost;
        reverse[e] = r;
        reverse[r] = e;
        forward.push_back(e);
    }

    stopIfCancelled(control);
    boost::successive_shortest_path_nonnegative_weights(g,
        static_cast<size_t>(network.source), static_cast<size_t>(network.sink));
    stopIfCancelled(control);

    FlowSolution solution;
    solution.arcFlow.reserve(forward.size());
    for (size_t i = 0; i < forward.size(); ++i) {
        const long long flow = capacity[forward[i]] - residual[forward[i]];
        solution.arcFlow.push_back(flow);
        if (network.arcs[i].from == network.source) solution.totalFlow += flow;
    }
    return solution;
}

static long long confidenceCost(double probability)
{
    const double p = std::isfinite(probability) ? std::min(1.0, std::max(probability, 1e-6)) : 1e-6;
    return std::llround(-std::log(p) * static_cast<double>(kConfidenceCostScale));
}

// Shrink until every line can carry its floor
static std::vector<FilteredCandidate> fitToTotal(
    std::vector<FilteredCandidate> candidates,
    long long total,
    long long floorAmount)
{
    while (candidates.size() > 1 && static_cast<long long>(candidates.size()) > total / floorAmount) {
        dropWeakestCandidate(candidates);
    }
    return candidates;
}

TransportProblem buildTransportProblem(
    const std::vector<FilteredCandidate>& debit,
    const std::vector<FilteredCandidate>& credit,
    long long total,
    long long minLine)
{
    if (debit.empty() || credit.empty()) throw EmptyCandidateError("no candidates left to balance");

    const long long floorAmount = std::max(minLine, 1LL);

    TransportProblem problem;
    problem.debit.candidates = fitToTotal(debit, total, floorAmount);
    problem.credit.candidates = fitToTotal(credit, total, floorAmount);

    const int debitCount = static_cast<int>(problem.debit.candidates.size());
    const int creditCount = static_cast<int>(problem.credit.candidates.size());
    const int superSource = 0;
    const int source = 1;
    const int firstDebit = 2;
    const int firstCredit = firstDebit + debitCount;
    const int sink = firstCredit + creditCount;

    FlowNetwork& network = problem.network;
    network.nodeCount = sink + 1;
    network.source = superSource;
    network.sink = sink;

    auto addArc = [&](int from, int to, long long capacity, long long cost) {
        network.arcs.push_back({ from, to, capacity, cost });
        return network.arcs.size() - 1;
    };

    addArc(superSource, source, total, 0);

    const long long scale = shareScaleFor(total);
    auto addCandidateArcs = [&](SideArcs& side, int firstNode, bool debitSide) {
        const auto shares = normalizeShares(side.candidates, scale);
        side.arcIndex.assign(shares.size(), std::vector<size_t>());
        for (size_t i = 0; i < shares.size(); ++i) {
            const int node = firstNode + static_cast<int>(i);
            const int from = debitSide ? source : node;
            const int to = debitSide ? node : sink;

            const ScaledTarget target = scaledTarget(shares[i].units, total, scale);
            const long long confidence = confidenceCost(shares[i].probability) + 1;
            const long long floorCap = std::min(floorAmount, total);

            side.arcIndex[i].push_back(addArc(from, to, floorCap, 0));
            if (target.whole > floorCap) {
                side.arcIndex[i].push_back(addArc(from, to, target.whole - floorCap, confidence));
            }
            const long double missing = static_cast<long double>(scale - target.remainder) / static_cast<long double>(scale);
            const long long roundUp = confidence + static_cast<long long>(kRoundUpPenalty * missing);
            side.arcIndex[i].push_back(addArc(from, to, 1, roundUp));
        }
    };

    addCandidateArcs(problem.debit, firstDebit, true);
    addCandidateArcs(problem.credit, firstCredit, false);

    for (int d = 0; d < debitCount; ++d) {
        for (int c = 0; c < creditCount; ++c) {
            addArc(firstDebit + d, firstCredit + c, total, 0);
        }
    }
    return problem;
}

FlowStrategy::FlowStrategy(std::shared_ptr<const MinCostFlowSolver> solver, std::chrono::milliseconds budget)
    : solver_(std::move(solver)), budget_(budget)
{
}

FlowStrategy::~FlowStrategy()
{
    std::lock_guard<std::mutex> lock(pendingMutex_);
    for (auto& p : pending_) p.control->cancelled.store(true);
    for (auto& p : pending_) {
        if (p.worker.joinable()) p.worker.join();
    }
    pending_.clear();
}

size_t FlowStrategy::pendingSolves() const
{
    std::lock_guard<std::mutex> lock(pendingMutex_);
    reapFinished();
    return pending_.size();
}

void FlowStrategy::reapFinished() const
{
    auto it = pending_.begin();
    while (it != pending_.end()) {
        if (it->finished->load()) {
            if (it->worker.joinable()) it->worker.join();
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
}

BalancedLines FlowStrategy::balance(
    const std::vector<FilteredCandidate>& debit,
    const std::vector<FilteredCandidate>& credit,
    long long total,
    long long minLine) const
{
    std::string reason;
    try {
        return solveTransport(debit, credit, total, minLine);
    } catch (const SolverUnavailableError& ex) {
        reason = std::string(ex.kind()) + ": " + ex.what();
    } catch (const SolverTimeoutError& ex) {
        reason = std::string(ex.kind()) + ": " + ex.what();
    }

    BalancedLines lines = greedy_.balance(debit, credit, total, minLine);
    lines.decoderUsed = "greedy_fallback";
    lines.fallbackReason = reason;
    return lines;
}

static std::vector<DecodedLine> readSide(
    const SideArcs& side,
    const FlowSolution& solution,
    long long floorAmount)
{
    std::vector<DecodedLine> lines;
    for (size_t i = 0; i < side.candidates.size(); ++i) {
        long long amount = 0;
        for (size_t arc : side.arcIndex[i]) amount += solution.arcFlow[arc];
        if (amount > 0) lines.push_back({ side.candidates[i], amount });
    }

    if (lines.size() != side.candidates.size()) {
        throw SolverUnavailableError("min-cost flow left a candidate without a line");
    }
    if (lines.size() > 1) {
        for (const auto& line : lines) {
            if (line.amount < floorAmount) {
                throw SolverUnavailableError("min-cost flow put " + std::to_string(line.amount) +
                    " on " + line.candidate.accountId + ", below the line minimum");
            }
        }
    }
    return lines;
}

BalancedLines FlowStrategy::solveTransport(
    const std::vector<FilteredCandidate>& debit,
    const std::vector<FilteredCandidate>& credit,
    long long total,
    long long minLine) const
{
    const TransportProblem problem = buildTransportProblem(debit, credit, total, minLine);
    const FlowSolution solution = runBounded(problem.network);

    if (solution.arcFlow.size() != problem.network.arcs.size()) {
        throw SolverUnavailableError("solver returned " + std::to_string(solution.arcFlow.size()) +
            " arc flows for " + std::to_string(problem.network.arcs.size()) + " arcs");
    }
    if (solution.totalFlow != total) {
        throw SolverUnavailableError("min-cost flow moved " + std::to_string(solution.totalFlow) +
            " of " + std::to_string(total) + " minor units");
    }

    const long long floorAmount = std::max(minLine, 1LL);
    BalancedLines lines;
    lines.debit = readSide(problem.debit, solution, floorAmount);
    lines.credit = readSide(problem.credit, solution, floorAmount);
    lines.decoderUsed = "combinatorial";
    return lines;
}

FlowSolution FlowStrategy::runBounded(const FlowNetwork& network) const
{
    if (!solver_) throw SolverUnavailableError("no min-cost flow solver configured");

    try {
        if (budget_.count() <= 0) {
            SolveControl control;
            return solver_->solve(network, control);
        }

        {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            reapFinished();
            if (pending_.size() + running_ >= kMaxPendingSolves) {
                throw SolverUnavailableError(std::to_string(pending_.size()) +
                    " timed-out min-cost flow solves are still running");
            }
            ++running_;
        }

        // The worker owns copies of everything it touches. On timeout it is
        // cancelled and kept until it finishes, then joined.
        auto solver = solver_;
        auto control = std::make_shared<SolveControl>();
        auto finished = std::make_shared<std::atomic<bool>>(false);
        auto task = std::make_shared<std::packaged_task<FlowSolution()>>(
            [solver, network, control]() { return solver->solve(network, *control); });
        std::future<FlowSolution> result = task->get_future();

        std::thread worker;
        try {
            worker = std::thread([task, finished]() { (*task)(); finished->store(true); });
        } catch (const std::system_error&) {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            --running_;
            throw;
        }

        const bool ready = result.wait_for(budget_) == std::future_status::ready;
        if (!ready) {
            control->cancelled.store(true);
            std::lock_guard<std::mutex> lock(pendingMutex_);
            --running_;
            pending_.push_back({ std::move(worker), control, finished });
            throw SolverTimeoutError("min-cost flow exceeded " + std::to_string(budget_.count()) + " ms");
        }

        worker.join();
        {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            --running_;
        }
        return result.get();
    } catch (const SolverUnavailableError&) {
        throw;
    } catch (const SolverTimeoutError&) {
        throw;
    } catch (const std::exception& ex) {
        throw SolverUnavailableError(ex.what());
    }
}
