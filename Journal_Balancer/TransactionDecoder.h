// TransactionDecoder.h : Per-transaction decode (blend, filter, balance, rank)
// and the parallel batch driver.

#pragma once

#include "FlowBalancer.h"
#include "Journal_Balancer.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

struct DecoderSettings {
    int topSuggestions = 3;
    std::chrono::milliseconds solverBudget{ 250 };
    unsigned workers = 1;
};

struct DecodeOutcome {
    std::string transactionId;
    bool ok = false;
    Decision decision;
    std::string errorKind;
    std::string errorMessage;
};

// Throws BalanceInvariantError if the primary allocation breaks the
// double-entry invariants for this request.
void validateDecision(const DecodeRequest& request, const Decision& decision);

class TransactionDecoder {
public:
    explicit TransactionDecoder(const DecoderSettings& settings,
                                std::shared_ptr<const MinCostFlowSolver> solver = std::make_shared<BoostFlowSolver>());

    // Throws the fatal DecodeError kinds; never returns a partial Decision.
    Decision decode(const DecodeRequest& request) const;

    // One outcome per request, in request order. Failures are recorded, never thrown.
    std::vector<DecodeOutcome> decodeBatch(const std::vector<DecodeRequest>& requests) const;

private:
    DecodeOutcome decodeOne(const DecodeRequest& request) const;

    DecoderSettings settings_;
    GreedyStrategy greedy_;
    FlowStrategy flow_;
};
