// BatchRunner.h : Transaction record reader, CSV report and the batch driver
// behind the journal_balancer command line.

#pragma once

#include "BalancerConfig.h"
#include "Journal_Balancer.h"
#include "TransactionDecoder.h"

#include <iosfwd>
#include <string>
#include <vector>

class RecordFormatError : public DecodeError {
public:
    explicit RecordFormatError(const std::string& message)
        : DecodeError("RecordFormatError", message) {}
};

// One transaction block of the input. A non-empty error means the block was
// malformed; request then holds whatever was read before the failure.
struct BatchRecord {
    DecodeRequest request;
    int line = 0;  // line of the tx record
    std::string error;
};

// Reads tx ... end blocks. Request defaults (thresholds, max k, min line,
// decoder) come from config. A malformed block is returned with its error and
// reading resumes at the next tx line.
std::vector<BatchRecord> readBatch(std::istream& in, const BalancerConfig& config);

// Keyword rules and, when blend_external_weight > 0, the keyword pair predictor.
void resolveRecord(DecodeRequest& request, const BalancerConfig& config, const PairwisePredictor& predictor);

void printDecisionCsvHeader();
void printDecisionRows(const Decision& decision);
void printFailureRow(const std::string& transactionId, const std::string& kind, const std::string& message);

// Decodes every record and prints the report on std::cout. Returns 0 when every
// transaction decoded, 2 otherwise.
int runBatch(std::istream& in, const BalancerConfig& config);
