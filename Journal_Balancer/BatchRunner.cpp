// BatchRunner.cpp : Reads transaction records, decodes them in a batch and
// prints the CSV report. Also holds main() for the journal_balancer tool.
//

#include "BatchRunner.h"
#include "CsvFields.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <new>
#include <optional>

// --- Record reader ---

static RecordFormatError recordError(int lineNo, const std::string& message)
{
    return RecordFormatError("line " + std::to_string(lineNo) + ": " + message);
}

static double readProbability(int lineNo, const std::string& what, const std::string& text)
{
    double v = 0.0;
    if (!parseNumber(text, v) || v < 0.0 || v > 1.0) {
        throw recordError(lineNo, what + " must be a number in [0, 1], got '" + text + "'");
    }
    return v;
}

static long long readCount(int lineNo, const std::string& what, const std::string& text)
{
    long long v = 0;
    if (!parseInteger(text, v) || v < 1) {
        throw recordError(lineNo, what + " must be a positive integer, got '" + text + "'");
    }
    return v;
}

static void requireFields(int lineNo, const std::vector<std::string>& cols, size_t lo, size_t hi, const char* usage)
{
    if (cols.size() < lo || cols.size() > hi) {
        throw recordError(lineNo, std::string("expected ") + usage);
    }
}

static void startTransaction(BatchRecord& record, int lineNo, const std::vector<std::string>& cols,
                             const BalancerConfig& config)
{
    DecodeRequest& req = record.request;
    req.thresholdDebit = config.thresholdDebit;
    req.thresholdCredit = config.thresholdCredit;
    req.maxKPerSide = config.maxKPerSide;
    req.minLineAmount = config.minLineAmount;
    req.decoder = config.decoder;
    record.line = lineNo;

    if (cols.size() < 3) throw recordError(lineNo, "expected tx,<id>,<total>[,<k_debit>,<k_credit>[,<description>]]");
    req.transactionId = cols[1];
    if (req.transactionId.empty()) throw recordError(lineNo, "transaction id is empty");

    if (!parseInteger(cols[2], req.total)) {
        throw recordError(lineNo, "total must be an integer number of minor units, got '" + cols[2] + "'");
    }
    if (cols.size() == 4) throw recordError(lineNo, "tx gives k_debit without k_credit");
    if (cols.size() >= 5) {
        req.predictedKDebit = static_cast<int>(std::min<long long>(readCount(lineNo, "k_debit", cols[3]), 1000));
        req.predictedKCredit = static_cast<int>(std::min<long long>(readCount(lineNo, "k_credit", cols[4]), 1000));
    }
    // Unquoted commas in the description are kept
    for (size_t i = 5; i < cols.size(); ++i) {
        if (i > 5) req.description.push_back(',');
        req.description += cols[i];
    }
}

static void readCandidate(std::vector<ScoredCandidate>& pool, int lineNo, const std::vector<std::string>& cols)
{
    requireFields(lineNo, cols, 3, 4, "<side>,<account>,<probability>[,<share>]");
    ScoredCandidate c;
    c.accountId = cols[1];
    if (c.accountId.empty()) throw recordError(lineNo, "account id is empty");
    c.probability = readProbability(lineNo, "probability", cols[2]);
    if (cols.size() == 4 && !cols[3].empty()) {
        if (!parseNumber(cols[3], c.share) || c.share < 0.0) {
            throw recordError(lineNo, "share must be a non-negative number, got '" + cols[3] + "'");
        }
    }
    pool.push_back(c);
}

static void readSideRule(DecodeRequest& req, int lineNo, const std::vector<std::string>& cols, bool force)
{
    requireFields(lineNo, cols, 3, 3, "<force|block>,<debit|credit|both>,<account>");
    SideScope scope = SideScope::Both;
    if (!parseSideScope(cols[1], scope)) {
        throw recordError(lineNo, "side must be debit, credit or both, got '" + cols[1] + "'");
    }
    if (cols[2].empty()) throw recordError(lineNo, "account id is empty");

    auto apply = [&](SideRules& rules) {
        if (force) rules.forced.insert(cols[2]);
        else rules.blocked.insert(cols[2]);
    };
    if (scope != SideScope::Credit) apply(req.debitRules);
    if (scope != SideScope::Debit) apply(req.creditRules);
}

static void readDetail(DecodeRequest& req, int lineNo, const std::string& tag, const std::vector<std::string>& cols)
{
    if (tag == "debit") {
        readCandidate(req.debitCandidates, lineNo, cols);
    } else if (tag == "credit") {
        readCandidate(req.creditCandidates, lineNo, cols);
    } else if (tag == "threshold") {
        requireFields(lineNo, cols, 3, 3, "threshold,<debit>,<credit>");
        req.thresholdDebit = readProbability(lineNo, "debit threshold", cols[1]);
        req.thresholdCredit = readProbability(lineNo, "credit threshold", cols[2]);
    } else if (tag == "max_k") {
        requireFields(lineNo, cols, 2, 2, "max_k,<n>");
        req.maxKPerSide = static_cast<int>(std::min<long long>(readCount(lineNo, "max_k", cols[1]), 64));
    } else if (tag == "min_line") {
        requireFields(lineNo, cols, 2, 2, "min_line,<n>");
        req.minLineAmount = readCount(lineNo, "min_line", cols[1]);
    } else if (tag == "pin") {
        requireFields(lineNo, cols, 4, 4, "pin,<debit|credit>,<account>,<amount>");
        const std::string side = toLower(cols[1]);
        if (side != "debit" && side != "credit") {
            throw recordError(lineNo, "pin side must be debit or credit, got '" + cols[1] + "'");
        }
        if (cols[2].empty()) throw recordError(lineNo, "account id is empty");
        PinnedLine pin;
        pin.accountId = cols[2];
        pin.amount = readCount(lineNo, "pinned amount", cols[3]);
        (side == "debit" ? req.pinnedDebit : req.pinnedCredit).push_back(pin);
    } else if (tag == "force" || tag == "block") {
        readSideRule(req, lineNo, cols, tag == "force");
    } else if (tag == "external") {
        requireFields(lineNo, cols, 4, 4, "external,<debit account>,<credit account>,<weight>");
        if (cols[1].empty() || cols[2].empty()) throw recordError(lineNo, "external account id is empty");
        ExternalPrediction ext;
        ext.debitAccountId = cols[1];
        ext.creditAccountId = cols[2];
        ext.weight = readProbability(lineNo, "external weight", cols[3]);
        req.externalPrediction = ext;
    } else if (tag == "decoder") {
        requireFields(lineNo, cols, 2, 2, "decoder,<greedy|combinatorial>");
        if (!parseDecoderKind(cols[1], req.decoder)) {
            throw recordError(lineNo, "decoder must be greedy or combinatorial, got '" + cols[1] + "'");
        }
    } else {
        throw recordError(lineNo, "unknown record '" + tag + "'");
    }
}

std::vector<BatchRecord> readBatch(std::istream& in, const BalancerConfig& config)
{
    std::vector<BatchRecord> records;
    std::optional<BatchRecord> open;
    bool skipping = false;  // after an error, until the next tx

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;

        auto cols = splitCsv(s);
        for (auto& c : cols) c = trim(c);
        const std::string tag = toLower(cols[0]);

        try {
            if (tag == "tx") {
                if (open) {
                    open->error = "line " + std::to_string(open->line) + ": transaction " +
                        open->request.transactionId + " has no end record";
                    records.push_back(std::move(*open));
                }
                skipping = false;
                open.emplace();
                startTransaction(*open, lineNo, cols, config);
            } else if (skipping) {
                continue;
            } else if (!open) {
                throw recordError(lineNo, "'" + tag + "' record outside a transaction");
            } else if (tag == "end") {
                requireFields(lineNo, cols, 1, 1, "end");
                records.push_back(std::move(*open));
                open.reset();
            } else {
                readDetail(open->request, lineNo, tag, cols);
            }
        } catch (const RecordFormatError& ex) {
            BatchRecord failed;
            if (open) {
                failed = std::move(*open);
                open.reset();
            } else {
                failed.line = lineNo;
            }
            failed.error = ex.what();
            records.push_back(std::move(failed));
            skipping = true;
        }
    }

    if (open) {
        open->error = "line " + std::to_string(open->line) + ": transaction " +
            open->request.transactionId + " has no end record";
        records.push_back(std::move(*open));
    }
    return records;
}

void resolveRecord(DecodeRequest& request, const BalancerConfig& config, const PairwisePredictor& predictor)
{
    applyKeywordRules(request, config.rules);
    attachExternalPrediction(request, predictor, config.blendExternalWeight);
}

// --- CSV report ---

void printDecisionCsvHeader()
{
    std::cout << "TxId,Status,Decoder,Rank,Side,Account,Amount,Probability,Detail\n";
}

static double lineProbability(const Decision& decision, const Allocation& line)
{
    for (const auto& c : decision.debug.candidates) {
        if (c.side == line.side && c.accountId == line.accountId) return c.probability;
    }
    return 0.0;
}

static void printAllocationRows(const Decision& decision, int rank,
                                const std::vector<Allocation>& lines, double joint)
{
    for (const auto& a : lines) {
        std::cout << csvQuote(decision.transactionId) << ",OK," << decision.debug.decoderUsed
                  << "," << rank << "," << sideName(a.side) << "," << csvQuote(a.accountId)
                  << "," << a.amount
                  << "," << std::fixed << std::setprecision(6) << lineProbability(decision, a)
                  << "," << joint << "\n";
    }
}

void printDecisionRows(const Decision& decision)
{
    printAllocationRows(decision, 0, decision.primary, decision.debug.primaryJointProbability);

    int rank = 1;
    for (const auto& alt : decision.alternates) {
        printAllocationRows(decision, rank++, alt.lines, alt.jointProbability);
    }

    for (const auto& c : decision.debug.candidates) {
        std::cout << csvQuote(decision.transactionId) << ",Debug," << decision.debug.decoderUsed
                  << ",," << sideName(c.side) << "," << csvQuote(c.accountId)
                  << ",," << std::fixed << std::setprecision(6) << c.probability << ",";
        if (c.status == AuditStatus::FilteredOut || c.status == AuditStatus::Pinned) std::cout << auditStatusName(c.status) << "\n";
        else std::cout << auditStatusName(c.status) << " " << c.share << "\n";
    }
}

void printFailureRow(const std::string& transactionId, const std::string& kind, const std::string& message)
{
    std::cout << csvQuote(transactionId) << "," << kind << ",,,,,,," << csvQuote(message) << "\n";
}

// --- Batch driver ---

int runBatch(std::istream& in, const BalancerConfig& config)
{
    std::vector<BatchRecord> records = readBatch(in, config);
    const KeywordPairPredictor predictor(config.pairs);

    std::vector<DecodeRequest> requests;
    std::vector<size_t> slot(records.size(), 0);
    for (size_t i = 0; i < records.size(); ++i) {
        if (!records[i].error.empty()) continue;
        resolveRecord(records[i].request, config, predictor);
        slot[i] = requests.size();
        requests.push_back(records[i].request);
    }

    if (config.verbose) {
        std::cerr << "Decoding " << requests.size() << " transaction(s) with " << config.workers
                  << " worker(s).\n";
    }
    const TransactionDecoder decoder(decoderSettings(config));
    const std::vector<DecodeOutcome> outcomes = decoder.decodeBatch(requests);

    printDecisionCsvHeader();
    size_t decoded = 0;
    for (size_t i = 0; i < records.size(); ++i) {
        const BatchRecord& record = records[i];
        if (!record.error.empty()) {
            if (config.verbose) std::cerr << "RecordFormatError: " << record.error << "\n";
            printFailureRow(record.request.transactionId, "RecordFormatError", record.error);
            continue;
        }

        const DecodeOutcome& outcome = outcomes[slot[i]];
        if (!outcome.ok) {
            if (config.verbose) {
                std::cerr << "Transaction " << outcome.transactionId << ": " << outcome.errorKind
                          << ": " << outcome.errorMessage << "\n";
            }
            printFailureRow(outcome.transactionId, outcome.errorKind, outcome.errorMessage);
            continue;
        }

        if (config.verbose && !outcome.decision.debug.fallbackReason.empty()) {
            std::cerr << "Transaction " << outcome.transactionId << ": fell back to greedy ("
                      << outcome.decision.debug.fallbackReason << ")\n";
        }
        printDecisionRows(outcome.decision);
        ++decoded;
    }

    std::cerr << "Decoded " << decoded << "/" << records.size() << " transaction(s).\n";
    return decoded == records.size() ? 0 : 2;
}

#ifndef JOURNAL_BALANCER_NO_MAIN
static void printUsage()
{
    std::cerr << "Usage: journal_balancer [--config <file>] [<input file>]\n"
              << "Reads transaction records from the input file, or stdin when none is given.\n";
}

int main(int argc, char* argv[])
{
    try {
        std::string configPath;
        std::string inputPath;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--config") {
                if (i + 1 >= argc) {
                    printUsage();
                    return EXIT_FAILURE;
                }
                configPath = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage();
                return EXIT_FAILURE;
            } else if (inputPath.empty()) {
                inputPath = arg;
            } else {
                printUsage();
                return EXIT_FAILURE;
            }
        }

        BalancerConfig config;
        if (!configPath.empty()) config = loadConfigFile(configPath);
        if (config.verbose) {
            std::cerr << "Config: decoder=" << decoderKindName(config.decoder)
                      << " threshold=" << config.thresholdDebit << "/" << config.thresholdCredit
                      << " max_k=" << config.maxKPerSide
                      << " budget_ms=" << config.solverTimeBudgetMs << "\n";
        }

        if (inputPath.empty() || inputPath == "-") return runBatch(std::cin, config);

        std::ifstream in(inputPath);
        if (!in) {
            std::cerr << "Error: cannot open input file " << inputPath << "\n";
            return EXIT_FAILURE;
        }
        return runBatch(in, config);
    } catch (const ConfigError& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n";
        return EXIT_FAILURE;
    } catch (const std::bad_alloc& ex) {
        std::cerr << "Error: memory allocation failed (std::bad_alloc). " << ex.what() << "\n";
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        std::cerr << "Unhandled exception: " << ex.what() << "\n";
        return EXIT_FAILURE;
    } catch (...) {
        std::cerr << "Unhandled unknown exception.\n";
        return EXIT_FAILURE;
    }
}
#endif
