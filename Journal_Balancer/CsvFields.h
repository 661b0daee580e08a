// CsvFields.h : Text helpers shared by the configuration and record readers
// and the CSV report.

#pragma once

#include <string>
#include <vector>

// Trim leading/trailing whitespace
std::string trim(const std::string& s);

std::string toLower(const std::string& s);

// Split one CSV line. Double-quoted fields may hold commas; "" is an escaped quote.
std::vector<std::string> splitCsv(const std::string& line);

// Wrap in double quotes, doubling embedded quotes.
std::string csvQuote(const std::string& s);

// Whole-token parses. Return false on empty input, trailing characters,
// out-of-range values or (for parseNumber) non-finite results.
bool parseInteger(const std::string& text, long long& out);
bool parseNumber(const std::string& text, double& out);
