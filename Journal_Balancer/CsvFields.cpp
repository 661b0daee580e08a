// CsvFields.cpp : Trimming, CSV splitting/quoting and validating number parses.
//

#include "CsvFields.h"

#include <cctype>
#include <cmath>
#include <stdexcept>

std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string toLower(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char ch : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return out;
}

std::vector<std::string> splitCsv(const std::string& line)
{
    std::vector<std::string> cols;
    std::string cur;
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (ch == '"') {
            if (inQuotes && i + 1 < line.size() && line[i + 1] == '"') {
                cur.push_back('"'); ++i; // escaped quote
            } else {
                inQuotes = !inQuotes;
            }
        } else if (ch == ',' && !inQuotes) {
            cols.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    cols.push_back(cur);
    return cols;
}

std::string csvQuote(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char ch : s) {
        if (ch == '"') out.push_back('"'); // escape double-quote by doubling
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

bool parseInteger(const std::string& text, long long& out)
{
    const std::string t = trim(text);
    if (t.empty()) return false;
    try {
        size_t idx = 0;
        long long v = std::stoll(t, &idx, 10);
        if (idx != t.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseNumber(const std::string& text, double& out)
{
    const std::string t = trim(text);
    if (t.empty()) return false;
    try {
        size_t idx = 0;
        double v = std::stod(t, &idx);
        if (idx != t.size() || !std::isfinite(v)) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}
