/**
 * @file datafeed.cpp
 * @brief CSV price data loading
 */

#include "cbt/datafeed.hpp"
#include "cbt/datetime.hpp"
#include "cbt/errors.hpp"
#include "cbt/log.hpp"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace cbt {

namespace {

bool isInteger(const std::string& s) {
    if (s.empty()) return false;
    Size i = (s[0] == '-') ? 1 : 0;
    if (i == s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

Value parseNumber(const std::string& s) {
    Size consumed = 0;
    Value v = std::stod(s, &consumed);
    if (consumed != s.size()) {
        throw std::invalid_argument("trailing characters in '" + s + "'");
    }
    return v;
}

Timestamp parseTime(const std::string& s) {
    if (isInteger(s)) {
        return std::stoll(s);
    }
    return parseTimestamp(s);
}

} // namespace

CsvPriceFeed::CsvPriceFeed(std::string filepath, const Params& params)
    : filepath_(std::move(filepath)), params_(resolveParams(getDefaultParams(), params)) {}

std::vector<std::string> CsvPriceFeed::split(const std::string& line, char sep) {
    std::vector<std::string> result;
    std::stringstream ss(line);
    std::string item;
    while (std::getline(ss, item, sep)) {
        size_t start = item.find_first_not_of(" \t\r\n");
        size_t end = item.find_last_not_of(" \t\r\n");
        if (start != std::string::npos) {
            result.push_back(item.substr(start, end - start + 1));
        } else {
            result.push_back("");
        }
    }
    return result;
}

PriceSeries CsvPriceFeed::load() const {
    std::ifstream file(filepath_);
    if (!file.is_open()) {
        throw IoError("cannot open " + filepath_);
    }
    PriceSeries series = read(file, filepath_);
    CBT_LOG_INFO("loaded " << series.size() << " bars from " << filepath_);
    return series;
}

PriceSeries CsvPriceFeed::read(std::istream& in, const std::string& source) const {
    char sep = ',';
    long sepType = params_.getInt("separator");
    if (sepType == 1) sep = '\t';
    else if (sepType == 2) sep = ';';

    const long headerRows = params_.getInt("header");
    const long tsCol = params_.getInt("timestamp");
    const long oCol = params_.getInt("open");
    const long hCol = params_.getInt("high");
    const long lCol = params_.getInt("low");
    const long cCol = params_.getInt("close");
    const long vCol = params_.getInt("volume");

    PriceSeries series({}, symbol_, timeframe_);
    std::string line;
    Size lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (static_cast<long>(lineNo) <= headerRows) continue;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        std::vector<std::string> cols = split(line, sep);
        auto column = [&](long idx, const char* name) -> const std::string& {
            if (idx < 0 || idx >= static_cast<long>(cols.size())) {
                throw IoError(source + ":" + std::to_string(lineNo) + ": missing " + name + " column");
            }
            return cols[static_cast<Size>(idx)];
        };

        Bar bar;
        try {
            bar.timestamp = parseTime(column(tsCol, "timestamp"));
            bar.open = parseNumber(column(oCol, "open"));
            bar.high = parseNumber(column(hCol, "high"));
            bar.low = parseNumber(column(lCol, "low"));
            bar.close = parseNumber(column(cCol, "close"));
            bar.volume = vCol >= 0 ? parseNumber(column(vCol, "volume")) : 0.0;
        } catch (const std::logic_error& e) {
            // std::invalid_argument / std::out_of_range from the number and date parsers
            throw IoError(source + ":" + std::to_string(lineNo) + ": malformed row: " + e.what());
        }
        series.addBar(bar);
    }
    return series;
}

void CsvPriceFeed::save(const PriceSeries& series, std::ostream& out) {
    out << "timestamp,open,high,low,close,volume\n";
    out << std::setprecision(17);
    for (const auto& bar : series.bars()) {
        out << bar.timestamp << ',' << bar.open << ',' << bar.high << ','
            << bar.low << ',' << bar.close << ',' << bar.volume << '\n';
    }
}

void CsvPriceFeed::save(const PriceSeries& series, const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw IoError("cannot write " + filepath);
    }
    save(series, file);
    if (!file) {
        throw IoError("write failed for " + filepath);
    }
}

} // namespace cbt
