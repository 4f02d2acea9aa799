#pragma once

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace parseutil {

inline std::string trimCopy(std::string_view s) {
    size_t start = 0;
    while (start < s.size() &&
           std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    size_t end = s.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return std::string(s.substr(start, end - start));
}

// Whole-token conversion: "1.5x" is rejected rather than read as 1.5
inline double parseDoubleStrict(const std::string& raw_value, const std::string& context) {
    const std::string value = trimCopy(raw_value);
    if (value.empty()) {
        throw std::runtime_error("Invalid value for " + context + ": expected number, got empty");
    }
    size_t idx = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &idx);
    } catch (const std::exception&) {
        idx = 0;
    }
    if (idx == 0 || idx != value.size()) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected number, got '" + raw_value + "'");
    }
    return parsed;
}

inline int parseIntStrict(const std::string& raw_value, const std::string& context) {
    const std::string value = trimCopy(raw_value);
    if (value.empty()) {
        throw std::runtime_error("Invalid value for " + context + ": expected integer, got empty");
    }
    size_t idx = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &idx);
    } catch (const std::exception&) {
        idx = 0;
    }
    if (idx == 0 || idx != value.size()) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected integer, got '" + raw_value + "'");
    }
    return parsed;
}

inline std::vector<std::string> splitTokens(const std::string& value, char sep) {
    std::vector<std::string> tokens;
    std::stringstream ss(value);
    std::string token;
    while (std::getline(ss, token, sep)) {
        tokens.push_back(trimCopy(token));
    }
    // getline drops a trailing empty field
    if (!value.empty() && value.back() == sep) {
        tokens.emplace_back();
    }
    return tokens;
}

// "a, b, c" or "[a, b, c]"
inline std::vector<double> parseDoubleListStrict(const std::string& raw_value,
                                                 const std::string& context) {
    std::string value = trimCopy(raw_value);
    if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
        value = trimCopy(std::string_view(value).substr(1, value.size() - 2));
    }
    if (value.empty()) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected comma-separated numbers, got empty");
    }

    std::vector<double> values;
    const std::vector<std::string> tokens = splitTokens(value, ',');
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].empty()) {
            throw std::runtime_error("Invalid value for " + context +
                                     ": empty token at position " + std::to_string(i));
        }
        values.push_back(parseDoubleStrict(tokens[i], context));
    }
    return values;
}

// Exactly two numbers, e.g. "0.05, 0.03"
inline std::pair<double, double> parsePairStrict(const std::string& raw_value,
                                                 const std::string& context) {
    const std::vector<double> values = parseDoubleListStrict(raw_value, context);
    if (values.size() != 2) {
        throw std::runtime_error("Invalid value for " + context + ": expected 2 numbers, got " +
                                 std::to_string(values.size()));
    }
    return {values[0], values[1]};
}

// Sweep axis: "start:end:count" or a single number
struct AxisSpec {
    double start = 0.0;
    double end = 0.0;
    int count = 1;
};

inline AxisSpec parseAxisStrict(const std::string& raw_value, const std::string& context) {
    const std::vector<std::string> parts = splitTokens(trimCopy(raw_value), ':');
    AxisSpec axis;
    if (parts.size() == 1) {
        axis.start = parseDoubleStrict(parts[0], context);
        axis.end = axis.start;
        return axis;
    }
    if (parts.size() != 3) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected START:END:COUNT, got '" + raw_value + "'");
    }
    axis.start = parseDoubleStrict(parts[0], context);
    axis.end = parseDoubleStrict(parts[1], context);
    axis.count = parseIntStrict(parts[2], context);
    if (axis.count < 1) {
        throw std::runtime_error("Invalid value for " + context + ": COUNT must be >= 1");
    }
    return axis;
}

}  // namespace parseutil
