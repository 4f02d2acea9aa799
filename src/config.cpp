#include "config.hpp"
#include "grid.hpp"

#include <fstream>
#include <sstream>
#include <vector>

namespace {

struct SectionRequiredFields {
    bool radius = false;
    bool chord = false;
    bool twist = false;
};

std::string stripInlineComment(const std::string& s) {
    size_t hash = s.find('#');
    if (hash == std::string::npos) {
        return s;
    }
    return s.substr(0, hash);
}

void validateSection(const SectionRequiredFields& fields, int section_start_line) {
    std::vector<std::string> missing;
    if (!fields.radius) missing.push_back("radius");
    if (!fields.chord) missing.push_back("chord");
    if (!fields.twist) missing.push_back("twist");

    if (missing.empty()) {
        return;
    }

    std::string msg = "Missing required parameter(s) in [[section]] starting at line " +
                      std::to_string(section_start_line) + ": ";
    for (size_t i = 0; i < missing.size(); ++i) {
        msg += missing[i];
        if (i + 1 < missing.size()) {
            msg += ", ";
        }
    }
    throw std::runtime_error(msg);
}

double parseDoubleAtLine(const std::string& value, const std::string& key, int line_num) {
    try {
        return parseutil::parseDoubleStrict(value, "'" + key + "'");
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for '" + key + "' at line " +
                                 std::to_string(line_num) + ": " + value);
    }
}

std::vector<double> parseListAtLine(const std::string& value, const std::string& key, int line_num) {
    try {
        return parseutil::parseDoubleListStrict(value, "'" + key + "'");
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string(e.what()) + " (line " + std::to_string(line_num) + ")");
    }
}

}  // namespace

bool Config::getBool(const std::string& key, bool default_val) const {
    if (!has(key)) return default_val;
    std::string val = getString(key);
    if (val == "true" || val == "1" || val == "yes") return true;
    if (val == "false" || val == "0" || val == "no") return false;
    throw std::runtime_error("Invalid value for '" + key + "': expected bool, got '" + val + "'");
}

std::vector<double> Config::getDoubleList(const std::string& key) const {
    return parseutil::parseDoubleListStrict(getString(key), "'" + key + "'");
}

std::pair<double, double> Config::getPair(const std::string& key) const {
    return parseutil::parsePairStrict(getString(key), "'" + key + "'");
}

std::pair<double, double> Config::getPair(const std::string& key,
                                          const std::pair<double, double>& default_val) const {
    if (!has(key)) return default_val;
    return getPair(key);
}

std::vector<double> Config::getAxis(const std::string& key) const {
    const parseutil::AxisSpec axis = parseutil::parseAxisStrict(getString(key), "'" + key + "'");
    return linspace(axis.start, axis.end, axis.count);
}

Config Config::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), filename);
}

Config Config::parse(const std::string& text, const std::string& source) {
    Config config;
    std::istringstream in(text);

    std::string line;
    int line_num = 0;
    bool in_section = false;
    SectionConfigEntry current;
    SectionRequiredFields fields;
    auto finalizeSection = [&]() {
        validateSection(fields, current.line);
        config.sections_.push_back(current);
    };

    while (std::getline(in, line)) {
        line_num++;

        std::string uncommented = stripInlineComment(line);
        std::string trimmed = parseutil::trimCopy(uncommented);
        if (trimmed.empty()) {
            continue;
        }

        if (trimmed == "[[section]]") {
            if (in_section) {
                finalizeSection();
            }
            in_section = true;
            current = SectionConfigEntry();
            current.line = line_num;
            fields = SectionRequiredFields();
            continue;
        }

        size_t eq = uncommented.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error(source + ": invalid config line " + std::to_string(line_num) +
                                     ": " + line);
        }

        std::string key = parseutil::trimCopy(uncommented.substr(0, eq));
        std::string value = parseutil::trimCopy(uncommented.substr(eq + 1));

        if (key.empty()) {
            throw std::runtime_error(source + ": empty key at line " + std::to_string(line_num));
        }

        if (in_section) {
            if (key == "radius") {
                current.radius = parseDoubleAtLine(value, key, line_num);
                fields.radius = true;
            } else if (key == "chord") {
                current.chord = parseDoubleAtLine(value, key, line_num);
                fields.chord = true;
            } else if (key == "twist") {
                current.twist = parseDoubleAtLine(value, key, line_num);
                fields.twist = true;
            } else if (key == "alpha_deg") {
                current.alpha_deg = parseListAtLine(value, key, line_num);
            } else if (key == "cl") {
                current.cl = parseListAtLine(value, key, line_num);
            } else if (key == "cd") {
                current.cd = parseListAtLine(value, key, line_num);
            } else {
                throw std::runtime_error("Unknown section parameter '" + key + "' at line " +
                                         std::to_string(line_num));
            }
        } else {
            config.values_[key] = value;
        }
    }

    if (in_section) {
        finalizeSection();
    }

    return config;
}
