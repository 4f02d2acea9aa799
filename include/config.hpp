#pragma once

#include "parse_utils.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Explicit blade station from a [[section]] block
struct SectionConfigEntry {
    double radius = 0.0;
    double chord = 0.0;
    double twist = 0.0;
    // Per-section airfoil tables; empty means "use the global alpha_deg/cl/cd"
    std::vector<double> alpha_deg;
    std::vector<double> cl;
    std::vector<double> cd;
    int line = 0;  // Line of the [[section]] marker, for error messages
};

// key = value config file parser with [[section]] block support.
// '#' starts a comment anywhere on a line.
class Config {
public:
    static Config load(const std::string& filename);
    static Config parse(const std::string& text, const std::string& source = "<string>");

    bool hasSections() const { return !sections_.empty(); }
    const std::vector<SectionConfigEntry>& getSectionEntries() const { return sections_; }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    std::string getString(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            throw std::runtime_error("Missing config key: " + key);
        }
        return it->second;
    }

    std::string getString(const std::string& key, const std::string& default_val) const {
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    double getDouble(const std::string& key) const {
        return parseutil::parseDoubleStrict(getString(key), "'" + key + "'");
    }

    double getDouble(const std::string& key, double default_val) const {
        if (!has(key)) return default_val;
        return getDouble(key);
    }

    int getInt(const std::string& key) const {
        return parseutil::parseIntStrict(getString(key), "'" + key + "'");
    }

    int getInt(const std::string& key, int default_val) const {
        if (!has(key)) return default_val;
        return getInt(key);
    }

    bool getBool(const std::string& key, bool default_val) const;

    std::vector<double> getDoubleList(const std::string& key) const;
    std::pair<double, double> getPair(const std::string& key) const;
    std::pair<double, double> getPair(const std::string& key,
                                      const std::pair<double, double>& default_val) const;

    // "start:end:count" or a single value, expanded to the grid values
    std::vector<double> getAxis(const std::string& key) const;

private:
    std::map<std::string, std::string> values_;
    std::vector<SectionConfigEntry> sections_;
};
