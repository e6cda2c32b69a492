// =============================================================================
// config.cpp - EngineConfig Implementation
// =============================================================================

#include "peerlend/config.hpp"
#include "peerlend/logger.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace peerlend {

// Minimal TOML reader: sections, key = value, comments
namespace {

constexpr const char* WHITESPACE = " \t\r\n";

std::string strip(const std::string& s) {
    size_t first = s.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) return "";
    return s.substr(first, s.find_last_not_of(WHITESPACE) - first + 1);
}

// The line without its "# comment" (outside quotes) and outer whitespace
std::string clean_line(const std::string& line) {
    bool quoted = false;
    size_t end = line.size();
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            quoted = !quoted;
        } else if (line[i] == '#' && !quoted) {
            end = i;
            break;
        }
    }
    return strip(line.substr(0, end));
}

// Quoted or bare value; a quote opened and never closed is an error
std::string string_value(const std::string& key, const std::string& raw) {
    if (raw.empty() || raw.front() != '"') return raw;
    if (raw.size() < 2 || raw.back() != '"') {
        throw std::runtime_error("Unterminated string for " + key + ": " + raw);
    }
    return raw.substr(1, raw.size() - 2);
}

uint32_t parse_uint(const std::string& key, const std::string& value, uint32_t max) {
    size_t pos = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + key + ": " + value);
    }
    if (pos != value.size() || value[0] == '-' || parsed > max) {
        throw std::runtime_error("Invalid value for " + key + ": " + value);
    }
    return static_cast<uint32_t>(parsed);
}

}  // namespace

EngineConfig EngineConfig::from_file(std::string_view path) {
    std::ifstream file{std::string(path)};
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + std::string(path));
    }
    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    return from_toml(content);
}

EngineConfig EngineConfig::from_toml(std::string_view content) {
    EngineConfig config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = clean_line(line);
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                current_section = strip(line.substr(1, end - 1));
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = strip(line.substr(0, eq));
        std::string value = string_value(key, strip(line.substr(eq + 1)));

        if (current_section == "general") {
            if (key == "log_level") {
                try {
                    parse_log_level(value);
                } catch (const std::invalid_argument& e) {
                    throw std::runtime_error(std::string("Invalid value for general.log_level: ") + e.what());
                }
                config.general.log_level = value;
            }
            else if (key == "log_file") config.general.log_file = value;
            else if (key == "risk_category") {
                config.general.risk_category = static_cast<uint8_t>(parse_uint("general.risk_category", value, 255));
            }
        }
        else if (current_section == "iterations") {
            const uint32_t max = 1000000;
            if (key == "supply") config.iterations.supply = parse_uint("iterations.supply", value, max);
            else if (key == "borrow") config.iterations.borrow = parse_uint("iterations.borrow", value, max);
            else if (key == "repay") config.iterations.repay = parse_uint("iterations.repay", value, max);
            else if (key == "withdraw") config.iterations.withdraw = parse_uint("iterations.withdraw", value, max);
        }
    }

    return config;
}

void EngineConfig::init_logging() const {
    Logger::init(parse_log_level(general.log_level), general.log_file);
}

}  // namespace peerlend
