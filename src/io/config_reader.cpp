/**
 * @file config_reader.cpp
 * @brief Configuration reader implementation
 */

#include <peribond/io/config_reader.hpp>

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace prb {
namespace io {

// ============================================================================
// ConfigSection Implementation
// ============================================================================

std::string ConfigSection::get_string(const std::string& key, const std::string& default_val) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;

    if (const auto* str = std::get_if<std::string>(&it->second)) {
        return *str;
    }
    return default_val;
}

Real ConfigSection::get_real(const std::string& key, Real default_val) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;

    if (const auto* r = std::get_if<Real>(&it->second)) {
        return *r;
    }
    if (const auto* i = std::get_if<Int>(&it->second)) {
        return static_cast<Real>(*i);
    }
    throw InvalidArgumentError("Config key '" + key + "' in section '" + name_ +
                               "' expects a number");
}

Int ConfigSection::get_int(const std::string& key, Int default_val) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;

    if (const auto* i = std::get_if<Int>(&it->second)) {
        return *i;
    }
    if (const auto* r = std::get_if<Real>(&it->second)) {
        if (!std::isfinite(*r) || std::trunc(*r) != *r ||
            *r < static_cast<Real>(std::numeric_limits<Int>::min()) ||
            *r > static_cast<Real>(std::numeric_limits<Int>::max())) {
            throw InvalidArgumentError("Config key '" + key + "' in section '" + name_ +
                                       "' expects an integer");
        }
        return static_cast<Int>(*r);
    }
    throw InvalidArgumentError("Config key '" + key + "' in section '" + name_ +
                               "' expects an integer");
}

bool ConfigSection::get_bool(const std::string& key, bool default_val) const {
    auto it = values_.find(key);
    if (it == values_.end()) return default_val;

    if (const auto* b = std::get_if<bool>(&it->second)) {
        return *b;
    }
    return default_val;
}

std::vector<Real> ConfigSection::get_real_array(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return {};

    if (const auto* reals = std::get_if<std::vector<Real>>(&it->second)) {
        return *reals;
    }
    if (const auto* ints = std::get_if<std::vector<Int>>(&it->second)) {
        return std::vector<Real>(ints->begin(), ints->end());
    }
    return {};
}

std::vector<Int> ConfigSection::get_int_array(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return {};

    if (const auto* ints = std::get_if<std::vector<Int>>(&it->second)) {
        return *ints;
    }
    return {};
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    return result;
}

ConfigSection& ConfigSection::subsection(const std::string& name) {
    auto& slot = subsections_[name];
    if (!slot) {
        slot = std::make_shared<ConfigSection>(name);
    }
    return *slot;
}

const ConfigSection& ConfigSection::subsection(const std::string& name) const {
    auto it = subsections_.find(name);
    if (it == subsections_.end()) {
        throw InvalidArgumentError("Config subsection not found: " + name);
    }
    return *it->second;
}

std::vector<std::string> ConfigSection::subsection_names() const {
    std::vector<std::string> result;
    result.reserve(subsections_.size());
    for (const auto& [name, _] : subsections_) {
        result.push_back(name);
    }
    return result;
}

// ============================================================================
// ConfigReader Implementation
// ============================================================================

ConfigSection ConfigReader::read(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw FileIOError(filename, "open");
    }

    PRB_LOG_INFO("Reading config file: {}", filename);

    std::stringstream buffer;
    buffer << file.rdbuf();
    return read_string(buffer.str());
}

ConfigSection ConfigReader::read_string(const std::string& content) {
    ConfigSection root("root");
    parse(content, root);
    return root;
}

void ConfigReader::parse(const std::string& content, ConfigSection& root) {
    std::istringstream stream(content);
    std::string line;

    section_stack_.assign(1, &root);
    indent_stack_.assign(1, -1);

    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        // Drop trailing comments outside of quotes
        std::size_t hash = trimmed.find(" #");
        if (hash != std::string::npos && trimmed.find('"') == std::string::npos) {
            trimmed = trim(trimmed.substr(0, hash));
        }

        const int indent = get_indent_level(line);

        // Leave every section opened at this indent or deeper
        while (indent_stack_.size() > 1 && indent <= indent_stack_.back()) {
            indent_stack_.pop_back();
            section_stack_.pop_back();
        }
        ConfigSection* current = section_stack_.back();

        std::size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            PRB_LOG_WARN("Ignoring config line without key: '{}'", trimmed);
            continue;
        }

        std::string key = trim(trimmed.substr(0, colon));
        std::string value_str = trim(trimmed.substr(colon + 1));

        if (value_str.empty()) {
            PRB_LOG_DEBUG("Config section '{}' under '{}'", key, current->name());
            section_stack_.push_back(&current->subsection(key));
            indent_stack_.push_back(indent);
        } else {
            current->set(key, parse_value(value_str));
        }
    }
}

ConfigValue ConfigReader::parse_value(const std::string& value_str) {
    std::string trimmed = trim(value_str);

    // Quoted string
    if (trimmed.size() >= 2 &&
        ((trimmed.front() == '"' && trimmed.back() == '"') ||
         (trimmed.front() == '\'' && trimmed.back() == '\''))) {
        return trimmed.substr(1, trimmed.size() - 2);
    }

    // Inline array [a, b, c]
    if (trimmed.size() >= 2 && trimmed.front() == '[' && trimmed.back() == ']') {
        std::vector<Real> reals;
        std::vector<Int> ints;
        bool all_int = true;

        std::istringstream iss(trimmed.substr(1, trimmed.size() - 2));
        std::string item;
        while (std::getline(iss, item, ',')) {
            item = trim(item);
            if (item.empty()) continue;

            auto number = parse_number(item);
            if (!number) {
                throw InvalidArgumentError("Config array element is not a number: '" + item + "'");
            }
            if (const auto* i = std::get_if<Int>(&*number)) {
                ints.push_back(*i);
                reals.push_back(static_cast<Real>(*i));
            } else {
                reals.push_back(std::get<Real>(*number));
                all_int = false;
            }
        }

        if (all_int) {
            return ints;
        }
        return reals;
    }

    if (trimmed == "true" || trimmed == "True" || trimmed == "TRUE") {
        return true;
    }
    if (trimmed == "false" || trimmed == "False" || trimmed == "FALSE") {
        return false;
    }

    if (auto number = parse_number(trimmed)) {
        return *number;
    }

    return trimmed;
}

std::optional<ConfigValue> ConfigReader::parse_number(const std::string& str) {
    const bool looks_real = str.find_first_of(".eE") != std::string::npos;
    std::size_t consumed = 0;

    try {
        if (looks_real) {
            Real value = std::stod(str, &consumed);
            if (consumed == str.size()) return ConfigValue{value};
        } else {
            Int value = static_cast<Int>(std::stoi(str, &consumed));
            if (consumed == str.size()) return ConfigValue{value};
        }
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        throw InvalidArgumentError("Config number out of range: '" + str + "'");
    }
    return std::nullopt;
}

int ConfigReader::get_indent_level(const std::string& line) {
    int count = 0;
    for (char c : line) {
        if (c == ' ') {
            count++;
        } else if (c == '\t') {
            count += 4;  // Treat tab as 4 spaces
        } else {
            break;
        }
    }
    return count;
}

std::string ConfigReader::trim(const std::string& str) {
    std::size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    std::size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

} // namespace io
} // namespace prb
