#pragma once

/**
 * @file config_reader.hpp
 * @brief Configuration file reader for bond list set-up parameters
 *
 * Supports a simple YAML-like format:
 * ```
 * logging:
 *   level: "info"
 *
 * neighbor_list:
 *   horizon: 0.1
 *   capacity: 0
 *   capacity_margin: 2
 *   search: cell_list
 *   overflow: throw
 *
 * lattice:
 *   counts: [40, 20]
 *   spacing: 0.025
 * ```
 * Nesting follows indentation, `#` starts a comment line.
 */

#include <peribond/core/core.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prb {
namespace io {

using ConfigValue = std::variant<
    std::string,
    Real,
    Int,
    bool,
    std::vector<Real>,
    std::vector<Int>
>;

/**
 * @brief Hierarchical key-value storage
 */
class ConfigSection {
public:
    ConfigSection() = default;
    explicit ConfigSection(const std::string& name) : name_(name) {}

    const std::string& name() const { return name_; }

    bool has(const std::string& key) const {
        return values_.count(key) > 0;
    }

    std::string get_string(const std::string& key, const std::string& default_val = "") const;

    /**
     * @brief Integers are accepted and widened
     * @throws InvalidArgumentError if the key holds a non-numeric value
     */
    Real get_real(const std::string& key, Real default_val = 0.0) const;

    /**
     * @throws InvalidArgumentError if the value is non-numeric, has a fractional
     *         part or does not fit in Int
     */
    Int get_int(const std::string& key, Int default_val = 0) const;

    bool get_bool(const std::string& key, bool default_val = false) const;

    std::vector<Real> get_real_array(const std::string& key) const;
    std::vector<Int> get_int_array(const std::string& key) const;

    void set(const std::string& key, const ConfigValue& value) {
        values_[key] = value;
    }

    std::vector<std::string> keys() const;

    /**
     * @brief Get or create a subsection
     */
    ConfigSection& subsection(const std::string& name);

    /**
     * @throws InvalidArgumentError if the subsection does not exist
     */
    const ConfigSection& subsection(const std::string& name) const;

    bool has_subsection(const std::string& name) const {
        return subsections_.count(name) > 0;
    }

    std::vector<std::string> subsection_names() const;

private:
    std::string name_;
    std::map<std::string, ConfigValue> values_;
    std::map<std::string, std::shared_ptr<ConfigSection>> subsections_;
};

class ConfigReader {
public:
    ConfigReader() = default;

    /**
     * @throws FileIOError if the file cannot be opened
     */
    ConfigSection read(const std::string& filename);

    ConfigSection read_string(const std::string& content);

private:
    void parse(const std::string& content, ConfigSection& root);

    static ConfigValue parse_value(const std::string& value_str);
    static std::optional<ConfigValue> parse_number(const std::string& str);
    static int get_indent_level(const std::string& line);
    static std::string trim(const std::string& str);

    std::vector<ConfigSection*> section_stack_;
    std::vector<int> indent_stack_;
};

} // namespace io
} // namespace prb
