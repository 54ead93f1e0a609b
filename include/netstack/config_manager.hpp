#ifndef NETSTACK_CONFIG_MANAGER_HPP
#define NETSTACK_CONFIG_MANAGER_HPP

#include "netstack/stack_config.hpp"
#include "netstack/types.hpp"

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace netstack {

class StackLogger;
class StackCoordinator;

using ConfigValue = std::variant<
    bool,
    int,
    uint32_t,
    uint64_t,
    double,
    std::string
>;

// Flat "path = value" configuration, e.g.
//   stack.probe_interval_seconds = 5
//   dp.s1.dp_id = 0x1
//   dp.s1.stack.priority = 1
//   dp.s1.port.1.stack.dp = s2
//   dp.s1.port.1.stack.port = 1
//   dp.s1.port.5.loop_protect_external = true
//   dp.s1.port.6.lacp = 1
using ConfigurationData = std::map<std::string, ConfigValue>;

class ConfigManager {
public:
    ConfigManager() = default;

    bool load_config(const std::string& filename);
    bool load_config_from_stream(std::istream& input, const std::string& source_name = "<stream>");
    bool save_config(const std::string& filename = "") const;

    // Parses one value: true/false, integers (narrowest fitting type), doubles, else string.
    static ConfigValue parse_value(const std::string& text);

    std::optional<ConfigValue> get_parameter(const std::string& path) const {
        auto it = config_data_.find(path);
        if (it != config_data_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    template<typename T>
    std::optional<T> get_parameter_as(const std::string& path) const {
        std::optional<ConfigValue> opt_val = get_parameter(path);
        if (opt_val && std::holds_alternative<T>(*opt_val)) {
            return std::get<T>(*opt_val);
        }
        return std::nullopt;
    }

    void set_parameter(const std::string& path, ConfigValue value) {
        config_data_[path] = std::move(value);
    }

    const ConfigurationData& get_current_config_data() const {
        return config_data_;
    }

    void set_logger(StackLogger* logger) {
        logger_ = logger;
    }

    // Builds the typed topology; throws ConfigError on malformed keys or
    // values and on topology errors (one-sided links, no root, ...).
    StackTopologyConfig build_stack_config(const ConfigurationData& data) const;
    StackTopologyConfig build_stack_config() const { return build_stack_config(config_data_); }

    // All problems found, empty when the configuration is usable.
    std::vector<std::string> validate_config(const ConfigurationData& data) const;

    void apply_config(const ConfigurationData& data, StackCoordinator& coordinator, TimePoint now) const;

private:
    StackTopologyConfig parse_stack_config(const ConfigurationData& data, std::vector<std::string>& errors) const;

    ConfigurationData config_data_;
    std::string loaded_config_filename_;
    StackLogger* logger_ = nullptr;
};

} // namespace netstack

#endif // NETSTACK_CONFIG_MANAGER_HPP
