#include "netstack/config_manager.hpp"
#include "netstack/logger.hpp"
#include "netstack/stack_coordinator.hpp"

#include <algorithm> // For std::transform
#include <cctype>
#include <charconv>  // For std::from_chars
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace netstack {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(path);
    while (std::getline(iss, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

std::optional<uint64_t> parse_unsigned(const std::string& text) {
    uint64_t value = 0;
    int base = 10;
    size_t offset = 0;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        offset = 2;
    }
    const char* begin = text.data() + offset;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value, base);
    if (ec != std::errc() || ptr != end || begin == end) {
        return std::nullopt;
    }
    return value;
}

std::optional<int64_t> as_integer(const ConfigValue& value) {
    return std::visit([](const auto& val) -> std::optional<int64_t> {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, int> || std::is_same_v<T, uint32_t>) {
            return static_cast<int64_t>(val);
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            if (val > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
            return static_cast<int64_t>(val);
        } else if constexpr (std::is_same_v<T, std::string>) {
            auto parsed = parse_unsigned(val);
            if (!parsed || *parsed > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
            return static_cast<int64_t>(*parsed);
        } else {
            return std::nullopt;
        }
    }, value);
}

std::optional<std::string> as_name(const ConfigValue& value) {
    if (auto* str_val = std::get_if<std::string>(&value)) {
        return *str_val;
    }
    if (auto number = as_integer(value)) {
        return std::to_string(*number);
    }
    return std::nullopt;
}

struct PendingPort {
    std::optional<std::string> stack_dp;
    std::optional<PortNumber> stack_port;
    bool loop_protect_external = false;
    std::optional<uint32_t> lacp_id;
};

struct PendingDatapath {
    std::optional<DpId> dp_id;
    std::optional<int64_t> priority;
    std::optional<uint32_t> root_down_time_multiple;
    std::map<PortNumber, PendingPort> ports;
};

} // namespace

ConfigValue ConfigManager::parse_value(const std::string& value_str) {
    std::string lower_value_str = value_str;
    std::transform(lower_value_str.begin(), lower_value_str.end(), lower_value_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower_value_str == "true") {
        return true;
    }
    if (lower_value_str == "false") {
        return false;
    }

    const char* begin = value_str.data();
    const char* end = value_str.data() + value_str.size();
    int int_val;
    auto [ptr, ec] = std::from_chars(begin, end, int_val);
    if (ec == std::errc() && ptr == end && !value_str.empty()) {
        return int_val;
    }
    uint64_t uint64_val;
    auto [ptr_u64, ec_u64] = std::from_chars(begin, end, uint64_val);
    if (ec_u64 == std::errc() && ptr_u64 == end && !value_str.empty()) {
        if (uint64_val <= std::numeric_limits<uint32_t>::max()) {
            return static_cast<uint32_t>(uint64_val);
        }
        return uint64_val;
    }
    double double_val;
    std::stringstream ss_double(value_str);
    ss_double >> double_val;
    if (!value_str.empty() && !ss_double.fail() && ss_double.eof()) {
        return double_val;
    }
    return value_str;
}

bool ConfigManager::load_config(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        if (logger_) logger_->error("CONFIG", "Failed to open config file: " + filename);
        return false;
    }
    if (!load_config_from_stream(file, filename)) {
        return false;
    }
    loaded_config_filename_ = filename;
    return true;
}

bool ConfigManager::load_config_from_stream(std::istream& input, const std::string& source_name) {
    ConfigurationData loaded;
    std::string line;
    int line_num = 0;
    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            if (logger_) logger_->warning("CONFIG", "Skipping malformed line (no '=') in " + source_name +
                                                        " at line " + std::to_string(line_num));
            continue;
        }

        std::string key = trim(line.substr(0, delimiter_pos));
        std::string value_str = trim(line.substr(delimiter_pos + 1));
        if (key.empty()) {
            if (logger_) logger_->warning("CONFIG", "Skipping line with empty key in " + source_name +
                                                        " at line " + std::to_string(line_num));
            continue;
        }
        loaded[key] = parse_value(value_str);
    }
    if (input.bad()) {
        if (logger_) logger_->error("CONFIG", "Read error while loading " + source_name);
        return false;
    }

    config_data_ = std::move(loaded);
    if (logger_) logger_->info("CONFIG", "Loaded " + std::to_string(config_data_.size()) +
                                             " parameters from " + source_name);
    return true;
}

bool ConfigManager::save_config(const std::string& filename_param) const {
    const std::string& target_filename = filename_param.empty() ? loaded_config_filename_ : filename_param;
    if (target_filename.empty()) {
        if (logger_) logger_->error("CONFIG", "Save failed: no filename specified and no config previously loaded.");
        return false;
    }

    std::ofstream file(target_filename);
    if (!file.is_open()) {
        if (logger_) logger_->error("CONFIG", "Failed to open file for saving: " + target_filename);
        return false;
    }

    for (const auto& pair : config_data_) {
        std::string value_str;
        std::visit([&](const auto& val) {
            using T = std::decay_t<decltype(val)>;
            if constexpr (std::is_same_v<T, bool>) {
                value_str = val ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                value_str = val;
            } else {
                std::ostringstream oss;
                oss << val;
                value_str = oss.str();
            }
        }, pair.second);
        file << pair.first << "=" << value_str << "\n";
    }
    return static_cast<bool>(file);
}

StackTopologyConfig ConfigManager::parse_stack_config(const ConfigurationData& data,
                                                      std::vector<std::string>& errors) const {
    StackTopologyConfig config;
    std::map<std::string, PendingDatapath> pending;

    auto positive = [&](const std::string& key, const ConfigValue& value) -> std::optional<int64_t> {
        auto number = as_integer(value);
        if (!number || *number <= 0) {
            errors.push_back("Invalid value for '" + key + "': expected a positive integer");
            return std::nullopt;
        }
        return number;
    };

    for (const auto& [key, value] : data) {
        std::vector<std::string> parts = split_path(key);

        if (parts.size() == 2 && parts[0] == "stack") {
            if (parts[1] == "probe_interval_seconds") {
                if (auto n = positive(key, value)) config.timing.probe_interval = std::chrono::seconds(*n);
            } else if (parts[1] == "max_probes_lost") {
                if (auto n = positive(key, value)) config.timing.max_probes_lost = static_cast<uint32_t>(*n);
            } else if (parts[1] == "health_check_interval_seconds") {
                if (auto n = positive(key, value)) config.timing.health_check_interval = std::chrono::seconds(*n);
            } else if (logger_) {
                logger_->warning("CONFIG", "Unrecognized path " + key);
            }
            continue;
        }

        if (parts.size() < 3 || parts[0] != "dp" || parts[1].empty()) {
            if (logger_) logger_->warning("CONFIG", "Unrecognized path " + key);
            continue;
        }

        PendingDatapath& dp = pending[parts[1]];
        if (parts.size() == 3 && parts[2] == "dp_id") {
            auto number = as_integer(value);
            if (!number || *number <= 0) {
                errors.push_back("Invalid value for '" + key + "': expected a dp_id");
            } else {
                dp.dp_id = static_cast<DpId>(*number);
            }
        } else if (parts.size() == 4 && parts[2] == "stack" && parts[3] == "priority") {
            auto number = as_integer(value);
            if (!number) {
                errors.push_back("Invalid value for '" + key + "': expected an integer");
            } else {
                dp.priority = *number;
            }
        } else if (parts.size() == 4 && parts[2] == "stack" && parts[3] == "root_down_time_multiple") {
            if (auto n = positive(key, value)) dp.root_down_time_multiple = static_cast<uint32_t>(*n);
        } else if (parts.size() >= 5 && parts[2] == "port") {
            auto port_number = parse_unsigned(parts[3]);
            if (!port_number || *port_number == 0 || *port_number > std::numeric_limits<PortNumber>::max()) {
                errors.push_back("Invalid port number in '" + key + "'");
                continue;
            }
            PendingPort& port = dp.ports[static_cast<PortNumber>(*port_number)];
            std::string attribute = parts[4];
            for (size_t i = 5; i < parts.size(); ++i) {
                attribute += "." + parts[i];
            }
            if (attribute == "stack.dp") {
                auto name = as_name(value);
                if (!name || name->empty()) {
                    errors.push_back("Invalid value for '" + key + "': expected a DP name");
                } else {
                    port.stack_dp = *name;
                }
            } else if (attribute == "stack.port") {
                if (auto n = positive(key, value)) port.stack_port = static_cast<PortNumber>(*n);
            } else if (attribute == "loop_protect_external") {
                if (auto* bool_val = std::get_if<bool>(&value)) {
                    port.loop_protect_external = *bool_val;
                } else {
                    errors.push_back("Invalid type for '" + key + "': expected true or false");
                }
            } else if (attribute == "lacp") {
                if (auto n = positive(key, value)) port.lacp_id = static_cast<uint32_t>(*n);
            } else if (attribute != "description" && logger_) {
                logger_->warning("CONFIG", "Unrecognized path " + key);
            }
        } else if (logger_) {
            logger_->warning("CONFIG", "Unrecognized path " + key);
        }
    }

    for (const auto& [name, dp] : pending) {
        DatapathConfig dp_config;
        dp_config.name = name;
        if (!dp.dp_id) {
            errors.push_back("DP " + name + " has no dp_id");
        } else {
            dp_config.dp_id = *dp.dp_id;
        }
        dp_config.priority = dp.priority;
        if (dp.root_down_time_multiple) {
            dp_config.root_down_time_multiple = *dp.root_down_time_multiple;
        }
        for (const auto& [number, port] : dp.ports) {
            if (port.stack_dp || port.stack_port) {
                if (!port.stack_dp || !port.stack_port) {
                    errors.push_back("DP " + name + " port " + std::to_string(number) +
                                     " needs both stack.dp and stack.port");
                    continue;
                }
                dp_config.stack_ports.push_back(StackPortConfig{number, *port.stack_dp, *port.stack_port});
            } else {
                dp_config.local_ports.push_back(LocalPortConfig{number, port.loop_protect_external, port.lacp_id});
            }
        }
        config.datapaths[name] = dp_config;
    }
    return config;
}

StackTopologyConfig ConfigManager::build_stack_config(const ConfigurationData& data) const {
    std::vector<std::string> errors;
    StackTopologyConfig config = parse_stack_config(data, errors);
    if (!errors.empty()) {
        if (logger_) logger_->error("CONFIG", errors.front());
        throw ConfigError(errors.front());
    }
    try {
        validate_stack_config(config);
    } catch (const ConfigError& e) {
        if (logger_) logger_->error("CONFIG", e.what());
        throw;
    }
    return config;
}

std::vector<std::string> ConfigManager::validate_config(const ConfigurationData& data) const {
    std::vector<std::string> errors;
    for (const auto& pair : data) {
        if (pair.first.empty()) {
            errors.push_back("Configuration key cannot be empty.");
        }
    }
    StackTopologyConfig config = parse_stack_config(data, errors);
    if (errors.empty()) {
        errors = find_stack_config_errors(config);
    }
    if (logger_) {
        if (!errors.empty()) {
            logger_->warning("CONFIG", "Configuration validation found " + std::to_string(errors.size()) + " errors.");
        } else {
            logger_->info("CONFIG", "Configuration validation successful.");
        }
    }
    return errors;
}

void ConfigManager::apply_config(const ConfigurationData& data, StackCoordinator& coordinator, TimePoint now) const {
    if (logger_) logger_->info("CONFIG", "Starting to apply configuration.");
    coordinator.apply_config(build_stack_config(data), now);
}

} // namespace netstack
