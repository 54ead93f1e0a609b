#ifndef NETSTACK_LOGGER_HPP
#define NETSTACK_LOGGER_HPP

#include "netstack/types.hpp" // For DpId, PortRef, StackState

#include <string>
#include <iostream>  // For std::cout, std::cerr, std::endl, std::ostream
#include <ctime>     // For std::time_t, std::time, std::localtime, std::strftime, struct std::tm
#include <cstdio>    // For std::snprintf
#include <sstream>   // For std::ostringstream
#include <iomanip>   // For std::hex
#include <cstdint>

namespace netstack {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

class StackLogger {
public:
    explicit StackLogger(LogLevel min_level = LogLevel::INFO) : min_log_level_(min_level) {}
    virtual ~StackLogger() = default;

    void set_min_log_level(LogLevel level) {
        min_log_level_ = level;
    }

    LogLevel get_min_log_level() const {
        return min_log_level_;
    }

    virtual void log(LogLevel level, const std::string& component, const std::string& message) const {
        if (level < min_log_level_) {
            return;
        }

        std::time_t t = std::time(nullptr);
        char time_buf[100];
        struct std::tm* local_tm = std::localtime(&t);

        if (!local_tm || !std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", local_tm)) {
            std::snprintf(time_buf, sizeof(time_buf), "YYYY-MM-DD HH:MM:SS");
        }

        std::ostream& output_stream = (level >= LogLevel::ERROR) ? std::cerr : std::cout;

        output_stream << "[" << time_buf << "] "
                      << "[" << level_to_string(level) << "] "
                      << "[" << component << "] "
                      << message << std::endl;
    }

    void debug(const std::string& component, const std::string& message) const {
        log(LogLevel::DEBUG, component, message);
    }
    void info(const std::string& component, const std::string& message) const {
        log(LogLevel::INFO, component, message);
    }
    void warning(const std::string& component, const std::string& message) const {
        log(LogLevel::WARNING, component, message);
    }
    void error(const std::string& component, const std::string& message) const {
        log(LogLevel::ERROR, component, message);
    }
    void critical(const std::string& component, const std::string& message) const {
        log(LogLevel::CRITICAL, component, message);
    }

    static std::string dpid_to_string(DpId dp_id) {
        std::ostringstream oss;
        oss << "0x" << std::hex << dp_id;
        return oss.str();
    }

    // Stack port transitions are logged at INFO, regressions (BAD/GONE) at WARNING.
    void log_stack_port_state(const PortRef& port, StackState before, StackState after,
                              const std::string& reason) const {
        LogLevel level = (after == StackState::BAD || after == StackState::GONE)
                             ? LogLevel::WARNING : LogLevel::INFO;
        if (level < min_log_level_) return;
        std::string message = "Stack " + port.to_string() + " state " + to_string(after) +
                              " (previous state " + to_string(before) + "): " + reason;
        log(level, "STACK", message);
    }

    void log_root_change(const std::string& previous_root, const std::string& new_root,
                         DpId new_root_id) const {
        if (min_log_level_ > LogLevel::INFO) return;
        std::string from = previous_root.empty() ? "(none)" : previous_root;
        log(LogLevel::INFO, "STACK_ROOT", "Stack root changed from " + from + " to " + new_root +
                                              " (dp_id " + dpid_to_string(new_root_id) + ")");
    }

private:
    LogLevel min_log_level_;

    std::string level_to_string(LogLevel level) const {
        switch (level) {
            case LogLevel::DEBUG:    return "DEBUG   ";
            case LogLevel::INFO:     return "INFO    ";
            case LogLevel::WARNING:  return "WARNING ";
            case LogLevel::ERROR:    return "ERROR   ";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN ";
        }
    }
};

} // namespace netstack

#endif // NETSTACK_LOGGER_HPP
