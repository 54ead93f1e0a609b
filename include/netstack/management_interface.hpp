#ifndef NETSTACK_MANAGEMENT_INTERFACE_HPP
#define NETSTACK_MANAGEMENT_INTERFACE_HPP

#include <cstddef>
#include <functional> // For std::function
#include <map>
#include <optional>
#include <sstream>    // For std::istringstream
#include <string>
#include <utility>    // For std::move
#include <vector>

namespace netstack {

// Scrape and operator surface of the controller: read-only OIDs and a
// word-based CLI.
class ManagementInterface {
public:
    using OidGetter = std::function<std::string()>;
    using CliHandler = std::function<std::string(const std::vector<std::string>& args)>;

    void register_oid_handler(const std::string& oid, OidGetter getter) {
        oids_[oid] = std::move(getter);
    }

    std::optional<std::string> handle_oid_get(const std::string& oid) const {
        auto it = oids_.find(oid);
        if (it == oids_.end() || !it->second) {
            return std::nullopt;
        }
        return it->second();
    }

    // Re-registering a command replaces its handler.
    void register_command(const std::vector<std::string>& words, CliHandler handler) {
        if (!words.empty()) {
            commands_[words] = std::move(handler);
        }
    }

    std::vector<std::string> registered_commands() const {
        std::vector<std::string> names;
        for (const auto& [words, handler] : commands_) {
            (void)handler;
            std::string name;
            for (const auto& word : words) {
                if (!name.empty()) name += ' ';
                name += word;
            }
            names.push_back(name);
        }
        return names;
    }

    // The longest registered command that starts the line wins; the words
    // after it are the handler's arguments.
    std::string handle_cli_command(const std::string& line) const {
        std::istringstream iss(line);
        std::vector<std::string> words;
        for (std::string word; iss >> word;) {
            words.push_back(word);
        }
        if (words.empty()) {
            return "Error: Empty command.";
        }
        for (std::size_t length = words.size(); length > 0; --length) {
            std::vector<std::string> key(words.begin(), words.begin() + static_cast<std::ptrdiff_t>(length));
            auto it = commands_.find(key);
            if (it != commands_.end()) {
                return it->second(std::vector<std::string>(words.begin() + static_cast<std::ptrdiff_t>(length),
                                                           words.end()));
            }
        }
        return "Error: Unknown command or prefix: " + line + ". Type 'help' for available commands.";
    }

private:
    std::map<std::string, OidGetter> oids_;
    std::map<std::vector<std::string>, CliHandler> commands_;
};

} // namespace netstack

#endif // NETSTACK_MANAGEMENT_INTERFACE_HPP
