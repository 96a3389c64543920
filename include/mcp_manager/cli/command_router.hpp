#pragma once

#include <mcp_manager/core/result.hpp>

#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_manager {

// ---------------------------------------------------------------------------
// CommandArgs: parsed command tokens for a specific command.
// ---------------------------------------------------------------------------
struct CommandArgs {
    std::string group;                   // e.g. "tools", "servers"
    std::string action;                  // e.g. "list", "call"
    std::vector<std::string> positional; // remaining positional arguments
    std::map<std::string, std::string> flags; // --key=value pairs
};

// Returns 0 on success, non-zero exit code on failure.
using CommandHandler = std::function<int(const CommandArgs& args)>;

struct FlagHelp {
    std::string name;        // e.g. "args"
    std::string placeholder; // e.g. "<json>"
    std::string description;
    bool required = false;
};

struct CommandHelp {
    std::string usage;
    std::string args_description;
    std::string long_description;
    std::vector<FlagHelp> flags;
    std::vector<std::string> examples;
};

struct CommandInfo {
    std::string group;
    std::string action;
    std::string description;
    CommandHandler handler;
    std::optional<CommandHelp> help;
};

// ---------------------------------------------------------------------------
// CommandRouter: two-level dispatch for CLI commands.
//
// Commands are registered as group/action pairs. The router receives the
// tokens left after the global options, splits them into group, action,
// positionals and flags, and dispatches to the registered handler.
// ---------------------------------------------------------------------------
class CommandRouter {
public:
    CommandRouter() = default;

    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler);

    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler,
                  CommandHelp help);

    void SetGroupDescription(const std::string& group,
                             const std::string& description);

    // Parse tokens and dispatch to the matching handler.
    // Returns the handler's exit code, or 1 on routing error.
    // Intercepts --help/-h/help at top, group and command levels.
    int Dispatch(const std::vector<std::string>& tokens, bool json_mode,
                 std::ostream& out, std::ostream& err) const;

    // Split tokens into CommandArgs without dispatching.
    static Result<CommandArgs, std::string> Parse(const std::vector<std::string>& tokens);

    // True for flags that never consume the next token as their value.
    static bool IsBooleanFlag(std::string_view arg);

    [[nodiscard]] std::vector<std::string> Groups() const;
    [[nodiscard]] bool HasGroup(const std::string& group) const;
    [[nodiscard]] std::vector<CommandInfo> CommandsForGroup(const std::string& group) const;
    [[nodiscard]] std::string GroupDescription(const std::string& group) const;

    void PrintHelp(std::ostream& out) const;
    void PrintGroupHelp(const std::string& group, std::ostream& out) const;
    void PrintCommandHelp(const std::string& group,
                          const std::string& action,
                          std::ostream& out) const;

private:
    // Key: "group:action"
    std::map<std::string, CommandInfo> commands_;
    std::map<std::string, std::string> group_descriptions_;
};

} // namespace mcp_manager
