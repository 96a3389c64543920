#include <mcp_manager/cli/command_router.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <set>

namespace mcp_manager {

namespace {

void PrintJsonError(const std::string& message, std::ostream& out) {
    out << nlohmann::json{{"error", {{"message", message}}}}.dump() << "\n";
}

bool IsHelpToken(std::string_view token) {
    return token == "--help" || token == "-h" || token == "help";
}

} // anonymous namespace

bool CommandRouter::IsBooleanFlag(std::string_view arg) {
    return arg == "--json" || arg == "--help" || arg == "--raw" ||
           arg == "--show-logs";
}

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler) {
    CommandInfo info;
    info.group = group;
    info.action = action;
    info.description = description;
    info.handler = std::move(handler);
    commands_[group + ":" + action] = std::move(info);
}

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler,
                             CommandHelp help) {
    CommandInfo info;
    info.group = group;
    info.action = action;
    info.description = description;
    info.handler = std::move(handler);
    info.help = std::move(help);
    commands_[group + ":" + action] = std::move(info);
}

void CommandRouter::SetGroupDescription(const std::string& group,
                                        const std::string& description) {
    group_descriptions_[group] = description;
}

int CommandRouter::Dispatch(const std::vector<std::string>& tokens, bool json_mode,
                            std::ostream& out, std::ostream& err) const {
    if (tokens.empty() || IsHelpToken(tokens.front())) {
        PrintHelp(tokens.empty() ? err : out);
        return tokens.empty() ? 1 : 0;
    }

    auto parse_result = Parse(tokens);
    if (parse_result.IsErr()) {
        if (json_mode) {
            PrintJsonError(parse_result.Error(), err);
        } else {
            err << "Error: " << parse_result.Error() << "\n";
            PrintHelp(err);
        }
        return 1;
    }
    auto args = std::move(parse_result).Value();

    if (!HasGroup(args.group)) {
        if (json_mode) {
            PrintJsonError("Unknown command group '" + args.group + "'", err);
        } else {
            err << "Error: unknown command group '" << args.group << "'\n";
            PrintHelp(err);
        }
        return 1;
    }

    if (args.action.empty() || IsHelpToken(args.action)) {
        if (args.action.empty() && args.flags.count("help") == 0) {
            if (json_mode) {
                PrintJsonError("Missing action for group '" + args.group + "'", err);
            } else {
                err << "Error: missing action for group '" << args.group << "'\n";
                PrintGroupHelp(args.group, err);
            }
            return 1;
        }
        PrintGroupHelp(args.group, out);
        return 0;
    }

    auto it = commands_.find(args.group + ":" + args.action);
    if (it == commands_.end()) {
        if (json_mode) {
            PrintJsonError("Unknown command '" + args.group + " " + args.action + "'", err);
        } else {
            err << "Error: unknown command '" << args.group << " " << args.action << "'\n";
            PrintGroupHelp(args.group, err);
        }
        return 1;
    }

    if (args.flags.count("help") > 0) {
        PrintCommandHelp(args.group, args.action, out);
        return 0;
    }

    return it->second.handler(args);
}

Result<CommandArgs, std::string> CommandRouter::Parse(const std::vector<std::string>& tokens) {
    CommandArgs args;
    size_t i = 0;

    if (i >= tokens.size() || tokens[i].substr(0, 2) == "--") {
        return Result<CommandArgs, std::string>::Err(
            "Missing command group. Usage: mcp-manager <group> <action> [args]");
    }
    args.group = tokens[i++];

    if (i < tokens.size() && tokens[i].substr(0, 2) != "--") {
        args.action = tokens[i++];
    }

    // Remaining tokens: flags and positional.
    while (i < tokens.size()) {
        std::string_view arg{tokens[i]};
        if (arg.substr(0, 2) == "--" && arg.size() > 2) {
            auto eq = arg.find('=');
            if (eq != std::string_view::npos) {
                args.flags[std::string(arg.substr(2, eq - 2))] = std::string(arg.substr(eq + 1));
                ++i;
            } else {
                auto key = std::string(arg.substr(2));
                if (IsBooleanFlag(arg)) {
                    args.flags[key] = "true";
                    ++i;
                } else if (i + 1 < tokens.size() && tokens[i + 1].substr(0, 2) != "--") {
                    args.flags[key] = tokens[i + 1];
                    i += 2;
                } else {
                    args.flags[key] = "true";
                    ++i;
                }
            }
        } else {
            args.positional.push_back(tokens[i]);
            ++i;
        }
    }

    return Result<CommandArgs, std::string>::Ok(std::move(args));
}

std::vector<std::string> CommandRouter::Groups() const {
    std::set<std::string> groups;
    for (const auto& [key, info] : commands_) {
        groups.insert(info.group);
    }
    return {groups.begin(), groups.end()};
}

bool CommandRouter::HasGroup(const std::string& group) const {
    return std::any_of(commands_.begin(), commands_.end(),
                       [&](const auto& entry) { return entry.second.group == group; });
}

std::vector<CommandInfo> CommandRouter::CommandsForGroup(const std::string& group) const {
    std::vector<CommandInfo> result;
    for (const auto& [key, info] : commands_) {
        if (info.group == group) {
            result.push_back(info);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const CommandInfo& a, const CommandInfo& b) {
                  return a.action < b.action;
              });
    return result;
}

std::string CommandRouter::GroupDescription(const std::string& group) const {
    auto it = group_descriptions_.find(group);
    return (it != group_descriptions_.end()) ? it->second : "";
}

void CommandRouter::PrintHelp(std::ostream& out) const {
    out << "\nUsage: mcp-manager [options] <group> <action> [args] [--flags]\n\n";
    out << "Available commands:\n";
    for (const auto& group : Groups()) {
        out << "\n  " << group << ":\n";
        for (const auto& cmd : CommandsForGroup(group)) {
            out << "    " << cmd.action;
            if (!cmd.description.empty()) {
                out << " - " << cmd.description;
            }
            out << "\n";
        }
    }
    out << "\nRun \"mcp-manager --help\" for global options.\n";
}

void CommandRouter::PrintGroupHelp(const std::string& group, std::ostream& out) const {
    auto desc = GroupDescription(group);
    if (desc.empty()) {
        desc = group;
    }
    out << "mcp-manager " << group << " - " << desc << "\n";

    out << "\nActions:\n";
    auto cmds = CommandsForGroup(group);
    size_t max_len = 0;
    for (const auto& cmd : cmds) {
        max_len = std::max(max_len, cmd.action.size());
    }
    for (const auto& cmd : cmds) {
        out << "  " << cmd.action;
        out << std::string(max_len - cmd.action.size() + 6, ' ');
        out << cmd.description << "\n";
    }

    out << "\nUse \"mcp-manager " << group
        << " <action> --help\" for details on a specific action.\n";
}

void CommandRouter::PrintCommandHelp(const std::string& group,
                                     const std::string& action,
                                     std::ostream& out) const {
    auto it = commands_.find(group + ":" + action);
    if (it == commands_.end()) {
        out << "Error: unknown command '" << group << " " << action << "'\n";
        return;
    }

    const auto& cmd = it->second;
    out << "mcp-manager " << group << " " << action << " - " << cmd.description << "\n";
    if (!cmd.help) {
        return;
    }
    const auto& help = *cmd.help;

    if (!help.usage.empty()) {
        out << "\nUsage:\n  " << help.usage << "\n";
    }
    if (!help.args_description.empty()) {
        out << "\nArguments:\n  " << help.args_description << "\n";
    }
    if (!help.flags.empty()) {
        out << "\nFlags:\n";
        std::vector<std::string> flag_displays;
        size_t max_len = 0;
        for (const auto& f : help.flags) {
            std::string display = "--" + f.name;
            if (!f.placeholder.empty()) {
                display += " " + f.placeholder;
            }
            max_len = std::max(max_len, display.size());
            flag_displays.push_back(std::move(display));
        }
        for (size_t i = 0; i < help.flags.size(); ++i) {
            out << "  " << flag_displays[i];
            out << std::string(max_len - flag_displays[i].size() + 4, ' ');
            out << help.flags[i].description;
            if (help.flags[i].required) {
                out << " (required)";
            }
            out << "\n";
        }
    }
    if (!help.long_description.empty()) {
        out << "\n" << help.long_description << "\n";
    }
    if (!help.examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : help.examples) {
            out << "  " << ex << "\n";
        }
    }
}

} // namespace mcp_manager
