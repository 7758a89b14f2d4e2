#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct CommandInfo {
    const char* usage;
    const char* desc;
};

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog) {
    static const std::vector<CommandInfo> commands = {
        {"create <name> -r repo:branch...", "Create an environment with one worktree per repo"},
        {"review <pr-url|repo#N>", "Create an environment for a GitHub pull request"},
        {"list", "List registered environments"},
        {"info <name>", "Show environment details and per-repo status"},
        {"delete <name>...", "Remove worktrees, files and registry record"},
        {"path <name>", "Print the environment directory"},
        {"branches [repo...]", "List remote branches of catalog repositories"},
        {"config", "Show the effective configuration"},
        {"init [file]", "Write a default configuration file"}};

    static const std::vector<OptionInfo> opts = {
        {"--repo", "-r", "<repo:branch>", "Repository and branch (repeatable)", "Create"},
        {"--name", "-n", "<name>", "Environment name for review (default pr-<N>)", "Create"},
        {"--no-fetch", "", "", "Skip fetching base repositories", "Create"},
        {"--no-templates", "", "", "Skip templates and copied files", "Create"},
        {"--json", "", "", "Print JSON (list, info, config)", "Output"},
        {"--name-only", "", "", "Only print names (list)", "Output"},
        {"--path-only", "", "", "Only print paths (list)", "Output"},
        {"--path", "", "", "Print the configuration file path (config)", "Output"},
        {"--force", "-f", "", "Delete despite unsaved work, overwrite on init", "Actions"},
        {"--yes", "-y", "", "Do not ask for confirmation", "Actions"},
        {"--config", "-c", "<file>", "Configuration file", "Config"},
        {"--log-file", "", "<path>", "File for general logs", "Logging"},
        {"--log-level", "", "<level>", "Set log verbosity", "Logging"},
        {"--verbose", "-v", "", "Mirror all log lines to stderr", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& c : commands)
        width = std::max(width, std::strlen(c.usage) + 2);
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        width = std::max(width, flag.size());
    }

    std::cout << "wtenv - Multi-repository worktree environments\n";
    std::cout << "Creates named directories holding one git worktree per repository.\n";
    std::cout << "Configuration is read from YAML or JSON files.\n\n";
    std::cout << "Usage: " << prog << " <command> [args] [options]\n\n";
    std::cout << "Commands:\n";
    for (const auto& c : commands) {
        std::cout << std::left << std::setw(static_cast<int>(width) + 2)
                  << (std::string("  ") + c.usage) << c.desc << "\n";
    }
    std::cout << "\n";
    const std::vector<std::string> order{"Create", "Output", "Actions", "Config", "Logging",
                                         "Basics"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::string flag = "  ";
            if (std::strlen(o->short_flag))
                flag += std::string(o->short_flag) + ", ";
            else
                flag += "    ";
            flag += o->long_flag;
            if (std::strlen(o->arg))
                flag += " " + std::string(o->arg);
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag << o->desc
                      << "\n";
        }
        std::cout << "\n";
    }
}
