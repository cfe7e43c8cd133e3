/*
 * Engram C++11 - Command-line commands
 */
#ifndef ENGRAM_CLI_COMMANDS_HPP
#define ENGRAM_CLI_COMMANDS_HPP

#include <engram/memory/engine.hpp>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace engram {

// Positional arguments and --options of one command invocation.
// "--key value" and "--key=value" set options; names listed as flags take
// no value.
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    bool has(const std::string& name) const { return options.find(name) != options.end(); }
    std::string get(const std::string& name, const std::string& def = "") const;
    int64_t get_int(const std::string& name, int64_t def) const;
    double get_double(const std::string& name, double def) const;

    // Positional arguments from `first` on, joined with spaces
    std::string rest(size_t first) const;

    static bool parse(const std::vector<std::string>& tokens, const std::set<std::string>& flags,
                      CommandArgs& out, std::string& error);
};

// Writes its JSON result to `out` and returns the process exit code
typedef int (*CommandFn)(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);

struct CommandDef {
    std::string name;
    std::string usage;
    std::string description;
    CommandFn handler;

    CommandDef() : handler(NULL) {}
    CommandDef(const std::string& n, const std::string& u, const std::string& d, CommandFn h)
        : name(n), usage(u), description(d), handler(h) {}
};

const std::vector<CommandDef>& cli_commands();
const CommandDef* find_command(const std::string& name);

// Option names that take no value
const std::set<std::string>& cli_flags();

namespace commands {

int cmd_ingest(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);
int cmd_status(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);
int cmd_memories(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);
int cmd_search(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);
int cmd_get(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);
int cmd_related(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);
int cmd_export(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);
int cmd_stats(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);
int cmd_timeline(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);
int cmd_rebalance(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);
int cmd_clear(MemoryEngine& engine, const CommandArgs& args, std::ostream& out);

} // namespace commands

} // namespace engram

#endif // ENGRAM_CLI_COMMANDS_HPP
