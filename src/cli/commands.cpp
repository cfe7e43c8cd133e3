/*
 * Engram C++11 - Command-line commands
 */
#include <engram/cli/commands.hpp>
#include <engram/memory/serialization.hpp>
#include <engram/core/json.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>
#include <cstddef>
#include <cstdlib>

namespace engram {

// ============================================================================
// CommandArgs
// ============================================================================

std::string CommandArgs::get(const std::string& name, const std::string& def) const {
    std::map<std::string, std::string>::const_iterator it = options.find(name);
    return it != options.end() ? it->second : def;
}

int64_t CommandArgs::get_int(const std::string& name, int64_t def) const {
    std::string value = get(name);
    if (value.empty()) return def;
    char* end = NULL;
    long long v = strtoll(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0') {
        LOG_WARN("Ignoring non-numeric --%s=%s", name.c_str(), value.c_str());
        return def;
    }
    return static_cast<int64_t>(v);
}

double CommandArgs::get_double(const std::string& name, double def) const {
    std::string value = get(name);
    if (value.empty()) return def;
    char* end = NULL;
    double v = strtod(value.c_str(), &end);
    if (end == value.c_str() || *end != '\0') {
        LOG_WARN("Ignoring non-numeric --%s=%s", name.c_str(), value.c_str());
        return def;
    }
    return v;
}

std::string CommandArgs::rest(size_t first) const {
    if (first >= positional.size()) return "";
    std::vector<std::string> tail(positional.begin() + static_cast<std::ptrdiff_t>(first), positional.end());
    return join(tail, " ");
}

bool CommandArgs::parse(const std::vector<std::string>& tokens, const std::set<std::string>& flags,
                        CommandArgs& out, std::string& error) {
    out = CommandArgs();
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& tok = tokens[i];
        if (tok == "--") {
            out.positional.insert(out.positional.end(), tokens.begin() + static_cast<std::ptrdiff_t>(i + 1), tokens.end());
            break;
        }
        if (!starts_with(tok, "--") || tok.size() == 2) {
            out.positional.push_back(tok);
            continue;
        }

        std::string name = tok.substr(2);
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            out.options[name.substr(0, eq)] = name.substr(eq + 1);
        } else if (flags.count(name)) {
            out.options[name] = "true";
        } else if (i + 1 < tokens.size()) {
            out.options[name] = tokens[++i];
        } else {
            error = "option --" + name + " needs a value";
            return false;
        }
    }
    return true;
}

// ============================================================================
// Registry
// ============================================================================

const std::vector<CommandDef>& cli_commands() {
    static std::vector<CommandDef> cmds;
    if (cmds.empty()) {
        cmds.push_back(CommandDef("ingest", "ingest <owner> [text...] [--file PATH] [--title T] [--async]",
                                  "Ingest text as a new document", commands::cmd_ingest));
        cmds.push_back(CommandDef("status", "status <document_id>",
                                  "Show a document's processing status", commands::cmd_status));
        cmds.push_back(CommandDef("memories", "memories <document_id>",
                                  "List the memories created from a document", commands::cmd_memories));
        cmds.push_back(CommandDef("search", "search <owner> <query...> [--limit N] [--all-versions] "
                                  "[--keywords a,b] [--require-keywords] [--weight W] [--entity-types a,b] "
                                  "[--kinds a,b] [--from MS] [--to MS] [--min-similarity S] [--hot-only]",
                                  "Ranked semantic search", commands::cmd_search));
        cmds.push_back(CommandDef("get", "get <memory_id>",
                                  "Show one memory", commands::cmd_get));
        cmds.push_back(CommandDef("related", "related <memory_id> [--depth N] [--kinds a,b]",
                                  "Show the relationship subgraph around a memory", commands::cmd_related));
        cmds.push_back(CommandDef("export", "export <owner>",
                                  "Export an owner's graph as JSON", commands::cmd_export));
        cmds.push_back(CommandDef("stats", "stats <owner>",
                                  "Graph and tier statistics", commands::cmd_stats));
        cmds.push_back(CommandDef("timeline", "timeline <owner> <topic...>",
                                  "Every version of a topic, oldest first", commands::cmd_timeline));
        cmds.push_back(CommandDef("rebalance", "rebalance",
                                  "Re-evaluate Hot/Cold tiers now", commands::cmd_rebalance));
        cmds.push_back(CommandDef("clear", "clear <owner>",
                                  "Delete all memories, relationships and documents of an owner",
                                  commands::cmd_clear));
    }
    return cmds;
}

const CommandDef* find_command(const std::string& name) {
    const std::vector<CommandDef>& cmds = cli_commands();
    for (size_t i = 0; i < cmds.size(); ++i) {
        if (cmds[i].name == name) return &cmds[i];
    }
    return NULL;
}

const std::set<std::string>& cli_flags() {
    static std::set<std::string> flags;
    if (flags.empty()) {
        flags.insert("async");
        flags.insert("all-versions");
        flags.insert("require-keywords");
        flags.insert("hot-only");
    }
    return flags;
}

// ============================================================================
// Command Implementations
// ============================================================================

namespace commands {

namespace {

int print_json(std::ostream& out, const Json& json) {
    out << json.dump(2) << "\n";
    return 0;
}

int print_error(std::ostream& out, ErrorCode code, const std::string& error) {
    Json j = Json::object();
    j.set("success", false);
    j.set("code", error_code_to_string(code));
    j.set("error", error);
    out << j.dump(2) << "\n";
    return 1;
}

int usage_error(std::ostream& out, const std::string& command) {
    const CommandDef* def = find_command(command);
    return print_error(out, ErrorCode::VALIDATION_FAILURE,
                       "usage: engram " + (def ? def->usage : command));
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::vector<std::string> parts = split(value, ',');
    for (size_t i = 0; i < parts.size(); ++i) {
        std::string item = trim(parts[i]);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

bool parse_kinds(const std::string& value, std::vector<RelationshipKind>& kinds, std::string& error) {
    std::vector<std::string> names = split_list(value);
    for (size_t i = 0; i < names.size(); ++i) {
        RelationshipKind kind;
        if (!string_to_relationship_kind(to_lower(names[i]), kind)) {
            error = "unknown relationship kind: " + names[i];
            return false;
        }
        kinds.push_back(kind);
    }
    return true;
}

Json search_result_to_json(const SearchResult& result) {
    Json items = Json::array();
    for (size_t i = 0; i < result.results.size(); ++i) {
        items.push(scored_memory_to_json(result.results[i]));
    }
    Json j = Json::object();
    j.set("count", result.results.size());
    j.set("results", items);
    return j;
}

} // anonymous namespace

int cmd_ingest(MemoryEngine& engine, const CommandArgs& args, std::ostream& out) {
    if (args.positional.empty()) {
        return usage_error(out, "ingest");
    }
    const std::string& owner = args.positional[0];

    std::string text;
    if (args.has("file")) {
        if (!read_file(args.get("file"), text)) {
            return print_error(out, ErrorCode::VALIDATION_FAILURE, "cannot read " + args.get("file"));
        }
    } else {
        text = args.rest(1);
    }

    std::string title = args.get("title");
    if (title.empty() && args.has("file")) {
        title = args.get("file");
    }

    DocumentResult result = args.has("async")
        ? engine.submit(owner, text, title)
        : engine.ingest(owner, text, title);
    if (!result.success) {
        if (!result.document.id.empty()) {
            Json j = document_to_json(result.document);
            j.set("code", error_code_to_string(result.code));
            print_json(out, j);
            return 1;
        }
        return print_error(out, result.code, result.error);
    }
    return print_json(out, document_to_json(result.document));
}

int cmd_status(MemoryEngine& engine, const CommandArgs& args, std::ostream& out) {
    if (args.positional.size() != 1) {
        return usage_error(out, "status");
    }
    DocumentResult result = engine.get_document_status(args.positional[0]);
    if (!result.success) {
        return print_error(out, result.code, result.error);
    }
    return print_json(out, document_to_json(result.document));
}

int cmd_memories(MemoryEngine& engine, const CommandArgs& args, std::ostream& out) {
    if (args.positional.size() != 1) {
        return usage_error(out, "memories");
    }
    MemoryListResult result = engine.get_document_memories(args.positional[0]);
    if (!result.success) {
        return print_error(out, result.code, result.error);
    }
    Json items = Json::array();
    for (size_t i = 0; i < result.memories.size(); ++i) {
        items.push(memory_to_json(result.memories[i]));
    }
    return print_json(out, items);
}

int cmd_search(MemoryEngine& engine, const CommandArgs& args, std::ostream& out) {
    if (args.positional.size() < 2) {
        return usage_error(out, "search");
    }

    SearchOptions options;
    options.limit = static_cast<int>(args.get_int("limit", 0));
    options.only_latest = !args.has("all-versions");
    options.keyword_filter = split_list(args.get("keywords"));
    options.require_keyword_match = args.has("require-keywords");
    options.semantic_weight = args.get_double("weight", -1.0);
    options.entity_types = split_list(args.get("entity-types"));
    options.date_from = args.get_int("from", 0);
    options.date_to = args.get_int("to", 0);
    options.min_similarity = args.get_double("min-similarity", 0.0);
    options.hot_only = args.has("hot-only");

    std::string error;
    if (!parse_kinds(args.get("kinds"), options.relationship_kinds, error)) {
        return print_error(out, ErrorCode::VALIDATION_FAILURE, error);
    }

    SearchResult result = engine.search(args.positional[0], args.rest(1), options);
    if (!result.success) {
        return print_error(out, result.code, result.error);
    }
    return print_json(out, search_result_to_json(result));
}

int cmd_get(MemoryEngine& engine, const CommandArgs& args, std::ostream& out) {
    if (args.positional.size() != 1) {
        return usage_error(out, "get");
    }
    MemoryResult result = engine.get_memory(args.positional[0]);
    if (!result.success) {
        return print_error(out, result.code, result.error);
    }
    return print_json(out, memory_to_json(result.memory));
}

int cmd_related(MemoryEngine& engine, const CommandArgs& args, std::ostream& out) {
    if (args.positional.size() != 1) {
        return usage_error(out, "related");
    }
    std::vector<RelationshipKind> kinds;
    std::string error;
    if (!parse_kinds(args.get("kinds"), kinds, error)) {
        return print_error(out, ErrorCode::VALIDATION_FAILURE, error);
    }

    int depth = static_cast<int>(args.get_int("depth", 2));
    SubgraphResult result = engine.get_related(args.positional[0], depth, kinds);
    if (!result.success) {
        return print_error(out, result.code, result.error);
    }
    return print_json(out, subgraph_to_json(result.graph));
}

int cmd_export(MemoryEngine& engine, const CommandArgs& args, std::ostream& out) {
    if (args.positional.size() != 1) {
        return usage_error(out, "export");
    }
    GraphExport graph;
    if (!engine.export_graph(args.positional[0], graph)) {
        return print_error(out, ErrorCode::STORAGE_FAILURE, engine.last_error());
    }
    return print_json(out, graph_export_to_json(graph));
}

int cmd_stats(MemoryEngine& engine, const CommandArgs& args, std::ostream& out) {
    if (args.positional.size() != 1) {
        return usage_error(out, "stats");
    }
    GraphStats stats;
    if (!engine.graph_stats(args.positional[0], stats)) {
        return print_error(out, ErrorCode::STORAGE_FAILURE, engine.last_error());
    }
    Json j = Json::object();
    j.set("graph", graph_stats_to_json(stats));
    j.set("tiers", tier_stats_to_json(engine.tier_stats(args.positional[0])));
    return print_json(out, j);
}

int cmd_timeline(MemoryEngine& engine, const CommandArgs& args, std::ostream& out) {
    if (args.positional.size() < 2) {
        return usage_error(out, "timeline");
    }
    SearchResult result = engine.timeline(args.positional[0], args.rest(1));
    if (!result.success) {
        return print_error(out, result.code, result.error);
    }
    return print_json(out, search_result_to_json(result));
}

int cmd_rebalance(MemoryEngine& engine, const CommandArgs& args, std::ostream& out) {
    if (!args.positional.empty()) {
        return usage_error(out, "rebalance");
    }
    return print_json(out, rebalance_report_to_json(engine.rebalance()));
}

int cmd_clear(MemoryEngine& engine, const CommandArgs& args, std::ostream& out) {
    if (args.positional.size() != 1) {
        return usage_error(out, "clear");
    }
    ClearReport report;
    if (!engine.clear_all(args.positional[0], report)) {
        return print_error(out, ErrorCode::STORAGE_FAILURE, engine.last_error());
    }
    return print_json(out, clear_report_to_json(report));
}

} // namespace commands

} // namespace engram
