/*
 * Engram C++11 - Memory knowledge-graph engine
 *
 * Usage:
 *   ./engram [-c config.json] [-v] <command> [args...]
 *
 * Configuration is read from config.json when present; every key can also
 * be supplied as an ENGRAM_<KEY> environment variable.
 */

#include <engram/cli/commands.hpp>
#include <engram/memory/engine.hpp>
#include <engram/core/config.hpp>
#include <engram/core/http_client.hpp>
#include <engram/core/logger.hpp>
#include <engram/core/utils.hpp>

#include <iostream>
#include <cstring>

namespace engram {

static const char* APP_VERSION = "0.3.0";
static const char* APP_NAME = "Engram C++11";
static const char* DEFAULT_CONFIG = "config.json";

void print_usage(const char* prog) {
    std::cout << APP_NAME << " - memory knowledge-graph engine\n\n"
              << "Usage: " << prog << " [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -c, --config PATH  Config file (default: " << DEFAULT_CONFIG << ")\n"
              << "  -v, --verbose      Debug logging\n"
              << "  -h, --help         Show this help message\n"
              << "  -V, --version      Show version\n\n"
              << "Commands:\n";

    const std::vector<CommandDef>& cmds = cli_commands();
    for (size_t i = 0; i < cmds.size(); ++i) {
        std::cout << "  " << cmds[i].usage << "\n"
                  << "      " << cmds[i].description << "\n";
    }

    std::cout << "\nExample:\n"
              << "  " << prog << " ingest alice \"I work as a Software Engineer at TechCorp\"\n"
              << "  " << prog << " search alice \"current role\" --limit 5\n";
}

void print_version() {
    std::cout << APP_NAME << " v" << APP_VERSION << "\n";
}

} // namespace engram

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    using namespace engram;

    std::string config_file;
    bool verbose = false;
    int command_index = -1;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return 0;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
            continue;
        }
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << argv[i] << "\n";
                return 2;
            }
            config_file = argv[++i];
            continue;
        }
        command_index = i;
        break;
    }

    if (command_index < 0) {
        print_usage(argv[0]);
        return 2;
    }

    const CommandDef* command = find_command(argv[command_index]);
    if (!command) {
        std::cerr << "Unknown command: " << argv[command_index] << "\n\n";
        print_usage(argv[0]);
        return 2;
    }

    std::vector<std::string> tokens;
    for (int i = command_index + 1; i < argc; ++i) {
        tokens.push_back(argv[i]);
    }
    CommandArgs args;
    std::string parse_error;
    if (!CommandArgs::parse(tokens, cli_flags(), args, parse_error)) {
        std::cerr << parse_error << "\n" << "Usage: engram " << command->usage << "\n";
        return 2;
    }

    Config config;
    if (!config_file.empty()) {
        if (!config.load_file(config_file)) {
            std::cerr << "Failed to load config " << config_file << ": " << config.last_error() << "\n";
            return 1;
        }
    } else if (path_exists(DEFAULT_CONFIG)) {
        if (!config.load_file(DEFAULT_CONFIG)) {
            LOG_WARN("Failed to load %s, using defaults: %s", DEFAULT_CONFIG, config.last_error().c_str());
        }
    }

    Logger::instance().set_level(verbose ? LogLevel::DEBUG
                                         : string_to_log_level(config.get_string("log_level", "info")));

    // curl_global_init must run before any worker thread starts
    HttpClient::global_init();

    int rc = 1;
    {
        MemoryEngine engine(EngineConfig::from_config(config));
        if (!engine.initialize(false)) {
            std::cerr << "Failed to start engine: " << engine.last_error() << "\n";
        } else {
            rc = command->handler(engine, args, std::cout);
            engine.wait_idle();
            engine.shutdown();
        }
    }

    HttpClient::global_cleanup();
    return rc;
}
