/**
 * Single-Radio WiFi Extender
 * Main entry point
 */

#include <iostream>
#include <csignal>
#include <unistd.h>
#include <memory>
#include <string>
#include <thread>
#include <chrono>
#include <atomic>

#include "core/orchestrator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "database/models.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/radio_probe.hpp"
#include "services/status_event_service.hpp"
#include "api/server.hpp"

// Command line argument parsing
#include <getopt.h>

namespace extender {

const char* const kDefaultConfigPath = "/etc/wifi-extender/config.json";

/**
 * Set by the signal handler, polled by the main thread
 */
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signum) {
    (void)signum;
    g_shutdown_requested = true;
}

/**
 * Setup signal handlers
 */
void setup_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGQUIT, signal_handler);
}

/**
 * Check if running with required privileges
 */
bool check_root_privileges() {
    if (geteuid() != 0) {
        std::cerr << "ERROR: The extender must be run as root to reconfigure the radio." << std::endl;
        std::cerr << "Please run with: sudo wifi_extenderd" << std::endl;
        return false;
    }
    return true;
}

/**
 * Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "Single-Radio WiFi Extender\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration file path (default: " << kDefaultConfigPath << ")\n";
    std::cout << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE      Log to file instead of console\n";
    std::cout << "  -g, --goal GOAL          Initial goal: extending (default) or stopped\n";
    std::cout << "  -i, --interface NAME     Wireless interface to drive\n";
    std::cout << "  -s, --status-interval N  Status reporting interval in seconds\n";
    std::cout << "      --no-api             Do not start the HTTP control API\n";
    std::cout << "      --probe              Print the radio's capabilities and exit\n";
    std::cout << "      --write-config FILE  Write the effective configuration to FILE and exit\n";
    std::cout << "      --events             Print status events to stdout as JSON lines\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  --version                Show version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "                          # Run with default config\n";
    std::cout << "  " << program_name << " -c custom_config.json    # Use custom configuration\n";
    std::cout << "  " << program_name << " --probe -i wlan0         # Check whether wlan0 can extend\n";
    std::cout << "  " << program_name << " -g stopped -vv           # Start idle with debug logging\n";
    std::cout << std::endl;
}

/**
 * Print version information
 */
void print_version() {
    std::cout << "WiFi Extender v0.1.0" << std::endl;
    std::cout << "Built for Linux (nl80211, hostapd, dnsmasq, wpa_supplicant)" << std::endl;
}

/**
 * Parse command line arguments
 */
struct Arguments {
    std::string config_file = kDefaultConfigPath;
    std::string write_config;
    int verbosity = 0;
    std::string log_file;
    std::string goal = "extending";
    std::string interface_name;
    int status_interval = -1;
    bool no_api = false;
    bool probe = false;
    bool print_events = false;
    bool help = false;
    bool version = false;
};

enum LongOnlyOption {
    OPT_NO_API = 1000,
    OPT_PROBE,
    OPT_WRITE_CONFIG,
    OPT_EVENTS,
    OPT_VERSION
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    static struct option long_options[] = {
        {"config",          required_argument, 0, 'c'},
        {"verbose",         no_argument,       0, 'v'},
        {"log-file",        required_argument, 0, 'l'},
        {"goal",            required_argument, 0, 'g'},
        {"interface",       required_argument, 0, 'i'},
        {"status-interval", required_argument, 0, 's'},
        {"no-api",          no_argument,       0, OPT_NO_API},
        {"probe",           no_argument,       0, OPT_PROBE},
        {"write-config",    required_argument, 0, OPT_WRITE_CONFIG},
        {"events",          no_argument,       0, OPT_EVENTS},
        {"help",            no_argument,       0, 'h'},
        {"version",         no_argument,       0, OPT_VERSION},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:vl:g:i:s:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                args.config_file = optarg;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'g':
                args.goal = optarg;
                break;
            case 'i':
                args.interface_name = optarg;
                break;
            case 's':
                try {
                    args.status_interval = std::stoi(optarg);
                } catch (const std::exception&) {
                    std::cerr << "Invalid status interval: " << optarg << std::endl;
                    exit(1);
                }
                break;
            case OPT_NO_API:
                args.no_api = true;
                break;
            case OPT_PROBE:
                args.probe = true;
                break;
            case OPT_WRITE_CONFIG:
                args.write_config = optarg;
                break;
            case OPT_EVENTS:
                args.print_events = true;
                break;
            case 'h':
                args.help = true;
                break;
            case OPT_VERSION:
                args.version = true;
                break;
            case '?':
                // getopt_long already printed an error message
                exit(1);
                break;
            default:
                std::cerr << "Unknown option: " << c << std::endl;
                exit(1);
        }
    }

    return args;
}

/**
 * --probe: report what the radio can do without touching it
 */
int run_probe(const core::ExtenderConfig& config, std::shared_ptr<core::Logger> logger) {
    auto runner = std::make_shared<infrastructure::PosixCommandRunner>();
    infrastructure::RadioCapabilityProbe probe(runner, config.paths.sysfs_net_dir,
                                               std::chrono::milliseconds(config.timeouts.command_ms));

    std::vector<std::string> interfaces;
    if (!config.interface_name.empty()) {
        interfaces.push_back(config.interface_name);
    } else {
        interfaces = probe.find_suitable_interfaces();
    }

    if (interfaces.empty()) {
        logger->error("No wireless interface found");
        return 1;
    }

    nlohmann::json report = nlohmann::json::array();
    bool any_concurrent = false;
    for (const auto& name : interfaces) {
        try {
            auto identity = probe.probe(name);
            any_concurrent = any_concurrent || identity.supports_concurrent;
            report.push_back(identity.to_json());
        } catch (const core::ExtenderError& e) {
            report.push_back({{"interface_name", name},
                              {"error", e.what()},
                              {"reason", core::reason_to_string(e.reason())}});
        }
    }

    std::cout << report.dump(2) << std::endl;
    return any_concurrent ? 0 : 2;
}

} // namespace extender

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    using namespace extender;

    try {
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        // Load configuration; a missing default file falls back to built-in defaults
        std::unique_ptr<core::ExtenderConfig> config;
        try {
            if (access(args.config_file.c_str(), F_OK) != 0 && args.config_file == kDefaultConfigPath) {
                config = core::ExtenderConfig::create_default();
            } else {
                config = core::ExtenderConfig::from_file(args.config_file);
            }
        } catch (const core::ConfigError& e) {
            std::cerr << "Failed to load configuration " << args.config_file << ":" << std::endl;
            for (const auto& violation : e.violations()) {
                std::cerr << "  - " << violation << std::endl;
            }
            return 1;
        }

        // Apply command-line overrides
        if (!args.log_file.empty()) {
            config->logging.log_file = args.log_file;
        }
        if (!args.interface_name.empty()) {
            config->interface_name = args.interface_name;
        }
        if (args.status_interval > 0) {
            config->logging.status_interval = args.status_interval;
        }

        // Setup logging; -v/-vv override the configured level
        core::LogLevel log_level = core::LoggerManager::string_to_level(config->logging.log_level);
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        }

        core::setup_logging(log_level, config->logging.log_file, config->logging.log_file.empty(),
                            core::LoggerManager::string_to_format(config->logging.format));
        auto logger = core::get_logger("main");

        if (args.probe) {
            return run_probe(*config, logger);
        }

        auto goal = core::goal_from_string(args.goal);
        if (!goal) {
            logger->error("Invalid goal", core::LogContext().add("goal", args.goal));
            return 1;
        }

        auto violations = config->validate();
        if (!violations.empty()) {
            for (const auto& violation : violations) {
                logger->error("Configuration validation failed", core::LogContext().add("violation", violation));
            }
            return 1;
        }

        if (!args.write_config.empty()) {
            config->save_to_file(args.write_config);
            logger->info("Configuration written", core::LogContext().add("path", args.write_config));
            return 0;
        }

        if (!check_root_privileges()) {
            return 1;
        }

        setup_signal_handlers();

        // Status journal
        std::shared_ptr<db::Storage> storage;
        if (!config->paths.state_db.empty()) {
            storage = std::make_shared<db::Storage>(db::initStorage(config->paths.state_db));
            storage->sync_schema();
        }
        auto status_events = std::make_shared<services::StatusEventService>(storage);
        if (args.print_events) {
            status_events->subscribe([](const services::StatusEvent& event) {
                std::cout << event.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                          << std::endl;
            });
        }
        status_events->start();

        logger->info("Starting WiFi extender...",
                     core::LogContext()
                         .add("config_file", args.config_file)
                         .add("interface", config->interface_name.empty() ? "auto" : config->interface_name)
                         .add("goal", args.goal));

        auto api_config = config->api;
        core::OrchestratorDependencies dependencies;
        dependencies.status_events = status_events;
        auto orchestrator = std::make_shared<core::ExtenderOrchestrator>(
            std::shared_ptr<core::ExtenderConfig>(std::move(config)), dependencies);

        if (!orchestrator->start(*goal)) {
            logger->error("Failed to start extender");
            status_events->stop();
            return 1;
        }

        std::unique_ptr<ApiServer> api_server;
        if (api_config.enabled && !args.no_api) {
            logger->info("Starting HTTP API server...",
                         core::LogContext().add("host", api_config.host).add("port", api_config.port));
            api_server = std::make_unique<ApiServer>(orchestrator, api_config.token);
            api_server->start(api_config.host, static_cast<uint16_t>(api_config.port));
        }

        logger->info("Extender started");

        while (!g_shutdown_requested && orchestrator->is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        logger->info("Shutting down gracefully...");

        if (api_server) {
            api_server->stop();
        }
        orchestrator->stop();
        status_events->stop();

        logger->info("Extender stopped");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
