/**
 * AirPlay service-discovery BLE beacon
 * Main entry point for the beacon daemon
 */

#include <iostream>
#include <csignal>
#include <memory>
#include <string>

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/net_utils.hpp"
#include "core/process_table.hpp"
#include "core/orphan_reclaimer.hpp"
#include "core/coordinator.hpp"
#include "core/poll_scheduler.hpp"
#include "transports/ble/beacon_driver.hpp"

// Command line argument parsing
#include <getopt.h>

namespace airbeacon {

/**
 * Poll loop instance for signal handling
 */
core::PollScheduler* g_scheduler = nullptr;

/**
 * Signal handler: only flags the loop, which winds down on its own
 */
void signal_handler(int) {
    if (g_scheduler) {
        g_scheduler->request_stop();
    }
}

void setup_signal_handlers() {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGQUIT, signal_handler);
}

void print_usage(const char* program_name) {
    std::cout << "AirPlay Service-Discovery Bluetooth LE beacon\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --file FILE          Beacon startup file: one \"--key value\" per line, # starts a comment\n";
    std::cout << "                       (default: ~/.uxplay.beacon)\n";
    std::cout << "  --path FILE          AirPlay server BLE beacon information file (default: ~/.uxplay.ble)\n";
    std::cout << "  --ipv4 ADDR          IPv4 address of the AirPlay server (default: use gethostbyname)\n";
    std::cout << "  --AdvMin N           Minimum advertising interval, msec, >= 100 (default 100)\n";
    std::cout << "  --AdvMax N           Maximum advertising interval, msec, >= AdvMin, <= 10240 (default 100)\n";
    std::cout << "  --index N            Beacon index 0..239, one advertising set per beacon (default 0)\n";
    std::cout << "  -v, --verbose        Debug logging\n";
    std::cout << "  -l, --log-file FILE  Log to file instead of console\n";
    std::cout << "  --no-stop-on-exit    Leave the advertisement running when the daemon exits\n";
    std::cout << "  --print-config       Print the effective configuration as JSON and exit\n";
    std::cout << "  -h, --help           Show this help message\n";
    std::cout << "  --version            Show version information\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program_name << " --ipv4 192.168.1.100 --path /home/user/.uxplay.ble --AdvMin 100 --AdvMax 100\n";
    std::cout << std::endl;
}

void print_version() {
    std::cout << "airbeacon v0.1.0" << std::endl;
    std::cout << "Built for Linux (BlueZ HCI)" << std::endl;
}

enum LongOption {
    OPT_FILE = 1000,
    OPT_PATH,
    OPT_IPV4,
    OPT_ADV_MIN,
    OPT_ADV_MAX,
    OPT_INDEX,
    OPT_NO_STOP_ON_EXIT,
    OPT_PRINT_CONFIG,
    OPT_VERSION
};

struct Arguments {
    core::CommandLineOptions options;
    bool print_config = false;
    bool help = false;
    bool version = false;
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;
    args.options.config_file = core::BeaconConfig::default_config_file();

    static struct option long_options[] = {
        {"file",            required_argument, 0, OPT_FILE},
        {"path",            required_argument, 0, OPT_PATH},
        {"ipv4",            required_argument, 0, OPT_IPV4},
        {"AdvMin",          required_argument, 0, OPT_ADV_MIN},
        {"AdvMax",          required_argument, 0, OPT_ADV_MAX},
        {"index",           required_argument, 0, OPT_INDEX},
        {"verbose",         no_argument,       0, 'v'},
        {"log-file",        required_argument, 0, 'l'},
        {"no-stop-on-exit", no_argument,       0, OPT_NO_STOP_ON_EXIT},
        {"print-config",    no_argument,       0, OPT_PRINT_CONFIG},
        {"help",            no_argument,       0, 'h'},
        {"version",         no_argument,       0, OPT_VERSION},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "vl:h", long_options, &option_index)) != -1) {
        switch (c) {
            case OPT_FILE:
                args.options.config_file = optarg;
                args.options.config_file_explicit = true;
                break;
            case OPT_PATH:
                args.options.state_path = std::string(optarg);
                break;
            case OPT_IPV4:
                args.options.ipv4 = std::string(optarg);
                break;
            case OPT_ADV_MIN:
                args.options.adv_min = std::string(optarg);
                break;
            case OPT_ADV_MAX:
                args.options.adv_max = std::string(optarg);
                break;
            case OPT_INDEX:
                args.options.index = std::string(optarg);
                break;
            case 'v':
                args.options.verbosity++;
                break;
            case 'l':
                args.options.log_file = optarg;
                break;
            case OPT_NO_STOP_ON_EXIT:
                args.options.stop_on_exit = false;
                break;
            case OPT_PRINT_CONFIG:
                args.print_config = true;
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

    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << std::endl;
        exit(1);
    }

    return args;
}

} // namespace airbeacon

int main(int argc, char* argv[]) {
    using namespace airbeacon;

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

        core::LogLevel log_level = args.options.verbosity >= 1 ? core::LogLevel::DEBUG : core::LogLevel::INFO;
        core::setup_logging(log_level, args.options.log_file, args.options.log_file.empty());
        auto logger = core::get_logger("main");

        core::BeaconConfig config;
        try {
            config = core::BeaconConfig::load(args.options, core::resolve_local_ipv4);
        } catch (const core::ConfigError& e) {
            logger->error("Configuration error", core::LogContext().add("error", e.what()));
            return 1;
        }

        if (args.print_config) {
            std::cout << config.to_json().dump(4) << std::endl;
            return 0;
        }

        logger->info("AirPlay Service-Discovery Bluetooth LE beacon",
                     core::LogContext()
                         .add("path", config.state_path)
                         .add("ipv4", config.ipv4)
                         .add("advmin", config.adv_min)
                         .add("advmax", config.adv_max)
                         .add("index", config.index));
        logger->debug("Effective configuration", core::LogContext().add("config", config.to_json().dump()));

        auto driver = transports::ble::create_beacon_driver(config);
        if (!driver) {
            logger->error("No usable Bluetooth LE advertising support, exiting");
            return 1;
        }

        core::LinuxProcessTable processes;
        core::OrphanReclaimer reclaimer;
        core::BeaconCoordinator coordinator(config, *driver, processes, reclaimer);
        core::CoordinatorState state;

        core::PollScheduler scheduler;
        scheduler.every(config.slow_tick, "check_state_file", [&] { coordinator.slow_tick(state); });
        scheduler.every(config.fast_tick, "apply_pending", [&] { coordinator.fast_tick(state); });

        g_scheduler = &scheduler;
        setup_signal_handlers();

        logger->info("(Press Ctrl+C to exit)");
        scheduler.run();

        logger->info("Exiting ...");
        coordinator.shutdown(state);
        g_scheduler = nullptr;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
