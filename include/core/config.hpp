#ifndef AIRBEACON_CORE_CONFIG_HPP
#define AIRBEACON_CORE_CONFIG_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <functional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace airbeacon
{
    namespace core
    {

        /**
         * Invalid command line value, config file directive or interval bound.
         * Fatal before the poll loop starts.
         */
        class ConfigError : public std::runtime_error
        {
        public:
            explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
        };

        // Advertising interval bounds, milliseconds
        constexpr uint32_t ADV_INTERVAL_MIN_MS = 100;
        constexpr uint32_t ADV_INTERVAL_MAX_MS = 10240;

        // Placeholder accepted by --ipv4 meaning "detect the local address"
        constexpr const char *IPV4_AUTODETECT = "use gethostbyname";

        /**
         * What the host platform lets the coordinator do
         */
        struct PlatformCapabilities
        {
            bool can_delete_open_files = true;
            bool detects_port_change_while_running = true;

            static PlatformCapabilities current();
            nlohmann::json to_json() const;
        };

        /**
         * Logging configuration
         */
        struct LoggingConfig
        {
            std::string log_level = "INFO";
            std::string log_file; // Empty means console output

            nlohmann::json to_json() const;
        };

        /**
         * Values gathered from the command line, before merging with the
         * config file. Unset optionals fall back to the file, then defaults.
         */
        struct CommandLineOptions
        {
            std::string config_file;
            bool config_file_explicit = false;
            std::optional<std::string> state_path;
            std::optional<std::string> ipv4;
            std::optional<std::string> adv_min;
            std::optional<std::string> adv_max;
            std::optional<std::string> index;
            int verbosity = 0;
            std::string log_file;
            bool stop_on_exit = true;
        };

        /**
         * Complete beacon configuration, immutable once loaded
         */
        class BeaconConfig
        {
        public:
            std::string ipv4;
            uint32_t adv_min = ADV_INTERVAL_MIN_MS;
            uint32_t adv_max = ADV_INTERVAL_MIN_MS;
            uint32_t index = 0;
            std::string state_path;

            std::chrono::milliseconds slow_tick{1000};
            std::chrono::milliseconds fast_tick{200};
            bool stop_on_exit = true;

            PlatformCapabilities capabilities = PlatformCapabilities::current();
            LoggingConfig logging;

        public:
            BeaconConfig();

            using Ipv4Resolver = std::function<std::string()>;

            // Merge order: defaults, config file, command line. Throws ConfigError.
            static BeaconConfig load(const CommandLineOptions &options,
                                     const Ipv4Resolver &resolve_ipv4);

            // Applies "--key value" lines from a config file. A missing file is
            // an error only when required is set.
            void apply_config_file(const std::string &path, bool required);

            void apply_directive(const std::string &key, const std::string &value, const std::string &source);

            nlohmann::json to_json() const;

            // Throws ConfigError
            void validate() const;

            static std::string default_state_path();
            static std::string default_config_file();
        };

        /**
         * Throws ConfigError unless 100 <= adv_min <= adv_max <= 10240.
         */
        void check_adv_interval(uint32_t adv_min, uint32_t adv_max);

        bool is_all_digits(const std::string &value);

        // Parses a non-negative decimal; what names the option in the error.
        uint32_t parse_unsigned(const std::string &value, const std::string &what);

    } // namespace core
} // namespace airbeacon

#endif // AIRBEACON_CORE_CONFIG_HPP
