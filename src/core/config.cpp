#include "core/config.hpp"
#include "core/logger.hpp"
#include <fstream>
#include <filesystem>
#include <limits>
#include <cctype>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>
#include <arpa/inet.h>

namespace airbeacon
{
    namespace core
    {

        namespace
        {
            std::string trim(const std::string &text)
            {
                size_t begin = 0;
                while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])))
                {
                    begin++;
                }
                size_t end = text.size();
                while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
                {
                    end--;
                }
                return text.substr(begin, end - begin);
            }

            std::string home_directory()
            {
                const char *home = std::getenv("HOME");
                if (home && *home)
                {
                    return home;
                }
                struct passwd *pw = getpwuid(getuid());
                if (pw && pw->pw_dir)
                {
                    return pw->pw_dir;
                }
                return ".";
            }
        } // namespace

        // PlatformCapabilities implementation
        PlatformCapabilities PlatformCapabilities::current()
        {
            // Linux unlinks files that another process still holds open, and the
            // state file is re-read every slow tick, so both are available.
            PlatformCapabilities caps;
            caps.can_delete_open_files = true;
            caps.detects_port_change_while_running = true;
            return caps;
        }

        nlohmann::json PlatformCapabilities::to_json() const
        {
            return nlohmann::json{
                {"can_delete_open_files", can_delete_open_files},
                {"detects_port_change_while_running", detects_port_change_while_running}};
        }

        // LoggingConfig implementation
        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // BeaconConfig implementation
        BeaconConfig::BeaconConfig()
            : state_path(default_state_path())
        {
        }

        BeaconConfig BeaconConfig::load(const CommandLineOptions &options, const Ipv4Resolver &resolve_ipv4)
        {
            BeaconConfig config;

            if (!options.config_file.empty())
            {
                config.apply_config_file(options.config_file, options.config_file_explicit);
            }

            if (options.state_path)
            {
                config.state_path = *options.state_path;
            }
            if (options.ipv4 && *options.ipv4 != IPV4_AUTODETECT)
            {
                config.ipv4 = *options.ipv4;
            }
            if (options.adv_min)
            {
                config.adv_min = parse_unsigned(*options.adv_min, "--AdvMin");
            }
            if (options.adv_max)
            {
                config.adv_max = parse_unsigned(*options.adv_max, "--AdvMax");
            }
            if (options.index)
            {
                config.index = parse_unsigned(*options.index, "--index");
            }

            config.stop_on_exit = options.stop_on_exit;
            config.logging.log_level = options.verbosity >= 1 ? "DEBUG" : "INFO";
            config.logging.log_file = options.log_file;

            if (config.ipv4.empty() || config.ipv4 == IPV4_AUTODETECT)
            {
                if (!resolve_ipv4)
                {
                    throw ConfigError("No IPv4 address given and no resolver available");
                }
                config.ipv4 = resolve_ipv4();
            }

            config.validate();
            return config;
        }

        void BeaconConfig::apply_config_file(const std::string &path, bool required)
        {
            std::ifstream file(path);
            if (!file.is_open())
            {
                if (required)
                {
                    throw ConfigError("configuration file " + path + " not found");
                }
                return;
            }

            get_logger("config")->info("Using config file", LogContext().add("file", path));

            std::string line;
            while (std::getline(file, line))
            {
                std::string stripped = trim(line);
                if (stripped.empty() || stripped[0] == '#')
                {
                    continue;
                }

                // Key and value are separated by the first space; a tab stays in the key
                size_t split = stripped.find(' ');
                std::string key = stripped.substr(0, split);
                std::string value = split == std::string::npos ? std::string() : trim(stripped.substr(split + 1));

                apply_directive(key, value, path);
            }
        }

        void BeaconConfig::apply_directive(const std::string &key, const std::string &value, const std::string &source)
        {
            auto numeric = [&](const char *name) -> uint32_t
            {
                if (!is_all_digits(value))
                {
                    throw ConfigError("Invalid config file input (" + std::string(name) + ") " + value + " in " + source);
                }
                return parse_unsigned(value, name);
            };

            if (key == "--path")
            {
                state_path = value;
            }
            else if (key == "--ipv4")
            {
                ipv4 = value;
            }
            else if (key == "--AdvMin")
            {
                adv_min = numeric("--AdvMin");
            }
            else if (key == "--AdvMax")
            {
                adv_max = numeric("--AdvMax");
            }
            else if (key == "--index")
            {
                index = numeric("--index");
            }
            else
            {
                throw ConfigError("Unknown key \"" + key + "\" in config file " + source);
            }
        }

        nlohmann::json BeaconConfig::to_json() const
        {
            return nlohmann::json{
                {"ipv4", ipv4},
                {"adv_min", adv_min},
                {"adv_max", adv_max},
                {"index", index},
                {"state_path", state_path},
                {"slow_tick_ms", slow_tick.count()},
                {"fast_tick_ms", fast_tick.count()},
                {"stop_on_exit", stop_on_exit},
                {"capabilities", capabilities.to_json()},
                {"logging", logging.to_json()}};
        }

        void BeaconConfig::validate() const
        {
            check_adv_interval(adv_min, adv_max);

            in_addr addr{};
            if (inet_pton(AF_INET, ipv4.c_str(), &addr) != 1)
            {
                throw ConfigError("Invalid IPv4 address: " + ipv4);
            }

            if (state_path.empty())
            {
                throw ConfigError("State file path cannot be empty");
            }

            if (fast_tick.count() <= 0 || slow_tick.count() <= 0 || fast_tick > slow_tick)
            {
                throw ConfigError("Fast tick period must be positive and not longer than the slow tick period");
            }
        }

        std::string BeaconConfig::default_state_path()
        {
            return (std::filesystem::path(home_directory()) / ".uxplay.ble").string();
        }

        std::string BeaconConfig::default_config_file()
        {
            return (std::filesystem::path(home_directory()) / ".uxplay.beacon").string();
        }

        void check_adv_interval(uint32_t adv_min, uint32_t adv_max)
        {
            if (!(ADV_INTERVAL_MIN_MS <= adv_min))
            {
                throw ConfigError("AdvMin was smaller than 100 msecs");
            }
            if (!(adv_max >= adv_min))
            {
                throw ConfigError("AdvMax was smaller than AdvMin");
            }
            if (!(adv_max <= ADV_INTERVAL_MAX_MS))
            {
                throw ConfigError("AdvMax was larger than 10240 msecs");
            }
        }

        bool is_all_digits(const std::string &value)
        {
            if (value.empty())
            {
                return false;
            }
            for (char c : value)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                {
                    return false;
                }
            }
            return true;
        }

        uint32_t parse_unsigned(const std::string &value, const std::string &what)
        {
            if (!is_all_digits(value))
            {
                throw ConfigError("Invalid input (" + what + ") " + value);
            }

            unsigned long long parsed = 0;
            try
            {
                parsed = std::stoull(value);
            }
            catch (const std::out_of_range &)
            {
                throw ConfigError("Input (" + what + ") " + value + " is out of range");
            }

            if (parsed > std::numeric_limits<uint32_t>::max())
            {
                throw ConfigError("Input (" + what + ") " + value + " is out of range");
            }
            return static_cast<uint32_t>(parsed);
        }

    } // namespace core
} // namespace airbeacon
