#include "transports/ble/ble_advertiser.hpp"
#include "transports/ble/advertisement.hpp"
#include "transports/ble/adapter_probe.hpp"
#include "transports/ble/hci_commands.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>

namespace airbeacon
{
    namespace transports
    {
        namespace ble
        {

            HciBeaconDriver::HciBeaconDriver(std::unique_ptr<IHciController> controller, int dev_id)
                : controller_(std::move(controller)), dev_id_(dev_id), advertising_(false), extended_(false),
                  handle_(0), unsupported_reported_(false), logger_(core::get_logger("HciBeacon"))
            {
            }

            HciBeaconDriver::~HciBeaconDriver()
            {
                controller_->close();
            }

            bool HciBeaconDriver::start(const std::string &ipv4, uint16_t port,
                                        uint32_t adv_min, uint32_t adv_max, uint32_t index)
            {
                if (advertising_)
                {
                    stop();
                }

                auto adv = AirPlayAdvertisement::create(ipv4, port, adv_min, adv_max);
                if (!adv)
                {
                    logger_->error("Cannot build AirPlay advertisement",
                                   core::LogContext().add("ipv4", ipv4).add("port", port));
                    return false;
                }

                auto handle = hci::advertising_handle(index);
                if (!handle)
                {
                    report_once("Beacon index exceeds the highest advertising set", index);
                    return false;
                }

                if (!controller_->open(dev_id_))
                {
                    return false;
                }

                bool extended = false;
                if (!read_extended_support(extended))
                {
                    controller_->close();
                    return false;
                }

                if (!extended && index != 0)
                {
                    report_once("Controller lacks LE extended advertising, only beacon index 0 is available", index);
                    controller_->close();
                    return false;
                }

                bool ok = extended ? start_extended(*adv, *handle) : start_legacy(*adv);
                if (!ok)
                {
                    logger_->error("Failed to register advertisement", core::LogContext().add("index", index));
                    controller_->close();
                    return false;
                }

                advertising_ = true;
                extended_ = extended;
                handle_ = *handle;
                logger_->info("AirPlay Service-Discovery advertisement registered",
                              core::LogContext()
                                  .add("address", ipv4 + ":" + std::to_string(port))
                                  .add("index", index)
                                  .add("mode", extended ? "extended" : "legacy")
                                  .add("adv_min_ms", adv_min)
                                  .add("adv_max_ms", adv_max));
                return true;
            }

            void HciBeaconDriver::stop()
            {
                if (!advertising_)
                {
                    return;
                }

                if (!disable_current())
                {
                    logger_->warning("Controller did not confirm advertising stop",
                                     core::LogContext().add("handle", static_cast<int>(handle_)));
                }
                controller_->close();
                advertising_ = false;
                logger_->info("AirPlay Service-Discovery advertisement unregistered",
                              core::LogContext().add("handle", static_cast<int>(handle_)));
            }

            bool HciBeaconDriver::read_extended_support(bool &supported)
            {
                std::vector<uint8_t> response;
                if (!controller_->send_le_command(hci::LE_READ_LOCAL_FEATURES, {}, response) ||
                    response.empty() || response[0] != hci::STATUS_SUCCESS)
                {
                    logger_->error("Cannot read controller LE features");
                    return false;
                }

                supported = hci::supports_extended_advertising(response);
                return true;
            }

            bool HciBeaconDriver::start_extended(const AirPlayAdvertisement &adv, uint8_t handle)
            {
                // A set left over from an earlier run has to be disabled before it
                // can be reconfigured. Unknown set and disallowed mean it is idle.
                if (!run_command(hci::LE_SET_EXT_ADV_ENABLE, hci::extended_enable(handle, false),
                                 "disable advertising set",
                                 {hci::STATUS_COMMAND_DISALLOWED, hci::STATUS_UNKNOWN_ADV_IDENTIFIER}))
                {
                    return false;
                }

                return run_command(hci::LE_SET_EXT_ADV_PARAMETERS, hci::extended_parameters(adv, handle),
                                   "set extended advertising parameters") &&
                       run_command(hci::LE_SET_EXT_ADV_DATA, hci::extended_data(adv, handle),
                                   "set extended advertising data") &&
                       run_command(hci::LE_SET_EXT_ADV_ENABLE, hci::extended_enable(handle, true),
                                   "enable advertising set");
            }

            bool HciBeaconDriver::start_legacy(const AirPlayAdvertisement &adv)
            {
                if (!run_command(hci::LE_SET_ADV_ENABLE, hci::legacy_enable(false), "disable advertising",
                                 {hci::STATUS_COMMAND_DISALLOWED}))
                {
                    return false;
                }

                return run_command(hci::LE_SET_ADV_PARAMETERS, hci::legacy_parameters(adv),
                                   "set advertising parameters") &&
                       run_command(hci::LE_SET_ADV_DATA, hci::legacy_data(adv), "set advertising data") &&
                       run_command(hci::LE_SET_ADV_ENABLE, hci::legacy_enable(true), "enable advertising");
            }

            bool HciBeaconDriver::disable_current()
            {
                if (!extended_)
                {
                    return run_command(hci::LE_SET_ADV_ENABLE, hci::legacy_enable(false), "disable advertising",
                                       {hci::STATUS_COMMAND_DISALLOWED});
                }

                return run_command(hci::LE_SET_EXT_ADV_ENABLE, hci::extended_enable(handle_, false),
                                   "disable advertising set",
                                   {hci::STATUS_COMMAND_DISALLOWED, hci::STATUS_UNKNOWN_ADV_IDENTIFIER}) &&
                       run_command(hci::LE_REMOVE_ADV_SET, hci::remove_advertising_set(handle_),
                                   "remove advertising set", {hci::STATUS_UNKNOWN_ADV_IDENTIFIER});
            }

            bool HciBeaconDriver::run_command(uint16_t ocf, const std::vector<uint8_t> &params, const char *what,
                                              std::initializer_list<uint8_t> tolerated)
            {
                std::vector<uint8_t> response;
                if (!controller_->send_le_command(ocf, params, response))
                {
                    logger_->error("HCI command not delivered", core::LogContext().add("command", what));
                    return false;
                }

                if (response.empty())
                {
                    logger_->error("HCI command returned no status", core::LogContext().add("command", what));
                    return false;
                }

                uint8_t status = response[0];
                if (status == hci::STATUS_SUCCESS)
                {
                    return true;
                }

                if (std::find(tolerated.begin(), tolerated.end(), status) != tolerated.end())
                {
                    logger_->debug("HCI command status ignored",
                                   core::LogContext().add("command", what).add("status", static_cast<int>(status)));
                    return true;
                }

                logger_->error("HCI command rejected by controller",
                               core::LogContext().add("command", what).add("status", static_cast<int>(status)));
                return false;
            }

            void HciBeaconDriver::report_once(const std::string &message, uint32_t index)
            {
                if (unsupported_reported_)
                {
                    logger_->debug(message, core::LogContext().add("index", index));
                    return;
                }
                logger_->error(message, core::LogContext().add("index", index));
                unsupported_reported_ = true;
            }

            int parse_hci_device_id(const std::string &identifier)
            {
                const std::string prefix = "hci";
                if (identifier.size() <= prefix.size() || identifier.compare(0, prefix.size(), prefix) != 0)
                {
                    return -1;
                }

                int id = 0;
                for (size_t i = prefix.size(); i < identifier.size(); i++)
                {
                    if (!std::isdigit(static_cast<unsigned char>(identifier[i])) || id > 0xFFFF)
                    {
                        return -1;
                    }
                    id = id * 10 + (identifier[i] - '0');
                }
                return id;
            }

            std::unique_ptr<IBeaconDriver> create_beacon_driver(const core::BeaconConfig &config)
            {
                auto logger = core::get_logger("HciBeacon");

                if (!hci::advertising_handle(config.index))
                {
                    logger->error("Beacon driver unavailable",
                                  core::LogContext()
                                      .add("reason", "beacon index above the highest advertising set")
                                      .add("index", config.index)
                                      .add("max", hci::MAX_ADV_HANDLE));
                    return nullptr;
                }

                auto probe = probe_bluetooth();
                if (!probe.available)
                {
                    logger->error("Beacon driver unavailable", core::LogContext().add("reason", probe.reason));
                    return nullptr;
                }

                // Every beacon goes on the first usable adapter; the index picks the set
                int dev_id = -1;
                for (const auto &adapter : probe.adapters)
                {
                    dev_id = parse_hci_device_id(adapter.identifier);
                    if (dev_id >= 0)
                    {
                        break;
                    }
                }

                logger->info("Using Bluetooth adapter",
                             core::LogContext()
                                 .add("device", dev_id >= 0 ? "hci" + std::to_string(dev_id) : std::string("default"))
                                 .add("adapters", probe.adapter_list()));

                return std::make_unique<HciBeaconDriver>(std::make_unique<BluezHciController>(), dev_id);
            }

        } // namespace ble
    } // namespace transports
} // namespace airbeacon
