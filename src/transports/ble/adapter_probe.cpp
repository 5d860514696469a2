#include "transports/ble/adapter_probe.hpp"
#include "core/logger.hpp"

#include <simpleble/Adapter.h>

namespace airbeacon
{
    namespace transports
    {
        namespace ble
        {

            std::string AdapterProbeResult::adapter_list() const
            {
                std::string list;
                for (const auto &adapter : adapters)
                {
                    if (!list.empty())
                    {
                        list += ",";
                    }
                    list += adapter.identifier;
                }
                return list;
            }

            AdapterProbeResult probe_bluetooth()
            {
                auto logger = core::get_logger("AdapterProbe");
                AdapterProbeResult result;

                try
                {
                    if (!SimpleBLE::Adapter::bluetooth_enabled())
                    {
                        result.reason = "Bluetooth is disabled";
                        return result;
                    }

                    auto adapters = SimpleBLE::Adapter::get_adapters();
                    if (adapters.empty())
                    {
                        result.reason = "No BLE adapters found";
                        return result;
                    }

                    for (auto &adapter : adapters)
                    {
                        AdapterInfo info{adapter.identifier(), adapter.address()};
                        logger->debug("Found BLE adapter",
                                      core::LogContext().add("identifier", info.identifier).add("address", info.address));
                        result.adapters.push_back(info);
                    }

                    result.available = true;
                }
                catch (const std::exception &e)
                {
                    result.available = false;
                    result.reason = std::string("Bluetooth stack error: ") + e.what();
                }

                return result;
            }

        } // namespace ble
    } // namespace transports
} // namespace airbeacon
