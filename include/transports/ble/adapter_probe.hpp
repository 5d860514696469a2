#ifndef AIRBEACON_ADAPTER_PROBE_HPP
#define AIRBEACON_ADAPTER_PROBE_HPP

#include <string>
#include <vector>

namespace airbeacon
{
    namespace transports
    {
        namespace ble
        {

            struct AdapterInfo
            {
                std::string identifier;
                std::string address;
            };

            struct AdapterProbeResult
            {
                bool available = false;
                std::string reason;
                std::vector<AdapterInfo> adapters;

                std::string adapter_list() const;
            };

            // One-off startup check that Bluetooth is enabled and an adapter exists.
            AdapterProbeResult probe_bluetooth();

        } // namespace ble
    } // namespace transports
} // namespace airbeacon

#endif // AIRBEACON_ADAPTER_PROBE_HPP
