#ifndef AIRBEACON_BEACON_DRIVER_HPP
#define AIRBEACON_BEACON_DRIVER_HPP

#include <string>
#include <memory>
#include <cstdint>

namespace airbeacon
{
    namespace core
    {
        class BeaconConfig;
    }

    namespace transports
    {
        namespace ble
        {

            /**
             * Platform advertisement mechanism. Native error detail stays inside
             * the driver, which reports it through its own logger; callers only
             * see the boolean result of start().
             */
            class IBeaconDriver
            {
            public:
                virtual ~IBeaconDriver() = default;

                virtual bool start(const std::string &ipv4, uint16_t port,
                                   uint32_t adv_min, uint32_t adv_max, uint32_t index) = 0;

                // Safe to call when nothing is advertised.
                virtual void stop() = 0;
            };

            // Returns nullptr when no usable Bluetooth adapter is present.
            std::unique_ptr<IBeaconDriver> create_beacon_driver(const core::BeaconConfig &config);

        } // namespace ble
    } // namespace transports
} // namespace airbeacon

#endif // AIRBEACON_BEACON_DRIVER_HPP
