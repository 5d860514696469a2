#ifndef AIRBEACON_BLE_ADVERTISER_HPP
#define AIRBEACON_BLE_ADVERTISER_HPP

#include <string>
#include <memory>
#include <vector>
#include <cstdint>
#include <initializer_list>

#include "transports/ble/beacon_driver.hpp"
#include "transports/ble/hci_controller.hpp"

namespace airbeacon
{
    namespace core
    {
        class Logger;
    }

    namespace transports
    {
        namespace ble
        {
            class AirPlayAdvertisement;

            /**
             * Beacon driver using HCI LE commands on a single controller.
             *
             * The beacon index selects an advertising set on that controller, so
             * several beacons can share one adapter. Controllers with LE extended
             * advertising get set <index>; older controllers only have the one
             * legacy advertisement and accept index 0 alone.
             */
            class HciBeaconDriver : public IBeaconDriver
            {
            public:
                // dev_id < 0 lets the controller pick the first adapter
                HciBeaconDriver(std::unique_ptr<IHciController> controller, int dev_id);
                ~HciBeaconDriver() override;

                HciBeaconDriver(const HciBeaconDriver &) = delete;
                HciBeaconDriver &operator=(const HciBeaconDriver &) = delete;

                bool start(const std::string &ipv4, uint16_t port,
                           uint32_t adv_min, uint32_t adv_max, uint32_t index) override;

                void stop() override;

                bool is_advertising() const { return advertising_; }
                bool uses_extended_advertising() const { return extended_; }
                uint8_t advertising_handle() const { return handle_; }

            private:
                bool read_extended_support(bool &supported);
                bool start_extended(const AirPlayAdvertisement &adv, uint8_t handle);
                bool start_legacy(const AirPlayAdvertisement &adv);
                bool disable_current();
                bool run_command(uint16_t ocf, const std::vector<uint8_t> &params, const char *what,
                                 std::initializer_list<uint8_t> tolerated = {});
                void report_once(const std::string &message, uint32_t index);

                std::unique_ptr<IHciController> controller_;
                int dev_id_;
                bool advertising_;
                bool extended_;
                uint8_t handle_;
                bool unsupported_reported_;
                std::shared_ptr<core::Logger> logger_;
            };

            // "hci3" -> 3; -1 for anything else
            int parse_hci_device_id(const std::string &identifier);

        } // namespace ble
    } // namespace transports
} // namespace airbeacon

#endif // AIRBEACON_BLE_ADVERTISER_HPP
