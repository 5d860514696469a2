#ifndef AIRBEACON_ADVERTISEMENT_HPP
#define AIRBEACON_ADVERTISEMENT_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace airbeacon
{
    namespace transports
    {
        namespace ble
        {

            constexpr uint16_t APPLE_COMPANY_ID = 0x004C;
            constexpr uint8_t AD_TYPE_MANUFACTURER_DATA = 0xFF;
            constexpr size_t LEGACY_ADV_DATA_MAX = 31;

            // HCI interval units are 0.625 ms; legacy advertising allows 20 ms..10.24 s
            constexpr uint16_t ADV_INTERVAL_UNITS_MIN = 0x0020;
            constexpr uint16_t ADV_INTERVAL_UNITS_MAX = 0x4000;

            /**
             * AirPlay service-discovery advertisement.
             *
             * Manufacturer data (company 0x004C):
             *   09 08 13 30 <ipv4, 4 bytes> <port, 2 bytes big-endian>
             * i.e. Apple data unit type 9 (AirPlay), length 8, flags 0x13, seed 0x30.
             */
            class AirPlayAdvertisement
            {
            public:
                // nullopt if ipv4 is not a dotted quad or port is 0
                static std::optional<AirPlayAdvertisement> create(const std::string &ipv4, uint16_t port,
                                                                  uint32_t adv_min_ms, uint32_t adv_max_ms);

                const std::vector<uint8_t> &manufacturer_data() const { return manufacturer_data_; }

                // Legacy advertising data: a single manufacturer specific AD structure
                std::vector<uint8_t> advertising_data() const;

                uint16_t min_interval_units() const { return ms_to_interval_units(adv_min_ms_); }
                uint16_t max_interval_units() const { return ms_to_interval_units(adv_max_ms_); }

                const std::string &ipv4() const { return ipv4_; }
                uint16_t port() const { return port_; }

                static uint16_t ms_to_interval_units(uint32_t ms);

            private:
                AirPlayAdvertisement() = default;

                std::string ipv4_;
                uint16_t port_ = 0;
                uint32_t adv_min_ms_ = 0;
                uint32_t adv_max_ms_ = 0;
                std::vector<uint8_t> manufacturer_data_;
            };

        } // namespace ble
    } // namespace transports
} // namespace airbeacon

#endif // AIRBEACON_ADVERTISEMENT_HPP
