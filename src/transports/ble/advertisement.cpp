#include "transports/ble/advertisement.hpp"

#include <algorithm>
#include <arpa/inet.h>

namespace airbeacon
{
    namespace transports
    {
        namespace ble
        {

            std::optional<AirPlayAdvertisement> AirPlayAdvertisement::create(const std::string &ipv4, uint16_t port,
                                                                              uint32_t adv_min_ms, uint32_t adv_max_ms)
            {
                if (port == 0)
                {
                    return std::nullopt;
                }

                in_addr addr{};
                if (inet_pton(AF_INET, ipv4.c_str(), &addr) != 1)
                {
                    return std::nullopt;
                }

                AirPlayAdvertisement adv;
                adv.ipv4_ = ipv4;
                adv.port_ = port;
                adv.adv_min_ms_ = adv_min_ms;
                adv.adv_max_ms_ = adv_max_ms;

                adv.manufacturer_data_ = {0x09, 0x08, 0x13, 0x30};

                // s_addr is already in network order
                const uint8_t *octets = reinterpret_cast<const uint8_t *>(&addr.s_addr);
                adv.manufacturer_data_.insert(adv.manufacturer_data_.end(), octets, octets + 4);

                adv.manufacturer_data_.push_back((port >> 8) & 0xFF);
                adv.manufacturer_data_.push_back(port & 0xFF);

                return adv;
            }

            std::vector<uint8_t> AirPlayAdvertisement::advertising_data() const
            {
                std::vector<uint8_t> data;
                // length covers type + company id + payload
                data.push_back(static_cast<uint8_t>(1 + 2 + manufacturer_data_.size()));
                data.push_back(AD_TYPE_MANUFACTURER_DATA);
                data.push_back(APPLE_COMPANY_ID & 0xFF);
                data.push_back((APPLE_COMPANY_ID >> 8) & 0xFF);
                data.insert(data.end(), manufacturer_data_.begin(), manufacturer_data_.end());
                return data;
            }

            uint16_t AirPlayAdvertisement::ms_to_interval_units(uint32_t ms)
            {
                uint64_t units = (static_cast<uint64_t>(ms) * 8) / 5;
                units = std::clamp<uint64_t>(units, ADV_INTERVAL_UNITS_MIN, ADV_INTERVAL_UNITS_MAX);
                return static_cast<uint16_t>(units);
            }

        } // namespace ble
    } // namespace transports
} // namespace airbeacon
