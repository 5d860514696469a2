#include "transports/ble/hci_commands.hpp"
#include "transports/ble/advertisement.hpp"

namespace airbeacon
{
    namespace transports
    {
        namespace ble
        {
            namespace hci
            {

                namespace
                {
                    constexpr uint8_t ADV_TYPE_NONCONN_IND = 0x03;
                    // Extended event properties: legacy PDU, not connectable, not scannable
                    constexpr uint16_t EXT_PROPS_LEGACY_NONCONN = 0x0010;
                    constexpr uint8_t OWN_ADDRESS_PUBLIC = 0x00;
                    constexpr uint8_t CHANNEL_MAP_ALL = 0x07;
                    constexpr uint8_t TX_POWER_NO_PREFERENCE = 0x7F;
                    constexpr uint8_t PHY_LE_1M = 0x01;
                    constexpr uint8_t DATA_OPERATION_COMPLETE = 0x03;
                    constexpr uint8_t NO_FRAGMENTATION = 0x01;
                    constexpr uint8_t EXTENDED_ADVERTISING_FEATURE_BIT = 12;

                    void put16(std::vector<uint8_t> &out, uint16_t value)
                    {
                        out.push_back(value & 0xFF);
                        out.push_back((value >> 8) & 0xFF);
                    }

                    void put24(std::vector<uint8_t> &out, uint32_t value)
                    {
                        out.push_back(value & 0xFF);
                        out.push_back((value >> 8) & 0xFF);
                        out.push_back((value >> 16) & 0xFF);
                    }

                    void put_no_peer(std::vector<uint8_t> &out)
                    {
                        out.push_back(0x00); // peer address type
                        out.insert(out.end(), 6, 0x00);
                    }
                } // namespace

                std::optional<uint8_t> advertising_handle(uint32_t index)
                {
                    if (index > MAX_ADV_HANDLE)
                    {
                        return std::nullopt;
                    }
                    return static_cast<uint8_t>(index);
                }

                bool supports_extended_advertising(const std::vector<uint8_t> &response)
                {
                    const size_t byte = 1 + EXTENDED_ADVERTISING_FEATURE_BIT / 8;
                    if (response.size() <= byte || response[0] != STATUS_SUCCESS)
                    {
                        return false;
                    }
                    return (response[byte] >> (EXTENDED_ADVERTISING_FEATURE_BIT % 8)) & 0x01;
                }

                std::vector<uint8_t> legacy_parameters(const AirPlayAdvertisement &adv)
                {
                    std::vector<uint8_t> out;
                    put16(out, adv.min_interval_units());
                    put16(out, adv.max_interval_units());
                    out.push_back(ADV_TYPE_NONCONN_IND);
                    out.push_back(OWN_ADDRESS_PUBLIC);
                    put_no_peer(out);
                    out.push_back(CHANNEL_MAP_ALL);
                    out.push_back(0x00); // filter policy
                    return out;
                }

                std::vector<uint8_t> legacy_data(const AirPlayAdvertisement &adv)
                {
                    auto data = adv.advertising_data();
                    std::vector<uint8_t> out;
                    out.push_back(static_cast<uint8_t>(data.size()));
                    out.insert(out.end(), data.begin(), data.end());
                    // The command always carries 31 data bytes
                    out.resize(1 + LEGACY_ADV_DATA_MAX, 0x00);
                    return out;
                }

                std::vector<uint8_t> legacy_enable(bool enable)
                {
                    return {static_cast<uint8_t>(enable ? 0x01 : 0x00)};
                }

                std::vector<uint8_t> extended_parameters(const AirPlayAdvertisement &adv, uint8_t handle)
                {
                    std::vector<uint8_t> out;
                    out.push_back(handle);
                    put16(out, EXT_PROPS_LEGACY_NONCONN);
                    put24(out, adv.min_interval_units());
                    put24(out, adv.max_interval_units());
                    out.push_back(CHANNEL_MAP_ALL);
                    out.push_back(OWN_ADDRESS_PUBLIC);
                    put_no_peer(out);
                    out.push_back(0x00); // filter policy
                    out.push_back(TX_POWER_NO_PREFERENCE);
                    out.push_back(PHY_LE_1M);
                    out.push_back(0x00); // secondary max skip
                    out.push_back(PHY_LE_1M);
                    out.push_back(handle & 0x0F); // advertising SID
                    out.push_back(0x00); // scan request notifications
                    return out;
                }

                std::vector<uint8_t> extended_data(const AirPlayAdvertisement &adv, uint8_t handle)
                {
                    auto data = adv.advertising_data();
                    std::vector<uint8_t> out{handle, DATA_OPERATION_COMPLETE, NO_FRAGMENTATION,
                                             static_cast<uint8_t>(data.size())};
                    out.insert(out.end(), data.begin(), data.end());
                    return out;
                }

                std::vector<uint8_t> extended_enable(uint8_t handle, bool enable)
                {
                    std::vector<uint8_t> out{static_cast<uint8_t>(enable ? 0x01 : 0x00), 0x01, handle};
                    put16(out, 0x0000); // no duration limit
                    out.push_back(0x00); // no event limit
                    return out;
                }

                std::vector<uint8_t> remove_advertising_set(uint8_t handle)
                {
                    return {handle};
                }

            } // namespace hci
        } // namespace ble
    } // namespace transports
} // namespace airbeacon
