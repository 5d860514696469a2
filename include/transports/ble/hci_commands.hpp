#ifndef AIRBEACON_HCI_COMMANDS_HPP
#define AIRBEACON_HCI_COMMANDS_HPP

#include <vector>
#include <optional>
#include <cstdint>

namespace airbeacon
{
    namespace transports
    {
        namespace ble
        {
            class AirPlayAdvertisement;

            /**
             * Parameter blocks for the LE controller commands (OGF 0x08) the
             * beacon driver sends. Multi-byte fields are little-endian.
             */
            namespace hci
            {
                constexpr uint16_t LE_READ_LOCAL_FEATURES = 0x0003;
                constexpr uint16_t LE_SET_ADV_PARAMETERS = 0x0006;
                constexpr uint16_t LE_SET_ADV_DATA = 0x0008;
                constexpr uint16_t LE_SET_ADV_ENABLE = 0x000A;
                constexpr uint16_t LE_SET_EXT_ADV_PARAMETERS = 0x0036;
                constexpr uint16_t LE_SET_EXT_ADV_DATA = 0x0037;
                constexpr uint16_t LE_SET_EXT_ADV_ENABLE = 0x0039;
                constexpr uint16_t LE_REMOVE_ADV_SET = 0x003C;

                constexpr uint8_t STATUS_SUCCESS = 0x00;
                constexpr uint8_t STATUS_COMMAND_DISALLOWED = 0x0C;
                constexpr uint8_t STATUS_UNKNOWN_ADV_IDENTIFIER = 0x42;

                // Advertising set handles run 0x00..0xEF
                constexpr uint32_t MAX_ADV_HANDLE = 0xEF;

                // Bit 0 of hci_dev_info.flags
                constexpr uint32_t DEV_FLAG_UP = 1u << 0;

                // Beacon index N advertises as set N; nullopt past the last handle.
                std::optional<uint8_t> advertising_handle(uint32_t index);

                // response: status followed by the 8-byte LE feature mask
                bool supports_extended_advertising(const std::vector<uint8_t> &response);

                inline bool adapter_is_up(uint32_t dev_flags) { return (dev_flags & DEV_FLAG_UP) != 0; }

                std::vector<uint8_t> legacy_parameters(const AirPlayAdvertisement &adv);
                std::vector<uint8_t> legacy_data(const AirPlayAdvertisement &adv);
                std::vector<uint8_t> legacy_enable(bool enable);

                std::vector<uint8_t> extended_parameters(const AirPlayAdvertisement &adv, uint8_t handle);
                std::vector<uint8_t> extended_data(const AirPlayAdvertisement &adv, uint8_t handle);
                std::vector<uint8_t> extended_enable(uint8_t handle, bool enable);
                std::vector<uint8_t> remove_advertising_set(uint8_t handle);

            } // namespace hci

        } // namespace ble
    } // namespace transports
} // namespace airbeacon

#endif // AIRBEACON_HCI_COMMANDS_HPP
