#ifndef AIRBEACON_HCI_CONTROLLER_HPP
#define AIRBEACON_HCI_CONTROLLER_HPP

#include <vector>
#include <memory>
#include <cstdint>

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

            /**
             * Command channel to one Bluetooth controller
             */
            class IHciController
            {
            public:
                virtual ~IHciController() = default;

                // Powers the adapter up if needed and opens it. dev_id < 0 picks
                // the first available controller.
                virtual bool open(int dev_id) = 0;
                virtual void close() = 0;
                virtual bool is_open() const = 0;

                // False if the command could not be delivered. On success the
                // return parameters are in response, status byte first.
                virtual bool send_le_command(uint16_t ocf, const std::vector<uint8_t> &params,
                                             std::vector<uint8_t> &response) = 0;
            };

            /**
             * IHciController over a BlueZ raw HCI socket
             */
            class BluezHciController : public IHciController
            {
            public:
                BluezHciController();
                ~BluezHciController() override;

                BluezHciController(const BluezHciController &) = delete;
                BluezHciController &operator=(const BluezHciController &) = delete;

                bool open(int dev_id) override;
                void close() override;
                bool is_open() const override { return hci_socket_ >= 0; }

                bool send_le_command(uint16_t ocf, const std::vector<uint8_t> &params,
                                     std::vector<uint8_t> &response) override;

            private:
                bool ensure_powered(int dev_id);

                int hci_socket_;
                int dev_id_;
                std::shared_ptr<core::Logger> logger_;
            };

        } // namespace ble
    } // namespace transports
} // namespace airbeacon

#endif // AIRBEACON_HCI_CONTROLLER_HPP
