#include "transports/ble/hci_controller.hpp"
#include "transports/ble/hci_commands.hpp"
#include "core/logger.hpp"

#include <cstring>
#include <cerrno>
#include <string>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>

namespace airbeacon
{
    namespace transports
    {
        namespace ble
        {

            namespace
            {
                constexpr int HCI_COMMAND_TIMEOUT_MS = 1000;

                std::string device_name(int dev_id)
                {
                    return "hci" + std::to_string(dev_id);
                }
            } // namespace

            BluezHciController::BluezHciController()
                : hci_socket_(-1), dev_id_(-1), logger_(core::get_logger("HciController"))
            {
            }

            BluezHciController::~BluezHciController()
            {
                close();
            }

            bool BluezHciController::open(int dev_id)
            {
                close();

                if (dev_id < 0)
                {
                    dev_id = hci_get_route(nullptr);
                    if (dev_id < 0)
                    {
                        logger_->error("No Bluetooth controller available",
                                       core::LogContext().add("error", strerror(errno)));
                        return false;
                    }
                }

                if (!ensure_powered(dev_id))
                {
                    return false;
                }

                hci_socket_ = hci_open_dev(dev_id);
                if (hci_socket_ < 0)
                {
                    logger_->error("Cannot open HCI device",
                                   core::LogContext()
                                       .add("device", device_name(dev_id))
                                       .add("error", strerror(errno)));
                    hci_socket_ = -1;
                    return false;
                }

                dev_id_ = dev_id;
                return true;
            }

            void BluezHciController::close()
            {
                if (hci_socket_ >= 0)
                {
                    hci_close_dev(hci_socket_);
                    hci_socket_ = -1;
                    dev_id_ = -1;
                }
            }

            bool BluezHciController::ensure_powered(int dev_id)
            {
                struct hci_dev_info info;
                memset(&info, 0, sizeof(info));
                if (hci_devinfo(dev_id, &info) < 0)
                {
                    logger_->error("Cannot query Bluetooth adapter",
                                   core::LogContext()
                                       .add("device", device_name(dev_id))
                                       .add("error", strerror(errno)));
                    return false;
                }

                // HCIDEVUP needs CAP_NET_ADMIN; skip it when the adapter is already up
                if (hci::adapter_is_up(info.flags))
                {
                    return true;
                }

                int ctl = socket(AF_BLUETOOTH, SOCK_RAW | SOCK_CLOEXEC, BTPROTO_HCI);
                if (ctl < 0)
                {
                    logger_->error("Cannot open HCI control socket",
                                   core::LogContext().add("error", strerror(errno)));
                    return false;
                }

                bool ok = true;
                if (ioctl(ctl, HCIDEVUP, dev_id) < 0 && errno != EALREADY)
                {
                    logger_->error("Cannot power on Bluetooth adapter",
                                   core::LogContext()
                                       .add("device", device_name(dev_id))
                                       .add("error", strerror(errno)));
                    ok = false;
                }
                else
                {
                    logger_->info("Powered on Bluetooth adapter", core::LogContext().add("device", device_name(dev_id)));
                }

                ::close(ctl);
                return ok;
            }

            bool BluezHciController::send_le_command(uint16_t ocf, const std::vector<uint8_t> &params,
                                                     std::vector<uint8_t> &response)
            {
                response.clear();
                if (hci_socket_ < 0)
                {
                    return false;
                }

                std::vector<uint8_t> cparam(params);
                uint8_t rparam[HCI_MAX_EVENT_SIZE];

                struct hci_request rq;
                memset(&rq, 0, sizeof(rq));
                rq.ogf = OGF_LE_CTL;
                rq.ocf = ocf;
                rq.cparam = cparam.empty() ? nullptr : cparam.data();
                rq.clen = static_cast<int>(cparam.size());
                rq.rparam = rparam;
                rq.rlen = sizeof(rparam);

                if (hci_send_req(hci_socket_, &rq, HCI_COMMAND_TIMEOUT_MS) < 0)
                {
                    logger_->error("HCI command failed",
                                   core::LogContext()
                                       .add("device", device_name(dev_id_))
                                       .add("ocf", ocf)
                                       .add("error", strerror(errno)));
                    return false;
                }

                response.assign(rparam, rparam + rq.rlen);
                return true;
            }

        } // namespace ble
    } // namespace transports
} // namespace airbeacon
