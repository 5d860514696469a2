#pragma once
/** @file  FakeHciController.hpp
 *  @brief IHciController that records LE commands and answers from a script.
 */

#include "transports/ble/hci_controller.hpp"
#include "transports/ble/hci_commands.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <vector>

namespace airbeacon {
  namespace test {

    struct SentCommand {
      uint16_t ocf;
      std::vector<uint8_t> params;
    };

    class FakeHciController : public airbeacon::transports::ble::IHciController {
    public:
      bool open(int dev_id) override {
        opened_devices.push_back(dev_id);
        open_ = open_succeeds;
        return open_;
      }

      void close() override { open_ = false; }
      bool is_open() const override { return open_; }

      bool send_le_command(uint16_t ocf, const std::vector<uint8_t>& params,
                           std::vector<uint8_t>& response) override {
        if (!open_) {
          return false;
        }
        sent.push_back(SentCommand{ocf, params});

        if (ocf == airbeacon::transports::ble::hci::LE_READ_LOCAL_FEATURES) {
          response = {0x00, 0x00, static_cast<uint8_t>(extended_advertising ? 0x10 : 0x00),
                      0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
          return true;
        }

        auto it = statuses_.find(ocf);
        if (it != statuses_.end() && !it->second.empty()) {
          response = {it->second.front()};
          it->second.pop_front();
        } else {
          response = {airbeacon::transports::ble::hci::STATUS_SUCCESS};
        }
        return true;
      }

      // Next status bytes returned for ocf, success once exhausted
      void reply(uint16_t ocf, uint8_t status) { statuses_[ocf].push_back(status); }

      std::vector<SentCommand> commands(uint16_t ocf) const {
        std::vector<SentCommand> matching;
        for (const auto& command : sent) {
          if (command.ocf == ocf) {
            matching.push_back(command);
          }
        }
        return matching;
      }

      bool extended_advertising = true;
      bool open_succeeds = true;
      std::vector<int> opened_devices;
      std::vector<SentCommand> sent;

    private:
      bool open_ = false;
      std::map<uint16_t, std::deque<uint8_t>> statuses_;
    };

  } // namespace test
} // namespace airbeacon
