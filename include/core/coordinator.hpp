#ifndef AIRBEACON_CORE_COORDINATOR_HPP
#define AIRBEACON_CORE_COORDINATOR_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

#include "core/config.hpp"
#include "protocol/state_record.h"

namespace airbeacon
{
    namespace transports
    {
        namespace ble
        {
            class IBeaconDriver;
        }
    }

    namespace core
    {
        class Logger;
        class ProcessTable;
        class OrphanReclaimer;

        /**
         * Everything the coordinator remembers between ticks.
         *
         * running == advertised_port.has_value(). After a fast tick,
         * pending_on implies !running and pending_off implies running.
         */
        struct CoordinatorState
        {
            bool running = false;
            bool pending_on = false;
            bool pending_off = false;
            std::optional<uint16_t> advertised_port;

            // Port from the last valid record, consumed by the next start
            std::optional<uint16_t> pending_port;
        };

        /**
         * Keeps one beacon in step with the AirPlay server's state file.
         *
         * slow_tick() observes the state file and decides; fast_tick() acts
         * on that decision through the driver. Both run on the poll loop
         * thread and never overlap.
         */
        class BeaconCoordinator
        {
        public:
            BeaconCoordinator(const BeaconConfig &config,
                              transports::ble::IBeaconDriver &driver,
                              const ProcessTable &processes,
                              OrphanReclaimer &reclaimer);

            void slow_tick(CoordinatorState &state);
            void fast_tick(CoordinatorState &state);

            // Stops a running beacon if stop_on_exit is configured.
            void shutdown(CoordinatorState &state);

        private:
            enum class RecordStatus
            {
                ABSENT,
                ORPHAN,
                VALID
            };

            RecordStatus inspect_state_file(StateRecord &record);
            void handle_orphan(const StateRecord &record);

            BeaconConfig config_;
            transports::ble::IBeaconDriver &driver_;
            const ProcessTable &processes_;
            OrphanReclaimer &reclaimer_;
            std::shared_ptr<Logger> logger_;
        };

        // Reads the whole file. False if it cannot be opened or read.
        bool read_state_file(const std::string &path, std::vector<uint8_t> &bytes);

    } // namespace core
} // namespace airbeacon

#endif // AIRBEACON_CORE_COORDINATOR_HPP
