#include "core/coordinator.hpp"
#include "core/logger.hpp"
#include "core/process_table.hpp"
#include "core/orphan_reclaimer.hpp"
#include "transports/ble/beacon_driver.hpp"

#include <fstream>
#include <iterator>
#include <filesystem>
#include <system_error>

namespace airbeacon
{
    namespace core
    {

        bool read_state_file(const std::string &path, std::vector<uint8_t> &bytes)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                return false;
            }

            bytes.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
            return !file.bad();
        }

        BeaconCoordinator::BeaconCoordinator(const BeaconConfig &config,
                                             transports::ble::IBeaconDriver &driver,
                                             const ProcessTable &processes,
                                             OrphanReclaimer &reclaimer)
            : config_(config), driver_(driver), processes_(processes), reclaimer_(reclaimer),
              logger_(get_logger("BeaconCoordinator"))
        {
        }

        BeaconCoordinator::RecordStatus BeaconCoordinator::inspect_state_file(StateRecord &record)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(config_.state_path, ec))
            {
                return RecordStatus::ABSENT;
            }

            std::vector<uint8_t> bytes;
            if (!read_state_file(config_.state_path, bytes))
            {
                logger_->warning("Beacon file exists but cannot be read",
                                 LogContext().add("path", config_.state_path));
                return RecordStatus::ORPHAN;
            }

            DecodeError error = DecodeError::NONE;
            if (!StateRecordCodec::decode(bytes, record, &error))
            {
                logger_->warning("Malformed beacon file",
                                 LogContext().add("path", config_.state_path)
                                             .add("size", bytes.size())
                                             .add("error", decode_error_to_string(error)));
                return RecordStatus::ORPHAN;
            }

            if (!processes_.is_alive(record.owner_pid) ||
                !processes_.name_matches(record.owner_pid, record.owner_executable_name()))
            {
                logger_->info("Orphan beacon file exists, but process is no longer active",
                              LogContext().add("pid", record.owner_pid)
                                          .add("process", record.owner_executable_name()));
                return RecordStatus::ORPHAN;
            }

            return RecordStatus::VALID;
        }

        void BeaconCoordinator::handle_orphan(const StateRecord &record)
        {
            if (!config_.capabilities.can_delete_open_files)
            {
                logger_->debug("Leaving orphan beacon file in place",
                               LogContext().add("path", config_.state_path).add("pid", record.owner_pid));
                return;
            }

            // Every outcome is non-fatal; the record is invalid regardless.
            reclaimer_.reclaim(config_.state_path);
        }

        void BeaconCoordinator::slow_tick(CoordinatorState &state)
        {
            StateRecord record;
            RecordStatus status = inspect_state_file(record);

            switch (status)
            {
            case RecordStatus::ABSENT:
                state.pending_on = false;
                state.pending_off = state.running;
                break;

            case RecordStatus::ORPHAN:
                handle_orphan(record);
                state.pending_on = false;
                state.pending_off = state.running;
                break;

            case RecordStatus::VALID:
                if (!state.running)
                {
                    state.pending_on = true;
                    state.pending_off = false;
                    state.pending_port = record.port;
                }
                else
                {
                    state.pending_on = false;
                    state.pending_off = config_.capabilities.detects_port_change_while_running &&
                                        state.advertised_port != record.port;
                    if (state.pending_off)
                    {
                        logger_->info("AirPlay server moved to a new port, withdrawing old advertisement",
                                      LogContext().add("old_port", *state.advertised_port)
                                                  .add("new_port", record.port));
                    }
                }
                break;
            }

            if (state.pending_on || state.pending_off)
            {
                logger_->debug("Beacon transition pending",
                               LogContext().add("running", state.running)
                                           .add("pending_on", state.pending_on)
                                           .add("pending_off", state.pending_off));
            }
        }

        void BeaconCoordinator::fast_tick(CoordinatorState &state)
        {
            if (state.running && state.pending_off)
            {
                state.pending_off = false;
                driver_.stop();
                state.running = false;
                state.advertised_port.reset();
                logger_->info("AirPlay service-discovery beacon stopped",
                              LogContext().add("index", config_.index));
            }
            else if (!state.running && state.pending_on)
            {
                state.pending_on = false;

                if (!state.pending_port)
                {
                    logger_->warning("Beacon start requested without a port");
                }
                else if (driver_.start(config_.ipv4, *state.pending_port,
                                       config_.adv_min, config_.adv_max, config_.index))
                {
                    state.running = true;
                    state.advertised_port = state.pending_port;
                    logger_->info("AirPlay service-discovery beacon started",
                                  LogContext().add("ipv4", config_.ipv4)
                                              .add("port", *state.advertised_port)
                                              .add("index", config_.index));
                }
                else
                {
                    logger_->warning("Beacon driver failed to start, retrying after next state file check",
                                     LogContext().add("port", *state.pending_port));
                }
            }

            // RUNNING+pending_on and STOPPED+pending_off are no-ops
            if (state.running)
            {
                state.pending_on = false;
            }
            else
            {
                state.pending_off = false;
            }
        }

        void BeaconCoordinator::shutdown(CoordinatorState &state)
        {
            state.pending_on = false;
            state.pending_off = false;

            if (!state.running)
            {
                return;
            }

            if (!config_.stop_on_exit)
            {
                logger_->info("Leaving beacon advertisement active on exit");
                return;
            }

            driver_.stop();
            state.running = false;
            state.advertised_port.reset();
            logger_->info("AirPlay service-discovery beacon stopped on exit");
        }

    } // namespace core
} // namespace airbeacon
