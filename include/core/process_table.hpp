#ifndef AIRBEACON_CORE_PROCESS_TABLE_HPP
#define AIRBEACON_CORE_PROCESS_TABLE_HPP

#include <string>
#include <optional>
#include <cstdint>

namespace airbeacon
{
    namespace core
    {

        /**
         * Liveness checks against the OS process table
         */
        class ProcessTable
        {
        public:
            virtual ~ProcessTable() = default;

            virtual bool is_alive(uint32_t pid) const = 0;

            // Name of the running process, or nullopt if it is gone.
            virtual std::optional<std::string> process_name(uint32_t pid) const = 0;

            // True iff the live process's name starts with expected_name.
            // Prefix, not equality: executables may carry platform suffixes.
            bool name_matches(uint32_t pid, const std::string &expected_name) const;
        };

        /**
         * /proc backed process table
         */
        class LinuxProcessTable : public ProcessTable
        {
        public:
            explicit LinuxProcessTable(std::string proc_root = "/proc");

            bool is_alive(uint32_t pid) const override;
            std::optional<std::string> process_name(uint32_t pid) const override;

        private:
            std::string proc_root_;
        };

    } // namespace core
} // namespace airbeacon

#endif // AIRBEACON_CORE_PROCESS_TABLE_HPP
