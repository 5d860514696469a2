#include "core/process_table.hpp"

#include <fstream>
#include <iterator>
#include <cerrno>
#include <csignal>
#include <sys/types.h>

namespace airbeacon
{
    namespace core
    {

        namespace
        {
            // TASK_COMM_LEN - 1
            constexpr size_t COMM_MAX_LENGTH = 15;

            std::string basename_of(const std::string &path)
            {
                size_t slash = path.find_last_of('/');
                return slash == std::string::npos ? path : path.substr(slash + 1);
            }
        } // namespace

        bool ProcessTable::name_matches(uint32_t pid, const std::string &expected_name) const
        {
            auto name = process_name(pid);
            if (!name)
            {
                return false;
            }
            return name->compare(0, expected_name.size(), expected_name) == 0;
        }

        LinuxProcessTable::LinuxProcessTable(std::string proc_root)
            : proc_root_(std::move(proc_root))
        {
        }

        bool LinuxProcessTable::is_alive(uint32_t pid) const
        {
            // kill(0, ...) and negative pids address process groups
            if (pid == 0 || pid > static_cast<uint32_t>(INT32_MAX))
            {
                return false;
            }

            if (kill(static_cast<pid_t>(pid), 0) == 0)
            {
                return true;
            }
            return errno == EPERM;
        }

        std::optional<std::string> LinuxProcessTable::process_name(uint32_t pid) const
        {
            if (!is_alive(pid))
            {
                return std::nullopt;
            }

            std::string base = proc_root_ + "/" + std::to_string(pid);

            std::ifstream comm_file(base + "/comm");
            std::string comm;
            if (!comm_file.is_open() || !std::getline(comm_file, comm))
            {
                return std::nullopt;
            }

            if (comm.size() < COMM_MAX_LENGTH)
            {
                return comm;
            }

            // The kernel truncated the name; argv[0] may carry the full one.
            std::ifstream cmdline_file(base + "/cmdline", std::ios::binary);
            if (cmdline_file.is_open())
            {
                std::string cmdline((std::istreambuf_iterator<char>(cmdline_file)),
                                    std::istreambuf_iterator<char>());
                std::string argv0 = cmdline.substr(0, cmdline.find('\0'));
                std::string full = basename_of(argv0);
                if (full.size() > comm.size() && full.compare(0, comm.size(), comm) == 0)
                {
                    return full;
                }
            }
            return comm;
        }

    } // namespace core
} // namespace airbeacon
