#ifndef AIRBEACON_CORE_ORPHAN_RECLAIMER_HPP
#define AIRBEACON_CORE_ORPHAN_RECLAIMER_HPP

#include <string>
#include <memory>
#include <functional>
#include <filesystem>
#include <system_error>

namespace airbeacon
{
    namespace core
    {
        class Logger;

        enum class ReclaimResult
        {
            DELETED,
            ALREADY_GONE,
            PERMISSION_DENIED,
            FAILED
        };

        const char *reclaim_result_to_string(ReclaimResult result);

        /**
         * Removes state files left behind by servers that are no longer running.
         * No outcome is fatal; the caller treats the record as invalid either way.
         */
        class OrphanReclaimer
        {
        public:
            // Returns true if the file was removed, false if it did not exist;
            // reports anything else through ec. Same contract as
            // std::filesystem::remove(path, ec).
            using RemoveFunction = std::function<bool(const std::filesystem::path &, std::error_code &)>;

            OrphanReclaimer();
            explicit OrphanReclaimer(RemoveFunction remove);

            ReclaimResult reclaim(const std::filesystem::path &path);

        private:
            RemoveFunction remove_;
            std::shared_ptr<Logger> logger_;
        };

    } // namespace core
} // namespace airbeacon

#endif // AIRBEACON_CORE_ORPHAN_RECLAIMER_HPP
