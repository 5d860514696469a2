#include "core/orphan_reclaimer.hpp"
#include "core/logger.hpp"

namespace airbeacon
{
    namespace core
    {

        const char *reclaim_result_to_string(ReclaimResult result)
        {
            switch (result)
            {
            case ReclaimResult::DELETED:
                return "deleted";
            case ReclaimResult::ALREADY_GONE:
                return "already_gone";
            case ReclaimResult::PERMISSION_DENIED:
                return "permission_denied";
            case ReclaimResult::FAILED:
                return "failed";
            }
            return "unknown";
        }

        OrphanReclaimer::OrphanReclaimer()
            : OrphanReclaimer([](const std::filesystem::path &path, std::error_code &ec)
                              { return std::filesystem::remove(path, ec); })
        {
        }

        OrphanReclaimer::OrphanReclaimer(RemoveFunction remove)
            : remove_(std::move(remove)), logger_(get_logger("OrphanReclaimer"))
        {
        }

        ReclaimResult OrphanReclaimer::reclaim(const std::filesystem::path &path)
        {
            std::error_code ec;
            bool removed = remove_(path, ec);

            if (!ec)
            {
                if (removed)
                {
                    logger_->info("Orphan beacon file deleted", LogContext().add("path", path.string()));
                    return ReclaimResult::DELETED;
                }
                logger_->info("Orphan beacon file already gone", LogContext().add("path", path.string()));
                return ReclaimResult::ALREADY_GONE;
            }

            if (ec == std::errc::no_such_file_or_directory)
            {
                logger_->info("Orphan beacon file already gone", LogContext().add("path", path.string()));
                return ReclaimResult::ALREADY_GONE;
            }

            if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
            {
                logger_->warning("Cannot delete orphan beacon file",
                                 LogContext().add("path", path.string()).add("error", ec.message()));
                return ReclaimResult::PERMISSION_DENIED;
            }

            logger_->error("Failed to delete orphan beacon file",
                           LogContext().add("path", path.string()).add("error", ec.message()));
            return ReclaimResult::FAILED;
        }

    } // namespace core
} // namespace airbeacon
