#include "common.h"


std::string lacq::backup_manager::current_timestamp()
{
    const std::time_t now = std::time(nullptr);
    struct tm local { };
    if (localtime_r(&now, &local) == nullptr) {
        THROW_SYSTEM_ERROR(errno, localtime_r);
    }

    char buffer[32];
    const size_t len = std::strftime(buffer, sizeof(buffer), "%Y%m%d%H%M%S", &local);
    ASSERT(len == 14);
    return std::string(buffer, len);
}

lacq::backup_report lacq::backup_manager::archive(const run_artifacts& artifacts)
{
    return archive(artifacts, current_timestamp());
}

lacq::backup_report lacq::backup_manager::archive(const run_artifacts& artifacts, const std::string& timestamp)
{
    std::error_code ec;
    stdfs::create_directories(artifacts.destination, ec);
    if (ec) {
        LOG_ERROR("Can't create destination folder {}: {}", artifacts.destination.string(), ec.message());
        throw configuration_error("Can't create destination folder " + artifacts.destination.string() + ": " + ec.message());
    }

    backup_report report;
    report.timestamp = timestamp;
    report.folder = artifacts.destination / timestamp;

    bool folder_ready = false;
    for (const stdfs::path& file : artifacts.all()) {
        if (!stdfs::is_regular_file(file, ec)) {
            continue;
        }

        // The folder is only created when there is something to put in it
        if (!folder_ready) {
            report.folder_created = stdfs::create_directory(report.folder, ec);
            if (ec) {
                LOG_WARN("Can't create backup folder {}: {}", report.folder.string(), ec.message());
            }
            else {
                LOG_DEBUG("Backup folder {} {}", report.folder.string(), report.folder_created ? "created" : "already exists");
            }
            folder_ready = true;
        }

        const stdfs::path archived = report.folder / (timestamp + "." + file.filename().string());
        if (stdfs::exists(archived, ec)) {
            // rename() would replace it
            LOG_WARN("Can't back up {}: {} already exists", file.string(), archived.string());
            report.failed.push_back(file);
            continue;
        }

        stdfs::rename(file, archived, ec);
        if (ec) {
            LOG_WARN("Can't back up {} to {}: {}", file.string(), archived.string(), ec.message());
            report.failed.push_back(file);
            continue;
        }

        LOG_DEBUG("Moved {} to {}", file.string(), archived.string());
        report.moved.emplace_back(file, archived);
    }

    return report;
}
