#include "common.h"


std::string lacq::format_local_time(const std::chrono::system_clock::time_point time)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(time);
    struct tm local { };
    if (localtime_r(&t, &local) == nullptr) {
        return std::to_string(static_cast<int64_t>(t));
    }

    char buffer[64];
    const size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S %z", &local);
    return std::string(buffer, len);
}

std::string lacq::format_size(const uint64_t bytes)
{
    static constexpr const char* UNITS[] = { "B", "KiB", "MiB", "GiB", "TiB", "PiB" };

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(UNITS)) {
        value /= 1024.0;
        ++unit;
    }

    if (unit == 0) {
        return fmt::format("{} B", bytes);
    }
    return fmt::format("{:.1f} {}", value, UNITS[unit]);
}

void lacq::print_summary(const run_summary& summary)
{
    LOG_INFO("Summary");
    LOG_INFO("-------");
    LOG_INFO("Start time:  {}", summary.start_time);
    LOG_INFO("End time:    {}", summary.end_time);
    LOG_INFO("Destination: {}", summary.destination);
    LOG_INFO("Image Name:  {}", summary.image_name);
    if (summary.md5.has_value()) {
        LOG_INFO("MD5:         {}", summary.md5.value());
    }
    if (summary.sha1.has_value()) {
        LOG_INFO("SHA1:        {}", summary.sha1.value());
    }
    if (summary.transfer_exit_code.has_value()) {
        LOG_INFO("Transfer:    {} exited with code {} ({} logged items, {} logged errors)",
                 summary.strategy, summary.transfer_exit_code.value(),
                 summary.transfer_log_entries, summary.error_log_entries);
    }
    for (const std::string& error : summary.errors) {
        LOG_WARN("Error:       {}", error);
    }

    if (summary.abort_reason.has_value()) {
        LOG_ERROR("Process has been terminated with errors: {}", summary.abort_reason.value());
        LOG_ERROR("Check manually if target has been mounted anyway and, if so, unmount it.");
        return;
    }

    LOG_INFO("Process has completed. Output created in {}", summary.destination);
    LOG_INFO("Please check the following log files about the copy:");
    LOG_INFO("FILES : {}", summary.transfer_log);
    LOG_INFO("ERRORS: {}", summary.error_log);
}

bool lacq::write_summary_file(const run_summary& summary, const stdfs::path& file)
{
    try {
        std::ofstream os(file, std::ios::out | std::ios::trunc);
        if (!os) {
            LOG_ERROR("Can't open {} for write", file.string());
            return false;
        }

        // The archive completes the JSON document when destroyed
        {
            cereal::JSONOutputArchive archive(os);
            archive(cereal::make_nvp("summary", summary));
        }
        os << std::endl;
    }
    catch (const std::exception& ex) {
        LOG_ERROR("Can't write summary {}: {}", file.string(), ex.what());
        return false;
    }

    LOG_DEBUG("Summary written to {}", file.string());
    return true;
}
