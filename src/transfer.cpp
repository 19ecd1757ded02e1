#include "common.h"

namespace lacq
{
    std::string with_trailing_separator(const stdfs::path& path)
    {
        std::string result = path.string();
        while (result.size() > 1 && result.back() == '/') {
            result.pop_back();
        }
        if (result.empty() || result.back() != '/') {
            result += '/';
        }
        return result;
    }

    std::vector<std::string> build_transfer_command(
        const transfer_strategy strategy,
        const stdfs::path& source,
        const stdfs::path& destination,
        const stdfs::path& log_file)
    {
        const std::string src = with_trailing_separator(source);
        const std::string dst = with_trailing_separator(destination);

        switch (strategy) {
            case transfer_strategy::COPY:
                // -P: don't follow symlinks, -R: recursive, -p: preserve attributes,
                // -v: one line per item, -i: never overwrite (stdin is the null device)
                return { "cp", "-PRpvi", src + ".", dst };

            case transfer_strategy::MIRROR:
                // -a: archive, -r: recursive, -t: times, -X: extended attributes
                return { "rsync", "-artvqX", "--log-file=" + log_file.string(), src, dst };
        }

        ASSERT(false, "Unknown transfer strategy {}", static_cast<int>(strategy));
        return { };
    }

    uint64_t count_log_entries(const stdfs::path& file, const uint64_t offset)
    {
        std::ifstream in(file);
        if (!in) {
            return 0;
        }
        if (offset > 0 && !in.seekg(static_cast<std::streamoff>(offset))) {
            return 0;
        }

        uint64_t count = 0;
        std::string line;
        while (std::getline(in, line)) {
            if (line.find_first_not_of(" \t\r") != std::string::npos) {
                ++count;
            }
        }
        return count;
    }

    uint64_t transfer_engine::size_of(const stdfs::path& file) noexcept
    {
        std::error_code ec;
        const uintmax_t size = stdfs::file_size(file, ec);
        return ec ? 0 : static_cast<uint64_t>(size);
    }

    transfer_result transfer_engine::transfer(
        const transfer_strategy strategy,
        const stdfs::path& target,
        const container_handle& container,
        const run_artifacts& artifacts)
    {
        ASSERT(container.is_attached());

        transfer_result result;
        result.strategy = strategy;

        const std::vector<std::string> argv = build_transfer_command(
            strategy, target, container.volume.mount_path, artifacts.transfer_log);
        LOG_INFO("Acquiring data from {} to {} with {} ...",
                 with_trailing_separator(target), with_trailing_separator(container.volume.mount_path), to_string(strategy));
        LOG_DEBUG("Transfer command: {}", infra::format_command_line(argv));

        // The logs are appended to: a log the backup could not move still holds a previous run
        const uint64_t transfer_log_start = size_of(artifacts.transfer_log);
        const uint64_t error_log_start = size_of(artifacts.error_log);
        if (transfer_log_start > 0 || error_log_start > 0) {
            LOG_WARN("Logs of a previous run are still in {}: only new entries are counted", artifacts.destination.string());
        }

        try {
            result.exit_code = _tools.run_transfer(argv, artifacts.transfer_log, artifacts.error_log);
        }
        catch (const std::exception& ex) {
            LOG_ERROR("Can't run {}: {}", argv.front(), ex.what());

            std::ofstream err(artifacts.error_log, std::ios::app);
            err << "Can't run " << infra::format_command_line(argv) << ": " << ex.what() << std::endl;
        }

        result.logged_items = count_log_entries(artifacts.transfer_log, transfer_log_start);
        result.logged_errors = count_log_entries(artifacts.error_log, error_log_start);

        if (result.succeeded()) {
            LOG_INFO("Data from {} copied to {} with {} completed successfully",
                     target.string(), container.volume.mount_path.string(), to_string(strategy));
        }
        else {
            LOG_WARN("Data from {} copied to {} with {} has terminated with error code {}",
                     target.string(), container.volume.mount_path.string(), to_string(strategy), result.exit_code);
            LOG_WARN("It is expected to encounter errors while copying some files. Please check '{}'",
                     artifacts.error_log.string());
        }
        LOG_INFO("Transfer log entries: {}, error log entries: {}", result.logged_items, result.logged_errors);

        return result;
    }

}  // namespace lacq
