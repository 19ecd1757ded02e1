#if !defined(_LACQ_SUMMARY_H_INCLUDED_)
#define _LACQ_SUMMARY_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    struct run_summary
    {
        std::string start_time { };
        std::string end_time { };
        std::string final_state { };
        int exit_code = 1;

        std::string target { };
        std::string destination { };
        std::string image_name { };
        std::optional<std::string> mount_path { };
        std::optional<uint64_t> container_size_kib { };
        std::string strategy { };

        std::optional<int> transfer_exit_code { };
        uint64_t transfer_log_entries = 0;
        uint64_t error_log_entries = 0;
        bool detached = false;
        std::optional<std::string> md5 { };
        std::optional<std::string> sha1 { };

        std::string transcript { };
        std::string transfer_log { };
        std::string error_log { };
        std::optional<std::string> backup_folder { };

        std::optional<std::string> abort_reason { };
        std::vector<std::string> errors { };  // non-fatal

        LACQ_DEFAULT_SERIALIZATION(
            CEREAL_NVP(start_time), CEREAL_NVP(end_time), CEREAL_NVP(final_state), CEREAL_NVP(exit_code),
            CEREAL_NVP(target), CEREAL_NVP(destination), CEREAL_NVP(image_name), CEREAL_NVP(mount_path),
            CEREAL_NVP(container_size_kib), CEREAL_NVP(strategy),
            CEREAL_NVP(transfer_exit_code), CEREAL_NVP(transfer_log_entries), CEREAL_NVP(error_log_entries),
            CEREAL_NVP(detached), CEREAL_NVP(md5), CEREAL_NVP(sha1),
            CEREAL_NVP(transcript), CEREAL_NVP(transfer_log), CEREAL_NVP(error_log), CEREAL_NVP(backup_folder),
            CEREAL_NVP(abort_reason), CEREAL_NVP(errors))
    };

    // "2024-02-26 10:15:00 +0100"
    std::string format_local_time(std::chrono::system_clock::time_point time);

    // "465.6 GiB"
    std::string format_size(uint64_t bytes);

    // Human-readable block on the log (and so in the transcript)
    void print_summary(const run_summary& summary);

    // JSON. Returns false (and logs) on failure.
    bool write_summary_file(const run_summary& summary, const stdfs::path& file);

}  // namespace lacq

#endif  // !defined(_LACQ_SUMMARY_H_INCLUDED_)
