#if !defined(_LACQ_BACKUP_H_INCLUDED_)
#define _LACQ_BACKUP_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    struct backup_report
    {
    public:
        std::string timestamp { };
        stdfs::path folder { };
        bool folder_created = false;
        std::vector<std::pair<stdfs::path, stdfs::path>> moved { };  // (from, to)
        std::vector<stdfs::path> failed { };

    public:
        bool nothing_to_archive() const noexcept { return moved.empty() && failed.empty(); }
    };


    //
    // Moves the artifacts of a previous run with the same name into
    // <destination>/<timestamp>/<timestamp>.<file name>, so that a new run
    // starts from a clean namespace. Nothing is ever deleted.
    //
    class backup_manager
    {
    public:
        // Local time, "YYYYMMDDHHMMSS"
        static std::string current_timestamp();

        // Creates the destination folder if needed; throws configuration_error if it can't.
        // Failing to move a single file is reported, not thrown.
        static backup_report archive(const run_artifacts& artifacts);
        static backup_report archive(const run_artifacts& artifacts, const std::string& timestamp);
    };

}  // namespace lacq

#endif  // !defined(_LACQ_BACKUP_H_INCLUDED_)
