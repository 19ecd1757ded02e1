#if !defined(_LACQ_ARTIFACTS_H_INCLUDED_)
#define _LACQ_ARTIFACTS_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    struct artifact_extensions
    {
#if PLATFORM_MACOS
        static constexpr const char CONTAINER[] = ".sparseimage";
#elif PLATFORM_LINUX
        static constexpr const char CONTAINER[] = ".img";
#else
#   error "Unknown platform"
#endif
        static constexpr const char TRANSCRIPT[] = ".out";
        static constexpr const char TRANSFER_LOG[] = ".log";
        static constexpr const char ERROR_LOG[] = ".err";
        static constexpr const char SUMMARY[] = ".json";
    };

    //
    // Paths of everything a run leaves in the destination folder,
    // all derived from the destination and the container name
    //
    struct run_artifacts
    {
    public:
        run_artifacts(const stdfs::path& destination, const std::string& container_name);

        // In archival order
        std::vector<stdfs::path> all() const;

    public:
        stdfs::path destination;
        std::string container_name;

        stdfs::path container_file;
        stdfs::path transcript;
        stdfs::path transfer_log;
        stdfs::path error_log;
        stdfs::path summary;
    };

}  // namespace lacq

#endif  // !defined(_LACQ_ARTIFACTS_H_INCLUDED_)
