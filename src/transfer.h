#if !defined(_LACQ_TRANSFER_H_INCLUDED_)
#define _LACQ_TRANSFER_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)

namespace lacq
{
    struct transfer_result
    {
    public:
        transfer_strategy strategy { run_defaults::STRATEGY };
        int exit_code = -1;         // -1: the transfer command could not be started
        uint64_t logged_items = 0;  // non-empty lines this run added to the transfer log
        uint64_t logged_errors = 0; // non-empty lines this run added to the error log

    public:
        bool succeeded() const noexcept { return exit_code == 0; }
    };

    // "/Volumes/Share", "/Volumes/Share/" and "/Volumes/Share//" all give "/Volumes/Share/"
    std::string with_trailing_separator(const stdfs::path& path);

    std::vector<std::string> build_transfer_command(
        transfer_strategy strategy,
        const stdfs::path& source,
        const stdfs::path& destination,
        const stdfs::path& log_file);

    // Non-empty lines, starting at byte offset
    uint64_t count_log_entries(const stdfs::path& file, uint64_t offset = 0);


    //
    // Copies the contents of the target into the root of the attached container.
    // A failing copy is expected (unreadable or busy files) and never throws.
    //
    class transfer_engine
    {
    public:
        LACQ_DISABLE_COPY_CONSTRUCTOR(transfer_engine)
        LACQ_DISABLE_MOVE_CONSTRUCTOR(transfer_engine)

        explicit transfer_engine(host_tools& tools) noexcept
            : _tools(tools)
        { }

        transfer_result transfer(
            transfer_strategy strategy,
            const stdfs::path& target,
            const container_handle& container,
            const run_artifacts& artifacts);

    private:
        static uint64_t size_of(const stdfs::path& file) noexcept;

    private:
        host_tools& _tools;
    };

}  // namespace lacq

#endif  // !defined(_LACQ_TRANSFER_H_INCLUDED_)
