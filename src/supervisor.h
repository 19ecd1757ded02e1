#if !defined(_LACQ_SUPERVISOR_H_INCLUDED_)
#define _LACQ_SUPERVISOR_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    enum class run_state
    {
        INIT,
        BACKUP,
        LOCATE_TARGET,
        PROVISION,
        TRANSFER,
        FINALIZE,
        SUMMARY,   // terminal: success
        ABORTED,   // terminal: fatal error
    };

    const char* to_string(run_state state) noexcept;

    enum class detached_by
    {
        NONE,
        FINALIZER,
        CLEANUP,
    };

    struct run_outcome
    {
        int exit_code = 1;
        run_state final_state = run_state::INIT;
        std::vector<run_state> visited { };

        std::optional<error_category> error { };
        std::optional<locator_failure> failure { };
        bool cleanup_fired = false;
        detached_by detach = detached_by::NONE;

        backup_report backup { };
        std::optional<transfer_result> transfer { };
        std::optional<finalize_result> finalize { };
        run_summary summary { };
    };


    //
    // Runs one acquisition:
    //
    //  INIT -> BACKUP -> [LOCATE_TARGET] -> PROVISION -> TRANSFER -> FINALIZE -> SUMMARY
    //
    // From PROVISION to the end of FINALIZE a cleanup handler is armed: on any fatal
    // error (including an interrupt signal) it detaches the container if it is still
    // attached, and the run ends in ABORTED.
    //
    class run_supervisor
    {
    public:
        LACQ_DISABLE_COPY_CONSTRUCTOR(run_supervisor)
        LACQ_DISABLE_MOVE_CONSTRUCTOR(run_supervisor)

        run_supervisor(std::shared_ptr<const run_configuration> config, host_tools& tools, input_provider& input);

        // Never throws acquisition_error: fatal errors end up in the outcome
        run_outcome run();

    private:
        void enter(run_state state);
        void check_interrupted() const;  // throws interrupted_error

        void prepare();
        stdfs::path resolve_target();
        locate_request ask_locate_request();
        void print_acquisition_info(const stdfs::path& target);
        void acquire(const stdfs::path& target);

        void record_abort(std::optional<error_category> category, const std::string& reason);
        void complete_summary(const std::optional<std::string>& abort_reason);

    private:
        const std::shared_ptr<const run_configuration> _config;
        host_tools& _tools;
        input_provider& _input;
        const run_artifacts _artifacts;

        // Run context
        std::chrono::system_clock::time_point _start_time { };
        std::optional<stdfs::path> _target { };
        std::unique_ptr<container_handle> _container { nullptr };
        run_outcome _outcome { };
    };

}  // namespace lacq

#endif  // !defined(_LACQ_SUPERVISOR_H_INCLUDED_)
