#if !defined(_LACQ_INFRA_SUBPROCESS_H_INCLUDED_)
#define _LACQ_INFRA_SUBPROCESS_H_INCLUDED_

#if !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    struct subprocess_options
    {
        // When set, the stream is written to this file instead of being captured
        std::optional<stdfs::path> stdout_file { };
        std::optional<stdfs::path> stderr_file { };
        bool truncate_files = false;

        // Added to (or overriding) the environment of the child
        std::vector<std::pair<std::string, std::string>> environment { };

        // Replaced by "****" whenever the command line is printed
        std::vector<std::string> secrets { };
    };

    struct subprocess_result
    {
        // Exit status of the child, or 128 + signal number if it was killed by a signal.
        // 127 means the program could not be executed.
        int exit_code = -1;
        std::string output { };
        std::string error_output { };

        [[nodiscard]]
        bool succeeded() const noexcept { return exit_code == 0; }
    };

    std::string format_command_line(const std::vector<std::string>& argv, const std::vector<std::string>& secrets = { });

    //
    // Run a command to completion. Standard input of the child is the null device.
    //
    subprocess_result run_subprocess(const std::vector<std::string>& argv, const subprocess_options& options = { });  // throws std::system_error

    //
    // Deliver a signal to the child currently run by run_subprocess(), if any.
    // Async-signal-safe.
    //
    void signal_running_subprocess(int sig) noexcept;

}  // namespace infra


#endif  // !defined(_LACQ_INFRA_SUBPROCESS_H_INCLUDED_)
