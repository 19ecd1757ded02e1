#if !defined(_LACQ_ERRORS_H_INCLUDED_)
#define _LACQ_ERRORS_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    enum class error_category
    {
        CONFIGURATION,
        LOCATOR,
        PROVISIONING,
        INTERRUPTED,
    };

    const char* to_string(error_category category) noexcept;


    //
    // Fatal errors of an acquisition run. All of them terminate the run with exit code 1.
    //
    struct acquisition_error : std::exception
    {
    public:
        const error_category category;
        const std::string error_message;

    public:
        acquisition_error(const error_category category, std::string error_message) noexcept
            : category(category),
              error_message(std::move(error_message))
        { }

        const char* what() const noexcept override { return error_message.c_str(); }
    };

    struct configuration_error : acquisition_error
    {
        explicit configuration_error(std::string error_message) noexcept
            : acquisition_error(error_category::CONFIGURATION, std::move(error_message))
        { }
    };

    enum class locator_failure
    {
        UNREACHABLE,
        AUTHENTICATION,
        NO_SHARE,
        AMBIGUOUS_SHARE,
        MOUNT_FAILED,
    };

    const char* to_string(locator_failure failure) noexcept;

    struct locator_error : acquisition_error
    {
    public:
        const locator_failure failure;

    public:
        locator_error(const locator_failure failure, std::string error_message) noexcept
            : acquisition_error(error_category::LOCATOR, std::move(error_message)),
              failure(failure)
        { }
    };

    struct provisioning_error : acquisition_error
    {
        explicit provisioning_error(std::string error_message) noexcept
            : acquisition_error(error_category::PROVISIONING, std::move(error_message))
        { }
    };

    struct interrupted_error : acquisition_error
    {
    public:
        const int signal_number;

    public:
        explicit interrupted_error(const int signal_number) noexcept
            : acquisition_error(error_category::INTERRUPTED, "Interrupted by signal " + std::to_string(signal_number)),
              signal_number(signal_number)
        { }
    };


    //
    // An external command could not be run or exited with a non-zero code
    //
    struct tool_error : std::exception
    {
    public:
        const std::string command_line;  // secrets redacted
        const int exit_code;
        const std::string output;
        const std::string error_message;

    public:
        tool_error(std::string command_line, const int exit_code, std::string output) noexcept
            : command_line(std::move(command_line)),
              exit_code(exit_code),
              output(std::move(output)),
              error_message("Command '" + this->command_line + "' failed with code " + std::to_string(exit_code))
        { }

        const char* what() const noexcept override { return error_message.c_str(); }
    };

}  // namespace lacq

#endif  // !defined(_LACQ_ERRORS_H_INCLUDED_)
