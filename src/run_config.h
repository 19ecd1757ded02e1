#if !defined(_LACQ_RUN_CONFIG_H_INCLUDED_)
#define _LACQ_RUN_CONFIG_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    enum class transfer_strategy
    {
        COPY,
        MIRROR,
    };

    const char* to_string(transfer_strategy strategy) noexcept;

    // Accepts "copy"/"mirror" and the tool names "cp"/"rsync"
    std::optional<transfer_strategy> parse_transfer_strategy(std::string_view name) noexcept;


    struct run_defaults
    {
        static constexpr const char CONTAINER_NAME[] = "ACQUISITION";
        static constexpr const transfer_strategy STRATEGY = transfer_strategy::COPY;
    };


    struct remote_credentials
    {
        std::optional<std::string> computer_name { };
        std::optional<std::string> user { };
        std::optional<std::string> password { };
        bool no_password = false;
    };


    //
    // Everything one acquisition attempt needs to know. Built once by
    // program options (or a test) and shared read-only afterwards.
    //
    struct run_configuration
    {
        stdfs::path target { };
        stdfs::path destination { };
        std::string container_name { run_defaults::CONTAINER_NAME };
        std::optional<uint64_t> container_size { };  // bytes
        transfer_strategy strategy { run_defaults::STRATEGY };
        bool calculate_hash = false;
        bool assisted = false;
        bool batch = false;
        remote_credentials remote { };
    };

    //
    // Check the fields that can't be validated while parsing.
    // Throws configuration_error.
    //
    void validate(const run_configuration& config);

}  // namespace lacq

#endif  // !defined(_LACQ_RUN_CONFIG_H_INCLUDED_)
