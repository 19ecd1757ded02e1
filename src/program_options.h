#if !defined(_LACQ_PROGRAM_OPTIONS_H_INCLUDED_)
#define _LACQ_PROGRAM_OPTIONS_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    struct program_options_defaults
    {
        static constexpr const char PASSWORD_ENV[] = "LACQ_PASSWORD";
    };

    struct base_program_options
    {
    public:
        int arg_verbosity = 0;

    public:
        virtual ~base_program_options() = default;
        virtual void add_options(CLI::App& app);
        virtual bool post_process();
    };


    struct lacq_program_options : base_program_options
    {
    public:
        std::string arg_target { };
        std::string arg_destination { };
        bool arg_assisted = false;
        bool arg_calculate_hash = false;
        std::string arg_image_name { run_defaults::CONTAINER_NAME };
        std::optional<std::string> arg_name { };
        std::optional<std::string> arg_user { };
        std::optional<std::string> arg_password { };
        bool arg_no_password = false;
        std::optional<uint64_t> arg_size { };
        std::string arg_tool { to_string(run_defaults::STRATEGY) };
        bool arg_batch = false;

        std::shared_ptr<const run_configuration> config { nullptr };

    public:
        void add_options(CLI::App& app) override;
        bool post_process() override;
    };

}  // namespace lacq


#endif  // !defined(_LACQ_PROGRAM_OPTIONS_H_INCLUDED_)
