#if !defined(_LACQ_INPUT_PROVIDER_H_INCLUDED_)
#define _LACQ_INPUT_PROVIDER_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    //
    // Source of the answers the operator gives while a run is suspended.
    // Every call blocks until an answer is available.
    //
    struct input_provider
    {
    public:
        virtual ~input_provider() = default;

        // Yes/no question
        virtual bool confirm(const std::string& question) = 0;

        virtual std::string ask(const std::string& prompt) = 0;

        // Like ask(), without echoing the answer
        virtual std::string ask_secret(const std::string& prompt) = 0;
    };


    struct terminal_input_provider : input_provider
    {
    public:
        LACQ_DISABLE_COPY_CONSTRUCTOR(terminal_input_provider)
        LACQ_DISABLE_MOVE_CONSTRUCTOR(terminal_input_provider)

        terminal_input_provider(std::istream& in, std::ostream& out)
            : _in(in),
              _out(out)
        { }

        bool confirm(const std::string& question) override;
        std::string ask(const std::string& prompt) override;
        std::string ask_secret(const std::string& prompt) override;

    private:
        std::string read_line();  // throws configuration_error at end of input

    private:
        std::istream& _in;
        std::ostream& _out;
    };


    //
    // Never asks anything: used when all input must come from the configuration
    //
    struct batch_input_provider : input_provider
    {
    public:
        bool confirm(const std::string& question) override;
        std::string ask(const std::string& prompt) override;
        std::string ask_secret(const std::string& prompt) override;
    };

}  // namespace lacq

#endif  // !defined(_LACQ_INPUT_PROVIDER_H_INCLUDED_)
