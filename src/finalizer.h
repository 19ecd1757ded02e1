#if !defined(_LACQ_FINALIZER_H_INCLUDED_)
#define _LACQ_FINALIZER_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    struct finalize_result
    {
        bool detached = false;
        std::optional<std::string> md5 { };
        std::optional<std::string> sha1 { };
        std::vector<std::string> errors { };  // detach and digest failures
    };


    enum class digest_algorithm
    {
        MD5,
        SHA1,
    };

    const char* to_string(digest_algorithm algorithm) noexcept;


    class finalizer
    {
    public:
        LACQ_DISABLE_COPY_CONSTRUCTOR(finalizer)
        LACQ_DISABLE_MOVE_CONSTRUCTOR(finalizer)

        explicit finalizer(host_tools& tools) noexcept
            : _tools(tools)
        { }

        //
        // Detach the container, then digest the closed image file if asked to.
        // Failures are collected in the result. Throws interrupted_error only.
        //
        finalize_result finalize(container_handle& container, bool calculate_hash);

    private:
        std::optional<std::string> digest(digest_algorithm algorithm, const stdfs::path& file, finalize_result& result);

    private:
        host_tools& _tools;
    };

}  // namespace lacq

#endif  // !defined(_LACQ_FINALIZER_H_INCLUDED_)
