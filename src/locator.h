#if !defined(_LACQ_LOCATOR_H_INCLUDED_)
#define _LACQ_LOCATOR_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    struct locate_request
    {
        std::string computer_name { };
        std::string user { };
        std::optional<std::string> password { };  // none or empty: no password
        stdfs::path mount_point { };
    };

    // "John's MacBook Air" -> "Johns-MacBook-Air.local"
    std::string mdns_host_name(std::string_view computer_name);

    share_address make_share_address(const std::string& computer_name, const std::string& user, const std::optional<std::string>& password);


    //
    // Assisted mode: finds the shared disk of the target computer and mounts it read-only
    //
    class target_locator
    {
    public:
        LACQ_DISABLE_COPY_CONSTRUCTOR(target_locator)
        LACQ_DISABLE_MOVE_CONSTRUCTOR(target_locator)

        explicit target_locator(host_tools& tools) noexcept
            : _tools(tools)
        { }

        // Returns the mount point, now holding the read-only share. Throws locator_error.
        stdfs::path locate(const locate_request& request);

    private:
        std::string find_disk_share(const share_address& address);  // throws locator_error

    private:
        host_tools& _tools;
    };

}  // namespace lacq

#endif  // !defined(_LACQ_LOCATOR_H_INCLUDED_)
