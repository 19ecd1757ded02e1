#include "common.h"


namespace
{
    bool is_authentication_failure(const std::string& output)
    {
        static constexpr const char* MARKERS[] = {
            "Authentication error",
            "authentication error",
            "Authentication failed",
            "NT_STATUS_LOGON_FAILURE",
            "NT_STATUS_ACCESS_DENIED",
            "NT_STATUS_WRONG_PASSWORD",
            "Permission denied",
        };
        return std::any_of(std::begin(MARKERS), std::end(MARKERS), [&](const char* marker) {
            return output.find(marker) != std::string::npos;
        });
    }
}  // namespace


std::string lacq::mdns_host_name(const std::string_view computer_name)
{
    std::string host;
    for (const char ch : computer_name) {
        const auto byte = static_cast<unsigned char>(ch);
        if (std::isalnum(byte)) {
            host += ch;
        }
        else if ((ch == ' ' || ch == '-' || ch == '_') && !host.empty() && host.back() != '-') {
            host += '-';
        }
    }
    while (!host.empty() && host.back() == '-') {
        host.pop_back();
    }
    return host + ".local";
}

lacq::share_address lacq::make_share_address(
    const std::string& computer_name,
    const std::string& user,
    const std::optional<std::string>& password)
{
    share_address address;
    address.computer_name = computer_name;
    address.service_name = percent_encode(computer_name);
    address.host_name = mdns_host_name(computer_name);
    address.user = user;
    address.password = password;
    return address;
}

std::string lacq::target_locator::find_disk_share(const share_address& address)
{
    LOG_INFO("Attempting to list resources on {} (password of target might be required) ...", address.to_url(false));

    std::string listing;
    try {
        listing = _tools.list_shares(address);
    }
    catch (const tool_error& ex) {
        LOG_ERROR("{}: {}", ex.what(), ex.output);
        if (is_authentication_failure(ex.output)) {
            throw locator_error(locator_failure::AUTHENTICATION,
                                "Authentication to " + address.computer_name + " failed as user " + address.user);
        }
        throw locator_error(locator_failure::UNREACHABLE,
                            "Can't list the shared resources of " + address.computer_name + " (exit code " + std::to_string(ex.exit_code) + ")");
    }
    catch (const std::system_error& ex) {
        LOG_ERROR("Can't run share discovery: {}", ex.what());
        throw locator_error(locator_failure::UNREACHABLE, std::string("Can't run share discovery: ") + ex.what());
    }
    LOG_DEBUG("Shared resources:\n{}", listing);

    const std::vector<std::string> shares = parse_disk_shares(listing);
    if (shares.empty()) {
        throw locator_error(locator_failure::NO_SHARE, "No shared disk found on " + address.computer_name);
    }
    if (shares.size() > 1) {
        std::string names;
        for (const std::string& share : shares) {
            if (!names.empty()) names += ", ";
            names += "'" + share + "'";
        }
        throw locator_error(locator_failure::AMBIGUOUS_SHARE,
                            "More than one shared disk found on " + address.computer_name + ": " + names);
    }
    return shares.front();
}

stdfs::path lacq::target_locator::locate(const locate_request& request)
{
    ASSERT(!request.computer_name.empty());
    ASSERT(!request.mount_point.empty());

    const share_address address = make_share_address(request.computer_name, request.user, request.password);
    const std::string share = find_disk_share(address);

    LOG_INFO("Found shared disk {}. Creating mount point at {} ...", share, request.mount_point.string());
    std::error_code ec;
    stdfs::create_directories(request.mount_point, ec);
    if (ec) {
        throw locator_error(locator_failure::MOUNT_FAILED,
                            "Can't create mount point " + request.mount_point.string() + ": " + ec.message());
    }

    LOG_INFO("Mounting {}/{} read-only at {} ...", address.to_url(false), percent_encode(share), request.mount_point.string());
    try {
        _tools.mount_share_readonly(address, share, request.mount_point);
    }
    catch (const tool_error& ex) {
        LOG_ERROR("{}: {}", ex.what(), ex.output);
        throw locator_error(locator_failure::MOUNT_FAILED,
                            "Can't mount " + share + " at " + request.mount_point.string() + " (exit code " + std::to_string(ex.exit_code) + ")");
    }
    catch (const std::system_error& ex) {
        throw locator_error(locator_failure::MOUNT_FAILED, std::string("Can't run mount: ") + ex.what());
    }

    LOG_INFO("Target mounted at {}", request.mount_point.string());
    return request.mount_point;
}
