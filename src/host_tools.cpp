#include "common.h"


//==============================================================================
// struct share_address
//==============================================================================

std::string lacq::percent_encode(const std::string_view text)
{
    static constexpr const char HEX[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(text.size());
    for (const char ch : text) {
        const auto byte = static_cast<unsigned char>(ch);
        if (std::isalnum(byte) || ch == '-' || ch == '.' || ch == '_' || ch == '~') {
            result += ch;
        }
        else {
            result += '%';
            result += HEX[byte >> 4];
            result += HEX[byte & 0x0F];
        }
    }
    return result;
}

std::string lacq::share_address::to_url(const bool with_password) const
{
    std::string url = "//";
    url += percent_encode(user);
    if (with_password && has_password()) {
        url += ':';
        url += percent_encode(password.value());
    }
    url += '@';
    url += service_name;
    url += "._smb._tcp.local";
    return url;
}



//==============================================================================
// struct native_host_tools
//==============================================================================

infra::subprocess_result lacq::native_host_tools::run_checked(
    const std::vector<std::string>& argv,
    const infra::subprocess_options& options)
{
    infra::subprocess_result result = infra::run_subprocess(argv, options);
    if (!result.succeeded()) {
        const std::string command_line = infra::format_command_line(argv, options.secrets);
        LOG_DEBUG("'{}' exited with code {}: {}", command_line, result.exit_code, result.error_output);
        throw tool_error(command_line, result.exit_code, result.output + result.error_output);
    }
    return result;
}

std::string lacq::native_host_tools::digest_of(const std::vector<std::string>& argv, const size_t hex_length)
{
    const infra::subprocess_result result = run_checked(argv);
    std::optional<std::string> digest = parse_digest(result.output, hex_length);
    if (!digest.has_value()) {
        throw tool_error(infra::format_command_line(argv), result.exit_code, "Unrecognized digest output: " + result.output);
    }
    return std::move(digest.value());
}

lacq::filesystem_capacity lacq::native_host_tools::query_capacity(const stdfs::path& path)
{
    struct statvfs st { };
    if (statvfs(path.c_str(), &st) != 0) {
        LOG_ERROR("statvfs() {} failed. errno = {} ({})", path.string(), errno, strerror(errno));
        THROW_SYSTEM_ERROR(errno, statvfs);
    }

    const uint64_t unit = (st.f_frsize != 0) ? st.f_frsize : st.f_bsize;
    filesystem_capacity capacity;
    capacity.total_bytes = static_cast<uint64_t>(st.f_blocks) * unit;
    capacity.used_bytes = static_cast<uint64_t>(st.f_blocks - st.f_bfree) * unit;
    capacity.available_bytes = static_cast<uint64_t>(st.f_bavail) * unit;
    return capacity;
}

int lacq::native_host_tools::run_transfer(
    const std::vector<std::string>& argv,
    const stdfs::path& log_file,
    const stdfs::path& error_file)
{
    infra::subprocess_options options;
    options.stdout_file = log_file;
    options.stderr_file = error_file;
    options.truncate_files = false;
    return infra::run_subprocess(argv, options).exit_code;
}


#if PLATFORM_MACOS

std::string lacq::native_host_tools::list_shares(const share_address& address)
{
    infra::subprocess_options options;
    if (address.has_password()) {
        options.secrets = { address.password.value(), percent_encode(address.password.value()) };
    }

    const infra::subprocess_result result = run_checked({ "smbutil", "view", address.to_url(true) }, options);
    return result.output;
}

void lacq::native_host_tools::mount_share_readonly(
    const share_address& address,
    const std::string& share,
    const stdfs::path& mount_point)
{
    infra::subprocess_options options;
    if (address.has_password()) {
        options.secrets = { address.password.value(), percent_encode(address.password.value()) };
    }

    run_checked({ "mount_smbfs", "-o", "ro", address.to_url(true) + "/" + percent_encode(share), mount_point.string() }, options);
}

lacq::attached_volume lacq::native_host_tools::create_and_attach_container(const container_request& request)
{
    const infra::subprocess_result result = run_checked({
        "hdiutil", "create",
        "-size", std::to_string(request.size_kib) + "k",
        "-volname", request.volume_name,
        "-fs", "APFS",
        "-layout", "GPTSPUD",
        "-type", "SPARSE",
        "-attach",
        request.image_file.string(),
    });
    LOG_INFO("hdiutil output:\n{}", result.output);

    // The volume is mounted under the requested name unless a volume with that name is already mounted
    const std::vector<attached_volume> volumes = parse_hdiutil_volumes(result.output);
    if (volumes.size() != 1) {
        throw provisioning_error(fmt::format(
            "Expected one attached volume in hdiutil output, found {}. "
            "The image {} may be attached: check with 'hdiutil info'",
            volumes.size(), request.image_file.string()));
    }
    return volumes.front();
}

void lacq::native_host_tools::detach_container(const attached_volume& volume)
{
    const infra::subprocess_result result = run_checked({ "hdiutil", "detach", "-force", volume.mount_path.string() });
    LOG_INFO("hdiutil output:\n{}", result.output);
}

std::string lacq::native_host_tools::md5_digest(const stdfs::path& file)
{
    return digest_of({ "md5", "-q", file.string() }, 32);
}

std::string lacq::native_host_tools::sha1_digest(const stdfs::path& file)
{
    return digest_of({ "openssl", "sha1", "-r", file.string() }, 40);
}

#elif PLATFORM_LINUX

namespace
{
    constexpr const size_t EXT4_LABEL_MAX = 16;

    infra::subprocess_options password_options(const lacq::share_address& address)
    {
        // smbclient and mount.cifs both read the password from $PASSWD
        infra::subprocess_options options;
        options.environment.emplace_back("PASSWD", address.has_password() ? address.password.value() : std::string());
        if (address.has_password()) {
            options.secrets = { address.password.value() };
        }
        return options;
    }
}  // namespace

std::string lacq::native_host_tools::list_shares(const share_address& address)
{
    std::vector<std::string> argv = { "smbclient", "-L", "//" + address.host_name, "-U", address.user };
    if (!address.has_password()) {
        argv.emplace_back("-N");
    }

    const infra::subprocess_result result = run_checked(argv, password_options(address));
    return result.output;
}

void lacq::native_host_tools::mount_share_readonly(
    const share_address& address,
    const std::string& share,
    const stdfs::path& mount_point)
{
    run_checked(
        { "mount", "-t", "cifs", "-o", "ro,username=" + address.user,
          "//" + address.host_name + "/" + share, mount_point.string() },
        password_options(address));
}

lacq::attached_volume lacq::native_host_tools::create_and_attach_container(const container_request& request)
{
    run_checked({ "truncate", "-s", std::to_string(request.size_kib) + "K", request.image_file.string() });

    run_checked({
        "mkfs.ext4", "-q", "-F",
        "-L", request.volume_name.substr(0, EXT4_LABEL_MAX),
        "-E", fmt::format("root_owner={}:{}", getuid(), getgid()),
        request.image_file.string(),
    });

    const infra::subprocess_result loop = run_checked({
        "udisksctl", "loop-setup", "--no-user-interaction", "-f", request.image_file.string() });
    LOG_INFO("udisksctl output: {}", loop.output);

    const std::vector<std::string> devices = parse_udisks_loop_devices(loop.output);
    if (devices.size() != 1) {
        throw provisioning_error(fmt::format(
            "Expected one loop device in udisksctl output, found {}. "
            "The image {} may be attached: check with 'losetup -a'",
            devices.size(), request.image_file.string()));
    }
    const std::string& device = devices.front();

    infra::sweeper loop_cleanup = [&]() {
        const infra::subprocess_result res = infra::run_subprocess({
            "udisksctl", "loop-delete", "--no-user-interaction", "-b", device });
        if (!res.succeeded()) {
            LOG_ERROR("Can't delete loop device {}: {}", device, res.error_output);
        }
    };

    const infra::subprocess_result mounted = run_checked({
        "udisksctl", "mount", "--no-user-interaction", "-b", device });
    LOG_INFO("udisksctl output: {}", mounted.output);

    const std::vector<attached_volume> volumes = parse_udisks_mounts(mounted.output);
    if (volumes.size() != 1) {
        throw provisioning_error(fmt::format(
            "Expected one mounted volume in udisksctl output, found {}. "
            "Device {} may be mounted: check with 'findmnt {}'",
            volumes.size(), device, device));
    }

    loop_cleanup.suppress_sweep();
    return volumes.front();
}

void lacq::native_host_tools::detach_container(const attached_volume& volume)
{
    if (volume.device.empty()) {
        run_checked({ "umount", volume.mount_path.string() });
        return;
    }

    run_checked({ "udisksctl", "unmount", "--no-user-interaction", "-b", volume.device });
    run_checked({ "udisksctl", "loop-delete", "--no-user-interaction", "-b", volume.device });
}

std::string lacq::native_host_tools::md5_digest(const stdfs::path& file)
{
    return digest_of({ "md5sum", file.string() }, 32);
}

std::string lacq::native_host_tools::sha1_digest(const stdfs::path& file)
{
    return digest_of({ "sha1sum", file.string() }, 40);
}

#else
#   error "Unknown platform"
#endif
