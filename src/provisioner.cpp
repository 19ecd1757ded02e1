#include "common.h"


uint64_t lacq::derive_container_size_kib(const filesystem_capacity& capacity) noexcept
{
    const uint64_t total_kib = (capacity.total_bytes + 1023) / 1024;

    uint64_t magnitude = 1;
    while (total_kib / magnitude >= 10) {
        magnitude *= 10;
    }
    const uint64_t leading_digit = total_kib / magnitude;
    const uint64_t derived = (leading_digit + 1) * magnitude;

    return std::max(derived, provisioning_defaults::MIN_CONTAINER_SIZE_KIB);
}

uint64_t lacq::requested_container_size_kib(const uint64_t size_bytes) noexcept
{
    return size_bytes / 1024 + ((size_bytes % 1024 != 0) ? 1 : 0);
}

uint64_t lacq::container_provisioner::compute_size_kib(const std::optional<uint64_t>& size_bytes, const stdfs::path& target)
{
    if (size_bytes.has_value()) {
        return requested_container_size_kib(size_bytes.value());
    }

    filesystem_capacity capacity;
    try {
        capacity = _tools.query_capacity(target);
    }
    catch (const std::system_error& ex) {
        throw provisioning_error("Can't get the capacity of " + target.string() + ": " + ex.what());
    }

    const uint64_t size_kib = derive_container_size_kib(capacity);
    LOG_DEBUG("Target total {} bytes, used {} bytes: container size {} KiB", capacity.total_bytes, capacity.used_bytes, size_kib);
    return size_kib;
}

void lacq::container_provisioner::provision(
    const run_artifacts& artifacts,
    const std::optional<uint64_t>& size_bytes,
    const stdfs::path& target,
    std::unique_ptr<container_handle>& container)
{
    ASSERT(!container);

    const uint64_t size_kib = compute_size_kib(size_bytes, target);
    LOG_INFO("Creating and attaching the sparse image of size {}k ...", size_kib);

    std::error_code ec;
    stdfs::create_directories(artifacts.destination, ec);
    if (ec) {
        throw provisioning_error("Can't create destination folder " + artifacts.destination.string() + ": " + ec.message());
    }
    if (stdfs::exists(artifacts.container_file, ec)) {
        throw provisioning_error("Image " + artifacts.container_file.string() + " already exists");
    }

    container_request request;
    request.image_file = artifacts.container_file;
    request.volume_name = artifacts.container_name;
    request.size_kib = size_kib;

    attached_volume volume;
    try {
        volume = _tools.create_and_attach_container(request);
    }
    catch (const tool_error& ex) {
        LOG_ERROR("{}: {}", ex.what(), ex.output);
        throw provisioning_error("Can't create and attach " + artifacts.container_file.string() + " (exit code " + std::to_string(ex.exit_code) + ")");
    }
    catch (const std::system_error& ex) {
        throw provisioning_error("Can't create and attach " + artifacts.container_file.string() + ": " + ex.what());
    }

    container = std::make_unique<container_handle>(_tools, artifacts.container_file, size_kib, std::move(volume));
    const stdfs::path& mount_path = container->volume.mount_path;
    if (mount_path.empty() || !stdfs::is_directory(mount_path, ec)) {
        throw provisioning_error("Attached image " + artifacts.container_file.string() + " has no usable mount path '" + mount_path.string() + "'");
    }
    if (mount_path.filename() != artifacts.container_name) {
        LOG_WARN("Volume attached as {} instead of {}: a volume with the same name is probably mounted",
                 mount_path.string(), artifacts.container_name);
    }

    LOG_INFO("Sparse image created at {}, attached at {}", artifacts.container_file.string(), mount_path.string());
}
