#include "common.h"


const char* lacq::to_string(const digest_algorithm algorithm) noexcept
{
    switch (algorithm) {
        case digest_algorithm::MD5: return "MD5";
        case digest_algorithm::SHA1: return "SHA1";
    }
    return "unknown";
}

std::optional<std::string> lacq::finalizer::digest(const digest_algorithm algorithm, const stdfs::path& file, finalize_result& result)
{
    if (infra::sighandle::is_exit_required()) {
        throw interrupted_error(infra::sighandle::caught_signal());
    }

    LOG_INFO("Calculating {} of {} ...", to_string(algorithm), file.string());
    try {
        return (algorithm == digest_algorithm::MD5) ? _tools.md5_digest(file) : _tools.sha1_digest(file);
    }
    catch (const tool_error& ex) {
        LOG_ERROR("{} of {} failed: {}. Output: {}", to_string(algorithm), file.string(), ex.what(), ex.output);
        result.errors.push_back(std::string(to_string(algorithm)) + ": " + ex.what());
    }
    catch (const std::system_error& ex) {
        LOG_ERROR("{} of {} failed: {}", to_string(algorithm), file.string(), ex.what());
        result.errors.push_back(std::string(to_string(algorithm)) + ": " + ex.what());
    }
    return std::nullopt;
}

lacq::finalize_result lacq::finalizer::finalize(container_handle& container, const bool calculate_hash)
{
    finalize_result result;

    if (container.is_attached()) {
        container.dispose();
    }
    result.detached = container.detach_succeeded();
    if (!result.detached) {
        result.errors.push_back("Detach: " + container.detach_error());
        LOG_WARN("The volume {} may still be attached: detach it manually", container.volume.mount_path.string());
    }

    // Digests are only taken over the closed image
    if (calculate_hash) {
        result.md5 = digest(digest_algorithm::MD5, container.image_file, result);
        result.sha1 = digest(digest_algorithm::SHA1, container.image_file, result);
    }

    return result;
}
