#include "common.h"


void lacq::container_handle::dispose_impl() noexcept /*override*/
{
    LOG_INFO("Detaching {} ...", volume.mount_path.string());
    try {
        _tools.detach_container(volume);
        _detach_succeeded = true;
        LOG_INFO("Detach of {} completed", volume.mount_path.string());
    }
    catch (const tool_error& ex) {
        _detach_error = ex.what();
        LOG_ERROR("Detach of {} failed: {}. Output: {}", volume.mount_path.string(), ex.what(), ex.output);
    }
    catch (const std::exception& ex) {
        _detach_error = ex.what();
        LOG_ERROR("Detach of {} failed: {}", volume.mount_path.string(), ex.what());
    }
}
