#include "common.h"


const char* lacq::to_string(const error_category category) noexcept
{
    switch (category) {
        case error_category::CONFIGURATION: return "configuration error";
        case error_category::LOCATOR: return "target locator error";
        case error_category::PROVISIONING: return "provisioning error";
        case error_category::INTERRUPTED: return "interrupted";
    }
    return "unknown error";
}

const char* lacq::to_string(const locator_failure failure) noexcept
{
    switch (failure) {
        case locator_failure::UNREACHABLE: return "target unreachable";
        case locator_failure::AUTHENTICATION: return "authentication failed";
        case locator_failure::NO_SHARE: return "no shared disk found";
        case locator_failure::AMBIGUOUS_SHARE: return "more than one shared disk found";
        case locator_failure::MOUNT_FAILED: return "mount failed";
    }
    return "unknown failure";
}
