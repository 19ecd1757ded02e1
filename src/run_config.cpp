#include "common.h"


const char* lacq::to_string(const transfer_strategy strategy) noexcept
{
    switch (strategy) {
        case transfer_strategy::COPY: return "copy";
        case transfer_strategy::MIRROR: return "mirror";
    }
    return "unknown";
}

std::optional<lacq::transfer_strategy> lacq::parse_transfer_strategy(const std::string_view name) noexcept
{
    if (name == "copy" || name == "cp") {
        return transfer_strategy::COPY;
    }
    if (name == "mirror" || name == "rsync") {
        return transfer_strategy::MIRROR;
    }
    return std::nullopt;
}

void lacq::validate(const run_configuration& config)
{
    if (config.target.empty()) {
        throw configuration_error("Requires target folder");
    }
    if (config.destination.empty()) {
        throw configuration_error("Requires destination folder");
    }

    if (config.container_name.empty()) {
        throw configuration_error("Image name must not be empty");
    }
    if (config.container_name.find('/') != std::string::npos ||
        config.container_name == "." || config.container_name == "..") {
        throw configuration_error("Image name must be a plain file name: " + config.container_name);
    }

    if (config.container_size.has_value() && config.container_size.value() == 0) {
        throw configuration_error("Image size must be greater than zero");
    }

    const remote_credentials& remote = config.remote;
    if (remote.no_password && remote.password.has_value()) {
        throw configuration_error("--password and --no-password are mutually exclusive");
    }
    for (const auto* value : { &remote.computer_name, &remote.user, &remote.password }) {
        if (value->has_value() && value->value().empty()) {
            throw configuration_error("Remote computer name, user and password must have a value");
        }
    }
}
