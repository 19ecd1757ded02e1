#include "common.h"


//==============================================================================
// struct base_program_options
//==============================================================================

void lacq::base_program_options::add_options(CLI::App& app)
{
    app.add_flag_function(
        "-V,--version",
        [&](const int64_t /*count*/) {
            printf("Version %d.%d.%d\n", LACQ_VERSION_MAJOR, LACQ_VERSION_MINOR, LACQ_VERSION_PATCH);
            exit(0);
        },
        "Print version and exit");

    app.add_flag_function(
        "-q,--quiet",
        [&](const int64_t count) { this->arg_verbosity -= static_cast<int>(count); },
        "Be more quiet");

    app.add_flag_function(
        "-v,--verbose",
        [&](const int64_t count) { this->arg_verbosity += static_cast<int>(count); },
        "Be more verbose");
}

bool lacq::base_program_options::post_process()
{
    // Set verbosity
    infra::set_logging_verbosity(this->arg_verbosity);

    return true;
}



//==============================================================================
// struct lacq_program_options
//==============================================================================

void lacq::lacq_program_options::add_options(CLI::App& app)
{
    base_program_options::add_options(app);

    app.set_config("--config", "", "Read options from a TOML/INI file");

    CLI::Option* opt_target = app.add_option(
        "target",
        this->arg_target,
        "Mount point of the shared disk of the target (created in assisted mode)");
    opt_target->type_name("<target>");

    CLI::Option* opt_destination = app.add_option(
        "destination",
        this->arg_destination,
        "Folder that receives the image and the log files");
    opt_destination->type_name("<destination>");

    app.add_flag(
        "-a,--assisted",
        this->arg_assisted,
        "Assisted mode: find the shared disk of the target and mount it read-only");

    app.add_flag(
        "-c,--calculate-hash",
        this->arg_calculate_hash,
        "Calculate MD5 and SHA1 of the image once it is detached");

    CLI::Option* opt_image_name = app.add_option(
        "-i,--image-name",
        this->arg_image_name,
        "Name of the image and of the log files");
    opt_image_name->type_name("<name>");
    opt_image_name->capture_default_str();

    CLI::Option* opt_name = app.add_option(
        "-n,--name",
        this->arg_name,
        "Computer name of the target (assisted mode)");
    opt_name->type_name("<name>");

    CLI::Option* opt_user = app.add_option(
        "-u,--user",
        this->arg_user,
        "User name on the target (assisted mode)");
    opt_user->type_name("<user>");

    CLI::Option* opt_password = app.add_option(
        "-p,--password",
        this->arg_password,
        "Password of the user on the target (assisted mode)");
    opt_password->type_name("<password>");
    opt_password->envname(program_options_defaults::PASSWORD_ENV);

    app.add_flag(
        "--no-password",
        this->arg_no_password,
        "The user on the target has no password (assisted mode)");

    CLI::Option* opt_size = app.add_option(
        "-s,--size",
        this->arg_size,
        "Size of the image (e.g. 500G). Derived from the capacity of the target if omitted");
    opt_size->type_name("<size>");
    opt_size->transform(CLI::AsSizeValue(false));

    CLI::Option* opt_tool = app.add_option(
        "-t,--tool",
        this->arg_tool,
        "Transfer tool");
    opt_tool->type_name("<copy|mirror>");
    opt_tool->check(CLI::IsMember({ "copy", "mirror", "cp", "rsync" }));
    opt_tool->capture_default_str();

    app.add_flag(
        "-b,--batch",
        this->arg_batch,
        "Never prompt: missing input is an error");
}

bool lacq::lacq_program_options::post_process()
{
    if (!base_program_options::post_process()) {
        return false;
    }

    std::shared_ptr<run_configuration> built = std::make_shared<run_configuration>();
    built->target = arg_target;
    built->destination = arg_destination;
    built->container_name = arg_image_name;
    built->container_size = arg_size;
    built->calculate_hash = arg_calculate_hash;
    built->assisted = arg_assisted;
    built->batch = arg_batch;

    const std::optional<transfer_strategy> strategy = parse_transfer_strategy(arg_tool);
    if (!strategy.has_value()) {
        LOG_ERROR("Unknown data transfer tool: {}. Only copy (cp) and mirror (rsync) are supported", arg_tool);
        return false;
    }
    built->strategy = strategy.value();

    built->remote.computer_name = arg_name;
    built->remote.user = arg_user;
    built->remote.password = arg_password;
    built->remote.no_password = arg_no_password;

    try {
        validate(*built);
    }
    catch (const configuration_error& ex) {
        LOG_ERROR("{}", ex.what());
        return false;
    }

    if (built->container_size.has_value()) {
        LOG_DEBUG("Image size: {} bytes", built->container_size.value());
    }
    else {
        LOG_DEBUG("Image size: derived from the capacity of the target");
    }
    LOG_DEBUG("Transfer tool: {}", to_string(built->strategy));

    config = std::move(built);
    return true;
}
