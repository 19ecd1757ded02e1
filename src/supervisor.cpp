#include "common.h"


namespace
{
    // The operator's answers are part of the run: they go to the transcript too,
    // except for secrets.
    bool confirm_logged(lacq::input_provider& input, const std::string& question)
    {
        const bool answer = input.confirm(question);
        LOG_INFO("{} {}", question, answer ? "yes" : "no");
        return answer;
    }

    std::string ask_logged(lacq::input_provider& input, const std::string& prompt)
    {
        std::string answer = input.ask(prompt);
        LOG_INFO("{}: {}", prompt, answer);
        return answer;
    }

    std::string ask_secret_logged(lacq::input_provider& input, const std::string& prompt)
    {
        std::string answer = input.ask_secret(prompt);
        LOG_INFO("{}: (not shown)", prompt);
        return answer;
    }
}  // namespace


const char* lacq::to_string(const run_state state) noexcept
{
    switch (state) {
        case run_state::INIT: return "INIT";
        case run_state::BACKUP: return "BACKUP";
        case run_state::LOCATE_TARGET: return "LOCATE_TARGET";
        case run_state::PROVISION: return "PROVISION";
        case run_state::TRANSFER: return "TRANSFER";
        case run_state::FINALIZE: return "FINALIZE";
        case run_state::SUMMARY: return "SUMMARY";
        case run_state::ABORTED: return "ABORTED";
    }
    return "unknown";
}


//==============================================================================
// class run_supervisor
//==============================================================================

lacq::run_supervisor::run_supervisor(
    std::shared_ptr<const run_configuration> config,
    host_tools& tools,
    input_provider& input)
    : _config(std::move(config)),
      _tools(tools),
      _input(input),
      _artifacts(_config->destination, _config->container_name)
{
}

void lacq::run_supervisor::enter(const run_state state)
{
    if (!_outcome.visited.empty()) {
        LOG_DEBUG("Run state: {} -> {}", to_string(_outcome.visited.back()), to_string(state));
    }
    _outcome.visited.push_back(state);
    _outcome.final_state = state;
}

void lacq::run_supervisor::check_interrupted() const
{
    if (infra::sighandle::is_exit_required()) {
        throw interrupted_error(infra::sighandle::caught_signal());
    }
}

lacq::run_outcome lacq::run_supervisor::run()
{
    _outcome = run_outcome();
    _target.reset();
    _start_time = std::chrono::system_clock::now();
    enter(run_state::INIT);

    // Declared before the try block: the transcript must record the abort and the summary
    const infra::sweeper transcript_sweep = []() {
        infra::detach_transcript();
    };

    std::optional<std::string> abort_reason { };
    try {
        prepare();

        const stdfs::path target = resolve_target();
        _target = target;
        print_acquisition_info(target);

        acquire(target);

        enter(run_state::SUMMARY);
        _outcome.exit_code = 0;
    }
    catch (const locator_error& ex) {
        _outcome.failure = ex.failure;
        record_abort(ex.category, fmt::format("{} ({})", ex.what(), to_string(ex.failure)));
        abort_reason = ex.what();
    }
    catch (const acquisition_error& ex) {
        record_abort(ex.category, ex.what());
        abort_reason = ex.what();
    }
    catch (const std::exception& ex) {
        record_abort(std::nullopt, ex.what());
        abort_reason = ex.what();
    }

    // A run that never got past its configuration leaves nothing behind
    if (infra::is_transcript_attached()) {
        complete_summary(abort_reason);
        print_summary(_outcome.summary);
        write_summary_file(_outcome.summary, _artifacts.summary);
    }

    _container.reset();
    return _outcome;
}

void lacq::run_supervisor::record_abort(const std::optional<error_category> category, const std::string& reason)
{
    _outcome.error = category;
    _outcome.exit_code = 1;
    if (category.has_value()) {
        LOG_ERROR("Fatal {}: {}", to_string(category.value()), reason);
    }
    else {
        LOG_ERROR("Unexpected error: {}", reason);
    }
    enter(run_state::ABORTED);
}

void lacq::run_supervisor::prepare()
{
    validate(*_config);

    enter(run_state::BACKUP);
    _outcome.backup = backup_manager::archive(_artifacts);

    try {
        infra::attach_transcript(_artifacts.transcript);
    }
    catch (const spdlog::spdlog_ex& ex) {
        throw configuration_error(fmt::format("Can't open transcript {}: {}", _artifacts.transcript.string(), ex.what()));
    }

    // Reported now, so that the new transcript tells where the previous run went
    const backup_report& report = _outcome.backup;
    if (report.folder_created) {
        LOG_INFO("Created backup folder {}", report.folder.string());
    }
    for (const auto& [from, to] : report.moved) {
        LOG_INFO("Backed up {} to {}", from.string(), to.string());
    }
    for (const stdfs::path& file : report.failed) {
        LOG_WARN("Can't back up {}: it is left in place", file.string());
    }
}

stdfs::path lacq::run_supervisor::resolve_target()
{
    std::error_code ec;
    const bool is_mounted = stdfs::is_directory(_config->target, ec);
    if (is_mounted && !_config->assisted) {
        return _config->target;
    }

    if (!_config->assisted) {
        LOG_WARN("Target {} is not an existing folder", _config->target.string());
        if (!confirm_logged(_input, "Do you want to continue in assisted mode to identify the target?")) {
            throw configuration_error("Target folder must be provided");
        }
    }

    enter(run_state::LOCATE_TARGET);
    LOG_INFO("Assisted mode selected");

    const locate_request request = ask_locate_request();
    target_locator locator(_tools);
    return locator.locate(request);
}

lacq::locate_request lacq::run_supervisor::ask_locate_request()
{
    const remote_credentials& remote = _config->remote;

    locate_request request;
    request.mount_point = _config->target;
    request.computer_name = remote.computer_name.has_value()
        ? remote.computer_name.value()
        : ask_logged(_input, "Please provide the computer name of the target");
    request.user = remote.user.has_value()
        ? remote.user.value()
        : ask_logged(_input, "Please provide the username of the target");

    if (!remote.no_password) {
        request.password = remote.password.has_value()
            ? remote.password.value()
            : ask_secret_logged(_input, "Please provide the password of the target");
    }
    return request;
}

void lacq::run_supervisor::print_acquisition_info(const stdfs::path& target)
{
    LOG_INFO("Process started at {}", format_local_time(_start_time));
    LOG_INFO("Acquisition Info");
    LOG_INFO("----------------");
    LOG_INFO("Target:      {}", target.string());
    LOG_INFO("Destination: {}", _config->destination.string());
    LOG_INFO("Image Name:  {}", _artifacts.container_file.filename().string());
    LOG_INFO("Tool:        {}", to_string(_config->strategy));

    try {
        const filesystem_capacity capacity = _tools.query_capacity(target);
        LOG_INFO("Capacity:    {} total, {} used, {} available",
                 format_size(capacity.total_bytes), format_size(capacity.used_bytes), format_size(capacity.available_bytes));
    }
    catch (const std::system_error& ex) {
        LOG_WARN("Can't query capacity of {}: {}", target.string(), ex.what());
    }
}

void lacq::run_supervisor::acquire(const stdfs::path& target)
{
    enter(run_state::PROVISION);

    // Signals are turned into interrupted_error at the stage boundaries below
    const infra::sighandle::scope signal_scope;

    infra::sweeper cleanup_sweep = [this]() {
        _outcome.cleanup_fired = true;
        LOG_ERROR("An error occurred. Cleaning up...");
        if (_container && _container->is_attached()) {
            _container->dispose();
            _outcome.detach = detached_by::CLEANUP;
            if (!_container->detach_succeeded()) {
                LOG_ERROR("The volume {} may still be attached: detach it manually",
                          _container->volume.mount_path.string());
            }
        }
    };

    try {
        container_provisioner provisioner(_tools);
        provisioner.provision(_artifacts, _config->container_size, target, _container);
        check_interrupted();

        enter(run_state::TRANSFER);
        transfer_engine engine(_tools);
        _outcome.transfer = engine.transfer(_config->strategy, target, *_container, _artifacts);
        check_interrupted();

        enter(run_state::FINALIZE);
        finalizer closer(_tools);
        const bool was_attached = _container->is_attached();
        _outcome.finalize = closer.finalize(*_container, _config->calculate_hash);
        if (was_attached) {
            _outcome.detach = detached_by::FINALIZER;
        }
        check_interrupted();
    }
    catch (const std::exception&) {
        // Fatal: detach before the error reaches run()
        cleanup_sweep.sweep();
        throw;
    }

    cleanup_sweep.suppress_sweep();
}

void lacq::run_supervisor::complete_summary(const std::optional<std::string>& abort_reason)
{
    run_summary& summary = _outcome.summary;
    summary = run_summary();

    summary.start_time = format_local_time(_start_time);
    summary.end_time = format_local_time(std::chrono::system_clock::now());
    summary.final_state = to_string(_outcome.final_state);
    summary.exit_code = _outcome.exit_code;

    summary.target = _target.has_value() ? _target->string() : _config->target.string();
    summary.destination = _config->destination.string();
    summary.image_name = _artifacts.container_file.filename().string();
    summary.strategy = to_string(_config->strategy);

    if (_container) {
        summary.mount_path = _container->volume.mount_path.string();
        summary.container_size_kib = _container->size_kib;
        summary.detached = _container->is_disposed() && _container->detach_succeeded();
    }

    if (_outcome.transfer.has_value()) {
        const transfer_result& transfer = _outcome.transfer.value();
        summary.transfer_exit_code = transfer.exit_code;
        summary.transfer_log_entries = transfer.logged_items;
        summary.error_log_entries = transfer.logged_errors;
    }

    if (_outcome.finalize.has_value()) {
        const finalize_result& finalize = _outcome.finalize.value();
        summary.md5 = finalize.md5;
        summary.sha1 = finalize.sha1;
        summary.errors = finalize.errors;
    }

    summary.transcript = _artifacts.transcript.string();
    summary.transfer_log = _artifacts.transfer_log.string();
    summary.error_log = _artifacts.error_log.string();
    if (!_outcome.backup.nothing_to_archive()) {
        summary.backup_folder = _outcome.backup.folder.string();
    }
    for (const stdfs::path& file : _outcome.backup.failed) {
        summary.errors.push_back("Backup: " + file.string());
    }

    summary.abort_reason = abort_reason;
}
