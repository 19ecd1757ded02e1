#include "common.h"


int main(int argc, char* argv[])
{
    //
    // Parse command line arguments
    //
    std::shared_ptr<lacq::lacq_program_options> options = std::make_shared<lacq::lacq_program_options>();
    CLI::App app("Logical acquisition of a shared disk into a sparse image", "lacq");
    options->add_options(app);
    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        // --help is reported as a "parse error" with code 0
        return (app.exit(e) == 0 ? 0 : 1);
    }

    if (!options->post_process()) {
        LOG_ERROR("lacq_program_options post_process() failed");
        return 1;
    }

    std::unique_ptr<lacq::input_provider> input;
    if (options->config->batch) {
        input = std::make_unique<lacq::batch_input_provider>();
    }
    else {
        input = std::make_unique<lacq::terminal_input_provider>(std::cin, std::cout);
    }

    lacq::native_host_tools tools;
    lacq::run_supervisor supervisor(options->config, tools, *input);
    const lacq::run_outcome outcome = supervisor.run();

    LOG_DEBUG("Run ended in state {} with exit code {}", lacq::to_string(outcome.final_state), outcome.exit_code);
    return outcome.exit_code;
}
