#include "test_common.h"

using namespace lacq;
using lacq::test::temp_directory;
using lacq::test::write_file;


namespace
{
    struct parsed_options
    {
        std::shared_ptr<lacq_program_options> options = std::make_shared<lacq_program_options>();
        CLI::App app { "test", "lacq" };

        parsed_options()
        {
            options->add_options(app);
        }

        // Parse error (thrown by CLI11) or post_process() result
        bool parse(std::vector<std::string> args)
        {
            args.insert(args.begin(), "lacq");
            std::vector<char*> argv;
            for (std::string& arg : args) {
                argv.push_back(arg.data());
            }
            app.parse(static_cast<int>(argv.size()), argv.data());
            return options->post_process();
        }
    };
}  // namespace


TEST(ProgramOptionsTest, PositionalsAndDefaults)
{
    parsed_options parsed;
    ASSERT_TRUE(parsed.parse({ "/mnt/share", "/out" }));

    const run_configuration& config = *parsed.options->config;
    EXPECT_EQ(config.target, stdfs::path("/mnt/share"));
    EXPECT_EQ(config.destination, stdfs::path("/out"));
    EXPECT_EQ(config.container_name, "ACQUISITION");
    EXPECT_EQ(config.strategy, transfer_strategy::COPY);
    EXPECT_FALSE(config.container_size.has_value());
    EXPECT_FALSE(config.calculate_hash);
    EXPECT_FALSE(config.assisted);
    EXPECT_FALSE(config.batch);
}

TEST(ProgramOptionsTest, AllOptions)
{
    parsed_options parsed;
    ASSERT_TRUE(parsed.parse({
        "-a", "-c", "-b",
        "-i", "CASE-001",
        "-n", "John's MacBook Air",
        "-u", "john",
        "-p", "secret",
        "-s", "500G",
        "-t", "rsync",
        "/Volumes/Share", "/out" }));

    const run_configuration& config = *parsed.options->config;
    EXPECT_TRUE(config.assisted);
    EXPECT_TRUE(config.calculate_hash);
    EXPECT_TRUE(config.batch);
    EXPECT_EQ(config.container_name, "CASE-001");
    EXPECT_EQ(config.remote.computer_name, std::optional<std::string>("John's MacBook Air"));
    EXPECT_EQ(config.remote.user, std::optional<std::string>("john"));
    EXPECT_EQ(config.remote.password, std::optional<std::string>("secret"));
    EXPECT_EQ(config.container_size, std::optional<uint64_t>(500ULL * 1024 * 1024 * 1024));
    EXPECT_EQ(config.strategy, transfer_strategy::MIRROR);
}

TEST(ProgramOptionsTest, UnknownToolIsAParseError)
{
    parsed_options parsed;
    EXPECT_THROW(parsed.parse({ "-t", "dd", "/mnt/share", "/out" }), CLI::ValidationError);
}

TEST(ProgramOptionsTest, MissingDestinationFailsPostProcess)
{
    parsed_options parsed;
    EXPECT_FALSE(parsed.parse({ "/mnt/share" }));
    EXPECT_EQ(parsed.options->config, nullptr);
}

TEST(ProgramOptionsTest, PasswordAndNoPasswordFailPostProcess)
{
    parsed_options parsed;
    EXPECT_FALSE(parsed.parse({ "-p", "secret", "--no-password", "/mnt/share", "/out" }));
}

TEST(ProgramOptionsTest, PasswordFromEnvironment)
{
    ASSERT_EQ(setenv(program_options_defaults::PASSWORD_ENV, "from-env", 1), 0);
    const infra::sweeper unset = []() {
        (void)unsetenv(program_options_defaults::PASSWORD_ENV);
    };

    parsed_options parsed;
    ASSERT_TRUE(parsed.parse({ "-a", "/mnt/share", "/out" }));
    EXPECT_EQ(parsed.options->config->remote.password, std::optional<std::string>("from-env"));
}

TEST(ProgramOptionsTest, OptionsFromConfigFile)
{
    const temp_directory temp;
    const stdfs::path file = temp.path() / "lacq.toml";
    write_file(file,
        "image-name = \"CASE-002\"\n"
        "tool = \"mirror\"\n"
        "calculate-hash = true\n"
        "user = \"examiner\"\n");

    parsed_options parsed;
    ASSERT_TRUE(parsed.parse({ "--config", file.string(), "/mnt/share", "/out" }));

    const run_configuration& config = *parsed.options->config;
    EXPECT_EQ(config.container_name, "CASE-002");
    EXPECT_EQ(config.strategy, transfer_strategy::MIRROR);
    EXPECT_TRUE(config.calculate_hash);
    EXPECT_EQ(config.remote.user, std::optional<std::string>("examiner"));
}

TEST(ProgramOptionsTest, VerbosityCounts)
{
    parsed_options parsed;
    ASSERT_TRUE(parsed.parse({ "-vv", "-q", "/mnt/share", "/out" }));
    EXPECT_EQ(parsed.options->arg_verbosity, 1);
    EXPECT_EQ(infra::console_logging_level(), spdlog::level::debug);
    infra::set_logging_verbosity(0);
}

TEST(ProgramOptionsDeathTest, VersionPrintsAndExits)
{
    EXPECT_EXIT(
        {
            parsed_options parsed;
            (void)parsed.parse({ "-V" });
        },
        ::testing::ExitedWithCode(0), "");
}
