#include "test_common.h"

using namespace lacq;


namespace
{
    run_configuration valid_configuration()
    {
        run_configuration config;
        config.target = "/mnt/share";
        config.destination = "/out";
        return config;
    }
}  // namespace


TEST(RunConfigTest, DefaultsAreAcquisitionAndCopy)
{
    const run_configuration config;
    EXPECT_EQ(config.container_name, "ACQUISITION");
    EXPECT_EQ(config.strategy, transfer_strategy::COPY);
    EXPECT_FALSE(config.container_size.has_value());
    EXPECT_FALSE(config.calculate_hash);
    EXPECT_FALSE(config.assisted);
}

TEST(RunConfigTest, ParseTransferStrategyAcceptsToolNames)
{
    EXPECT_EQ(parse_transfer_strategy("copy"), transfer_strategy::COPY);
    EXPECT_EQ(parse_transfer_strategy("cp"), transfer_strategy::COPY);
    EXPECT_EQ(parse_transfer_strategy("mirror"), transfer_strategy::MIRROR);
    EXPECT_EQ(parse_transfer_strategy("rsync"), transfer_strategy::MIRROR);
    EXPECT_FALSE(parse_transfer_strategy("dd").has_value());
    EXPECT_FALSE(parse_transfer_strategy("").has_value());
}

TEST(RunConfigTest, ValidConfigurationPasses)
{
    EXPECT_NO_THROW(validate(valid_configuration()));
}

TEST(RunConfigTest, MissingTargetOrDestinationIsRejected)
{
    run_configuration config = valid_configuration();
    config.target.clear();
    EXPECT_THROW(validate(config), configuration_error);

    config = valid_configuration();
    config.destination.clear();
    EXPECT_THROW(validate(config), configuration_error);
}

TEST(RunConfigTest, ImageNameMustBeAPlainFileName)
{
    run_configuration config = valid_configuration();
    config.container_name = "";
    EXPECT_THROW(validate(config), configuration_error);

    config.container_name = "../escape";
    EXPECT_THROW(validate(config), configuration_error);

    config.container_name = "..";
    EXPECT_THROW(validate(config), configuration_error);

    config.container_name = "CASE-2024-001";
    EXPECT_NO_THROW(validate(config));
}

TEST(RunConfigTest, ZeroSizeIsRejected)
{
    run_configuration config = valid_configuration();
    config.container_size = 0;
    EXPECT_THROW(validate(config), configuration_error);
}

TEST(RunConfigTest, PasswordAndNoPasswordAreExclusive)
{
    run_configuration config = valid_configuration();
    config.remote.password = "secret";
    config.remote.no_password = true;

    try {
        validate(config);
        FAIL() << "configuration_error expected";
    }
    catch (const configuration_error& ex) {
        EXPECT_EQ(ex.category, error_category::CONFIGURATION);
    }
}

TEST(RunConfigTest, EmptyRemoteValuesAreRejected)
{
    run_configuration config = valid_configuration();
    config.remote.user = "";
    EXPECT_THROW(validate(config), configuration_error);
}

TEST(RunArtifactsTest, AllPathsDeriveFromDestinationAndName)
{
    const run_artifacts artifacts("/out", "CASE");
    EXPECT_EQ(artifacts.container_file, stdfs::path("/out") / (std::string("CASE") + artifact_extensions::CONTAINER));
    EXPECT_EQ(artifacts.transcript, stdfs::path("/out/CASE.out"));
    EXPECT_EQ(artifacts.transfer_log, stdfs::path("/out/CASE.log"));
    EXPECT_EQ(artifacts.error_log, stdfs::path("/out/CASE.err"));
    EXPECT_EQ(artifacts.summary, stdfs::path("/out/CASE.json"));

    const std::vector<stdfs::path> all = artifacts.all();
    ASSERT_EQ(all.size(), 5u);
    EXPECT_EQ(all.front(), artifacts.container_file);
}
