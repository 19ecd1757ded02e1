#include "test_common.h"

using namespace lacq;
using lacq::test::temp_directory;


TEST(SummaryTest, FormatSize)
{
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(1023), "1023 B");
    EXPECT_EQ(format_size(1536), "1.5 KiB");
    EXPECT_EQ(format_size(40ULL * 1024 * 1024 * 1024), "40.0 GiB");
    EXPECT_EQ(format_size(500ULL * 1000 * 1000 * 1000), "465.7 GiB");
}

TEST(SummaryTest, FormatLocalTimeHasTimezone)
{
    const std::string text = format_local_time(std::chrono::system_clock::now());
    static const std::regex re_time(R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} [+-]\d{4}$)");
    EXPECT_TRUE(std::regex_match(text, re_time)) << text;
}

TEST(SummaryTest, WritesJsonDocument)
{
    const temp_directory temp;
    const stdfs::path file = temp.path() / "ACQUISITION.json";

    run_summary summary;
    summary.final_state = "SUMMARY";
    summary.exit_code = 0;
    summary.destination = "/out";
    summary.image_name = "ACQUISITION.sparseimage";
    summary.strategy = "copy";
    summary.transfer_exit_code = 1;
    summary.transfer_log_entries = 997;
    summary.error_log_entries = 3;
    summary.md5 = "d41d8cd98f00b204e9800998ecf8427e";
    summary.errors.push_back("SHA1: Command 'openssl sha1 -r /out/ACQUISITION.sparseimage' failed with code 1");

    ASSERT_TRUE(write_summary_file(summary, file));

    std::ifstream is(file);
    run_summary loaded;
    {
        cereal::JSONInputArchive archive(is);
        archive(cereal::make_nvp("summary", loaded));
    }

    EXPECT_EQ(loaded.final_state, "SUMMARY");
    EXPECT_EQ(loaded.exit_code, 0);
    EXPECT_EQ(loaded.destination, "/out");
    EXPECT_EQ(loaded.transfer_exit_code, std::optional<int>(1));
    EXPECT_EQ(loaded.transfer_log_entries, 997u);
    EXPECT_EQ(loaded.error_log_entries, 3u);
    EXPECT_EQ(loaded.md5, summary.md5);
    EXPECT_FALSE(loaded.sha1.has_value());
    EXPECT_FALSE(loaded.abort_reason.has_value());
    EXPECT_EQ(loaded.errors, summary.errors);
}

TEST(SummaryTest, UnwritableFileIsReportedNotThrown)
{
    const temp_directory temp;
    run_summary summary;
    EXPECT_FALSE(write_summary_file(summary, temp.path() / "missing" / "ACQUISITION.json"));
}
