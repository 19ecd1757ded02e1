#include "test_common.h"

using namespace lacq;
using lacq::test::temp_directory;
using lacq::test::write_file;


#if PLATFORM_LINUX

TEST(NativeHostToolsTest, DigestsOfAKnownFile)
{
    const temp_directory temp;
    const stdfs::path file = temp.path() / "ACQUISITION.img";
    write_file(file, "abc");

    native_host_tools tools;
    EXPECT_EQ(tools.md5_digest(file), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(tools.sha1_digest(file), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(NativeHostToolsTest, RepeatedDigestsAreIdentical)
{
    const temp_directory temp;
    const stdfs::path file = temp.path() / "ACQUISITION.img";
    std::string content;
    for (int i = 0; i < 100000; ++i) {
        content += static_cast<char>('a' + i % 26);
    }
    write_file(file, content);

    native_host_tools tools;
    const std::string md5 = tools.md5_digest(file);
    const std::string sha1 = tools.sha1_digest(file);
    EXPECT_EQ(md5.size(), 32u);
    EXPECT_EQ(sha1.size(), 40u);
    EXPECT_EQ(tools.md5_digest(file), md5);
    EXPECT_EQ(tools.sha1_digest(file), sha1);
}

TEST(NativeHostToolsTest, DigestOfMissingFileIsAToolError)
{
    const temp_directory temp;
    native_host_tools tools;
    EXPECT_THROW(tools.md5_digest(temp.path() / "missing.img"), tool_error);
    EXPECT_THROW(tools.sha1_digest(temp.path() / "missing.img"), tool_error);
}

#endif  // PLATFORM_LINUX

TEST(NativeHostToolsTest, CapacityOfTemporaryFolder)
{
    const temp_directory temp;
    native_host_tools tools;
    const filesystem_capacity capacity = tools.query_capacity(temp.path());

    EXPECT_GT(capacity.total_bytes, 0u);
    EXPECT_GE(capacity.total_bytes, capacity.used_bytes);
    EXPECT_GE(capacity.total_bytes, capacity.available_bytes);
}

TEST(NativeHostToolsTest, CapacityOfMissingFolderIsASystemError)
{
    const temp_directory temp;
    native_host_tools tools;
    EXPECT_THROW(tools.query_capacity(temp.path() / "missing"), std::system_error);
}
