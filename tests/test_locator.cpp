#include "test_common.h"

using namespace lacq;
using lacq::test::temp_directory;
using lacq::test::fake_host_tools;


class LocatorTest : public ::testing::Test
{
protected:
    locate_request request_for(const std::string& name, const std::optional<std::string>& password)
    {
        locate_request request;
        request.computer_name = name;
        request.user = "examiner";
        request.password = password;
        request.mount_point = temp.path() / "mnt" / "share";
        return request;
    }

    locator_failure failure_of(const locate_request& request)
    {
        target_locator locator(tools);
        try {
            (void)locator.locate(request);
        }
        catch (const locator_error& ex) {
            EXPECT_EQ(ex.category, error_category::LOCATOR);
            return ex.failure;
        }
        ADD_FAILURE() << "locator_error expected";
        return locator_failure::UNREACHABLE;
    }

protected:
    temp_directory temp;
    fake_host_tools tools { temp.path() / "volumes" };
};


TEST(ShareAddressTest, PercentEncodeReservedCharacters)
{
    EXPECT_EQ(percent_encode("John's MacBook Air"), "John%27s%20MacBook%20Air");
    EXPECT_EQ(percent_encode("a-b_c.d~e"), "a-b_c.d~e");
    EXPECT_EQ(percent_encode("p@ss:w/rd"), "p%40ss%3Aw%2Frd");
}

TEST(ShareAddressTest, MulticastHostName)
{
    EXPECT_EQ(mdns_host_name("John's MacBook Air"), "Johns-MacBook-Air.local");
    EXPECT_EQ(mdns_host_name("lab-mac"), "lab-mac.local");
    EXPECT_EQ(mdns_host_name("  spaced  out  "), "spaced-out.local");
}

TEST(ShareAddressTest, UrlNeverShowsThePasswordUnlessAsked)
{
    const share_address address = make_share_address("John's MacBook Air", "john", std::string("p@ss"));
    EXPECT_EQ(address.to_url(false), "//john@John%27s%20MacBook%20Air._smb._tcp.local");
    EXPECT_EQ(address.to_url(true), "//john:p%40ss@John%27s%20MacBook%20Air._smb._tcp.local");

    const share_address no_password = make_share_address("Mac", "john", std::nullopt);
    EXPECT_FALSE(no_password.has_password());
    EXPECT_EQ(no_password.to_url(true), "//john@Mac._smb._tcp.local");

    const share_address empty_password = make_share_address("Mac", "john", std::string());
    EXPECT_FALSE(empty_password.has_password());
}

TEST_F(LocatorTest, MountsTheSingleDiskShareReadOnly)
{
    target_locator locator(tools);
    const locate_request request = request_for("John's MacBook Air", std::string("secret"));

    const stdfs::path mounted = locator.locate(request);

    EXPECT_EQ(mounted, request.mount_point);
    EXPECT_TRUE(stdfs::is_directory(request.mount_point));
    ASSERT_EQ(tools.mounts.size(), 1u);
    EXPECT_EQ(tools.mounts[0].first, "Macintosh HD");
    EXPECT_EQ(tools.mounts[0].second, request.mount_point);
    ASSERT_FALSE(tools.addresses.empty());
    EXPECT_EQ(tools.addresses[0].service_name, "John%27s%20MacBook%20Air");
    EXPECT_EQ(tools.calls, (std::vector<std::string> { "list_shares", "mount_share_readonly" }));
}

TEST_F(LocatorTest, ExistingMountPointIsReused)
{
    const locate_request request = request_for("Mac", std::nullopt);
    stdfs::create_directories(request.mount_point);

    target_locator locator(tools);
    EXPECT_EQ(locator.locate(request), request.mount_point);
}

TEST_F(LocatorTest, WrongPasswordIsAnAuthenticationFailure)
{
    tools.list_shares_failure.emplace("smbutil view //examiner:****@Mac._smb._tcp.local", 68,
                                      "smbutil: server rejected the connection: Authentication error\n");
    EXPECT_EQ(failure_of(request_for("Mac", std::string("wrong"))), locator_failure::AUTHENTICATION);
    EXPECT_EQ(tools.count_calls("mount_share_readonly"), 0u);
}

TEST_F(LocatorTest, UnreachableTarget)
{
    tools.list_shares_failure.emplace("smbutil view //examiner@Mac._smb._tcp.local", 64,
                                      "smbutil: server connection failed: No route to host\n");
    EXPECT_EQ(failure_of(request_for("Mac", std::nullopt)), locator_failure::UNREACHABLE);
}

TEST_F(LocatorTest, NoDiskShare)
{
    tools.shares_listing = "IPC$    Pipe    IPC Service\n";
    EXPECT_EQ(failure_of(request_for("Mac", std::nullopt)), locator_failure::NO_SHARE);
    EXPECT_FALSE(stdfs::exists(temp.path() / "mnt"));
}

TEST_F(LocatorTest, SeveralDiskSharesAreAmbiguous)
{
    tools.shares_listing = "Macintosh HD    Disk\nBackup    Disk\n";
    EXPECT_EQ(failure_of(request_for("Mac", std::nullopt)), locator_failure::AMBIGUOUS_SHARE);
    EXPECT_EQ(tools.count_calls("mount_share_readonly"), 0u);
}

TEST_F(LocatorTest, MountFailure)
{
    tools.mount_failure.emplace("mount_smbfs -o ro //examiner@Mac._smb._tcp.local/Macintosh%20HD /mnt/share", 1,
                                "mount_smbfs: mount error: File exists\n");
    EXPECT_EQ(failure_of(request_for("Mac", std::nullopt)), locator_failure::MOUNT_FAILED);
}
