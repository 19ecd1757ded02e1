#if !defined(_LACQ_TEST_COMMON_H_INCLUDED_)
#define _LACQ_TEST_COMMON_H_INCLUDED_

#include "common.h"

#include <gtest/gtest.h>


namespace lacq::test
{
    //
    // A fresh directory under the system temporary directory, removed on destruction
    //
    class temp_directory
    {
    public:
        LACQ_DISABLE_COPY_CONSTRUCTOR(temp_directory)
        LACQ_DISABLE_MOVE_CONSTRUCTOR(temp_directory)

        temp_directory()
        {
            std::string pattern = (stdfs::temp_directory_path() / "lacq-test-XXXXXX").string();
            if (mkdtemp(pattern.data()) == nullptr) {
                THROW_SYSTEM_ERROR(errno, mkdtemp);
            }
            _path = pattern;
        }

        ~temp_directory()
        {
            std::error_code ec;
            stdfs::remove_all(_path, ec);
        }

        const stdfs::path& path() const noexcept { return _path; }

    private:
        stdfs::path _path;
    };

    inline void write_file(const stdfs::path& file, const std::string& content)
    {
        std::ofstream os(file, std::ios::out | std::ios::trunc | std::ios::binary);
        os << content;
    }

    inline std::string read_file(const stdfs::path& file)
    {
        std::ifstream is(file, std::ios::in | std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
    }

    inline std::vector<std::string> list_directory(const stdfs::path& dir)
    {
        std::vector<std::string> names;
        for (const stdfs::directory_entry& entry : stdfs::directory_iterator(dir)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }


    //
    // host_tools double: records every call, attaches containers as plain
    // directories under volumes_root and writes scripted transfer logs
    //
    struct fake_host_tools : host_tools
    {
    public:
        // Behavior
        std::string shares_listing = "\tMacintosh HD                    Disk\n\tIPC$    Pipe    IPC Service\n";
        std::optional<tool_error> list_shares_failure { };
        std::optional<tool_error> mount_failure { };
        std::optional<tool_error> create_failure { };
        std::optional<tool_error> detach_failure { };
        std::optional<tool_error> digest_failure { };
        std::optional<std::string> attached_name { };  // mount path name, defaults to the volume name
        bool attach_without_mount_path = false;

        stdfs::path volumes_root { };
        filesystem_capacity capacity { };
        bool capacity_failure = false;

        int transfer_exit_code = 0;
        size_t transferred_items = 0;
        size_t failed_items = 0;
        std::function<void()> during_transfer { };

        std::string md5 = "d41d8cd98f00b204e9800998ecf8427e";
        std::string sha1 = "da39a3ee5e6b4b0d3255bfef95601890afd80709";

        // Recorded
        std::vector<std::string> calls { };
        std::vector<share_address> addresses { };
        std::vector<std::pair<std::string, stdfs::path>> mounts { };
        std::vector<container_request> created { };
        std::vector<attached_volume> detached { };
        std::vector<std::vector<std::string>> transfers { };

    public:
        explicit fake_host_tools(stdfs::path volumes_root)
            : volumes_root(std::move(volumes_root))
        { }

        std::string list_shares(const share_address& address) override
        {
            calls.emplace_back("list_shares");
            addresses.push_back(address);
            if (list_shares_failure.has_value()) {
                throw list_shares_failure.value();
            }
            return shares_listing;
        }

        void mount_share_readonly(const share_address& address, const std::string& share, const stdfs::path& mount_point) override
        {
            calls.emplace_back("mount_share_readonly");
            addresses.push_back(address);
            if (mount_failure.has_value()) {
                throw mount_failure.value();
            }
            mounts.emplace_back(share, mount_point);
        }

        attached_volume create_and_attach_container(const container_request& request) override
        {
            calls.emplace_back("create_and_attach_container");
            if (create_failure.has_value()) {
                throw create_failure.value();
            }
            created.push_back(request);
            write_file(request.image_file, "sparse image");

            attached_volume volume;
            volume.device = "/dev/fake" + std::to_string(created.size());
            if (!attach_without_mount_path) {
                volume.mount_path = volumes_root / attached_name.value_or(request.volume_name);
                stdfs::create_directories(volume.mount_path);
            }
            return volume;
        }

        void detach_container(const attached_volume& volume) override
        {
            calls.emplace_back("detach_container");
            detached.push_back(volume);
            if (detach_failure.has_value()) {
                throw detach_failure.value();
            }
        }

        std::string md5_digest(const stdfs::path& file) override
        {
            calls.emplace_back("md5_digest");
            if (digest_failure.has_value()) {
                throw digest_failure.value();
            }
            EXPECT_TRUE(stdfs::exists(file)) << file;
            return md5;
        }

        std::string sha1_digest(const stdfs::path& file) override
        {
            calls.emplace_back("sha1_digest");
            if (digest_failure.has_value()) {
                throw digest_failure.value();
            }
            EXPECT_TRUE(stdfs::exists(file)) << file;
            return sha1;
        }

        filesystem_capacity query_capacity(const stdfs::path& /*path*/) override
        {
            calls.emplace_back("query_capacity");
            if (capacity_failure) {
                THROW_SYSTEM_ERROR(ENOENT, statvfs);
            }
            return capacity;
        }

        int run_transfer(const std::vector<std::string>& argv, const stdfs::path& log_file, const stdfs::path& error_file) override
        {
            calls.emplace_back("run_transfer");
            transfers.push_back(argv);
            {
                std::ofstream log(log_file, std::ios::app);
                for (size_t i = 0; i < transferred_items; ++i) {
                    log << "/Volumes/Share/file" << i << " -> /Volumes/ACQUISITION/file" << i << "\n";
                }
                std::ofstream err(error_file, std::ios::app);
                for (size_t i = 0; i < failed_items; ++i) {
                    err << "cp: /Volumes/Share/locked" << i << ": Permission denied\n";
                }
            }
            if (during_transfer) {
                during_transfer();
            }
            return transfer_exit_code;
        }

        size_t count_calls(const std::string& name) const
        {
            return static_cast<size_t>(std::count(calls.begin(), calls.end(), name));
        }

        // Index of the first call with that name, or calls.size()
        size_t position_of(const std::string& name) const
        {
            return static_cast<size_t>(std::find(calls.begin(), calls.end(), name) - calls.begin());
        }
    };


    //
    // input_provider double answering from a script, in order
    //
    struct scripted_input_provider : input_provider
    {
    public:
        std::deque<std::string> answers { };
        std::vector<std::string> prompts { };

    public:
        scripted_input_provider() = default;

        explicit scripted_input_provider(std::initializer_list<std::string> answers)
            : answers(answers)
        { }

        bool confirm(const std::string& question) override
        {
            const std::string answer = next(question);
            return (answer == "y" || answer == "Y");
        }

        std::string ask(const std::string& prompt) override
        {
            return next(prompt);
        }

        std::string ask_secret(const std::string& prompt) override
        {
            return next(prompt);
        }

    private:
        std::string next(const std::string& prompt)
        {
            prompts.push_back(prompt);
            if (answers.empty()) {
                throw configuration_error("No scripted answer for \"" + prompt + "\"");
            }
            std::string answer = std::move(answers.front());
            answers.pop_front();
            return answer;
        }
    };

}  // namespace lacq::test

#endif  // !defined(_LACQ_TEST_COMMON_H_INCLUDED_)
