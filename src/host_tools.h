#if !defined(_LACQ_HOST_TOOLS_H_INCLUDED_)
#define _LACQ_HOST_TOOLS_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    // Everything but RFC 3986 unreserved characters becomes %XX
    std::string percent_encode(std::string_view text);

    //
    // How to reach the file sharing service of the target computer
    //
    struct share_address
    {
    public:
        std::string computer_name { };  // as given by the operator, e.g. "John's MacBook Air"
        std::string service_name { };   // percent-encoded, e.g. "John%27s%20MacBook%20Air"
        std::string host_name { };      // multicast DNS host, e.g. "Johns-MacBook-Air.local"
        std::string user { };
        std::optional<std::string> password { };  // empty means no password

    public:
        // "//user[:password]@service._smb._tcp.local", user and password percent-encoded
        std::string to_url(bool with_password) const;

        bool has_password() const noexcept { return password.has_value() && !password->empty(); }
    };

    struct filesystem_capacity
    {
        uint64_t total_bytes = 0;
        uint64_t used_bytes = 0;
        uint64_t available_bytes = 0;
    };

    struct container_request
    {
        stdfs::path image_file { };
        std::string volume_name { };
        uint64_t size_kib = 0;
    };


    //
    // The external primitives an acquisition is built on.
    // Every call blocks until the underlying command has finished.
    //
    struct host_tools
    {
    public:
        virtual ~host_tools() = default;

        // Textual list of the shared resources. Throws tool_error.
        virtual std::string list_shares(const share_address& address) = 0;

        // Throws tool_error
        virtual void mount_share_readonly(const share_address& address, const std::string& share, const stdfs::path& mount_point) = 0;

        // Create a sparse, natively formatted container and attach it.
        // Throws tool_error, or provisioning_error if the attached volume can't be told
        virtual attached_volume create_and_attach_container(const container_request& request) = 0;

        // Throws tool_error
        virtual void detach_container(const attached_volume& volume) = 0;

        // Lower-case hex digests. Throws tool_error.
        virtual std::string md5_digest(const stdfs::path& file) = 0;
        virtual std::string sha1_digest(const stdfs::path& file) = 0;

        // Throws std::system_error
        virtual filesystem_capacity query_capacity(const stdfs::path& path) = 0;

        // Run a transfer command, appending its stdout and stderr to the given files.
        // Returns the exit code. Throws std::system_error if it can't be started.
        virtual int run_transfer(const std::vector<std::string>& argv, const stdfs::path& log_file, const stdfs::path& error_file) = 0;
    };


    //
    // host_tools implemented by the commands of the host operating system
    //
    struct native_host_tools : host_tools
    {
    public:
        std::string list_shares(const share_address& address) override;
        void mount_share_readonly(const share_address& address, const std::string& share, const stdfs::path& mount_point) override;
        attached_volume create_and_attach_container(const container_request& request) override;
        void detach_container(const attached_volume& volume) override;
        std::string md5_digest(const stdfs::path& file) override;
        std::string sha1_digest(const stdfs::path& file) override;
        filesystem_capacity query_capacity(const stdfs::path& path) override;
        int run_transfer(const std::vector<std::string>& argv, const stdfs::path& log_file, const stdfs::path& error_file) override;

    private:
        // Throws tool_error on a non-zero exit code
        static infra::subprocess_result run_checked(const std::vector<std::string>& argv, const infra::subprocess_options& options = { });
        static std::string digest_of(const std::vector<std::string>& argv, size_t hex_length);
    };

}  // namespace lacq

#endif  // !defined(_LACQ_HOST_TOOLS_H_INCLUDED_)
