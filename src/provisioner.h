#if !defined(_LACQ_PROVISIONER_H_INCLUDED_)
#define _LACQ_PROVISIONER_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    struct provisioning_defaults
    {
        static constexpr const uint64_t MIN_CONTAINER_SIZE_KIB = 64 * 1024;  // 64 MiB
    };

    //
    // Size for a container that must hold the whole source: the total capacity
    // in KiB, rounded up to (leading digit + 1) followed by zeros.
    // E.g. 41943040 KiB -> 50000000 KiB.
    //
    uint64_t derive_container_size_kib(const filesystem_capacity& capacity) noexcept;

    // Rounded up, so that the container is never smaller than requested
    uint64_t requested_container_size_kib(uint64_t size_bytes) noexcept;


    class container_provisioner
    {
    public:
        LACQ_DISABLE_COPY_CONSTRUCTOR(container_provisioner)
        LACQ_DISABLE_MOVE_CONSTRUCTOR(container_provisioner)

        explicit container_provisioner(host_tools& tools) noexcept
            : _tools(tools)
        { }

        //
        // Throws provisioning_error. The handle is stored in container as soon as
        // the container is attached, so a container that fails the checks after
        // attach is still owned (and detached) by the caller.
        //
        void provision(
            const run_artifacts& artifacts,
            const std::optional<uint64_t>& size_bytes,
            const stdfs::path& target,
            std::unique_ptr<container_handle>& container);

    private:
        uint64_t compute_size_kib(const std::optional<uint64_t>& size_bytes, const stdfs::path& target);  // throws provisioning_error

    private:
        host_tools& _tools;
    };

}  // namespace lacq

#endif  // !defined(_LACQ_PROVISIONER_H_INCLUDED_)
