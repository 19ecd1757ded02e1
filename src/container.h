#if !defined(_LACQ_CONTAINER_H_INCLUDED_)
#define _LACQ_CONTAINER_H_INCLUDED_

#if !defined(_LACQ_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_LACQ_COMMON_H_INCLUDED_)


namespace lacq
{
    //
    // The attached destination container. Detached exactly once: by dispose(),
    // whoever calls it first, or at the latest by the destructor.
    //
    struct container_handle : infra::disposable
    {
    public:
        LACQ_DISABLE_COPY_CONSTRUCTOR(container_handle)
        LACQ_DISABLE_MOVE_CONSTRUCTOR(container_handle)

        container_handle(host_tools& tools, stdfs::path image_file, uint64_t size_kib, attached_volume volume)
            : image_file(std::move(image_file)),
              size_kib(size_kib),
              volume(std::move(volume)),
              _tools(tools)
        { }

        ~container_handle() noexcept override final { this->dispose(); }

        bool is_attached() const noexcept { return !is_disposed(); }

        // Only meaningful after dispose()
        bool detach_succeeded() const noexcept { return _detach_succeeded; }
        const std::string& detach_error() const noexcept { return _detach_error; }

    protected:
        void dispose_impl() noexcept override final;

    public:
        const stdfs::path image_file;
        const uint64_t size_kib;
        const attached_volume volume;

    private:
        host_tools& _tools;
        bool _detach_succeeded = false;
        std::string _detach_error { };
    };

}  // namespace lacq

#endif  // !defined(_LACQ_CONTAINER_H_INCLUDED_)
