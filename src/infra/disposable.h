#if !defined(_LACQ_INFRA_DISPOSABLE_H_INCLUDED_)
#define _LACQ_INFRA_DISPOSABLE_H_INCLUDED_

#if !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    //
    // A resource that is released exactly once: the first dispose() runs
    // dispose_impl(), later calls are no-ops.
    // Derived classes MUST call dispose() in their own destructor.
    //
    class disposable
    {
    protected:
        virtual void dispose_impl() noexcept = 0;
        disposable() noexcept = default;

    public:
        LACQ_DISABLE_COPY_CONSTRUCTOR(disposable)
        LACQ_DISABLE_MOVE_CONSTRUCTOR(disposable)

        virtual ~disposable() noexcept
        {
            ASSERT(_status == STATUS_DISPOSED);
        }

        void dispose() noexcept
        {
            int status = STATUS_NORMAL;
            if (_status.compare_exchange_strong(status, STATUS_DISPOSING)) {
                dispose_impl();
                _status = STATUS_DISPOSED;
                return;
            }

            // Re-entrance from dispose_impl() or a repeated call
            ASSERT(status == STATUS_DISPOSING || status == STATUS_DISPOSED);
        }

        [[nodiscard]]
        bool is_disposed() const noexcept
        {
            return (_status != STATUS_NORMAL);
        }

    private:
        static constexpr const int STATUS_NORMAL = 0;
        static constexpr const int STATUS_DISPOSING = 1;
        static constexpr const int STATUS_DISPOSED = 2;

        std::atomic_int _status { STATUS_NORMAL };
    };

}  // namespace infra


#endif  // !defined(_LACQ_INFRA_DISPOSABLE_H_INCLUDED_)
