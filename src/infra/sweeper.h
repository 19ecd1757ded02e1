#if !defined(_LACQ_INFRA_SWEEPER_H_INCLUDED_)
#define _LACQ_INFRA_SWEEPER_H_INCLUDED_

#if !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    //
    // Error cleanup armed right after a resource is acquired: the sweep function
    // runs at most once, when going out of scope or on an explicit sweep(),
    // unless it has been suppressed once the resource was released normally.
    // A sweep function that throws is logged: a cleanup never replaces the
    // error that triggered it.
    //
    class sweeper
    {
    public:
        LACQ_DISABLE_COPY_CONSTRUCTOR(sweeper)
        LACQ_DISABLE_MOVE_CONSTRUCTOR(sweeper)

        template<typename TFunc>
        sweeper(TFunc fn)  // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
            : _sweep_fn(std::move(fn))
        { }

        ~sweeper() noexcept
        {
            sweep();
        }

        void sweep() noexcept
        {
            if (!is_armed()) {
                return;
            }
            _swept = true;

            try {
                if (_sweep_fn) {
                    _sweep_fn();
                }
            }
            catch (const std::exception& ex) {
                LOG_ERROR("Cleanup failed: {}", ex.what());
            }
        }

        void suppress_sweep() noexcept
        {
            _suppressed = true;
        }

        [[nodiscard]]
        bool is_armed() const noexcept
        {
            return !_suppressed && !_swept;
        }

    private:
        bool _suppressed = false;
        bool _swept = false;
        const std::function<void()> _sweep_fn;
    };

}  // namespace infra


#endif  // !defined(_LACQ_INFRA_SWEEPER_H_INCLUDED_)
