#if !defined(_LACQ_INFRA_SIGHANDLE_H_INCLUDED_)
#define _LACQ_INFRA_SIGHANDLE_H_INCLUDED_

#if !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    class sighandle
    {
    private:
        static inline volatile std::sig_atomic_t __exit_required { 0 };
        static inline volatile std::sig_atomic_t __caught_signal { 0 };

        static void stop_handler(
            const int sig,
            [[maybe_unused]] siginfo_t* const info,
            [[maybe_unused]] void* const ucontext)
        {
            // Nothing but async-signal-safe calls here
            __caught_signal = sig;
            __exit_required = 1;
            signal_running_subprocess(sig == SIGINT ? SIGINT : SIGTERM);
        }

    public:
        static void require_exit() noexcept
        {
            __exit_required = 1;
        }

        static bool is_exit_required() noexcept
        {
            return (__exit_required != 0);
        }

        static int caught_signal() noexcept
        {
            return __caught_signal;
        }

        //
        // Installs the stop handler for the lifetime of the object, restoring the
        // previous dispositions afterwards. Resets the exit-required flag on install.
        //
        class scope
        {
        public:
            LACQ_DISABLE_COPY_CONSTRUCTOR(scope)
            LACQ_DISABLE_MOVE_CONSTRUCTOR(scope)

            scope()  // throws std::system_error
            {
                __exit_required = 0;
                __caught_signal = 0;

                for (size_t i = 0; i < SIGNALS.size(); ++i) {
                    struct sigaction act { };
                    act.sa_flags = SA_RESTART | SA_SIGINFO;
                    act.sa_sigaction = &stop_handler;
                    sigemptyset(&act.sa_mask);
                    if (sigaction(SIGNALS[i], &act, &_previous[i]) != 0) {
                        const int err = errno;
                        LOG_ERROR("sigaction() for signal {} failed: errno = {} ({})", SIGNALS[i], err, strerror(err));
                        restore(i);
                        THROW_SYSTEM_ERROR(err, sigaction);
                    }
                    LOG_TRACE("Setup signal handler for {}", SIGNALS[i]);
                }
            }

            ~scope() noexcept
            {
                restore(SIGNALS.size());
            }

        private:
            void restore(const size_t installed) noexcept
            {
                for (size_t i = 0; i < installed; ++i) {
                    if (sigaction(SIGNALS[i], &_previous[i], nullptr) != 0) {
                        LOG_WARN("Restore signal handler for {} failed: errno = {} ({})", SIGNALS[i], errno, strerror(errno));
                    }
                }
            }

        private:
            static constexpr const std::array<int, 4> SIGNALS { SIGINT, SIGTERM, SIGHUP, SIGQUIT };
            std::array<struct sigaction, 4> _previous { };
        };
    };

}  // namespace infra


#endif  // !defined(_LACQ_INFRA_SIGHANDLE_H_INCLUDED_)
