#if !defined(_FSEND_INFRA_SIGHANDLE_H_INCLUDED_)
#define _FSEND_INFRA_SIGHANDLE_H_INCLUDED_

#if !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    //
    // Process-wide signal state of the fsend tool.
    // SIGINT/SIGTERM/SIGQUIT only raise a flag; blocking calls return EINTR
    // (no SA_RESTART) and the caller polls is_exit_required().
    //
    class sighandle
    {
    public:
        sighandle() = delete;

        static void require_exit() noexcept { _exit_required = 1; }

        [[nodiscard]]
        static bool is_exit_required() noexcept { return _exit_required != 0; }

        static void setup_signal_handler()
        {
            for (const int sig : { SIGINT, SIGTERM, SIGQUIT }) {
                struct sigaction act { };
                act.sa_handler = &on_stop_signal;
                sigemptyset(&act.sa_mask);
                act.sa_flags = 0;
                if (sigaction(sig, &act, nullptr) != 0) {
                    const int err = errno;
                    LOG_ERROR("sigaction({}) failed. {}", strsignal(sig), errno_description(err));
                    THROW_SYSTEM_ERROR(err, sigaction);
                }
                LOG_TRACE("Stop handler installed for {}", strsignal(sig));
            }

            ignore_sigpipe();
        }

        // A write to a closed peer then fails with EPIPE instead of killing the process
        static void ignore_sigpipe()
        {
            if (signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
                const int err = errno;
                LOG_ERROR("signal(SIGPIPE, SIG_IGN) failed. {}", errno_description(err));
                THROW_SYSTEM_ERROR(err, signal);
            }
        }

    private:
        static void on_stop_signal(const int /*sig*/) noexcept
        {
            // async-signal-safe: no logging here
            _exit_required = 1;
        }

    private:
        static inline volatile std::sig_atomic_t _exit_required { 0 };
    };


    //
    // Blocks SIGPIPE on the calling thread for the lifetime of the object.
    // A SIGPIPE raised meanwhile (sendfile/splice/write to a closed peer) is consumed
    // before the mask is restored, so the call just fails with EPIPE whatever the
    // process-wide disposition of SIGPIPE is.
    //
    class sigpipe_blocker
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(sigpipe_blocker)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(sigpipe_blocker)

        sigpipe_blocker()
        {
            sigset_t pending;
            sigemptyset(&pending);
            if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
                // Someone else's SIGPIPE: leave it alone
                _was_pending = true;
            }

            sigset_t block;
            sigemptyset(&block);
            sigaddset(&block, SIGPIPE);
            const int ret = pthread_sigmask(SIG_BLOCK, &block, &_old_mask);
            if (ret != 0) {
                LOG_ERROR("pthread_sigmask(SIG_BLOCK, SIGPIPE) failed. {}", errno_description(ret));
                THROW_SYSTEM_ERROR(ret, pthread_sigmask);
            }
        }

        ~sigpipe_blocker() noexcept
        {
            if (!_was_pending) {
                sigset_t pending;
                sigemptyset(&pending);
                if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
                    sigset_t only_pipe;
                    sigemptyset(&only_pipe);
                    sigaddset(&only_pipe, SIGPIPE);
                    const timespec no_wait { 0, 0 };
                    while (sigtimedwait(&only_pipe, nullptr, &no_wait) == -1 && errno == EINTR) { }
                }
            }

            (void)pthread_sigmask(SIG_SETMASK, &_old_mask, nullptr);
        }

    private:
        sigset_t _old_mask { };
        bool _was_pending = false;
    };

}  // namespace infra


#endif  // !defined(_FSEND_INFRA_SIGHANDLE_H_INCLUDED_)
