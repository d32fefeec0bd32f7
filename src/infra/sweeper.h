#if !defined(_FSEND_INFRA_SWEEPER_H_INCLUDED_)
#define _FSEND_INFRA_SWEEPER_H_INCLUDED_

#if !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    //
    // Scope guard. The function runs at most once: at scope exit, or earlier
    // through sweep_now(). suppress_sweep() drops it without running it.
    //
    //     infra::sweeper close_file = [&]() { (void)close(fd); };
    //
    class sweeper
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(sweeper)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(sweeper)

        template<typename TFunc>
        sweeper(TFunc&& fn)  // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
            : _fn(std::forward<TFunc>(fn))
        { }

        ~sweeper() noexcept { this->sweep_now(); }

        void suppress_sweep() noexcept { _fn = nullptr; }

        // The function must not throw
        void sweep_now() noexcept
        {
            if (_fn) {
                const std::function<void()> fn = std::move(_fn);
                _fn = nullptr;
                fn();
            }
        }

    private:
        std::function<void()> _fn;
    };

}  // namespace infra


#endif  // !defined(_FSEND_INFRA_SWEEPER_H_INCLUDED_)
