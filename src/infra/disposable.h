#if !defined(_FSEND_INFRA_DISPOSABLE_H_INCLUDED_)
#define _FSEND_INFRA_DISPOSABLE_H_INCLUDED_

#if !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    //
    // Owner of a resource that is released once: sockets, sinks.
    // dispose_impl() runs for the first dispose() only; a concurrent dispose() waits
    // until it has finished. The most derived class calls dispose() in its destructor.
    //
    class disposable
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(disposable)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(disposable)

        virtual ~disposable() noexcept
        {
            ASSERT(_state.load() == state::disposed, "derived destructor did not call dispose()");
        }

        // true only for the call that released the resource
        bool dispose() noexcept
        {
            state expected = state::alive;
            if (!_state.compare_exchange_strong(expected, state::disposing)) {
                while (_state.load() != state::disposed) {
                    std::this_thread::yield();
                }
                return false;
            }

            this->dispose_impl();
            _state.store(state::disposed);
            return true;
        }

        // Set as soon as dispose() starts
        [[nodiscard]]
        bool is_dispose_required() const noexcept
        {
            return _state.load() != state::alive;
        }

    protected:
        disposable() noexcept = default;
        virtual void dispose_impl() noexcept = 0;

    private:
        enum class state
        {
            alive,
            disposing,
            disposed,
        };

        std::atomic<state> _state { state::alive };
    };

}  // namespace infra


#endif  // !defined(_FSEND_INFRA_DISPOSABLE_H_INCLUDED_)
