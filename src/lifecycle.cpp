#include "common.h"

namespace
{
    // Run one terminal hook; an exception it raises is captured, never propagated from here
    template<typename TCallback, typename... TArgs>
    std::exception_ptr invoke_guarded(const char* name, const TCallback& callback, TArgs&&... args) noexcept
    {
        if (!callback) {
            return nullptr;
        }

        try {
            callback(std::forward<TArgs>(args)...);
        }
        catch (const std::exception& ex) {
            LOG_ERROR("Callback {} raised: {}", name, ex.what());
            return std::current_exception();
        }
        catch (...) {
            LOG_ERROR("Callback {} raised an unknown exception", name);
            return std::current_exception();
        }
        return nullptr;
    }

}  // namespace



//==============================================================================
// struct lifecycle_callbacks
//==============================================================================

const std::vector<std::string>& fsend::lifecycle_callbacks::recognized_names()
{
    static const std::vector<std::string> names {
        NAME_STARTED,
        NAME_ABORTED,
        NAME_ERROR,
        NAME_COMPLETE,
        NAME_BYTES_SENT,
        NAME_CLEANUP,
    };
    return names;
}

fsend::lifecycle_callbacks fsend::lifecycle_callbacks::from_named(const std::map<std::string, named_callback>& hooks)
{
    lifecycle_callbacks callbacks;

    for (const auto& [name, hook] : hooks) {
        const auto& names = recognized_names();
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            std::string supported;
            for (const std::string& n : names) {
                if (!supported.empty()) supported += ", ";
                supported += n;
            }
            LOG_ERROR("Unknown callback \"{}\" (supported: {})", name, supported);
            throw configuration_error("Unknown callback \"" + name + "\" (supported: " + supported + ")");
        }

        const auto expect = [&](auto& field) {
            typedef std::decay_t<decltype(field)> callback_t;
            if (!std::holds_alternative<callback_t>(hook)) {
                LOG_ERROR("Callback \"{}\" has a mismatched signature", name);
                throw configuration_error("Callback \"" + name + "\" has a mismatched signature");
            }
            field = std::get<callback_t>(hook);
        };

        if (name == NAME_STARTED) expect(callbacks.started);
        else if (name == NAME_BYTES_SENT) expect(callbacks.bytes_sent);
        else if (name == NAME_COMPLETE) expect(callbacks.complete);
        else if (name == NAME_ABORTED) expect(callbacks.aborted);
        else if (name == NAME_ERROR) expect(callbacks.error);
        else if (name == NAME_CLEANUP) expect(callbacks.cleanup);
        else PANIC_TERMINATE("BUG: recognized callback {} is not mapped", name);
    }

    return callbacks;
}



//==============================================================================
// class lifecycle_notifier
//==============================================================================

void fsend::lifecycle_notifier::started()
{
    ASSERT(!_started_fired, "started must fire only once");
    _started_fired = true;

    if (_callbacks.started) {
        _callbacks.started(0);
    }
}

void fsend::lifecycle_notifier::bytes_sent(const uint64_t chunk_bytes, const uint64_t total_bytes)
{
    ASSERT(_started_fired && !_terminal_fired);

    if (_callbacks.bytes_sent) {
        _callbacks.bytes_sent(chunk_bytes, total_bytes);
    }
}

std::exception_ptr fsend::lifecycle_notifier::complete(const uint64_t total_bytes) noexcept
{
    ASSERT(!_terminal_fired, "complete/aborted must fire only once");
    _terminal_fired = true;

    return invoke_guarded(lifecycle_callbacks::NAME_COMPLETE, _callbacks.complete, total_bytes);
}

std::exception_ptr fsend::lifecycle_notifier::abort(const transfer_failure& failure) noexcept
{
    ASSERT(!_terminal_fired, "complete/aborted must fire only once");
    _terminal_fired = true;

    std::exception_ptr callback_failure = invoke_guarded(lifecycle_callbacks::NAME_ABORTED, _callbacks.aborted, failure);
    if (failure.is_disconnect()) {
        return callback_failure;
    }

    std::exception_ptr error_failure = invoke_guarded(lifecycle_callbacks::NAME_ERROR, _callbacks.error, failure);
    if (failure.exception) {
        return failure.exception;
    }
    return callback_failure ? callback_failure : error_failure;
}

std::exception_ptr fsend::lifecycle_notifier::cleanup(const uint64_t total_bytes) noexcept
{
    if (_cleanup_fired) {
        return nullptr;
    }
    _cleanup_fired = true;

    return invoke_guarded(lifecycle_callbacks::NAME_CLEANUP, _callbacks.cleanup, total_bytes);
}
