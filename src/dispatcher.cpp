#include "common.h"


fsend::runtime_capabilities fsend::runtime_capabilities::detect() noexcept
{
    runtime_capabilities runtime;
#if PLATFORM_LINUX
    runtime.send_file_available = true;
    runtime.force_blocking_send_file = false;
#else
#   error "Unknown platform"
#endif
    return runtime;
}


fsend::strategy_kind fsend::select_strategy(const sink_capabilities& sink_caps, const runtime_capabilities& runtime) noexcept
{
    if (runtime.send_file_available && sink_caps.file_range_transfer) {
        if (!runtime.force_blocking_send_file) {
            return strategy_kind::zero_copy;
        }
        return strategy_kind::bulk_copy;
    }

    if (sink_caps.bulk_file_copy) {
        return strategy_kind::bulk_copy;
    }

    return strategy_kind::buffered_copy;
}


const char* fsend::to_string(const dispatch_mode mode) noexcept
{
    switch (mode) {
        case dispatch_mode::takeover: return "takeover";
        case dispatch_mode::each: return "each";
    }
    return "unknown";
}

std::optional<fsend::dispatch_mode> fsend::parse_dispatch_mode(const std::string& name) noexcept
{
    if (name == "takeover") return dispatch_mode::takeover;
    if (name == "each") return dispatch_mode::each;
    return std::nullopt;
}


fsend::dispatch_environment fsend::dispatch_environment::from_sink(
    const sink_capabilities& sink_caps,
    std::optional<dispatch_mode> requested) noexcept
{
    dispatch_environment env;
    env.takeover_supported = sink_caps.file_range_transfer || sink_caps.bulk_file_copy;
    env.takeover_via_pipe = false;
    env.requested = requested;
    return env;
}

fsend::dispatch_mode fsend::decide_dispatch(const dispatch_environment& env) noexcept
{
    if (env.requested.has_value()) {
        return env.requested.value();
    }

    if (!env.takeover_supported || env.takeover_via_pipe) {
        return dispatch_mode::each;
    }
    return dispatch_mode::takeover;
}



//==============================================================================
// class dispatcher
//==============================================================================

fsend::dispatcher::dispatcher(transfer_options options, const runtime_capabilities runtime)
    : _options(std::move(options)),
      _runtime(runtime)
{
    _options.validate();
}

uint64_t fsend::dispatcher::dispatch(file_source& source, sink& out, lifecycle_callbacks callbacks)
{
    const strategy_kind kind = select_strategy(out.capabilities(), _runtime);
    LOG_DEBUG("Will do file-to-sink using {}", to_string(kind));

    const std::unique_ptr<transfer_strategy> strategy = make_transfer_strategy(kind, _options);
    transfer_session session(source, out, *strategy, std::move(callbacks), _options);
    return session.run();
}

uint64_t fsend::dispatcher::serve(
    file_source& source,
    sink& out,
    lifecycle_callbacks callbacks,
    const std::optional<dispatch_mode> requested)
{
    const dispatch_mode mode = decide_dispatch(dispatch_environment::from_sink(out.capabilities(), requested));
    LOG_DEBUG("Dispatch: {}", to_string(mode));

    if (mode == dispatch_mode::takeover) {
        return this->dispatch(source, out, std::move(callbacks));
    }

    const infra::sweeper close_sink = [&]() {
        out.close();
    };
    out.set_stall_timeout(_options.dead_peer_timeout);

    naive_each fallback(source, std::move(callbacks), _options.buffer_size);
    return fallback.each([&](const char* data, const size_t size) {
        size_t done = 0;
        while (done < size) {
            const io_result result = out.write(data + done, size - done);
            if (!result.ok()) {
                if (result.error_code == EINTR) continue;
                throw transfer_error(
                    classify_errno(result.error_code),
                    result.error_code,
                    "Write to sink failed: " + infra::errno_description(result.error_code));
            }
            done += (size_t)result.bytes;
        }
    });
}
