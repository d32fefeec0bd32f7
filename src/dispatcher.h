#if !defined(_FSEND_DISPATCHER_H_INCLUDED_)
#define _FSEND_DISPATCHER_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    struct runtime_capabilities
    {
    public:
        bool send_file_available = true;

        // Non-blocking sendfile is known to misbehave: use the blocking bulk copy instead
        bool force_blocking_send_file = false;

    public:
        static runtime_capabilities detect() noexcept;
    };

    //
    // Pick the fastest strategy the sink and the runtime support:
    //   zero_copy > bulk_copy > buffered_copy
    //
    [[nodiscard]]
    strategy_kind select_strategy(const sink_capabilities& sink_caps, const runtime_capabilities& runtime) noexcept;


    enum class dispatch_mode
    {
        takeover,   // the engine owns the raw connection
        each,       // buffered fallback through a chunk_consumer
    };

    const char* to_string(dispatch_mode mode) noexcept;

    // "takeover" or "each"; nullopt for anything else
    std::optional<dispatch_mode> parse_dispatch_mode(const std::string& name) noexcept;

    struct dispatch_environment
    {
    public:
        bool takeover_supported = false;
        bool takeover_via_pipe = false;     // takeover is emulated by copying through a pipe
        std::optional<dispatch_mode> requested { };

    public:
        // Anything with a kernel-assisted path can be taken over
        static dispatch_environment from_sink(const sink_capabilities& sink_caps, std::optional<dispatch_mode> requested) noexcept;
    };

    [[nodiscard]]
    dispatch_mode decide_dispatch(const dispatch_environment& env) noexcept;


    //
    // Entry point of the engine
    //
    class dispatcher
    {
    public:
        // throws configuration_error if options are invalid
        explicit dispatcher(transfer_options options, runtime_capabilities runtime = runtime_capabilities::detect());

        // Select a strategy once for out, then run one transfer_session over it
        uint64_t dispatch(file_source& source, sink& out, lifecycle_callbacks callbacks);

        // Decide between takeover and the buffered fallback, then send.
        // out is closed when this returns, in both modes.
        uint64_t serve(file_source& source, sink& out, lifecycle_callbacks callbacks, std::optional<dispatch_mode> requested);

        [[nodiscard]]
        const transfer_options& options() const noexcept { return _options; }

        [[nodiscard]]
        const runtime_capabilities& runtime() const noexcept { return _runtime; }

    private:
        const transfer_options _options;
        const runtime_capabilities _runtime;
    };

}  // namespace fsend

#endif  // !defined(_FSEND_DISPATCHER_H_INCLUDED_)
