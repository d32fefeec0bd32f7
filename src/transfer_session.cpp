#include "common.h"


const char* fsend::to_string(const session_outcome outcome) noexcept
{
    switch (outcome) {
        case session_outcome::running: return "running";
        case session_outcome::completed: return "completed";
        case session_outcome::aborted: return "aborted";
    }
    return "unknown";
}


fsend::transfer_session::transfer_session(
    file_source& source,
    sink& out,
    transfer_strategy& strategy,
    lifecycle_callbacks callbacks,
    const transfer_options& options)
    : _source(source),
      _sink(out),
      _strategy(strategy),
      _options(options),
      _notifier(std::move(callbacks)),
      _planner(options.chunk_size),
      _guard(options.poll_interval, options.dead_peer_timeout)
{
    _options.validate();
    _sink.set_stall_timeout(_options.dead_peer_timeout);
}


uint64_t fsend::transfer_session::run()
{
    ASSERT(!_run_called, "transfer_session::run() may be called only once");
    _run_called = true;

    LOG_DEBUG("Transfer session starts with strategy {}", to_string(_strategy.kind()));

    std::exception_ptr terminal_failure = nullptr;
    std::exception_ptr cleanup_failure = nullptr;

    // Single exit path: the sink is closed and cleanup fires however the code below ends
    infra::sweeper finalizer = [&]() {
        cleanup_failure = this->finalize();
    };

    try {
        _notifier.started();

        _source.each_file([&](const file_item& file) {
            this->transfer_file(file);
        });

        _outcome = session_outcome::completed;
        LOG_INFO("Transfer complete: {} bytes written in full", _bytes_written_total);
        terminal_failure = _notifier.complete(_bytes_written_total);
    }
    catch (...) {
        _current_file = nullptr;
        _outcome = session_outcome::aborted;
        _failure = transfer_failure::from_exception(std::current_exception());

        if (_failure->is_disconnect()) {
            LOG_WARN("Client closed connection after {} bytes: {}", _bytes_written_total, _failure->message);
        }
        else {
            LOG_ERROR("Transfer aborted after {} bytes: {}", _bytes_written_total, _failure->message);
        }
        terminal_failure = _notifier.abort(_failure.value());
    }

    finalizer.sweep_now();

    if (terminal_failure) {
        std::rethrow_exception(terminal_failure);
    }
    if (cleanup_failure) {
        std::rethrow_exception(cleanup_failure);
    }
    return _bytes_written_total;
}


void fsend::transfer_session::close() noexcept
{
    if (!_run_called) {
        // Never started: nothing to clean up but the sink itself
        _sink.close();
        return;
    }

    const std::exception_ptr ex = this->finalize();
    ASSERT(ex == nullptr, "cleanup must not fire again");
}


std::exception_ptr fsend::transfer_session::finalize() noexcept
{
    if (_sink.close()) {
        LOG_TRACE("Sink closed");
    }
    else {
        LOG_TRACE("Sink was already closed");
    }
    return _notifier.cleanup(_bytes_written_total);
}


void fsend::transfer_session::transfer_file(const file_item& file)
{
    LOG_DEBUG("Sending {} ({} bytes)", file.path, file.size);

    _current_file = &file;
    _remaining_in_file = file.size;
    _guard.reset();

    while (_remaining_in_file > 0) {
        const std::optional<chunk_range> range = _planner.next(file.size, _remaining_in_file);
        ASSERT(range.has_value());

        const transfer_result result = _strategy.transfer(file, range.value(), _sink);
        switch (result.status) {
            case transfer_result::status_t::written: {
                ASSERT(result.bytes <= range->length, "wrote {} of {}", result.bytes, range->length);
                if (result.bytes == 0) {
                    // No progress: same as would-block, the guard bounds how long this may go on
                    this->wait_writable();
                    break;
                }

                _bytes_written_total += result.bytes;
                _remaining_in_file -= result.bytes;
                _consecutive_transient_failures = 0;
                _guard.reset();

                _notifier.bytes_sent(result.bytes, _bytes_written_total);
                break;
            }

            case transfer_result::status_t::would_block: {
                this->wait_writable();
                break;
            }

            case transfer_result::status_t::end_of_file: {
                LOG_WARN("{} ended {} bytes short of its size {}", file.path, _remaining_in_file, file.size);
                _remaining_in_file = 0;
                break;
            }

            case transfer_result::status_t::failed: {
                if (result.kind == failure_kind::transient) {
                    this->on_transient_failure(result);
                    break;
                }
                throw transfer_error(
                    result.kind,
                    result.error_code,
                    std::string("Transfer of ") + file.path + " failed: " + infra::errno_description(result.error_code));
            }
        }
    }

    _current_file = nullptr;
    LOG_DEBUG("{} sent", file.path);
}


void fsend::transfer_session::wait_writable()
{
    switch (_guard.await_writable(_sink)) {
        case timeout_guard::await_result::ready:
            break;

        case timeout_guard::await_result::timed_out:
            throw transfer_error(
                failure_kind::peer_disconnect,
                ETIMEDOUT,
                "Sink was not writable for " + std::to_string(_guard.elapsed().count()) +
                    " ms, probably a dead slow loris");

        case timeout_guard::await_result::hang_up:
            throw transfer_error(failure_kind::peer_disconnect, ECONNRESET, "Peer hung up");
    }
}


void fsend::transfer_session::on_transient_failure(const transfer_result& result)
{
    ++_consecutive_transient_failures;
    if (_consecutive_transient_failures >= _options.max_transient_retries) {
        throw transfer_error(
            failure_kind::peer_disconnect,
            result.error_code,
            "Giving up after " + std::to_string(_consecutive_transient_failures) + " consecutive failures: " +
                infra::errno_description(result.error_code));
    }

    LOG_DEBUG("Transient failure #{}: {}. Retrying in {} ms",
              _consecutive_transient_failures,
              infra::errno_description(result.error_code),
              _options.transient_backoff.count());
    std::this_thread::sleep_for(_options.transient_backoff);
}
