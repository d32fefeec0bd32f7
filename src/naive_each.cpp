#include "common.h"


fsend::naive_each::naive_each(file_source& source, lifecycle_callbacks callbacks, const size_t buffer_size)
    : _source(source),
      _notifier(std::move(callbacks)),
      _buffer_size(buffer_size)
{
    if (_buffer_size == 0) {
        LOG_ERROR("naive_each: buffer size must not be 0");
        throw configuration_error("buffer_size must be at least 1");
    }
    _buffer.reset(new char[_buffer_size]);
}


uint64_t fsend::naive_each::each(const chunk_consumer& consumer)
{
    ASSERT(!_each_called, "naive_each::each() may be called only once");
    _each_called = true;

    LOG_WARN("Connection can't be taken over: sending through {} byte buffers", _buffer_size);

    std::exception_ptr terminal_failure = nullptr;
    std::exception_ptr cleanup_failure = nullptr;

    infra::sweeper finalizer = [&]() {
        cleanup_failure = _notifier.cleanup(_bytes_written_total);
    };

    try {
        _notifier.started();

        _source.each_file([&](const file_item& file) {
            this->read_file(file, consumer);
        });

        _outcome = session_outcome::completed;
        LOG_INFO("Transfer complete: {} bytes written in full", _bytes_written_total);
        terminal_failure = _notifier.complete(_bytes_written_total);
    }
    catch (...) {
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


void fsend::naive_each::read_file(const file_item& file, const chunk_consumer& consumer)
{
    LOG_DEBUG("Reading {} ({} bytes)", file.path, file.size);

    // Read until end of file, whatever size was reported
    uint64_t offset = 0;
    while (true) {
        const ssize_t got = pread64(file.file_handle, _buffer.get(), _buffer_size, (off64_t)offset);
        if (got < 0) {
            const int err = errno;
            if (err == EINTR) continue;
            LOG_ERROR("pread(offset={}) of {} failed. {}", offset, file.path, infra::errno_description(err));
            throw transfer_error(failure_kind::application, err, std::string("Reading ") + file.path + " failed");
        }
        if (got == 0) {
            break;
        }

        consumer(_buffer.get(), (size_t)got);

        offset += (uint64_t)got;
        _bytes_written_total += (uint64_t)got;
        _notifier.bytes_sent((uint64_t)got, _bytes_written_total);
    }

    if (offset != file.size) {
        LOG_WARN("{} had {} bytes while {} were expected", file.path, offset, file.size);
    }
}
