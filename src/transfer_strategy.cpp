#include "common.h"

namespace fsend
{
    const char* to_string(const strategy_kind kind) noexcept
    {
        switch (kind) {
            case strategy_kind::zero_copy: return "zero_copy";
            case strategy_kind::bulk_copy: return "bulk_copy";
            case strategy_kind::buffered_copy: return "buffered_copy";
        }
        return "unknown";
    }


    //--------------------------------------------------------------------------
    // class zero_copy_strategy
    //--------------------------------------------------------------------------
    transfer_result zero_copy_strategy::transfer(const file_item& file, const chunk_range& range, sink& out)
    {
        ASSERT(range.length > 0);

        // Use the exact offset: never trust the file's own read cursor
        const io_result result = out.try_send_file(file.file_handle, range.offset, range.length);
        if (result.ok()) {
            if (result.bytes == 0) {
                return transfer_result::end_of_file();
            }
            ASSERT((uint64_t)result.bytes <= range.length, "sent {} of {}", result.bytes, range.length);
            return transfer_result::written((uint64_t)result.bytes);
        }

        if (result.error_code == EAGAIN || result.error_code == EINTR) {
            return transfer_result::would_block();
        }

        LOG_DEBUG("sendfile(offset={}, len={}) of {} failed. {}",
                  range.offset, range.length, file.path, infra::errno_description(result.error_code));
        return transfer_result::failed(result.error_code);
    }


    //--------------------------------------------------------------------------
    // class bulk_copy_strategy
    //--------------------------------------------------------------------------
    transfer_result bulk_copy_strategy::transfer(const file_item& file, const chunk_range& range, sink& out)
    {
        ASSERT(range.length > 0);

        const io_result result = out.bulk_copy(file.file_handle, range.offset, range.length);
        if (result.ok()) {
            if (result.bytes == 0) {
                return transfer_result::end_of_file();
            }
            ASSERT((uint64_t)result.bytes <= range.length, "copied {} of {}", result.bytes, range.length);
            return transfer_result::written((uint64_t)result.bytes);
        }

        if (result.error_code == EINTR) {
            return transfer_result::written(0);
        }

        LOG_DEBUG("bulk copy(offset={}, len={}) of {} failed. {}",
                  range.offset, range.length, file.path, infra::errno_description(result.error_code));
        return transfer_result::failed(result.error_code);
    }


    //--------------------------------------------------------------------------
    // class buffered_copy_strategy
    //--------------------------------------------------------------------------
    buffered_copy_strategy::buffered_copy_strategy(const size_t buffer_size)
        : _buffer(new char[buffer_size]),
          _buffer_size(buffer_size)
    {
        ASSERT(buffer_size > 0);
    }

    transfer_result buffered_copy_strategy::transfer(const file_item& file, const chunk_range& range, sink& out)
    {
        ASSERT(range.length > 0);

        uint64_t done = 0;
        while (done < range.length) {
            const size_t want = (size_t)std::min<uint64_t>(range.length - done, _buffer_size);
            const ssize_t got = pread64(file.file_handle, _buffer.get(), want, (off64_t)(range.offset + done));
            if (got < 0) {
                const int err = errno;
                if (err == EINTR) continue;
                LOG_ERROR("pread(offset={}, len={}) of {} failed. {}",
                          range.offset + done, want, file.path, infra::errno_description(err));
                if (done > 0) break;
                return transfer_result::failed(err);
            }
            if (got == 0) {
                break;  // end of file
            }

            size_t flushed = 0;
            while (flushed < (size_t)got) {
                const io_result result = out.write(_buffer.get() + flushed, (size_t)got - flushed);
                if (!result.ok()) {
                    if (result.error_code == EINTR) continue;

                    // Bytes read but not written are read again on the next call
                    done += flushed;
                    if (done > 0) {
                        return transfer_result::written(done);
                    }
                    return transfer_result::failed(result.error_code);
                }
                flushed += (size_t)result.bytes;
            }
            done += flushed;
        }

        if (done == 0) {
            return transfer_result::end_of_file();
        }
        return transfer_result::written(done);
    }


    std::unique_ptr<transfer_strategy> make_transfer_strategy(const strategy_kind kind, const transfer_options& options)
    {
        switch (kind) {
            case strategy_kind::zero_copy:
                return std::make_unique<zero_copy_strategy>();
            case strategy_kind::bulk_copy:
                return std::make_unique<bulk_copy_strategy>();
            case strategy_kind::buffered_copy:
                return std::make_unique<buffered_copy_strategy>(options.buffer_size);
        }
        PANIC_TERMINATE("BUG: Unknown strategy kind: {}", (int)kind);
    }

}  // namespace fsend
