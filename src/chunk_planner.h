#if !defined(_FSEND_CHUNK_PLANNER_H_INCLUDED_)
#define _FSEND_CHUNK_PLANNER_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    //
    // Splits a file into ranges no larger than the chunk ceiling.
    // The next range always starts at (file_size - remaining): exact offsets, never a read cursor,
    // so a retried or partially written range resumes at the first unsent byte.
    //
    class chunk_planner
    {
    public:
        // throws configuration_error if ceiling is 0
        explicit chunk_planner(uint64_t ceiling = transfer_defaults::CHUNK_SIZE);

        [[nodiscard]]
        std::optional<chunk_range> next(const uint64_t file_size, const uint64_t remaining) const noexcept
        {
            ASSERT(remaining <= file_size, "remaining = {}, file_size = {}", remaining, file_size);

            if (remaining == 0) {
                return std::nullopt;
            }

            chunk_range range;
            range.offset = file_size - remaining;
            range.length = (remaining < _ceiling) ? remaining : _ceiling;
            return range;
        }

        [[nodiscard]]
        uint64_t ceiling() const noexcept { return _ceiling; }

    private:
        const uint64_t _ceiling;
    };

}  // namespace fsend

#endif  // !defined(_FSEND_CHUNK_PLANNER_H_INCLUDED_)
