#if !defined(_FSEND_TRANSFER_STRATEGY_H_INCLUDED_)
#define _FSEND_TRANSFER_STRATEGY_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    enum class strategy_kind
    {
        zero_copy,      // non-blocking sendfile()
        bulk_copy,      // blocking splice() through a pipe
        buffered_copy,  // pread() + write()
    };

    const char* to_string(strategy_kind kind) noexcept;


    //
    // Moves one chunk_range of a file into a sink.
    //
    // All strategies may write less than range.length. A failure is only reported when the call
    // made no progress at all; otherwise the bytes written are reported and the failure shows up
    // again on the next call for the remainder.
    //
    class transfer_strategy
    {
    public:
        virtual ~transfer_strategy() noexcept = default;

        [[nodiscard]]
        virtual strategy_kind kind() const noexcept = 0;

        virtual transfer_result transfer(const file_item& file, const chunk_range& range, sink& out) = 0;
    };


    class zero_copy_strategy final : public transfer_strategy
    {
    public:
        [[nodiscard]]
        strategy_kind kind() const noexcept override { return strategy_kind::zero_copy; }

        transfer_result transfer(const file_item& file, const chunk_range& range, sink& out) override;
    };


    class bulk_copy_strategy final : public transfer_strategy
    {
    public:
        [[nodiscard]]
        strategy_kind kind() const noexcept override { return strategy_kind::bulk_copy; }

        transfer_result transfer(const file_item& file, const chunk_range& range, sink& out) override;
    };


    class buffered_copy_strategy final : public transfer_strategy
    {
    public:
        explicit buffered_copy_strategy(size_t buffer_size = transfer_defaults::BUFFER_SIZE);

        [[nodiscard]]
        strategy_kind kind() const noexcept override { return strategy_kind::buffered_copy; }

        transfer_result transfer(const file_item& file, const chunk_range& range, sink& out) override;

    private:
        std::unique_ptr<char[]> _buffer;
        const size_t _buffer_size;
    };


    std::unique_ptr<transfer_strategy> make_transfer_strategy(strategy_kind kind, const transfer_options& options);

}  // namespace fsend

#endif  // !defined(_FSEND_TRANSFER_STRATEGY_H_INCLUDED_)
