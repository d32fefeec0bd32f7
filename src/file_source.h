#if !defined(_FSEND_FILE_SOURCE_H_INCLUDED_)
#define _FSEND_FILE_SOURCE_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    //
    // A readable, seekable file handle of known size.
    // Owned by the file_source; the engine only reads through it while the source's callback runs.
    //
    struct file_item
    {
        int file_handle = -1;
        uint64_t size = 0;
        std::string path { };
    };


    //
    // Produces file_items strictly in order, one at a time.
    // The source opens and closes every handle; it may throw to abort the transfer.
    //
    class file_source
    {
    public:
        virtual ~file_source() noexcept = default;

        virtual void each_file(const std::function<void(const file_item&)>& fn) = 0;
    };


    //
    // Opens a list of paths one after another
    //
    class path_file_source final : public file_source
    {
    public:
        explicit path_file_source(std::vector<std::string> paths) noexcept
            : _paths(std::move(paths))
        { }

        // throws transfer_error if a file can't be opened or stat'ed
        void each_file(const std::function<void(const file_item&)>& fn) override;

        [[nodiscard]]
        const std::vector<std::string>& paths() const noexcept { return _paths; }

    private:
        const std::vector<std::string> _paths;
    };

}  // namespace fsend

#endif  // !defined(_FSEND_FILE_SOURCE_H_INCLUDED_)
