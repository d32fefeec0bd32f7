#include "common.h"


void fsend::path_file_source::each_file(const std::function<void(const file_item&)>& fn)
{
    for (const std::string& path : _paths) {
        file_item item;
        item.path = path;

        item.file_handle = open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (item.file_handle == -1) {
            const int err = errno;
            LOG_ERROR("open() {} for read failed. {}", path, infra::errno_description(err));
            throw transfer_error(failure_kind::application, err, std::string("open() ") + path + " for read failed");
        }

        const infra::sweeper close_file = [&]() {
            (void)close(item.file_handle);
        };

        struct stat64 st { };
        if (fstat64(item.file_handle, &st) != 0) {
            const int err = errno;
            LOG_ERROR("fstat64() {} failed. {}", path, infra::errno_description(err));
            throw transfer_error(failure_kind::application, err, std::string("fstat64() ") + path + " failed");
        }

        if (!S_ISREG(st.st_mode)) {
            LOG_ERROR("{} is not a regular file", path);
            throw transfer_error(failure_kind::application, EINVAL, path + " is not a regular file");
        }

        item.size = (uint64_t)st.st_size;
        LOG_TRACE("Opened {} ({} bytes)", path, item.size);

        fn(item);
    }
}
