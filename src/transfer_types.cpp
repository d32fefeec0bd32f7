#include "common.h"


const char* fsend::to_string(const failure_kind kind) noexcept
{
    switch (kind) {
        case failure_kind::peer_disconnect: return "peer_disconnect";
        case failure_kind::transient: return "transient";
        case failure_kind::application: return "application";
    }
    return "unknown";
}

fsend::failure_kind fsend::classify_errno(const int err) noexcept
{
    switch (err) {
        case EPIPE:
            return failure_kind::transient;

        case ECONNRESET:
        case ECONNABORTED:
        case ENOTCONN:
        case EPROTOTYPE:
        case ESHUTDOWN:
        case ETIMEDOUT:
            return failure_kind::peer_disconnect;

        default:
            return failure_kind::application;
    }
}


fsend::transfer_failure fsend::transfer_failure::from_exception(std::exception_ptr ex)
{
    transfer_failure failure;
    failure.exception = ex;

    try {
        std::rethrow_exception(ex);
    }
    catch (const transfer_error& err) {
        failure.kind = err.kind;
        failure.error_code = err.error_code;
        failure.message = err.error_message;
    }
    catch (const std::system_error& err) {
        failure.error_code = err.code().value();
        failure.kind = (err.code().category() == std::system_category() || err.code().category() == std::generic_category())
            ? classify_errno(failure.error_code)
            : failure_kind::application;
        failure.message = err.what();
    }
    catch (const std::exception& err) {
        failure.kind = failure_kind::application;
        failure.message = err.what();
    }
    catch (...) {
        failure.kind = failure_kind::application;
        failure.message = "unknown exception";
    }

    if (failure.kind == failure_kind::transient) {
        failure.kind = failure_kind::peer_disconnect;
    }
    return failure;
}
