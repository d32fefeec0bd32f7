#if !defined(_FSEND_INFRA_ASSERTION_H_INCLUDED_)
#define _FSEND_INFRA_ASSERTION_H_INCLUDED_

#if !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    namespace details
    {
        // Log (or print, if logging is gone) and abort. Only for bugs.
        [[noreturn]]
        inline void fail_fast(const char* what, const char* file, const int line, const std::string& message) noexcept
        {
            if (g_logger) {
                g_logger->critical("{} ({}:{}) {}", what, file, line, message);
                g_logger->flush();
            }
            else {
                fprintf(stderr, "%s (%s:%d) %s\n", what, file, line, message.c_str());
                fflush(stderr);
            }
            std::abort();
        }
    }  // namespace details

}  // namespace infra


// ASSERT(cond) or ASSERT(cond, "format", args...)
#define ASSERT(_What_, ...) \
    do { \
        if (!(_What_)) { \
            ::infra::details::fail_fast("ASSERT(" #_What_ ") failed", __FILE__, __LINE__, fmt::format("" __VA_ARGS__)); \
        } \
    } while (false)

#define PANIC_TERMINATE(...) \
    ::infra::details::fail_fast("PANIC!", __FILE__, __LINE__, fmt::format(__VA_ARGS__))


#endif  // !defined(_FSEND_INFRA_ASSERTION_H_INCLUDED_)
