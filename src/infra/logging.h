#if !defined(_FSEND_INFRA_LOGGING_H_INCLUDED_)
#define _FSEND_INFRA_LOGGING_H_INCLUDED_

#if !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)


namespace infra
{
    namespace details
    {
        constexpr const char LOGGER_NAME[] = "fsend";

        // Process-wide; created by global_initialize_logging() before main()
        inline std::shared_ptr<spdlog::logger> g_logger { nullptr };
    }  // namespace details


    // All engine logs go to stderr: stdout may be the data sink
    inline void global_initialize_logging()
    {
        if (details::g_logger) {
            return;
        }

        try {
            std::shared_ptr<spdlog::logger> logger = spdlog::get(details::LOGGER_NAME);
            if (!logger) {
                logger = spdlog::stderr_color_mt(details::LOGGER_NAME);
            }
            logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%t] %^%-5l%$ %v  <%s:%#>");
            logger->set_level(spdlog::level::info);
            logger->flush_on(spdlog::level::warn);
            details::g_logger = std::move(logger);
        }
        catch (const spdlog::spdlog_ex& ex) {
            fprintf(stderr, "Can't create logger: %s\n", ex.what());
            throw;
        }
    }

    inline void global_finalize_logging() noexcept
    {
        if (!details::g_logger) {
            return;
        }
        details::g_logger->flush();
        details::g_logger = nullptr;
        spdlog::drop(details::LOGGER_NAME);
    }

    // 0 is info; each -v goes one level down to trace, each -q one level up to error
    inline void set_logging_verbosity(const int verbosity)
    {
        static constexpr const spdlog::level::level_enum LEVELS[] = {
            spdlog::level::trace,   // +2
            spdlog::level::debug,   // +1
            spdlog::level::info,    //  0
            spdlog::level::warn,    // -1
            spdlog::level::err,     // -2
        };
        const int index = std::clamp(2 - verbosity, 0, static_cast<int>(std::size(LEVELS)) - 1);
        details::g_logger->set_level(LEVELS[index]);
    }

    // "Broken pipe (errno 32)"
    inline std::string errno_description(const int err)
    {
        return fmt::format("{} (errno {})", std::strerror(err), err);
    }

}  // namespace infra


#define LOG_ERROR(...)      SPDLOG_LOGGER_ERROR(::infra::details::g_logger, __VA_ARGS__)
#define LOG_WARN(...)       SPDLOG_LOGGER_WARN(::infra::details::g_logger, __VA_ARGS__)
#define LOG_INFO(...)       SPDLOG_LOGGER_INFO(::infra::details::g_logger, __VA_ARGS__)
#define LOG_DEBUG(...)      SPDLOG_LOGGER_DEBUG(::infra::details::g_logger, __VA_ARGS__)
#define LOG_TRACE(...)      SPDLOG_LOGGER_TRACE(::infra::details::g_logger, __VA_ARGS__)


#endif  // !defined(_FSEND_INFRA_LOGGING_H_INCLUDED_)
