#include "infra.h"

namespace
{
    //
    // Logging must be up before any other static object logs, and go down last
    //
    struct logging_lifetime
    {
        FSEND_DISABLE_COPY_CONSTRUCTOR(logging_lifetime)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(logging_lifetime)

        logging_lifetime() { infra::global_initialize_logging(); }
        ~logging_lifetime() noexcept { infra::global_finalize_logging(); }
    };

    [[maybe_unused]]
    const logging_lifetime g_logging_lifetime;  // NOLINT(cert-err58-cpp)

}  // namespace
