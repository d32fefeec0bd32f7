#include "common.h"


fsend::chunk_planner::chunk_planner(const uint64_t ceiling)
    : _ceiling(ceiling)
{
    if (_ceiling == 0) {
        LOG_ERROR("chunk_planner: chunk ceiling must not be 0");
        throw configuration_error("chunk ceiling must not be 0");
    }
}
