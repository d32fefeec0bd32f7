#if !defined(_FSEND_COMMON_H_INCLUDED_)
#define _FSEND_COMMON_H_INCLUDED_

#include "infra/infra.h"

#include "transfer_types.h"
#include "transfer_options.h"
#include "lifecycle.h"
#include "sink.h"
#include "file_source.h"
#include "chunk_planner.h"
#include "transfer_strategy.h"
#include "timeout_guard.h"
#include "transfer_session.h"
#include "naive_each.h"
#include "dispatcher.h"
#include "listener.h"
#include "speedometer.h"

#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)
