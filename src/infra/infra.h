#if !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)
#define _FSEND_INFRA_INFRA_H_INCLUDED_

#include "predef.h"
#include "macro.h"

#include "logging.h"
#include "assertion.h"
#include "sweeper.h"
#include "disposable.h"

#include "sighandle.h"


#endif  // !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)
