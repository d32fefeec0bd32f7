#if !defined(_FSEND_INFRA_MACRO_H_INCLUDED_)
#define _FSEND_INFRA_MACRO_H_INCLUDED_

#if !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)


// Non-copyable and non-movable classes spell it out with these
#define FSEND_DISABLE_COPY_CONSTRUCTOR(_Class_) \
    _Class_(const _Class_&) = delete; \
    _Class_& operator =(const _Class_&) = delete;

#define FSEND_DISABLE_MOVE_CONSTRUCTOR(_Class_) \
    _Class_(_Class_&&) = delete; \
    _Class_& operator =(_Class_&&) = delete;


// Throw std::system_error for a failed libc call, e.g. THROW_SYSTEM_ERROR(errno, sigaction)
#define THROW_SYSTEM_ERROR(_Errno_, _Function_) \
    throw std::system_error((_Errno_), std::system_category(), #_Function_ "() failed")


// Stringify the expansion of a macro (version and git information)
#define FSEND_STRINGIFY_IMPL(_X_)   #_X_
#define TEXTIFY(_X_)                FSEND_STRINGIFY_IMPL(_X_)


#endif  // !defined(_FSEND_INFRA_MACRO_H_INCLUDED_)
