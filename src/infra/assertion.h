#if !defined(_LACQ_INFRA_ASSERTION_H_INCLUDED_)
#define _LACQ_INFRA_ASSERTION_H_INCLUDED_

#if !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)


// Invariant checks only: recoverable failures are reported by exceptions
#define ASSERT(_What_, ...) \
    do { \
        if (!(_What_)) { \
            JUST(LOG_ERROR("ASSERT(" #_What_ ") failed. " __VA_ARGS__)); \
            std::abort(); \
        } \
    } while(false)


#endif  // !defined(_LACQ_INFRA_ASSERTION_H_INCLUDED_)
