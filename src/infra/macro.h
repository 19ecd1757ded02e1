#if !defined(_LACQ_INFRA_MACRO_H_INCLUDED_)
#define _LACQ_INFRA_MACRO_H_INCLUDED_

#if !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)


//
// Macros for defaulted/disabled copy/move constructor
//
#define LACQ_DISABLE_COPY_CONSTRUCTOR(_Class_) \
    _Class_(const _Class_&) = delete; \
    _Class_& operator =(const _Class_&) = delete;

#define LACQ_DISABLE_MOVE_CONSTRUCTOR(_Class_) \
    _Class_(_Class_&&) = delete; \
    _Class_& operator =(_Class_&&) = delete;

#define LACQ_DEFAULT_COPY_CONSTRUCTOR(_Class_) \
    _Class_(const _Class_&) = default; \
    _Class_& operator =(const _Class_&) = default;

#define LACQ_DEFAULT_MOVE_CONSTRUCTOR(_Class_) \
    _Class_(_Class_&&) noexcept = default; \
    _Class_& operator =(_Class_&&) noexcept = default;


//
// Serialization
// Arguments should be wrapped by CEREAL_NVP() so that JSON archives get named fields
//
#define LACQ_DEFAULT_SERIALIZATION(...) \
    friend class cereal::access; \
    \
    template<typename Archive> \
    void serialize(Archive& ar) \
    { \
        ar(__VA_ARGS__); \
    }


//
// Errors
//
#define THROW_SYSTEM_ERROR(_Errno_, _What_) \
    throw std::system_error(std::error_code((_Errno_), std::system_category()), #_What_)


//
// Helper macros
//
#define JUST(...)       __VA_ARGS__

#define __TEXTIFY(_X_)  #_X_
#define TEXTIFY(_X_)    __TEXTIFY(_X_)


#endif  // !defined(_LACQ_INFRA_MACRO_H_INCLUDED_)
