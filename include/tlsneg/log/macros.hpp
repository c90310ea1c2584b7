#pragma once

#include "logger.hpp"

/// Logging macros with file and line information

#ifdef TLSNEG_DEBUG
    #define TLSNEG_LOG_DEBUG(fmt, ...) \
        ::tlsneg::log::logger::instance().log( \
            ::tlsneg::log::level::debug, \
            __FILE__, __LINE__, \
            fmt __VA_OPT__(,) __VA_ARGS__ \
        )
#else
    #define TLSNEG_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define TLSNEG_LOG_INFO(fmt, ...) \
    ::tlsneg::log::logger::instance().log( \
        ::tlsneg::log::level::info, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define TLSNEG_LOG_WARNING(fmt, ...) \
    ::tlsneg::log::logger::instance().log( \
        ::tlsneg::log::level::warning, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

#define TLSNEG_LOG_ERROR(fmt, ...) \
    ::tlsneg::log::logger::instance().log( \
        ::tlsneg::log::level::error, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

/// Failure record tagged with a reason name, e.g.
/// TLSNEG_LOG_FAILURE(warning, failure_reason_name(r), "handshake failed: {}", detail)
#define TLSNEG_LOG_FAILURE(lvl, reason, fmt, ...) \
    ::tlsneg::log::logger::instance().log_failure( \
        ::tlsneg::log::level::lvl, reason, \
        __FILE__, __LINE__, \
        fmt __VA_OPT__(,) __VA_ARGS__ \
    )

/// True when a record at this level would be emitted
#define TLSNEG_LOG_ENABLED(lvl) \
    (::tlsneg::log::logger::instance().get_level() <= ::tlsneg::log::level::lvl)
