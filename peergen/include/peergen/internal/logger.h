/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>

#include <fmt/format.h>

namespace peergen
{
    // numbering follows the level argument of the log sink callback
    enum class log_level
    {
        critical = 0,
        error = 1,
        warn = 2,
        info = 3,
        trace = 4,
        debug = 5
    };

    void log(log_level level, const std::string& message);

    // messages less severe than level are dropped
    void set_log_level(log_level level);
}

#define PEERGEN_LOG(level, ...) ::peergen::log(level, fmt::format(__VA_ARGS__))

#define PEERGEN_CRITICAL(...) PEERGEN_LOG(::peergen::log_level::critical, __VA_ARGS__)
#define PEERGEN_ERROR(...) PEERGEN_LOG(::peergen::log_level::error, __VA_ARGS__)
#define PEERGEN_WARN(...) PEERGEN_LOG(::peergen::log_level::warn, __VA_ARGS__)
#define PEERGEN_INFO(...) PEERGEN_LOG(::peergen::log_level::info, __VA_ARGS__)
#define PEERGEN_TRACE(...) PEERGEN_LOG(::peergen::log_level::trace, __VA_ARGS__)
#define PEERGEN_DEBUG(...) PEERGEN_LOG(::peergen::log_level::debug, __VA_ARGS__)
