/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <spdlog/spdlog.h>

#include <peergen/internal/logger.h>

namespace peergen
{
    namespace
    {
        spdlog::level::level_enum to_spdlog(log_level level)
        {
            switch (level)
            {
            case log_level::critical:
                return spdlog::level::critical;
            case log_level::error:
                return spdlog::level::err;
            case log_level::warn:
                return spdlog::level::warn;
            case log_level::info:
                return spdlog::level::info;
            case log_level::trace:
                return spdlog::level::trace;
            case log_level::debug:
                return spdlog::level::debug;
            }
            return spdlog::level::info;
        }
    }

    void log(log_level level, const std::string& message)
    {
        spdlog::default_logger_raw()->log(to_spdlog(level), message);
    }

    void set_log_level(log_level level)
    {
        // trace is the noisiest level spdlog has, debug sits just above it
        if (level == log_level::debug)
            spdlog::set_level(spdlog::level::trace);
        else
            spdlog::set_level(to_spdlog(level));
    }
}
