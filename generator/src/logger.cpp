/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <spdlog/sinks/stdout_color_sinks.h>

#include <gnoigen/logger.h>

namespace gnoigen
{
    void init_logging(bool verbose)
    {
        auto logger = spdlog::get("gnoigen");
        if (!logger)
            logger = spdlog::stderr_color_mt("gnoigen");

        logger->set_pattern("[%^%l%$] %v");
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        spdlog::set_default_logger(logger);
    }
}
