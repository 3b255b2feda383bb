/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <spdlog/spdlog.h>

// fmt style logging, e.g. GNOIGEN_INFO("writing file: {}", path);
#define GNOIGEN_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define GNOIGEN_INFO(...) spdlog::info(__VA_ARGS__)
#define GNOIGEN_WARNING(...) spdlog::warn(__VA_ARGS__)
#define GNOIGEN_ERROR(...) spdlog::error(__VA_ARGS__)

namespace gnoigen
{
    // installs the console logger, debug level when verbose
    void init_logging(bool verbose);
}
