/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace gnoigen
{
    // exit code reported for configuration and resolution failures
    constexpr int EXIT_RESOLUTION_FAILURE = 2;

    // a required option is missing or unusable, raised before any module is processed
    class configuration_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // a typedef, prefix, grouping or leafref target could not be resolved
    class resolution_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // malformed YANG text or a module that cannot be loaded
    class parse_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };
}
