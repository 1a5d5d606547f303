//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_COMMON_LOGGING_HPP_INCLUDED
#define BTMUX_COMMON_LOGGING_HPP_INCLUDED

#include "common_helpers.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace btmux
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    performWithoutThrowing([&logger] {
        //
        spdlog::register_logger(logger);
    });

    return logger;
}

}  // namespace common
}  // namespace btmux

#endif  // BTMUX_COMMON_LOGGING_HPP_INCLUDED
