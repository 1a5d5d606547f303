//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_COMMON_HELPERS_HPP_INCLUDED
#define BTMUX_COMMON_HELPERS_HPP_INCLUDED

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace btmux
{
namespace common
{

/// @brief Wraps the given action into a try/catch block, and performs it without throwing the given exception type.
///
/// Used at the boundary with subscriber callbacks and forced release handlers.
///
/// @return `true` if the action was performed successfully, `false` if an exception was thrown.
///         Always `true` if exceptions are disabled.
///
template <typename Exception = std::exception, typename Action>
bool performWithoutThrowing(Action&& action) noexcept
{
#if defined(__cpp_exceptions)
    try
    {
#endif
        std::forward<Action>(action)();
        return true;

#if defined(__cpp_exceptions)
    } catch (const Exception& ex)
    {
        spdlog::critical("Unexpected C++ exception is caught: {}", ex.what());
        return false;
    }
#endif
}

}  // namespace common
}  // namespace btmux

#endif  // BTMUX_COMMON_HELPERS_HPP_INCLUDED
