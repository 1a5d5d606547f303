//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_DAEMON_ENGINE_HPP_INCLUDED
#define BTMUX_DAEMON_ENGINE_HPP_INCLUDED

#include "btmux/core/central.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "platform/steady_executor.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <functional>
#include <string>

namespace btmux
{
namespace daemon
{
namespace engine
{

class Engine
{
public:
    explicit Engine(Config::Ptr config);

    CETL_NODISCARD cetl::optional<std::string> init();
    void                                       runWhile(const std::function<bool()>& loop_predicate);

    /// Entry point for sighting sources. Valid after successful `init`.
    ///
    core::Central& central() const
    {
        CETL_DEBUG_ASSERT(central_, "");
        return *central_;
    }

private:
    void maintain();

    Config::Ptr                         config_;
    common::LoggerPtr                   logger_{common::getLogger("engine")};
    platform::SteadyExecutor            executor_;
    core::Central::Ptr                  central_;
    libcyphal::IExecutor::Callback::Any maintenance_cb_;

};  // Engine

}  // namespace engine
}  // namespace daemon
}  // namespace btmux

#endif  // BTMUX_DAEMON_ENGINE_HPP_INCLUDED
