//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
#define BTMUX_DAEMON_ENGINE_CONFIG_HPP_INCLUDED

#include "btmux/core/types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <memory>
#include <string>
#include <vector>

namespace btmux
{
namespace daemon
{
namespace engine
{

class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// Observer declared statically in the configuration file (typically local adapters).
    ///
    struct Observer
    {
        core::ObserverId           id;
        core::ObserverCapabilities capabilities;
    };

    /// Parses the TOML file at the given path.
    ///
    /// @throws std::exception if the file can't be read or is not valid TOML.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    /// Core tuning parameters. Missing keys keep their defaults.
    ///
    CETL_NODISCARD virtual auto getCoreParams() const -> core::Params                    = 0;
    CETL_NODISCARD virtual auto getObservers() const -> std::vector<Observer>            = 0;
    CETL_NODISCARD virtual auto getMaintenanceInterval() const -> core::Duration         = 0;
    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

protected:
    Config() = default;

};  // Config

}  // namespace engine
}  // namespace daemon
}  // namespace btmux

#endif  // BTMUX_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
