//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include "btmux/core/types.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace btmux
{
namespace daemon
{
namespace engine
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    ConfigImpl(std::string file_path, TomlValue&& root)
        : file_path_{std::move(file_path)}
        , root_{std::move(root)}
    {
    }

    // Config

    auto getCoreParams() const -> core::Params override
    {
        core::Params params;

        params.hysteresis_margin =
            static_cast<core::Strength>(findOr<std::int64_t>(params.hysteresis_margin, "core", "hysteresis_margin"));
        params.dedup_strength_delta = static_cast<core::Strength>(
            findOr<std::int64_t>(params.dedup_strength_delta, "core", "dedup_strength_delta"));
        params.dedup_time_floor = findMillisOr(params.dedup_time_floor, "core", "dedup_time_floor_ms");
        params.default_availability_timeout =
            findMillisOr(params.default_availability_timeout, "core", "availability_timeout_ms");
        params.watchdog_timeout = findMillisOr(params.watchdog_timeout, "core", "watchdog_timeout_ms");
        params.notification_queue_capacity = static_cast<std::size_t>(
            findOr<std::int64_t>(static_cast<std::int64_t>(params.notification_queue_capacity),
                                 "core",
                                 "notification_queue_capacity"));
        params.shard_count = static_cast<std::size_t>(
            findOr<std::int64_t>(static_cast<std::int64_t>(params.shard_count), "core", "shard_count"));

        try
        {
            if (root_.contains("slots") && root_.at("slots").contains("capacity_overrides"))
            {
                for (const auto& id_capacity : root_.at("slots").at("capacity_overrides").as_table())
                {
                    const auto capacity = id_capacity.second.as_integer();
                    if (capacity < 0)
                    {
                        spdlog::warn("Ignoring negative capacity override (obs='{}').", id_capacity.first);
                        continue;
                    }
                    params.capacity_overrides[id_capacity.first] = static_cast<std::size_t>(capacity);
                }
            }

        } catch (const std::exception& ex)
        {
            spdlog::error("Failed to read slot capacity overrides (file='{}'). Error: {}", file_path_, ex.what());
        }

        return params;
    }

    auto getObservers() const -> std::vector<Observer> override
    {
        std::vector<Observer> observers;
        if (!root_.contains("observers"))
        {
            return observers;
        }

        try
        {
            for (const auto& item : root_.at("observers").as_array())
            {
                Observer observer;
                observer.id = toml::find<std::string>(item, "id");

                const auto max_connections = toml::find_or(item, "max_connections", std::int64_t{0});
                if (max_connections < 0)
                {
                    spdlog::warn("Ignoring observer with negative max_connections (obs='{}').", observer.id);
                    continue;
                }

                auto& caps = observer.capabilities;
                caps.kind  = (toml::find_or(item, "kind", std::string{"local"}) == "relay")
                                 ? core::ObserverKind::RemoteRelay
                                 : core::ObserverKind::LocalAdapter;
                caps.connectable     = toml::find_or(item, "connectable", false);
                caps.max_connections = static_cast<std::size_t>(max_connections);
                caps.rank            = static_cast<std::int32_t>(toml::find_or(item, "rank", std::int64_t{0}));
                caps.name            = toml::find_or(item, "name", observer.id);
                caps.adapter         = toml::find_or(item, "adapter", std::string{});
                if (item.contains("expiry_ms"))
                {
                    caps.expiry = std::chrono::milliseconds{toml::find<std::int64_t>(item, "expiry_ms")};
                }
                observers.push_back(std::move(observer));
            }

        } catch (const std::exception& ex)
        {
            spdlog::error("Failed to read observers (file='{}'). Error: {}", file_path_, ex.what());
        }
        return observers;
    }

    auto getMaintenanceInterval() const -> core::Duration override
    {
        constexpr core::Duration default_interval{std::chrono::seconds{1}};
        return findMillisOr(default_interval, "maintenance", "interval_ms");
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception& ex)
        {
            (void) ex;
            return cetl::nullopt;
        }
    }

    template <typename T, typename... Keys>
    T findOr(const T default_value, Keys&&... keys) const
    {
        return findImpl<T>(std::forward<Keys>(keys)...).value_or(default_value);
    }

    template <typename... Keys>
    core::Duration findMillisOr(const core::Duration default_value, Keys&&... keys) const
    {
        if (const auto millis = findImpl<std::int64_t>(std::forward<Keys>(keys)...))
        {
            return std::chrono::milliseconds{millis.value()};
        }
        return default_value;
    }

    std::string file_path_;
    TomlValue   root_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(file_path), std::move(root));
}

}  // namespace engine
}  // namespace daemon
}  // namespace btmux
