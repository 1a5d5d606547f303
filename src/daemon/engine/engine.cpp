//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "btmux/core/central.hpp"
#include "btmux/core/subscriber.hpp"
#include "btmux/core/types.hpp"
#include "config.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace btmux
{
namespace daemon
{
namespace engine
{
namespace
{

/// Mirrors core decisions into the engine log.
///
class LoggingSubscriber final : public core::Subscriber
{
public:
    explicit LoggingSubscriber(common::LoggerPtr logger)
        : logger_{std::move(logger)}
    {
    }

    void onSightingUpdated(const core::DeviceId& device, const core::DeviceRecord& chosen_record) override
    {
        logger_->debug("Device '{}' via '{}' (strength={}dBm, connectable={}).",
                       device,
                       chosen_record.observer,
                       chosen_record.strength,
                       chosen_record.connectable);
    }

    void onUnavailable(const core::DeviceId& device) override
    {
        logger_->info("Device '{}' is gone.", device);
    }

    void onObserverChanged(const core::ObserverId& observer, const core::ObserverEvent event) override
    {
        switch (event)
        {
        case core::ObserverEvent::Added:
            logger_->info("Observer '{}' is online.", observer);
            break;
        case core::ObserverEvent::Updated:
            logger_->info("Observer '{}' has updated its capabilities.", observer);
            break;
        case core::ObserverEvent::Removed:
            logger_->info("Observer '{}' is offline.", observer);
            break;
        case core::ObserverEvent::Quiet:
            logger_->warn("Observer '{}' stopped reporting sightings.", observer);
            break;
        case core::ObserverEvent::Resumed:
            logger_->info("Observer '{}' reports sightings again.", observer);
            break;
        }
    }

private:
    common::LoggerPtr logger_;

};  // LoggingSubscriber

}  // namespace

Engine::Engine(Config::Ptr config)
    : config_{std::move(config)}
{
}

cetl::optional<std::string> Engine::init()
{
    logger_->trace("Initializing engine...");

    // 1. Create the core with the configured parameters, driven by the executor clock.
    //
    central_ = core::Central::make(config_->getCoreParams(), [this] { return executor_.now(); });
    if (central_ == nullptr)
    {
        std::string msg = "Failed to create the core.";
        logger_->error(msg);
        return msg;
    }

    // 2. Mirror decisions into the log.
    //
    (void) central_->subscribe(std::make_shared<LoggingSubscriber>(logger_), core::SubscriptionFilter{});

    // 3. Register statically configured observers.
    //
    for (const auto& observer : config_->getObservers())
    {
        logger_->debug("Registering configured observer '{}'...", observer.id);
        central_->registerObserver(observer.id, observer.capabilities);
    }

    // 4. Schedule periodic maintenance.
    //
    const auto interval = config_->getMaintenanceInterval();
    if (interval <= libcyphal::Duration::zero())
    {
        std::string msg = "Maintenance interval must be positive.";
        logger_->error(msg);
        return msg;
    }
    maintenance_cb_ = executor_.registerCallback([this](const auto&) {
        //
        maintain();
    });
    const auto is_scheduled = maintenance_cb_.schedule(
        libcyphal::IExecutor::Callback::Schedule::Repeat{executor_.now() + interval, interval});
    if (!is_scheduled)
    {
        std::string msg = "Failed to schedule maintenance.";
        logger_->error(msg);
        return msg;
    }

    logger_->debug("Engine is initialized (maintenance_interval={}ms).",
                   std::chrono::duration_cast<std::chrono::milliseconds>(interval).count());
    return cetl::nullopt;
}

void Engine::runWhile(const std::function<bool()>& loop_predicate)
{
    using std::chrono_literals::operator""s;

    libcyphal::Duration worst_lateness{0};
    while (loop_predicate())
    {
        const auto spin_result = executor_.spinOnce();
        worst_lateness         = std::max(worst_lateness, spin_result.worst_lateness);

        // Sleep until the next callback but awake at least once per second.
        libcyphal::Duration timeout{1s};
        if (spin_result.next_exec_time.has_value())
        {
            timeout = std::min(timeout, spin_result.next_exec_time.value() - executor_.now());
        }
        if (timeout > libcyphal::Duration::zero())
        {
            std::this_thread::sleep_for(timeout);
        }
    }
    spdlog::debug("Run loop predicate is fulfilled (worst_lateness={}us).",
                  std::chrono::duration_cast<std::chrono::microseconds>(worst_lateness).count());
}

void Engine::maintain()
{
    const auto pruned  = central_->pruneStale();
    const auto expired = central_->expireTimers();
    const auto quiet   = central_->checkWatchdog();
    const auto sent    = central_->dispatchPending();

    if ((pruned + expired + quiet.size() + sent) > 0)
    {
        logger_->trace("Maintenance (pruned={}, expired={}, quiet={}, dispatched={}).",
                       pruned,
                       expired,
                       quiet.size(),
                       sent);
    }
}

}  // namespace engine
}  // namespace daemon
}  // namespace btmux
