/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 *
 * Members are declared in dependency order so that destruction runs from the
 * top-level controller down to the event loop.
 */

#pragma once

#include <memory>
#include "application/EventLoop.hpp"
#include "application/AsyncTaskManager.hpp"
#include "application/ProfileService.hpp"
#include "application/SessionRegistry.hpp"
#include "application/OutputScanner.hpp"
#include "application/AuthService.hpp"
#include "application/UsageMonitor.hpp"
#include "application/AutoSwitchController.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SessionStoreFs.hpp"

namespace agentdeck::application {

struct AppServices {
    std::unique_ptr<EventLoop> eventLoop;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<infrastructure::SessionStoreFs> sessionStore;
    std::shared_ptr<AsyncTaskManager> taskManager;
    std::unique_ptr<ProfileService> profileService;
    std::unique_ptr<SessionRegistry> sessionRegistry;
    std::unique_ptr<OutputScanner> outputScanner;
    std::unique_ptr<AuthService> authService;
    std::unique_ptr<UsageMonitor> usageMonitor;
    std::unique_ptr<AutoSwitchController> autoSwitchController;
};

} // namespace agentdeck::application
