/**
 * @file AgentDeckApp.hpp
 * @brief Main application class for AgentDeck.
 */

#pragma once

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace agentdeck::app {

/**
 * @class AgentDeckApp
 * @brief Orchestrates the application lifecycle: composition, the event loop, and shutdown.
 *
 * Line commands are read from stdin on a helper thread and executed on the
 * event loop. SIGINT and SIGTERM are handled synchronously by a signal thread.
 */
class AgentDeckApp {
public:
    AgentDeckApp();
    ~AgentDeckApp();

    /**
     * @brief Parses arguments, initializes services and runs until quit or a signal.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

private:
    struct InputBridge;

    bool ParseArguments(int argc, char** argv);
    bool Init();
    void Shutdown();

    void ConnectEvents();
    void StartSignalThread();
    void StartInputThread();
    void RequestQuit();

    void HandleCommand(const std::string& line);
    void CommandNew(const std::vector<std::string>& args);
    void CommandWrite(const std::vector<std::string>& args, const std::string& line);
    void CommandAttach(const std::vector<std::string>& args);
    void CommandLogin(const std::vector<std::string>& args);
    void CommandAutoSwitch(const std::vector<std::string>& args);
    void PrintHelp() const;
    void PrintSessions() const;
    void PrintProfiles() const;
    void PrintUsage() const;
    void PrintDates();

    /** @brief Respawns the sessions saved for @p date under their profiles' credentials. */
    void RestoreSessions(const std::string& date);

    /** @brief Interrupts the agent in a session and relaunches it under @p profile. */
    void RelaunchSession(const std::string& sessionId, const domain::Profile& profile);

    /** @brief Accepts a full session id or a unique prefix of one. */
    std::optional<std::string> ResolveSession(const std::string& idOrPrefix) const;

    infrastructure::AppConfig m_config;                ///< settings.json contents.
    std::string m_configDir;                           ///< Directory holding settings.json.
    std::optional<std::string> m_restoreDate;          ///< --restore argument.
    application::AppServices m_services;               ///< Composition root.
    std::vector<application::Subscription> m_subscriptions;
    std::map<std::string, application::Subscription> m_scans; ///< Output scanner attachment per session.
    application::Subscription m_attached;              ///< Output echo of the attached session.
    std::string m_attachedId;
    std::shared_ptr<InputBridge> m_input;              ///< Shared with the detached stdin reader.
    std::thread m_signalThread;
    std::atomic<bool> m_shuttingDown{false};
    bool m_initialized = false;
};

} // namespace agentdeck::app
