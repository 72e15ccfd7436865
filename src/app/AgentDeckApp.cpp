/**
 * @file AgentDeckApp.cpp
 * @brief Implementation of the AgentDeckApp class.
 */
#include "app/AgentDeckApp.hpp"

#include "domain/AgentCommand.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/CredentialInspector.hpp"
#include "infrastructure/ForkPtyLauncher.hpp"
#include "infrastructure/HttpUsageSource.hpp"
#include "infrastructure/JsonProfileRepository.hpp"
#include "infrastructure/PathUtils.hpp"

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace agentdeck::app {

namespace fs = std::filesystem;

namespace {

constexpr auto kInterruptSettle = std::chrono::milliseconds(100);
constexpr auto kExitSettle = std::chrono::milliseconds(1000);

std::vector<std::string> SplitWords(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

// Text after the first @p count words of @p line.
std::string RestAfterWords(const std::string& line, std::size_t count) {
    std::size_t pos = 0;
    for (std::size_t i = 0; i < count; ++i) {
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) {
            return {};
        }
        pos = line.find_first_of(" \t", pos);
        if (pos == std::string::npos) {
            return {};
        }
    }
    return line.substr(pos + 1);
}

std::string ShortId(const std::string& id) {
    return id.substr(0, 8);
}

sigset_t HandledSignals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

} // namespace

/**
 * @struct AgentDeckApp::InputBridge
 * @brief Lets the detached stdin reader post into the loop only while the app is alive.
 */
struct AgentDeckApp::InputBridge {
    std::mutex mutex;
    application::EventLoop* loop = nullptr;
    AgentDeckApp* app = nullptr;
};

AgentDeckApp::AgentDeckApp() = default;

AgentDeckApp::~AgentDeckApp() {
    Shutdown();
}

int AgentDeckApp::Run(int argc, char** argv) {
    if (!ParseArguments(argc, argv)) {
        return 2;
    }
    if (!Init()) {
        Shutdown();
        return 1;
    }

    std::cout << "[AgentDeckApp] Ready. Type 'help' for commands." << std::endl;
    m_services.eventLoop->run();

    Shutdown();
    return 0;
}

bool AgentDeckApp::ParseArguments(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--restore" && i + 1 < argc) {
            m_restoreDate = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            m_configDir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: agentdeck [--config DIR] [--restore YYYY-MM-DD|today]" << std::endl;
            return false;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

bool AgentDeckApp::Init() {
    // Block before any thread exists so every thread inherits the mask.
    sigset_t signals = HandledSignals();
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    if (m_configDir.empty()) {
        m_configDir = infrastructure::PathUtils::GetAppConfigDir().string();
    }
    m_config = infrastructure::ConfigLoader::Load(m_configDir);

    fs::path dataDir = m_config.dataDir.empty()
        ? infrastructure::PathUtils::GetAppDataDir()
        : fs::path(infrastructure::PathUtils::ExpandHome(m_config.dataDir));
    std::error_code ec;
    fs::create_directories(dataDir, ec);
    if (ec) {
        std::cerr << "[AgentDeckApp] Failed to create data directory " << dataDir << ": " << ec.message() << std::endl;
        return false;
    }
    const std::string profilesRoot = m_config.profilesRoot.empty()
        ? (dataDir / "profiles").string()
        : infrastructure::PathUtils::ExpandHome(m_config.profilesRoot);

    // Dependency Injection / Composition Root
    try {
        m_services.eventLoop = std::make_unique<application::EventLoop>();
        m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
        m_services.sessionStore = std::make_shared<infrastructure::SessionStoreFs>(
            (dataDir / "sessions").string(), m_services.persistenceService,
            static_cast<std::size_t>(m_config.outputBufferLimit));
        m_services.sessionStore->purgeOlderThan(m_config.sessionRetentionDays);
        m_services.taskManager = std::make_shared<application::AsyncTaskManager>();

        application::ProfileServiceOptions profileOptions;
        profileOptions.profilesRoot = profilesRoot;
        profileOptions.defaultCredentialDirectory = infrastructure::PathUtils::ExpandHome(m_config.defaultCredentialDir);
        profileOptions.credentialEnvVar = m_config.credentialEnvVar;
        profileOptions.tokenEnvVar = m_config.tokenEnvVar;
        m_services.profileService = std::make_unique<application::ProfileService>(
            std::make_shared<infrastructure::JsonProfileRepository>((dataDir / "profiles.json").string()),
            profileOptions);

        application::SessionRegistryOptions registryOptions;
        registryOptions.shell = m_config.shell;
        registryOptions.shellArgs = m_config.shellArgs;
        registryOptions.credentialEnvVar = m_config.credentialEnvVar;
        registryOptions.maxSessions = static_cast<std::size_t>(m_config.maxSessions);
        registryOptions.outputBufferLimit = static_cast<std::size_t>(m_config.outputBufferLimit);
        registryOptions.snapshotInterval = std::chrono::milliseconds(m_config.snapshotIntervalMs);
        m_services.sessionRegistry = std::make_unique<application::SessionRegistry>(
            *m_services.eventLoop, std::make_shared<infrastructure::ForkPtyLauncher>(),
            m_services.sessionStore, registryOptions);

        application::ProfileService* profiles = m_services.profileService.get();
        m_services.outputScanner = std::make_unique<application::OutputScanner>(
            *m_services.sessionRegistry,
            [profiles](const std::string& profileId) {
                auto profile = profiles->get(profileId);
                return profile ? infrastructure::CredentialInspector::NeedsOnboarding(*profile) : true;
            });

        application::AuthAttemptOptions authOptions;
        authOptions.loginCommand = m_config.loginCommand;
        authOptions.prefillDelay = std::chrono::milliseconds(m_config.prefillDelayMs);
        authOptions.autoCloseDelay = std::chrono::milliseconds(m_config.autoCloseDelayMs);
        authOptions.readyTimeout = std::chrono::milliseconds(m_config.readyTimeoutMs);
        m_services.authService = std::make_unique<application::AuthService>(
            *m_services.eventLoop, *m_services.sessionRegistry, *m_services.outputScanner,
            *m_services.profileService, authOptions);

        m_services.usageMonitor = std::make_unique<application::UsageMonitor>(
            *m_services.eventLoop, *m_services.profileService,
            std::make_shared<infrastructure::HttpUsageSource>(m_config.usageEndpoint, m_config.usageTimeoutSeconds),
            m_services.taskManager);

        application::AutoSwitchOptions switchOptions;
        switchOptions.settleDelay = std::chrono::milliseconds(m_config.switchSettleMs);
        m_services.autoSwitchController = std::make_unique<application::AutoSwitchController>(
            *m_services.eventLoop, *m_services.profileService, *m_services.usageMonitor,
            *m_services.outputScanner, *m_services.sessionRegistry, switchOptions);
        m_services.autoSwitchController->setRetryHook(
            [this](const std::string& sessionId, const domain::Profile& profile) {
                RelaunchSession(sessionId, profile);
            });
    } catch (const std::exception& e) {
        std::cerr << "[AgentDeckApp] Initialization failed: " << e.what() << std::endl;
        return false;
    }
    m_initialized = true;

    ConnectEvents();

    if (m_restoreDate) {
        const std::string date = *m_restoreDate == "today"
            ? domain::DateKey(std::chrono::system_clock::now())
            : *m_restoreDate;
        RestoreSessions(date);
    }

    m_services.sessionRegistry->startSnapshotTimer();
    m_services.usageMonitor->start();

    StartSignalThread();
    StartInputThread();
    return true;
}

void AgentDeckApp::ConnectEvents() {
    auto& registry = *m_services.sessionRegistry;
    m_subscriptions.push_back(registry.onExit.connect([this](const std::string& id, int code) {
        std::cout << "[session " << ShortId(id) << "] exited with code " << code << std::endl;
        if (id == m_attachedId) {
            m_attached.reset();
            m_attachedId.clear();
        }
        m_scans.erase(id);
    }));

    m_subscriptions.push_back(m_services.authService->onStateChanged.connect(
        [](const std::string& attemptId, domain::AuthState state, const domain::AuthPayload& payload) {
            std::cout << "[auth " << attemptId << "] " << payload.profileId << " -> " << domain::ToString(state);
            if (payload.email) {
                std::cout << " (" << *payload.email << ")";
            }
            if (payload.message) {
                std::cout << ": " << *payload.message;
            }
            std::cout << std::endl;
        }));

    m_subscriptions.push_back(m_services.usageMonitor->onUsageUpdated.connect(
        [](const std::string& profileId, const domain::UsageSnapshot& usage) {
            std::cout << "[usage] " << profileId << ": session " << std::fixed << std::setprecision(0)
                      << usage.sessionPercent << "%, weekly " << usage.weeklyPercent << "%" << std::endl;
        }));

    m_subscriptions.push_back(m_services.autoSwitchController->onNotified.connect(
        [](application::SwitchReason reason, const std::string& from, const std::optional<std::string>& to) {
            if (to) {
                std::cout << "[autoswitch] " << application::ToString(reason) << ": " << from << " -> " << *to << std::endl;
            } else {
                std::cout << "[autoswitch] " << application::ToString(reason) << ": no alternative profile for "
                          << from << std::endl;
            }
        }));
}

void AgentDeckApp::StartSignalThread() {
    m_signalThread = std::thread([this]() {
        sigset_t signals = HandledSignals();
        int received = 0;
        while (sigwait(&signals, &received) == 0) {
            if (m_shuttingDown) {
                return;
            }
            std::cout << "\n[AgentDeckApp] Caught signal " << received << ", shutting down" << std::endl;
            m_services.eventLoop->post([this]() { RequestQuit(); });
            return;
        }
    });
}

void AgentDeckApp::StartInputThread() {
    m_input = std::make_shared<InputBridge>();
    m_input->loop = m_services.eventLoop.get();
    m_input->app = this;

    std::weak_ptr<InputBridge> weak = m_input;
    // Blocking getline cannot be interrupted, so the reader is detached.
    std::thread([weak]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            auto bridge = weak.lock();
            if (!bridge) {
                return;
            }
            std::lock_guard<std::mutex> lock(bridge->mutex);
            if (!bridge->loop) {
                return;
            }
            AgentDeckApp* app = bridge->app;
            bridge->loop->post([app, line]() { app->HandleCommand(line); });
        }
        if (auto bridge = weak.lock()) {
            std::lock_guard<std::mutex> lock(bridge->mutex);
            if (bridge->loop) {
                AgentDeckApp* app = bridge->app;
                bridge->loop->post([app]() { app->RequestQuit(); });
            }
        }
    }).detach();
}

void AgentDeckApp::RequestQuit() {
    if (m_services.eventLoop) {
        m_services.eventLoop->stop();
    }
}

void AgentDeckApp::Shutdown() {
    if (m_shuttingDown.exchange(true)) {
        return;
    }

    if (m_input) {
        std::lock_guard<std::mutex> lock(m_input->mutex);
        m_input->loop = nullptr;
        m_input->app = nullptr;
    }
    if (m_signalThread.joinable()) {
        pthread_kill(m_signalThread.native_handle(), SIGTERM);
        m_signalThread.join();
    }

    if (m_initialized) {
        m_attached.reset();
        m_services.usageMonitor->stop();
        for (const auto& attemptId : m_services.authService->attempts()) {
            try {
                m_services.authService->cancel(attemptId);
            } catch (const std::exception& e) {
                std::cerr << "[AgentDeckApp] Could not cancel " << attemptId << ": " << e.what() << std::endl;
            }
        }
        m_services.sessionRegistry->shutdown();
    }
    m_scans.clear();
    m_subscriptions.clear();

    if (m_services.taskManager) {
        m_services.taskManager->WaitForAll();
    }
    if (m_services.persistenceService) {
        m_services.persistenceService->stop();
    }
    std::cout << "[AgentDeckApp] Bye" << std::endl;
}

void AgentDeckApp::HandleCommand(const std::string& line) {
    const std::vector<std::string> args = SplitWords(line);
    if (args.empty()) {
        return;
    }
    const std::string& command = args[0];

    try {
        if (command == "help") {
            PrintHelp();
        } else if (command == "new") {
            CommandNew(args);
        } else if (command == "write") {
            CommandWrite(args, line);
        } else if (command == "resize" && args.size() == 4) {
            auto id = ResolveSession(args[1]);
            domain::TerminalSize size{std::stoi(args[2]), std::stoi(args[3])};
            if (!id || !m_services.sessionRegistry->resize(*id, size)) {
                std::cerr << "No running session " << args[1] << std::endl;
            }
        } else if (command == "kill" && args.size() == 2) {
            auto id = ResolveSession(args[1]);
            if (!id) {
                std::cerr << "No session " << args[1] << std::endl;
                return;
            }
            m_services.sessionRegistry->destroy(*id);
        } else if (command == "attach") {
            CommandAttach(args);
        } else if (command == "detach") {
            m_attached.reset();
            m_attachedId.clear();
        } else if (command == "list") {
            PrintSessions();
        } else if (command == "order" && args.size() > 1) {
            std::vector<std::string> ids;
            for (std::size_t i = 1; i < args.size(); ++i) {
                if (auto id = ResolveSession(args[i])) {
                    ids.push_back(*id);
                }
            }
            m_services.sessionRegistry->reorder(ids);
        } else if (command == "dates") {
            PrintDates();
        } else if (command == "restore" && args.size() == 2) {
            RestoreSessions(args[1]);
        } else if (command == "login") {
            CommandLogin(args);
        } else if (command == "cancel-login" && args.size() == 2) {
            m_services.authService->cancel(args[1]);
        } else if (command == "profiles") {
            PrintProfiles();
        } else if (command == "add-profile" && args.size() > 1) {
            domain::Profile profile;
            profile.name = RestAfterWords(line, 1);
            auto saved = m_services.profileService->save(profile);
            std::cout << "Added profile " << saved.id << " (" << saved.credentialDirectory << ")" << std::endl;
        } else if (command == "rename-profile" && args.size() > 2) {
            m_services.profileService->rename(args[1], RestAfterWords(line, 2));
        } else if (command == "remove-profile" && args.size() == 2) {
            m_services.profileService->remove(args[1]);
        } else if (command == "use" && args.size() == 2) {
            auto outcome = m_services.autoSwitchController->switchTo(args[1]);
            std::cout << "Switch: " << application::ToString(outcome) << std::endl;
        } else if (command == "token" && (args.size() == 3 || args.size() == 4)) {
            std::optional<std::string> email;
            if (args.size() == 4) {
                email = args[3];
            }
            m_services.profileService->setToken(args[1], args[2], email);
            std::cout << "Token stored for " << args[1] << std::endl;
        } else if (command == "usage") {
            if (args.size() == 2 && args[1] == "refresh") {
                m_services.usageMonitor->refresh();
            } else {
                PrintUsage();
            }
        } else if (command == "autoswitch") {
            CommandAutoSwitch(args);
        } else if (command == "quit" || command == "exit") {
            RequestQuit();
        } else {
            std::cerr << "Unknown or malformed command: " << line << " (try 'help')" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
}

void AgentDeckApp::RestoreSessions(const std::string& date) {
    application::ProfileService& profiles = *m_services.profileService;
    auto restored = m_services.sessionRegistry->restore(date,
        [&profiles](const domain::SessionSnapshot&, domain::SessionOptions& options) {
            profiles.applyCredentials(options);
        });
    for (const auto& session : restored) {
        m_scans[session.id] = m_services.outputScanner->attach(session.id);
    }
    std::cout << "Restored " << restored.size() << " session(s) from " << date << std::endl;
}

void AgentDeckApp::CommandNew(const std::vector<std::string>& args) {
    domain::SessionOptions options;
    std::size_t next = 1;
    bool startAgent = false;
    if (args.size() > next && (args[next] == "agent" || args[next] == "shell")) {
        startAgent = args[next] == "agent";
        ++next;
    }
    if (args.size() > next) {
        options.projectScope = infrastructure::PathUtils::ExpandHome(args[next]);
    }

    if (auto active = m_services.profileService->activeId()) {
        options.profileId = *active;
        m_services.profileService->applyCredentials(options);
    }
    if (startAgent) {
        options.initialInput = m_config.agentCommand + "\r";
        options.agentCommand = m_config.agentCommand;
        options.title = m_config.agentCommand;
    }

    auto info = m_services.sessionRegistry->create(options);
    std::cout << "Session " << info.id << " (" << info.title << ") running" << std::endl;
    m_scans[info.id] = m_services.outputScanner->attach(info.id);
}

void AgentDeckApp::CommandWrite(const std::vector<std::string>& args, const std::string& line) {
    if (args.size() < 2) {
        std::cerr << "Usage: write <session> <text>" << std::endl;
        return;
    }
    auto id = ResolveSession(args[1]);
    if (!id || !m_services.sessionRegistry->write(*id, RestAfterWords(line, 2) + "\r")) {
        std::cerr << "No running session " << args[1] << std::endl;
    }
}

void AgentDeckApp::CommandAttach(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: attach <session>" << std::endl;
        return;
    }
    auto id = ResolveSession(args[1]);
    if (!id) {
        std::cerr << "No session " << args[1] << std::endl;
        return;
    }
    m_attached.reset();
    m_attachedId = *id;
    m_attached = m_services.sessionRegistry->subscribeOutput(*id, [](const std::string& chunk) {
        std::cout << chunk << std::flush;
    });
}

void AgentDeckApp::CommandLogin(const std::vector<std::string>& args) {
    const std::string profileId = args.size() > 1
        ? args[1]
        : m_services.profileService->activeId().value_or("");
    const std::string attemptId = m_services.authService->start(profileId);
    std::cout << "Login attempt " << attemptId << " started for " << profileId << std::endl;
    if (auto login = m_services.authService->loginSession(attemptId)) {
        std::cout << "Attach with 'attach " << ShortId(login->sessionId) << "' and press enter to log in" << std::endl;
    }
}

void AgentDeckApp::CommandAutoSwitch(const std::vector<std::string>& args) {
    domain::AutoSwitchSettings settings = m_services.profileService->autoSwitchSettings();
    auto parseFlag = [](const std::string& value) { return value == "on" || value == "true" || value == "1"; };

    if (args.size() == 2 && (args[1] == "on" || args[1] == "off")) {
        settings.enabled = parseFlag(args[1]);
    } else if (args.size() == 3 && args[1] == "proactive") {
        settings.proactiveEnabled = parseFlag(args[2]);
    } else if (args.size() == 3 && args[1] == "reactive") {
        settings.reactiveEnabled = parseFlag(args[2]);
    } else if (args.size() == 3 && args[1] == "session") {
        settings.sessionThreshold = std::stod(args[2]);
    } else if (args.size() == 3 && args[1] == "weekly") {
        settings.weeklyThreshold = std::stod(args[2]);
    } else if (args.size() == 3 && args[1] == "interval") {
        settings.pollIntervalMs = std::stoi(args[2]);
    } else if (args.size() != 1) {
        std::cerr << "Usage: autoswitch [on|off|proactive on|off|reactive on|off|session N|weekly N|interval MS]"
                  << std::endl;
        return;
    }

    if (args.size() > 1) {
        m_services.profileService->updateAutoSwitchSettings(settings);
    }
    std::cout << "Auto-switch " << (settings.enabled ? "on" : "off")
              << ", proactive " << (settings.proactiveEnabled ? "on" : "off")
              << ", reactive " << (settings.reactiveEnabled ? "on" : "off")
              << ", thresholds " << settings.sessionThreshold << "% / " << settings.weeklyThreshold << "%"
              << ", poll every " << settings.pollIntervalMs << " ms" << std::endl;
}

void AgentDeckApp::PrintHelp() const {
    std::cout <<
        "Sessions:  new [agent|shell] [dir] | list | attach <id> | detach | write <id> <text>\n"
        "           resize <id> <cols> <rows> | kill <id> | order <id>... | dates | restore <date>\n"
        "Profiles:  profiles | add-profile <name> | rename-profile <id> <name> | remove-profile <id>\n"
        "           use <id> | token <id> <token> [email] | login [id] | cancel-login <attempt>\n"
        "Usage:     usage [refresh] | autoswitch [...]\n"
        "           quit" << std::endl;
}

void AgentDeckApp::PrintSessions() const {
    for (const auto& session : m_services.sessionRegistry->list()) {
        std::cout << std::setw(3) << session.displayOrder << "  " << ShortId(session.id) << "  "
                  << std::setw(10) << std::left << domain::ToString(session.status) << std::right << "  "
                  << session.profileId.value_or("-") << "  " << session.title;
        if (session.projectScope) {
            std::cout << "  [" << *session.projectScope << "]";
        }
        std::cout << std::endl;
    }
}

void AgentDeckApp::PrintProfiles() const {
    const auto activeId = m_services.profileService->activeId();
    for (const auto& profile : m_services.profileService->list()) {
        std::cout << (activeId && *activeId == profile.id ? "* " : "  ") << profile.id << "  " << profile.name
                  << (profile.isDefault ? " (default)" : "")
                  << (domain::IsAuthenticated(profile) ? "  authenticated" : "  not authenticated");
        if (profile.email) {
            std::cout << "  " << *profile.email;
        }
        if (m_services.profileService->isRateLimited(profile.id)) {
            std::cout << "  rate-limited until " << profile.lastRateLimit->resetTime;
        }
        std::cout << std::endl;
    }
}

void AgentDeckApp::PrintUsage() const {
    const auto all = m_services.usageMonitor->all();
    if (all.empty()) {
        std::cout << "No usage data yet" << std::endl;
        return;
    }
    for (const auto& [profileId, usage] : all) {
        std::cout << profileId << ": session " << usage.sessionPercent << "%"
                  << (usage.sessionResetsAt ? " (resets " + *usage.sessionResetsAt + ")" : "")
                  << ", weekly " << usage.weeklyPercent << "%"
                  << (usage.weeklyResetsAt ? " (resets " + *usage.weeklyResetsAt + ")" : "") << std::endl;
    }
}

void AgentDeckApp::PrintDates() {
    for (const auto& date : m_services.sessionRegistry->availableDates()) {
        std::cout << date.date << "  " << date.sessionCount << " session(s)" << std::endl;
    }
}

void AgentDeckApp::RelaunchSession(const std::string& sessionId, const domain::Profile& profile) {
    domain::RelaunchSpec spec;
    spec.agentCommand = m_config.agentCommand;
    spec.credentialEnvVar = m_config.credentialEnvVar;
    if (profile.hasToken()) {
        try {
            spec.tokenEnvFile = infrastructure::CredentialInspector::WriteTokenEnvFile(m_config.tokenEnvVar, *profile.token);
        } catch (const std::exception& e) {
            std::cerr << "[AgentDeckApp] Cannot relaunch session " << sessionId << ": " << e.what() << std::endl;
            return;
        }
    } else if (!profile.isDefault) {
        spec.credentialDirectory = profile.credentialDirectory;
    }
    const std::string command = domain::BuildRelaunchCommand(spec);

    auto& registry = *m_services.sessionRegistry;
    auto& loop = *m_services.eventLoop;
    if (!registry.write(sessionId, "\x03")) {
        if (spec.tokenEnvFile) {
            std::error_code ec;
            fs::remove(*spec.tokenEnvFile, ec);
        }
        return;
    }
    loop.schedule(kInterruptSettle, [&registry, &loop, sessionId, command, spec]() {
        registry.write(sessionId, "/exit\r");
        loop.schedule(kExitSettle, [&registry, sessionId, command, spec]() {
            if (!registry.write(sessionId, command) && spec.tokenEnvFile) {
                std::error_code ec;
                fs::remove(*spec.tokenEnvFile, ec);
            }
        });
    });
    std::cout << "[AgentDeckApp] Relaunching session " << ShortId(sessionId) << " as " << profile.id << std::endl;
}

std::optional<std::string> AgentDeckApp::ResolveSession(const std::string& idOrPrefix) const {
    std::optional<std::string> match;
    for (const auto& session : m_services.sessionRegistry->list()) {
        if (session.id == idOrPrefix) {
            return session.id;
        }
        if (session.id.compare(0, idOrPrefix.size(), idOrPrefix) == 0) {
            if (match) {
                return std::nullopt; // Ambiguous.
            }
            match = session.id;
        }
    }
    return match;
}

} // namespace agentdeck::app
