/**
 * @file Application.hpp
 * @brief Process setup: command line, configuration, logging and wiring.
 *
 * Builds the configuration once (file first, then command line overrides),
 * creates the poller, resolve service, renderer and session, and runs the Qt
 * event loop. SIGINT and SIGTERM are routed through a socket pair into the
 * event loop so the terminal is always restored on exit.
 *
 * @section Dependencies
 * - Config
 * - Session
 * - QCommandLineParser
 */

#pragma once
#include <QStringList>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "core/Config.hpp"
#include "util/Result.hpp"

class QCoreApplication;
class QSocketNotifier;

namespace cal {

class PlayerPoller;
class Renderer;
class Session;

namespace lyrics {
class ThreadedResolveService;
}

struct AppOptions {
    std::string token;
    bool clearHeaders{false};
    bool saveTags{false};
    bool autoScroll{false};
    bool offline{false};
    bool center{false};
    std::optional<u32> limitHeight;
    std::optional<i32> color;
    std::optional<i32> colorCurrent;
    std::optional<std::filesystem::path> configPath;
    bool debug{false};
    bool noUi{false};
    bool printConfig{false};
    std::optional<std::filesystem::path> writeConfig;
    bool showHelp{false};
    bool showVersion{false};
    std::string helpText;
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    Result<AppOptions> parseArgs();
    Result<void> init(const AppOptions& opts);
    int exec();

    // args[0] is the program name
    static Result<AppOptions> parseArguments(const QStringList& args);
    // Booleans are OR-ed onto the file values; explicit values replace them
    static void applyOptions(Config& config, const AppOptions& opts);

private:
    Result<void> installSignalHandlers();

    std::unique_ptr<QCoreApplication> app_;
    Config config_;

    std::unique_ptr<PlayerPoller> poller_;
    std::unique_ptr<Renderer> renderer_;
    std::unique_ptr<lyrics::ThreadedResolveService> resolver_;
    std::unique_ptr<Session> session_;

    QSocketNotifier* signalNotifier_{nullptr};
    bool exitNow_{false};
};

} // namespace cal
