#include "Application.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSocketNotifier>
#include <sys/socket.h>
#include <csignal>
#include <iostream>
#include <sstream>
#include <unistd.h>
#include "core/ConfigParsers.hpp"
#include "core/Logger.hpp"
#include "lyrics/ResolveService.hpp"
#include "player/CmusPoller.hpp"
#include "session/Session.hpp"
#include "ui/CursesRenderer.hpp"
#include "ui/HeadlessRenderer.hpp"
#include "util/FileUtils.hpp"

namespace cal {

namespace {

constexpr const char* kAppName = "cmus-auto-lyrics";

// [0] written by the signal handler, [1] read by the event loop
int g_signalFds[2] = {-1, -1};

void onUnixSignal(int) {
    char byte = 1;
    [[maybe_unused]] auto n = ::write(g_signalFds[0], &byte, sizeof(byte));
}

Result<i32> parseColor(const QString& value, const char* option) {
    bool ok = false;
    int color = value.toInt(&ok);
    if (!ok || color < -1 || color > 255) {
        return Result<i32>::err(std::string("Invalid value for --") + option +
                                ": " + value.toStdString() +
                                " (expected -1..255)");
    }
    return Result<i32>::ok(color);
}

} // namespace

Application::Application(int& argc, char** argv)
    : app_(std::make_unique<QCoreApplication>(argc, argv)) {
    QCoreApplication::setApplicationName(kAppName);
    QCoreApplication::setApplicationVersion(CAL_VERSION);
}

Application::~Application() {
    session_.reset();
    resolver_.reset();
    if (renderer_)
        renderer_->shutdown();
    renderer_.reset();
    poller_.reset();

    for (int& fd : g_signalFds) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
    Logger::shutdown();
}

Result<AppOptions> Application::parseArgs() {
    return parseArguments(QCoreApplication::arguments());
}

Result<AppOptions> Application::parseArguments(const QStringList& args) {
    QCommandLineParser parser;
    parser.setApplicationDescription(
            "Curses based lyrics display and fetcher for the cmus music player");
    auto helpOpt = parser.addHelpOption();
    auto versionOpt = parser.addVersionOption();

    parser.addPositionalArgument(
            "token",
            "Genius API token. Without one, AZLyrics is used.",
            "[token]");

    QCommandLineOption clearOpt(
            {"c", "clear-headers"},
            "Remove section headers such as [Chorus] from remote lyrics.");
    QCommandLineOption saveOpt(
            {"s", "save-tags"},
            "Save fetched lyrics, artist and title to the file's tags.");
    QCommandLineOption autoOpt({"a", "auto-scroll"},
                               "Scroll lyrics along with playback.");
    QCommandLineOption offlineOpt(
            {"o", "offline"},
            "Only show lyrics from tags; never use the network.");
    QCommandLineOption centerOpt({"e", "center"}, "Center lyrics lines.");
    QCommandLineOption limitOpt({"l", "limit-height"},
                                "Use at most <lines> rows of the terminal.",
                                "lines");
    QCommandLineOption colorOpt("color",
                                "Color of lyrics (ANSI 8-bit code, -1 = default).",
                                "code");
    QCommandLineOption currentOpt(
            "color-current",
            "Color of the current line (ANSI 8-bit code).",
            "code");
    QCommandLineOption configOpt("config", "Read configuration from <path>.", "path");
    QCommandLineOption debugOpt("debug", "Enable debug logging.");
    QCommandLineOption noUiOpt("no-ui", "Run without the terminal UI, logging to stderr.");
    QCommandLineOption printOpt("print-config",
                                "Print the effective configuration and exit.");
    QCommandLineOption writeOpt("write-config",
                                "Save the effective configuration to <path> and exit.",
                                "path");

    parser.addOptions({clearOpt,
                       saveOpt,
                       autoOpt,
                       offlineOpt,
                       centerOpt,
                       limitOpt,
                       colorOpt,
                       currentOpt,
                       configOpt,
                       debugOpt,
                       noUiOpt,
                       printOpt,
                       writeOpt});

    if (!parser.parse(args))
        return Result<AppOptions>::err(parser.errorText().toStdString());

    AppOptions opts;
    opts.showHelp = parser.isSet(helpOpt);
    opts.showVersion = parser.isSet(versionOpt);
    opts.helpText = parser.helpText().toStdString();

    auto positional = parser.positionalArguments();
    if (positional.size() > 1) {
        return Result<AppOptions>::err("Unexpected argument: " +
                                       positional.at(1).toStdString());
    }
    if (!positional.isEmpty())
        opts.token = positional.first().toStdString();

    opts.clearHeaders = parser.isSet(clearOpt);
    opts.saveTags = parser.isSet(saveOpt);
    opts.autoScroll = parser.isSet(autoOpt);
    opts.offline = parser.isSet(offlineOpt);
    opts.center = parser.isSet(centerOpt);
    opts.debug = parser.isSet(debugOpt);
    opts.noUi = parser.isSet(noUiOpt);
    opts.printConfig = parser.isSet(printOpt);

    if (parser.isSet(limitOpt)) {
        bool ok = false;
        uint lines = parser.value(limitOpt).toUInt(&ok);
        if (!ok) {
            return Result<AppOptions>::err(
                    "Invalid value for --limit-height: " +
                    parser.value(limitOpt).toStdString());
        }
        opts.limitHeight = lines;
    }
    if (parser.isSet(colorOpt)) {
        auto color = parseColor(parser.value(colorOpt), "color");
        if (!color)
            return Result<AppOptions>::err(color.error().message);
        opts.color = *color;
    }
    if (parser.isSet(currentOpt)) {
        auto color = parseColor(parser.value(currentOpt), "color-current");
        if (!color)
            return Result<AppOptions>::err(color.error().message);
        opts.colorCurrent = *color;
    }
    if (parser.isSet(configOpt)) {
        opts.configPath =
                file::expandHome(parser.value(configOpt).toStdString());
    }
    if (parser.isSet(writeOpt)) {
        opts.writeConfig =
                file::expandHome(parser.value(writeOpt).toStdString());
    }

    return Result<AppOptions>::ok(std::move(opts));
}

void Application::applyOptions(Config& config, const AppOptions& opts) {
    auto& lyrics = config.lyrics();
    if (!opts.token.empty())
        lyrics.geniusToken = opts.token;
    lyrics.clearHeaders = lyrics.clearHeaders || opts.clearHeaders;
    lyrics.saveTags = lyrics.saveTags || opts.saveTags;
    lyrics.offline = lyrics.offline || opts.offline;

    config.scroll().autoScroll = config.scroll().autoScroll || opts.autoScroll;

    auto& ui = config.ui();
    ui.center = ui.center || opts.center;
    if (opts.limitHeight)
        ui.limitHeight = *opts.limitHeight;
    if (opts.color)
        ui.color = *opts.color;
    if (opts.colorCurrent)
        ui.colorCurrent = *opts.colorCurrent;
    ui.enabled = !opts.noUi;

    config.setDebug(config.debug() || opts.debug);
}

Result<void> Application::init(const AppOptions& opts) {
    if (opts.showHelp) {
        std::cout << opts.helpText;
        exitNow_ = true;
        return Result<void>::ok();
    }
    if (opts.showVersion) {
        std::cout << kAppName << " " << CAL_VERSION << "\n";
        exitNow_ = true;
        return Result<void>::ok();
    }

    bool oneShot = opts.printConfig || opts.writeConfig.has_value();
    Logger::init(kAppName, opts.debug, opts.noUi || oneShot);

    auto loaded = opts.configPath ? config_.load(*opts.configPath)
                                  : config_.loadDefault();
    if (!loaded) {
        LOG_ERROR("{}. Using built-in defaults.", loaded.error().message);
        config_ = Config{};
    }
    applyOptions(config_, opts);
    if (config_.debug())
        Logger::get()->set_level(spdlog::level::debug);

    if (opts.printConfig) {
        std::ostringstream out;
        out << ConfigParsers::serialize(config_.lyrics(),
                                        config_.scroll(),
                                        config_.player(),
                                        config_.ui(),
                                        config_.debug());
        std::cout << out.str() << "\n";
        exitNow_ = true;
        return Result<void>::ok();
    }
    if (opts.writeConfig) {
        if (auto res = config_.save(*opts.writeConfig); !res)
            return res;
        std::cout << "Configuration written to " << opts.writeConfig->string()
                  << "\n";
        exitNow_ = true;
        return Result<void>::ok();
    }

    if (auto res = installSignalHandlers(); !res)
        return res;

    const auto& lyricsCfg = config_.lyrics();
    LOG_INFO("Lyrics: {} (clear headers: {}, save tags: {})",
             lyricsCfg.offline      ? "offline"
             : lyricsCfg.hasToken() ? "Genius"
                                    : "AZLyrics",
             lyricsCfg.clearHeaders,
             lyricsCfg.saveTags);

    poller_ = std::make_unique<CmusPoller>(config_.player());
    resolver_ = std::make_unique<lyrics::ThreadedResolveService>(lyricsCfg);

    if (config_.ui().enabled)
        renderer_ = std::make_unique<CursesRenderer>(config_.ui());
    else
        renderer_ = std::make_unique<HeadlessRenderer>();
    if (auto res = renderer_->init(); !res)
        return res;

    session_ = std::make_unique<Session>(config_.player(),
                                         config_.scroll(),
                                         *poller_,
                                         *resolver_,
                                         *renderer_);
    QObject::connect(session_.get(),
                     &Session::quitRequested,
                     app_.get(),
                     &QCoreApplication::quit);

    return Result<void>::ok();
}

int Application::exec() {
    if (exitNow_)
        return 0;

    session_->start();
    int rc = app_->exec();
    session_->stop();
    renderer_->shutdown();
    LOG_INFO("Exiting");
    return rc;
}

Result<void> Application::installSignalHandlers() {
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0)
        return Result<void>::err("Could not create signal socket pair");

    signalNotifier_ =
            new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read, app_.get());
    QObject::connect(signalNotifier_, &QSocketNotifier::activated, app_.get(), [] {
        char byte = 0;
        [[maybe_unused]] auto n = ::read(g_signalFds[1], &byte, sizeof(byte));
        LOG_INFO("Termination signal received");
        QCoreApplication::quit();
    });

    struct sigaction action {};
    action.sa_handler = onUnixSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    if (sigaction(SIGINT, &action, nullptr) != 0 ||
        sigaction(SIGTERM, &action, nullptr) != 0) {
        return Result<void>::err("Could not install signal handlers");
    }
    return Result<void>::ok();
}

} // namespace cal
