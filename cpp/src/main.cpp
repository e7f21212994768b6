#include <CaptureBackends.hpp>
#include <Config.hpp>
#include <SessionOrchestrator.hpp>
#include <TaskQueue.hpp>
#include <X11Toolkit.hpp>
#include <X11/Xlib.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <iostream>

namespace {

int run(int argc, char** argv) {
    Config::CommandLine cli;
    std::string error;
    if (!Config::parseCommandLine(argc, argv, cli, error)) {
        std::cerr << "[Main] " << error << std::endl;
        Config::printUsage(argv[0]);
        return 2;
    }
    if (cli.help) {
        Config::printUsage(argv[0]);
        return 0;
    }

    Config::AppConfig config;
    Config::loadConfig(cli.configPath.empty() ? Config::defaultConfigPath() : cli.configPath, config);
    if (!cli.backendOverride.empty()) {
        config.backend = cli.backendOverride;
    }
    Config::printConfig(config);

    Capture::BackendType requested = Capture::BackendType::Auto;
    Capture::parseBackendType(config.backend, requested);
    const Capture::BackendType backend = Capture::detectBackend(requested);

    std::unique_ptr<Capture::ICaptureProvider> provider = Capture::createProvider(backend, config.failureBudget);
    std::unique_ptr<Capture::IPermissionGate> gate = Capture::createPermissionGate(backend);
    if (!provider || !gate) {
        std::cerr << "[Main] Failed to create capture backend: " << Capture::toString(backend) << std::endl;
        return 1;
    }
    std::cout << "[Main] Capturing with " << provider->name() << std::endl;

    Toolkit::X11Toolkit toolkit(config.borderWidth);
    if (!toolkit.open()) {
        return 1;
    }

    Session::TaskQueue tasks;

    Capture::SessionOptions sessionOptions;
    sessionOptions.frameRateCap = config.frameRate;
    sessionOptions.showCursor = config.showCursor;
    sessionOptions.startTimeout = std::chrono::milliseconds(config.startTimeoutMs);

    Session::OrchestratorOptions options;
    options.showBorder = config.showBorder;
    options.excludeSelf = config.excludeSelf;

    Session::SessionOrchestrator orchestrator(*provider, *gate, toolkit, tasks, sessionOptions, options);
    orchestrator.addObserver([&toolkit](bool capturing) { toolkit.setCapturing(capturing); });

    bool quit = false;
    auto select = [&tasks, &orchestrator] { tasks.post([&orchestrator] { orchestrator.beginSelection(); }); };
    if (!toolkit.openControlWindow(select, [&quit] { quit = true; })) {
        return 1;
    }
    if (cli.selectOnStart) {
        select();
    }

    pollfd fds[2];
    fds[0].fd = toolkit.connectionFd();
    fds[0].events = POLLIN;
    fds[1].fd = tasks.wakeFd();
    fds[1].events = POLLIN;

    while (!quit) {
        toolkit.dispatchEvents();
        tasks.drain();
        orchestrator.renderPending();
        if (quit) {
            break;
        }

        // Xlib may already hold events read while drawing
        toolkit.dispatchEvents();
        if (quit) {
            break;
        }

        if (poll(fds, 2, -1) < 0 && errno != EINTR) {
            std::cerr << "[Main] poll failed: " << strerror(errno) << std::endl;
            break;
        }
    }

    std::cout << "[Main] Shutting down" << std::endl;
    orchestrator.shutdown();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    // Capture threads open their own connections; Xlib must know before anything else runs
    if (!XInitThreads()) {
        std::cerr << "[Main] Xlib has no thread support" << std::endl;
        return 1;
    }

    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[Main] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
