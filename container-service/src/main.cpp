#include "ContainerApp.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>

namespace {

containers::ContainerApp* runningApp = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ", stopping container service" << std::endl;
    if (runningApp) {
        runningApp->stop();
    }
}

const char* envOr(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "[main] Container Service 1.0.0"
              << " storage=" << envOr("CONTAINER_STORAGE", "postgres")
              << " registration_url=" << envOr("REGISTRATION_SERVER_URL", "<unset>")
              << std::endl;

    try {
        containers::ContainerApp app;
        runningApp = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        // loadEnvironment() -> configureInjection() -> start()
        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] Stopped" << std::endl;
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        runningApp = nullptr;
        std::cerr << "[main] Fatal: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
