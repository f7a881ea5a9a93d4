#include "utils/MainApp.hpp"
#include <atomic>
#include <signal.h>

namespace {

std::atomic<MainApp*> g_app{ nullptr };

extern "C" void OnTerminateSignal(int) {
    if (MainApp* app = g_app.load()) app->requestShutdown();
}

// Senza SA_RESTART la lettura bloccata su stdin ritorna con EINTR e il loop esce
void InstallSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = OnTerminateSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

// Registra l'app per il signal handler finche' e' viva
struct SignalTarget {
    explicit SignalTarget(MainApp& app) { g_app = &app; }
    ~SignalTarget() { g_app = nullptr; }
};

} // namespace

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config.json";

    return RunWithExitCodes([&] {
        MainApp app{ configPath };
        SignalTarget target{ app };
        InstallSignalHandlers();
        return app.run();
    });
}
