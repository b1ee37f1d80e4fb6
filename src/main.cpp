#include "core/Agent.h"
#include <csignal>

static volatile std::sig_atomic_t g_stop_requested = 0;

static void handle_stop_signal(int){ g_stop_requested = 1; }

static void install_signal_handlers(){
    struct sigaction sa{};
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

int main(int argc, char** argv) {
    install_signal_handlers();
    return conn_tracker::run_agent(argc, argv, []{ return g_stop_requested != 0; });
}
