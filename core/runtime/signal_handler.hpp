#pragma once

#include <atomic>

namespace mup1gw {
namespace runtime {

// Installs SIGINT/SIGTERM handlers that only raise a flag; the main loop polls it
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace mup1gw
