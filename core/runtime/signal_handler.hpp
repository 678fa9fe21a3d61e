#pragma once

#include <atomic>

namespace timestamp {
namespace runtime {

class SignalHandler {
public:
    // Installs SIGINT/SIGTERM handlers that only raise a flag
    static void install();
    static bool is_shutdown_requested();

    // Clears a pending request; called when a runtime is (re)initialized
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace timestamp
