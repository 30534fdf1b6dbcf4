#include "Log.h"
#include <atomic>
#include <mutex>

namespace {
std::once_flag g_init_flag;
std::atomic<bool> g_initialized{false};
}

void Log::init(const char* program) {
    std::call_once(g_init_flag, [program] {
        FLAGS_alsologtostderr = 1;
        FLAGS_logtostderr = 1; // no log files; the library has no directory of its own
        google::InitGoogleLogging(program);
        g_initialized = true;
    });
}

void Log::shutdown() {
    if (g_initialized.exchange(false)) {
        google::ShutdownGoogleLogging();
    }
}

void Log::set_min_log_level(int level) {
    FLAGS_minloglevel = level;
}
