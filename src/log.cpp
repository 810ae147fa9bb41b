#include "log.h"

#include <atomic>

namespace fsched
{

    static std::atomic<bool> g_verbose{false};

    void set_log_verbose(bool on) { g_verbose.store(on, std::memory_order_relaxed); }

    bool log_verbose() { return g_verbose.load(std::memory_order_relaxed); }

} // namespace fsched
