#include "SignalManager.hpp"

namespace SignalManager {

struct Handlers {
    std::vector<SignalCallback> callbacks;
    std::optional<SignalCallback> final_callback;
};

static std::map<int, Handlers> registry;
static std::recursive_mutex registry_mutex;

static void dispatch(int signum) {
    std::lock_guard<std::recursive_mutex> lock(registry_mutex);
    auto it = registry.find(signum);
    if (it == registry.end()) {
        return;
    }
    for (auto& cb : it->second.callbacks) {
        cb(signum);
    }
    if (it->second.final_callback) {
        (*it->second.final_callback)(signum);
    }
}

void register_signal(int signum, SignalCallback cb, bool is_final) {
    std::lock_guard<std::recursive_mutex> lock(registry_mutex);
    Handlers& handlers = registry[signum];
    if (is_final) {
        handlers.final_callback = std::move(cb);
    } else {
        handlers.callbacks.push_back(std::move(cb));
    }
}

void setup() {
    std::lock_guard<std::recursive_mutex> lock(registry_mutex);
    for (const auto& entry : registry) {
        std::signal(entry.first, dispatch);
    }
}

void reset() {
    std::lock_guard<std::recursive_mutex> lock(registry_mutex);
    for (const auto& entry : registry) {
        std::signal(entry.first, SIG_DFL);
    }
    registry.clear();
}

}
