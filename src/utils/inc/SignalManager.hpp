#pragma once
#include <functional>
#include <map>
#include <vector>
#include <mutex>
#include <optional>
#include <csignal>

// Process-wide signal dispatch. Callbacks for a signal run in registration
// order; the final callback (usually the one that exits) runs last.
namespace SignalManager {

using SignalCallback = std::function<void(int)>;

void register_signal(int signum, SignalCallback cb, bool is_final = false);

// Installs the dispatcher for every signal with registered callbacks
void setup();

// Drops all callbacks and restores the default disposition
void reset();

}
