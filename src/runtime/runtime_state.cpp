#include "rrpc/runtime/runtime_state.hpp"
#include "rrpc/debug/call_logger.hpp"

#include <sodium.h>

namespace rrpc::runtime {

// ============================================================================
// Lifecycle
// ============================================================================

RuntimeState& RuntimeState::Initialize() {
    std::call_once(init_flag_, []() {
        // sodium_memzero works without sodium_init, so a failure here only
        // loses the library's other guarantees, not secure release.
        if (sodium_init() < 0) {
            debug::LogSodiumInitFailed();
        }
        // Never deleted: the runtime lives until process exit.
        auto* state = new RuntimeState();
        instance_.store(state, std::memory_order_release);
        debug::LogRuntimeInitialized();
    });
    return *instance_.load(std::memory_order_acquire);
}

RuntimeState* RuntimeState::TryGet() noexcept {
    return instance_.load(std::memory_order_acquire);
}

bool RuntimeState::IsInitialized() noexcept {
    return TryGet() != nullptr;
}

} // namespace rrpc::runtime
