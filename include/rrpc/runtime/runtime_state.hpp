#pragma once

#include "rrpc/runtime/registry.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

namespace rrpc::runtime {

/**
 * @brief Process-wide runtime holding the method registry
 *
 * Lifecycle: Uninitialized until the first Initialize(), Initialized for the
 * rest of the process. The instance is created exactly once under
 * std::call_once and is never destroyed; there is no shutdown.
 *
 * Every registry access goes through a single std::mutex. The lock is not
 * reentrant: a handler that calls back into rrpc_call (or Register) on the
 * same runtime deadlocks.
 */
class RuntimeState {
public:
    /**
     * @brief Create the runtime on first use
     *
     * Thread-safe and idempotent. Later calls return the existing instance
     * and leave its registrations untouched.
     */
    static RuntimeState& Initialize();

    /**
     * @brief Existing runtime, or nullptr before the first Initialize()
     */
    [[nodiscard]] static RuntimeState* TryGet() noexcept;

    [[nodiscard]] static bool IsInitialized() noexcept;

    /**
     * @brief Register a handler under the runtime lock
     */
    template<typename Handler>
    void Register(std::string name, Handler&& handler) {
        std::lock_guard guard(lock_);
        registry_.Register(std::move(name), std::forward<Handler>(handler));
    }

    /**
     * @brief Run an operation on the registry while holding the runtime lock
     *
     * The lock is held for the whole operation, including anything the
     * operation does with the handler's result.
     */
    template<typename Operation>
    auto WithRegistry(Operation&& operation) -> std::invoke_result_t<Operation, Registry&> {
        std::lock_guard guard(lock_);
        return std::forward<Operation>(operation)(registry_);
    }

    RuntimeState(const RuntimeState&) = delete;
    RuntimeState& operator=(const RuntimeState&) = delete;
    RuntimeState(RuntimeState&&) = delete;
    RuntimeState& operator=(RuntimeState&&) = delete;

private:
    RuntimeState() = default;
    ~RuntimeState() = default;

    static inline std::once_flag init_flag_;
    static inline std::atomic<RuntimeState*> instance_{nullptr};

    std::mutex lock_;
    Registry registry_;
};

} // namespace rrpc::runtime
