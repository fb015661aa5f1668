#include <catch2/catch_test_macros.hpp>
#include "rrpc/c_api/rrpc_api.h"
#include "rrpc/runtime/runtime_state.hpp"
#include <atomic>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

using namespace rrpc;
using rrpc::interfaces::Bytes;
using rrpc::runtime::RuntimeState;

namespace {

RuntimeState& InitializedRuntime() {
    REQUIRE(rrpc_init() == RRPC_SUCCESS);
    auto* state = RuntimeState::TryGet();
    REQUIRE(state != nullptr);
    return *state;
}

} // namespace

TEST_CASE("Concurrency - Parallel echo calls", "[concurrency][c_api]") {
    auto& state = InitializedRuntime();
    state.Register("echo", [](std::span<const uint8_t> input) {
        return Result<Bytes, RpcFailure>::Ok(Bytes(input.begin(), input.end()));
    });

    SECTION("32 threads calling 500 times each get their own payloads back") {
        constexpr int THREAD_COUNT = 32;
        constexpr int CALLS_PER_THREAD = 500;

        std::atomic<int> successful_calls{0};
        std::atomic<int> mismatched_payloads{0};
        std::atomic<int> failed_calls{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);

        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&, t]() {
                for (int i = 0; i < CALLS_PER_THREAD; ++i) {
                    const std::string payload = "thread-" + std::to_string(t) + "-call-" + std::to_string(i);
                    uint8_t* out_ptr = nullptr;
                    size_t out_len = 0;
                    const auto status = rrpc_call(
                        "echo",
                        reinterpret_cast<const uint8_t*>(payload.data()), payload.size(),
                        &out_ptr, &out_len);
                    if (status != RRPC_SUCCESS) {
                        failed_calls.fetch_add(1);
                        continue;
                    }
                    if (out_len != payload.size() || std::memcmp(out_ptr, payload.data(), out_len) != 0) {
                        mismatched_payloads.fetch_add(1);
                    }
                    rrpc_free(out_ptr, out_len);
                    successful_calls.fetch_add(1);
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failed_calls.load() == 0);
        REQUIRE(mismatched_payloads.load() == 0);
        REQUIRE(successful_calls.load() == THREAD_COUNT * CALLS_PER_THREAD);
    }
}

TEST_CASE("Concurrency - Handlers never overlap", "[concurrency][c_api][lock]") {
    auto& state = InitializedRuntime();

    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
    std::atomic<int> invocations{0};

    state.Register("serialized", [&](std::span<const uint8_t>) {
        const int now = active.fetch_add(1) + 1;
        int observed = max_active.load();
        while (now > observed && !max_active.compare_exchange_weak(observed, now)) {
        }
        std::this_thread::sleep_for(std::chrono::microseconds(50));
        invocations.fetch_add(1);
        active.fetch_sub(1);
        return Result<Bytes, RpcFailure>::Ok(Bytes{1});
    });

    constexpr int THREAD_COUNT = 16;
    constexpr int CALLS_PER_THREAD = 100;
    std::atomic<int> failed_calls{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < CALLS_PER_THREAD; ++i) {
                uint8_t* out_ptr = nullptr;
                size_t out_len = 0;
                if (rrpc_call("serialized", nullptr, 0, &out_ptr, &out_len) != RRPC_SUCCESS) {
                    failed_calls.fetch_add(1);
                    continue;
                }
                rrpc_free(out_ptr, out_len);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failed_calls.load() == 0);
    REQUIRE(invocations.load() == THREAD_COUNT * CALLS_PER_THREAD);
    REQUIRE(max_active.load() == 1);
}

TEST_CASE("Concurrency - Registration while calls are in flight", "[concurrency][registry]") {
    auto& state = InitializedRuntime();
    state.Register("stable", [](std::span<const uint8_t>) {
        return Result<Bytes, RpcFailure>::Ok(Bytes{'o', 'k'});
    });

    constexpr int CALLER_COUNT = 8;
    constexpr int CALLS_PER_THREAD = 300;
    constexpr int REGISTRATIONS = 200;

    std::atomic<bool> start{false};
    std::atomic<int> unexpected_status{0};

    std::vector<std::thread> threads;
    threads.reserve(CALLER_COUNT + 1);

    for (int t = 0; t < CALLER_COUNT; ++t) {
        threads.emplace_back([&]() {
            while (!start.load()) {
                std::this_thread::yield();
            }
            for (int i = 0; i < CALLS_PER_THREAD; ++i) {
                uint8_t* out_ptr = nullptr;
                size_t out_len = 0;
                const auto status = rrpc_call("stable", nullptr, 0, &out_ptr, &out_len);
                if (status != RRPC_SUCCESS || out_len != 2) {
                    unexpected_status.fetch_add(1);
                }
                rrpc_free(out_ptr, out_len);
            }
        });
    }

    threads.emplace_back([&]() {
        while (!start.load()) {
            std::this_thread::yield();
        }
        for (int i = 0; i < REGISTRATIONS; ++i) {
            state.Register("dynamic." + std::to_string(i), [](std::span<const uint8_t>) {
                return Result<Bytes, RpcFailure>::Ok(Bytes{});
            });
        }
    });

    start.store(true);
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(unexpected_status.load() == 0);
    const bool all_registered = state.WithRegistry([](const runtime::Registry& registry) {
        for (int i = 0; i < REGISTRATIONS; ++i) {
            if (!registry.HasMethod("dynamic." + std::to_string(i))) {
                return false;
            }
        }
        return registry.HasMethod("stable");
    });
    REQUIRE(all_registered);
}
