#pragma once
#include "rrpc/interfaces/i_method_handler.hpp"
#include "rrpc/core/result.hpp"
#include "rrpc/core/failures.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace rrpc::test_helpers {

using interfaces::Bytes;
using interfaces::IMethodHandler;

/**
 * @brief Echo handler that counts invocations, optionally failing with a
 * fixed failure instead of echoing
 *
 * The counter is shared so a test can keep observing it after the handler
 * has been moved into a registry.
 */
class CountingHandler final : public IMethodHandler {
public:
    explicit CountingHandler(std::shared_ptr<std::atomic<int>> counter,
                             std::optional<RpcFailure> failure = std::nullopt)
        : counter_(std::move(counter))
        , failure_(std::move(failure)) {}

    [[nodiscard]] Result<Bytes, RpcFailure> Handle(const std::span<const uint8_t> input) const override {
        counter_->fetch_add(1);
        if (failure_.has_value()) {
            return Result<Bytes, RpcFailure>::Err(*failure_);
        }
        return Result<Bytes, RpcFailure>::Ok(Bytes(input.begin(), input.end()));
    }

private:
    std::shared_ptr<std::atomic<int>> counter_;
    std::optional<RpcFailure> failure_;
};

inline std::unique_ptr<IMethodHandler> MakeCountingHandler(
    std::shared_ptr<std::atomic<int>> counter,
    std::optional<RpcFailure> failure = std::nullopt) {
    return std::make_unique<CountingHandler>(std::move(counter), std::move(failure));
}

inline std::span<const uint8_t> AsBytes(const std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

} // namespace rrpc::test_helpers
