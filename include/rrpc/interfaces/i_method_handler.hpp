#pragma once
#include "rrpc/core/result.hpp"
#include "rrpc/core/failures.hpp"
#include <cstdint>
#include <functional>
#include <span>
#include <utility>
#include <vector>
namespace rrpc::interfaces {
using Bytes = std::vector<uint8_t>;
using HandlerFunction = std::function<Result<Bytes, RpcFailure>(std::span<const uint8_t>)>;
class IMethodHandler {
public:
    virtual ~IMethodHandler() = default;
    [[nodiscard]] virtual Result<Bytes, RpcFailure> Handle(std::span<const uint8_t> input) const = 0;
};
class FunctionHandler final : public IMethodHandler {
public:
    explicit FunctionHandler(HandlerFunction function)
        : function_(std::move(function)) {}
    [[nodiscard]] Result<Bytes, RpcFailure> Handle(const std::span<const uint8_t> input) const override {
        return function_(input);
    }
private:
    HandlerFunction function_;
};
}
