#pragma once
#include "rrpc/core/result.hpp"
#include "rrpc/core/failures.hpp"
#include "rrpc/interfaces/i_method_handler.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
namespace rrpc::runtime {
using interfaces::Bytes;
using interfaces::HandlerFunction;
using interfaces::IMethodHandler;

/**
 * @brief Name-keyed table of method handlers
 *
 * Not synchronized. Inside the process-wide runtime every access happens
 * under RuntimeState's lock.
 */
class Registry {
public:
    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) noexcept = default;
    Registry& operator=(Registry&&) noexcept = default;
    ~Registry() = default;

    /**
     * @brief Insert or replace the handler for a method name
     *
     * @throws std::invalid_argument if the handler is empty
     */
    void Register(std::string name, std::unique_ptr<IMethodHandler> handler);
    void Register(std::string name, HandlerFunction function);

    /**
     * @brief Resolve a method and run its handler
     *
     * The handler's result is returned as-is. An unregistered name yields
     * RpcFailure::UnknownMethod carrying the name.
     */
    [[nodiscard]] Result<Bytes, RpcFailure> Call(std::string_view method, std::span<const uint8_t> input) const;

    [[nodiscard]] bool HasMethod(std::string_view method) const;
    [[nodiscard]] std::vector<std::string> Methods() const;
    [[nodiscard]] size_t Size() const noexcept;

private:
    struct NameHash {
        using is_transparent = void;
        size_t operator()(std::string_view name) const noexcept;
    };

    std::unordered_map<std::string, std::unique_ptr<IMethodHandler>, NameHash, std::equal_to<>> handlers_;
};
}
