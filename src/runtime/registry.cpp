#include "rrpc/runtime/registry.hpp"
#include "rrpc/debug/call_logger.hpp"
#include <functional>
#include <stdexcept>

namespace rrpc::runtime {
    size_t Registry::NameHash::operator()(const std::string_view name) const noexcept {
        return std::hash<std::string_view>{}(name);
    }

    void Registry::Register(std::string name, std::unique_ptr<IMethodHandler> handler) {
        if (!handler) {
            throw std::invalid_argument("Handler for '" + name + "' is null");
        }
        const bool replaced = handlers_.contains(name);
        debug::LogMethodRegistered(name, replaced);
        handlers_.insert_or_assign(std::move(name), std::move(handler));
    }

    void Registry::Register(std::string name, HandlerFunction function) {
        if (!function) {
            throw std::invalid_argument("Handler for '" + name + "' is empty");
        }
        Register(std::move(name), std::make_unique<interfaces::FunctionHandler>(std::move(function)));
    }

    Result<Bytes, RpcFailure> Registry::Call(
        const std::string_view method,
        const std::span<const uint8_t> input) const {
        const auto it = handlers_.find(method);
        if (it == handlers_.end()) {
            return Result<Bytes, RpcFailure>::Err(
                RpcFailure::UnknownMethod(std::string(method)));
        }
        return it->second->Handle(input);
    }

    bool Registry::HasMethod(const std::string_view method) const {
        return handlers_.find(method) != handlers_.end();
    }

    std::vector<std::string> Registry::Methods() const {
        std::vector<std::string> names;
        names.reserve(handlers_.size());
        for (const auto &[name, handler]: handlers_) {
            (void)handler;
            names.push_back(name);
        }
        return names;
    }

    size_t Registry::Size() const noexcept {
        return handlers_.size();
    }
}
