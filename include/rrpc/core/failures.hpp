#pragma once
#include <fmt/format.h>
#include <string>
#include <string_view>
namespace rrpc {
enum class RpcFailureType {
    UnknownMethod,
    NotFound,
    ParseError,
    SerializationError,
    Internal,
    TooLarge
};
class RpcFailure {
public:
    RpcFailureType type;
    std::string message;
    RpcFailure(const RpcFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static RpcFailure UnknownMethod(std::string method) {
        return {RpcFailureType::UnknownMethod, std::move(method)};
    }
    static RpcFailure NotFound(std::string resource) {
        return {RpcFailureType::NotFound, std::move(resource)};
    }
    static RpcFailure ParseError(std::string msg) {
        return {RpcFailureType::ParseError, std::move(msg)};
    }
    static RpcFailure SerializationError(std::string msg) {
        return {RpcFailureType::SerializationError, std::move(msg)};
    }
    static RpcFailure Internal(std::string msg) {
        return {RpcFailureType::Internal, std::move(msg)};
    }
    static RpcFailure TooLarge(std::string msg) {
        return {RpcFailureType::TooLarge, std::move(msg)};
    }
    [[nodiscard]] std::string ToString() const {
        return fmt::format("{}: {}", TypeName(type), message);
    }
    [[nodiscard]] static constexpr std::string_view TypeName(const RpcFailureType t) noexcept {
        switch (t) {
            case RpcFailureType::UnknownMethod: return "Unknown method";
            case RpcFailureType::NotFound: return "Not found";
            case RpcFailureType::ParseError: return "Parse error";
            case RpcFailureType::SerializationError: return "Serialization error";
            case RpcFailureType::Internal: return "Internal error";
            case RpcFailureType::TooLarge: return "Input too large";
        }
        return "Internal error";
    }
};
}
