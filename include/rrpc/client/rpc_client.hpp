#pragma once

#include "rrpc/c_api/rrpc_api.h"
#include "rrpc/core/result.hpp"

#include <google/protobuf/message_lite.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace rrpc::client {

/**
 * @brief Failed boundary call: the status code plus a readable description
 */
struct CallFailure {
    RrpcStatus status;
    std::string message;
};

/**
 * @brief RAII owner of a buffer returned by rrpc_call
 *
 * Releases through rrpc_free exactly once. Move-only.
 */
class OwnedBuffer {
public:
    OwnedBuffer() = default;
    OwnedBuffer(uint8_t* data, size_t length) noexcept;
    OwnedBuffer(OwnedBuffer&& other) noexcept;
    OwnedBuffer& operator=(OwnedBuffer&& other) noexcept;
    OwnedBuffer(const OwnedBuffer&) = delete;
    OwnedBuffer& operator=(const OwnedBuffer&) = delete;
    ~OwnedBuffer();

    [[nodiscard]] std::span<const uint8_t> View() const noexcept;
    [[nodiscard]] std::vector<uint8_t> Copy() const;

private:
    void Reset() noexcept;

    uint8_t* data_ = nullptr;
    size_t length_ = 0;
};

/**
 * @brief Host-side convenience wrapper over the C boundary
 *
 * Goes through rrpc_init/rrpc_call/rrpc_free exactly as a foreign caller
 * would, and turns status codes into Result values.
 */
class RpcClient {
public:
    [[nodiscard]] static Result<Unit, CallFailure> Initialize();

    [[nodiscard]] static Result<std::vector<uint8_t>, CallFailure> Call(
        std::string_view method,
        std::span<const uint8_t> input);

    [[nodiscard]] static Result<std::vector<uint8_t>, CallFailure> Call(
        std::string_view method,
        std::string_view input);

    /**
     * @brief Serialize a request message, call, and parse the reply
     */
    template<typename Response, typename Request>
    [[nodiscard]] static Result<Response, CallFailure> CallMessage(
        std::string_view method,
        const Request& request) {
        static_assert(std::is_base_of_v<google::protobuf::MessageLite, Response>,
                      "Response must be a protobuf message");
        std::string payload;
        if (!request.SerializeToString(&payload)) {
            return Result<Response, CallFailure>::Err(
                CallFailure{RRPC_ERROR_SERIALIZATION, "Failed to serialize request"});
        }
        auto reply = Call(method, std::string_view(payload));
        if (reply.IsErr()) {
            return Result<Response, CallFailure>::Err(std::move(reply).UnwrapErr());
        }
        const auto& bytes = reply.Unwrap();
        Response response;
        if (!response.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<Response, CallFailure>::Err(
                CallFailure{RRPC_ERROR_PARSE, "Failed to parse response"});
        }
        return Result<Response, CallFailure>::Ok(std::move(response));
    }

    /**
     * @brief Failure describing a non-success status
     */
    [[nodiscard]] static CallFailure FailureFor(RrpcStatus status, std::string_view method);

    RpcClient() = delete;
};

} // namespace rrpc::client
