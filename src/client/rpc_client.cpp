#include "rrpc/client/rpc_client.hpp"

#include <fmt/format.h>
#include <utility>

namespace rrpc::client {

// ============================================================================
// OwnedBuffer
// ============================================================================

OwnedBuffer::OwnedBuffer(uint8_t* data, const size_t length) noexcept
    : data_(data), length_(length) {
}

OwnedBuffer::OwnedBuffer(OwnedBuffer&& other) noexcept
    : data_(std::exchange(other.data_, nullptr))
    , length_(std::exchange(other.length_, 0)) {
}

OwnedBuffer& OwnedBuffer::operator=(OwnedBuffer&& other) noexcept {
    if (this != &other) {
        Reset();
        data_ = std::exchange(other.data_, nullptr);
        length_ = std::exchange(other.length_, 0);
    }
    return *this;
}

OwnedBuffer::~OwnedBuffer() {
    Reset();
}

std::span<const uint8_t> OwnedBuffer::View() const noexcept {
    if (!data_) {
        return {};
    }
    return {data_, length_};
}

std::vector<uint8_t> OwnedBuffer::Copy() const {
    const auto view = View();
    return {view.begin(), view.end()};
}

void OwnedBuffer::Reset() noexcept {
    if (data_) {
        rrpc_free(data_, length_);
        data_ = nullptr;
        length_ = 0;
    }
}

// ============================================================================
// RpcClient
// ============================================================================

Result<Unit, CallFailure> RpcClient::Initialize() {
    if (const auto status = rrpc_init(); status != RRPC_SUCCESS) {
        return Result<Unit, CallFailure>::Err(FailureFor(status, "rrpc_init"));
    }
    return Result<Unit, CallFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, CallFailure> RpcClient::Call(
    const std::string_view method,
    const std::span<const uint8_t> input) {
    // rrpc_call needs a NUL-terminated name.
    const std::string method_name(method);
    uint8_t* out_ptr = nullptr;
    size_t out_len = 0;
    const auto status = rrpc_call(
        method_name.c_str(),
        input.empty() ? nullptr : input.data(),
        input.size(),
        &out_ptr,
        &out_len);
    if (status != RRPC_SUCCESS) {
        return Result<std::vector<uint8_t>, CallFailure>::Err(FailureFor(status, method));
    }
    const OwnedBuffer output(out_ptr, out_len);
    return Result<std::vector<uint8_t>, CallFailure>::Ok(output.Copy());
}

Result<std::vector<uint8_t>, CallFailure> RpcClient::Call(
    const std::string_view method,
    const std::string_view input) {
    return Call(method, std::span(reinterpret_cast<const uint8_t*>(input.data()), input.size()));
}

CallFailure RpcClient::FailureFor(const RrpcStatus status, const std::string_view method) {
    return CallFailure{
        status,
        fmt::format("rrpc_call('{}') failed: rc={} ({})",
                    method, static_cast<int>(status), rrpc_status_string(status))
    };
}

} // namespace rrpc::client
