/**
 * @file echo_demo.cpp
 * @brief Registers a few handlers and drives them through the C boundary
 */

#include "graph_handlers.hpp"
#include "rrpc/c_api/rrpc_api.h"
#include "rrpc/client/rpc_client.hpp"
#include "rrpc/runtime/runtime_state.hpp"

#include <iostream>
#include <string>
#include <string_view>

using namespace rrpc;
using namespace rrpc::client;

namespace {

void call_text(const std::string_view method, const std::string_view input) {
    std::cout << "Calling '" << method << "' with: \"" << input << "\"" << std::endl;
    auto reply = RpcClient::Call(method, input);
    if (reply.IsErr()) {
        std::cout << "   Error: " << reply.UnwrapErr().message << std::endl;
        return;
    }
    const auto& bytes = reply.Unwrap();
    std::cout << "   Result: \"" << std::string(bytes.begin(), bytes.end()) << "\"" << std::endl;
}

} // namespace

int main() {
    std::cout << "=== rRPC Echo Demo ===" << std::endl;
    std::cout << std::endl;

    if (auto init = RpcClient::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize: " << init.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ rRPC " << rrpc_version() << " initialized" << std::endl;

    auto* state = runtime::RuntimeState::TryGet();
    if (!state) {
        std::cerr << "Runtime missing after initialization" << std::endl;
        return 1;
    }
    demo::RegisterDemoHandlers(*state);
    const auto method_count = state->WithRegistry([](const runtime::Registry& registry) {
        return registry.Size();
    });
    std::cout << "   ✓ Registered " << method_count << " handlers" << std::endl;
    std::cout << std::endl;

    call_text("echo", "Hello, rRPC!");
    call_text("reverse", "Hello, rRPC!");
    std::cout << std::endl;

    proto::demo::Node node;
    node.set_id("n-1");
    node.set_title("First node");
    for (const double component : {1.0, 2.0, 2.0, 4.0}) {
        node.add_position(component);
    }
    std::cout << "Calling 'graph.describe_node' with node " << node.id() << std::endl;
    auto summary = RpcClient::CallMessage<proto::demo::NodeSummary>("graph.describe_node", node);
    if (summary.IsErr()) {
        std::cout << "   Error: " << summary.UnwrapErr().message << std::endl;
    } else {
        std::cout << "   Result: " << summary.Unwrap().description()
                  << " (|position| = " << summary.Unwrap().magnitude() << ")" << std::endl;
    }
    std::cout << std::endl;

    std::cout << "Calling unknown method 'missing'..." << std::endl;
    if (auto missing = RpcClient::Call("missing", "test"); missing.IsErr()) {
        std::cout << "   Expected error: " << missing.UnwrapErr().message << std::endl;
    } else {
        std::cout << "   Unexpected success" << std::endl;
    }

    std::cout << std::endl;
    std::cout << "=== Demo Complete ===" << std::endl;
    return 0;
}
