#include "graph_handlers.hpp"

#include <fmt/format.h>
#include <cmath>
#include <memory>

namespace rrpc::demo {

namespace {

constexpr int POSITION_COMPONENTS = 4;

Result<Bytes, RpcFailure> SerializeMessage(const google::protobuf::MessageLite& message) {
    Bytes out(message.ByteSizeLong());
    if (!message.SerializeToArray(out.data(), static_cast<int>(out.size()))) {
        return Result<Bytes, RpcFailure>::Err(
            RpcFailure::SerializationError("Failed to serialize " + message.GetTypeName()));
    }
    return Result<Bytes, RpcFailure>::Ok(std::move(out));
}

} // namespace

Result<Bytes, RpcFailure> Echo(const std::span<const uint8_t> input) {
    return Result<Bytes, RpcFailure>::Ok(Bytes(input.begin(), input.end()));
}

Result<Bytes, RpcFailure> Reverse(const std::span<const uint8_t> input) {
    return Result<Bytes, RpcFailure>::Ok(Bytes(input.rbegin(), input.rend()));
}

Result<Bytes, RpcFailure> DescribeNode(const std::span<const uint8_t> input) {
    proto::demo::Node node;
    if (!node.ParseFromArray(input.data(), static_cast<int>(input.size()))) {
        return Result<Bytes, RpcFailure>::Err(RpcFailure::ParseError("Input is not a Node"));
    }
    if (node.position_size() != POSITION_COMPONENTS) {
        return Result<Bytes, RpcFailure>::Err(RpcFailure::ParseError(
            fmt::format("Node position has {} components, expected {}",
                        node.position_size(), POSITION_COMPONENTS)));
    }

    double sum_of_squares = 0.0;
    for (const double component : node.position()) {
        sum_of_squares += component * component;
    }

    proto::demo::NodeSummary summary;
    summary.set_id(node.id());
    summary.set_description(fmt::format("Node {}: {}", node.id(), node.title()));
    summary.set_magnitude(std::sqrt(sum_of_squares));
    return SerializeMessage(summary);
}

NodeLookupHandler::NodeLookupHandler(std::unordered_map<std::string, proto::demo::Node> nodes)
    : nodes_(std::move(nodes)) {
}

Result<Bytes, RpcFailure> NodeLookupHandler::Handle(const std::span<const uint8_t> input) const {
    const std::string id(input.begin(), input.end());
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return Result<Bytes, RpcFailure>::Err(RpcFailure::NotFound("node " + id));
    }
    return SerializeMessage(it->second);
}

void RegisterDemoHandlers(runtime::RuntimeState& runtime) {
    runtime.Register("echo", &Echo);
    runtime.Register("reverse", &Reverse);
    runtime.Register("graph.describe_node", &DescribeNode);

    proto::demo::Node origin;
    origin.set_id("origin");
    origin.set_title("Origin");
    for (int i = 0; i < POSITION_COMPONENTS; ++i) {
        origin.add_position(0.0);
    }
    std::unordered_map<std::string, proto::demo::Node> nodes;
    nodes.emplace(origin.id(), origin);
    runtime.Register("graph.lookup_node",
                     std::unique_ptr<interfaces::IMethodHandler>(
                         std::make_unique<NodeLookupHandler>(std::move(nodes))));
}

} // namespace rrpc::demo
