#pragma once

#include "rrpc/core/result.hpp"
#include "rrpc/core/failures.hpp"
#include "rrpc/interfaces/i_method_handler.hpp"
#include "rrpc/runtime/runtime_state.hpp"
#include "rrpc/demo/graph.pb.h"

#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>

namespace rrpc::demo {

using interfaces::Bytes;

Result<Bytes, RpcFailure> Echo(std::span<const uint8_t> input);

Result<Bytes, RpcFailure> Reverse(std::span<const uint8_t> input);

/**
 * @brief graph.describe_node: Node in, NodeSummary out
 *
 * ParseError for undecodable input or a position that is not 4 components.
 */
Result<Bytes, RpcFailure> DescribeNode(std::span<const uint8_t> input);

/**
 * @brief graph.lookup_node: Node id (UTF-8 bytes) in, stored Node out
 *
 * The node table is fixed at construction.
 */
class NodeLookupHandler final : public interfaces::IMethodHandler {
public:
    explicit NodeLookupHandler(std::unordered_map<std::string, proto::demo::Node> nodes);
    [[nodiscard]] Result<Bytes, RpcFailure> Handle(std::span<const uint8_t> input) const override;

private:
    std::unordered_map<std::string, proto::demo::Node> nodes_;
};

/**
 * @brief Register echo, reverse, graph.describe_node and graph.lookup_node
 */
void RegisterDemoHandlers(runtime::RuntimeState& runtime);

} // namespace rrpc::demo
