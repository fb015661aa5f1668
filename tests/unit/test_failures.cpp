#include <catch2/catch_test_macros.hpp>
#include "rrpc/core/failures.hpp"
#include "c_api/rrpc_internal.hpp"
#include <set>

using namespace rrpc;

TEST_CASE("RpcFailure - Factories and rendering", "[failures][core]") {
    SECTION("Factories set the matching type") {
        REQUIRE(RpcFailure::UnknownMethod("m").type == RpcFailureType::UnknownMethod);
        REQUIRE(RpcFailure::NotFound("r").type == RpcFailureType::NotFound);
        REQUIRE(RpcFailure::ParseError("p").type == RpcFailureType::ParseError);
        REQUIRE(RpcFailure::SerializationError("s").type == RpcFailureType::SerializationError);
        REQUIRE(RpcFailure::Internal("i").type == RpcFailureType::Internal);
        REQUIRE(RpcFailure::TooLarge("t").type == RpcFailureType::TooLarge);
    }

    SECTION("ToString prefixes the kind") {
        REQUIRE(RpcFailure::UnknownMethod("missing").ToString() == "Unknown method: missing");
        REQUIRE(RpcFailure::NotFound("user 42").ToString() == "Not found: user 42");
        REQUIRE(RpcFailure::ParseError("bad json").ToString() == "Parse error: bad json");
        REQUIRE(RpcFailure::SerializationError("x").ToString() == "Serialization error: x");
        REQUIRE(RpcFailure::Internal("x").ToString() == "Internal error: x");
    }
}

TEST_CASE("RpcFailure - Boundary status mapping", "[failures][c_api]") {
    using internal::status_from_failure;

    SECTION("Each kind maps to its fixed code") {
        REQUIRE(status_from_failure(RpcFailure::UnknownMethod("")) == 2);
        REQUIRE(status_from_failure(RpcFailure::ParseError("")) == 3);
        REQUIRE(status_from_failure(RpcFailure::NotFound("")) == 4);
        REQUIRE(status_from_failure(RpcFailure::SerializationError("")) == 5);
        REQUIRE(status_from_failure(RpcFailure::TooLarge("")) == 6);
        REQUIRE(status_from_failure(RpcFailure::Internal("")) == 99);
    }

    SECTION("No two kinds share a code") {
        const std::set<int> codes{
            status_from_failure(RpcFailure::UnknownMethod("")),
            status_from_failure(RpcFailure::NotFound("")),
            status_from_failure(RpcFailure::ParseError("")),
            status_from_failure(RpcFailure::SerializationError("")),
            status_from_failure(RpcFailure::Internal("")),
            status_from_failure(RpcFailure::TooLarge("")),
        };
        REQUIRE(codes.size() == 6);
        REQUIRE(codes.count(RRPC_SUCCESS) == 0);
        REQUIRE(codes.count(RRPC_ERROR_NOT_INITIALIZED) == 0);
    }

    SECTION("Context never changes the code") {
        REQUIRE(status_from_failure(RpcFailure::NotFound("a")) ==
                status_from_failure(RpcFailure::NotFound("something else entirely")));
    }
}
