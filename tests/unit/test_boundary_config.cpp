#include <catch2/catch_test_macros.hpp>
#include "rrpc/configuration/boundary_config.hpp"
#include "rrpc/c_api/rrpc_api.h"

using namespace rrpc;
using namespace rrpc::configuration;

TEST_CASE("BoundaryConfig - Factories", "[config]") {
    SECTION("Input cap is 10 MiB everywhere") {
        STATIC_REQUIRE(BoundaryConfig::Default().MaxInputSize() == 10u * 1024u * 1024u);
        STATIC_REQUIRE(BoundaryConfig::Fast().MaxInputSize() == BoundaryConfig::Hardened().MaxInputSize());
        STATIC_REQUIRE(BoundaryConfig::Active().MaxInputSize() == RRPC_MAX_INPUT_SIZE);
    }

    SECTION("Release policies") {
        STATIC_REQUIRE(BoundaryConfig::Hardened().WipeOnRelease());
        STATIC_REQUIRE_FALSE(BoundaryConfig::Fast().WipeOnRelease());
        STATIC_REQUIRE(BoundaryConfig::Fast().GetReleasePolicy() == ReleasePolicy::Plain);
        STATIC_REQUIRE(BoundaryConfig::Default() == BoundaryConfig::Hardened());
        STATIC_REQUIRE(BoundaryConfig::Default() != BoundaryConfig::Fast());
    }

    SECTION("Active follows the build option") {
#if defined(RRPC_SECURE_RELEASE) && RRPC_SECURE_RELEASE == 0
        STATIC_REQUIRE(BoundaryConfig::Active() == BoundaryConfig::Fast());
#else
        STATIC_REQUIRE(BoundaryConfig::Active() == BoundaryConfig::Hardened());
#endif
    }
}
