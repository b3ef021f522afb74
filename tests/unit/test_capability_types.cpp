#include <catch2/catch_test_macros.hpp>
#include "witnesschain/capability/capability_types.hpp"
#include <string>
using namespace witnesschain::vault::capability;
TEST_CASE("CapabilityAction - String forms", "[capability]") {
    for (const auto action : {CapabilityAction::EvidenceUpload, CapabilityAction::EvidenceRead,
                              CapabilityAction::EvidenceList, CapabilityAction::EvidenceDelete}) {
        REQUIRE(ParseAction(ActionToString(action)) == action);
    }
    REQUIRE(ActionToString(CapabilityAction::EvidenceUpload) == "witnesschain/evidence/upload");
    REQUIRE(ActionToString(CapabilityAction::EvidenceRead) == "witnesschain/evidence/read");
    REQUIRE_FALSE(ParseAction("witnesschain/evidence/*").has_value());
    REQUIRE_FALSE(ParseAction("WITNESSCHAIN/EVIDENCE/READ").has_value());
    REQUIRE_FALSE(ParseAction("").has_value());
}
TEST_CASE("ResourceDescriptor - Resource ids and coverage", "[capability]") {
    SECTION("Resource id rules") {
        REQUIRE(IsValidResourceId("ev-1"));
        REQUIRE(IsValidResourceId(std::string(128, 'a')));
        REQUIRE_FALSE(IsValidResourceId(""));
        REQUIRE_FALSE(IsValidResourceId(std::string(129, 'a')));
        REQUIRE_FALSE(IsValidResourceId("a/b"));
        REQUIRE_FALSE(IsValidResourceId("*"));
    }
    SECTION("URIs") {
        REQUIRE(ResourceDescriptor::Specific("did:key:zA", "ev-1").ToUri() == "did:key:zA:evidence/ev-1");
        REQUIRE(ResourceDescriptor::Wildcard("did:key:zA").ToUri() == "did:key:zA:evidence/*");
    }
    SECTION("Wildcard covers every valid id") {
        const auto wildcard = ResourceDescriptor::Wildcard("did:key:zA");
        REQUIRE(wildcard.IsWildcard());
        REQUIRE(wildcard.Covers("ev-1"));
        REQUIRE(wildcard.Covers(std::nullopt));
        REQUIRE_FALSE(wildcard.Covers("../ev-1"));
    }
    SECTION("Specific covers exactly one id") {
        const auto specific = ResourceDescriptor::Specific("did:key:zA", "ev-1");
        REQUIRE_FALSE(specific.IsWildcard());
        REQUIRE(specific.Covers("ev-1"));
        REQUIRE(specific.Covers(std::nullopt));
        REQUIRE_FALSE(specific.Covers("ev-2"));
        REQUIRE_FALSE(specific.Covers("ev-1*"));
    }
}
