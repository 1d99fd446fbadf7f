// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <sstream>

#include <catch2/catch_test_macros.hpp>

#include <l1fee/core/common/test_util.hpp>

namespace l1fee {

TEST_CASE("Rollup upgrade activation") {
    CHECK(!test::kBedrockConfig.is_regolith(0));
    CHECK(!test::kBedrockConfig.is_eclipse(UINT64_MAX));

    CHECK(!test::kRegolithConfig.is_regolith(0));
    CHECK(test::kRegolithConfig.is_regolith(1));
    CHECK(test::kRegolithConfig.is_regolith(2));
    CHECK(!test::kRegolithConfig.is_eclipse(2));

    CHECK(test::kEclipseConfig.upgrade_activation(0) == protocol::UpgradeActivation{.is_regolith = true});
    CHECK(test::kEclipseConfig.upgrade_activation(999) == protocol::UpgradeActivation{.is_regolith = true});
    CHECK(test::kEclipseConfig.upgrade_activation(1000) ==
          protocol::UpgradeActivation{.is_regolith = true, .is_eclipse = true});
}

TEST_CASE("L1 fee gate") {
    CHECK(test::kNoRollupConfig.l1_fee_gate() == protocol::FeatureGate::kDisabled);
    CHECK(test::kBedrockConfig.l1_fee_gate() == protocol::FeatureGate::kEnabled);
    CHECK(test::kEclipseConfig.l1_fee_gate() == protocol::FeatureGate::kEnabled);
}

TEST_CASE("Config from JSON") {
    const auto json = nlohmann::json::parse(R"({
        "chainId": 901,
        "regolithTime": 0,
        "eclipseTime": 1000,
        "optimism": {
            "eip1559Elasticity": 6,
            "eip1559Denominator": 50
        }
    })");
    const std::optional<ChainConfig> config{ChainConfig::from_json(json)};
    REQUIRE(config);
    CHECK(*config == test::kEclipseConfig);
    CHECK(config->to_json() == json);
}

TEST_CASE("Config without rollup section") {
    const auto json = nlohmann::json::parse(R"({"chainId": 1})");
    const std::optional<ChainConfig> config{ChainConfig::from_json(json)};
    REQUIRE(config);
    CHECK(*config == test::kNoRollupConfig);
    CHECK(config->l1_fee_gate() == protocol::FeatureGate::kDisabled);
}

TEST_CASE("Malformed config") {
    CHECK(!ChainConfig::from_json(nlohmann::json::parse("[]")));
    CHECK(!ChainConfig::from_json(nlohmann::json::parse(R"({})")));
    CHECK(!ChainConfig::from_json(nlohmann::json::parse(R"({"chainId": "10"})")));
    CHECK(!ChainConfig::from_json(nlohmann::json::parse(R"({"chainId": 10, "regolithTime": -1})")));
    CHECK(!ChainConfig::from_json(nlohmann::json::parse(R"({"chainId": 10, "eclipseTime": "soon"})")));
    CHECK(!ChainConfig::from_json(nlohmann::json::parse(R"({"chainId": 10, "optimism": true})")));
    CHECK(!ChainConfig::from_json(nlohmann::json::parse(R"({"chainId": 10, "optimism": {"eip1559Elasticity": 1.5}})")));
    CHECK(!ChainConfig::from_json(nlohmann::json::parse("{", nullptr, /*allow_exceptions=*/false)));
}

TEST_CASE("Config round trip") {
    for (const ChainConfig& config :
         {test::kNoRollupConfig, test::kBedrockConfig, test::kRegolithConfig, test::kEclipseConfig}) {
        CHECK(ChainConfig::from_json(config.to_json()) == config);
    }
}

TEST_CASE("Config output") {
    std::ostringstream out;
    out << test::kRegolithConfig;
    CHECK(nlohmann::json::parse(out.str()) == test::kRegolithConfig.to_json());
}

}  // namespace l1fee
