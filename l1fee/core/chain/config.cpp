// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <string>

namespace l1fee {

static void member_to_json(nlohmann::json& json, const std::string& key, const std::optional<uint64_t>& source) {
    if (source) {
        json[key] = source.value();
    }
}

//! \return false if the member is present but not an unsigned integer
[[nodiscard]] static bool read_json_config_member(const nlohmann::json& json, const std::string& key,
                                                  std::optional<uint64_t>& target) {
    if (!json.contains(key)) {
        return true;
    }
    if (!json[key].is_number_unsigned()) {
        return false;
    }
    target = json[key].get<uint64_t>();
    return true;
}

bool ChainConfig::is_regolith(BlockTime block_time) const noexcept {
    return regolith_time && block_time >= *regolith_time;
}

bool ChainConfig::is_eclipse(BlockTime block_time) const noexcept {
    return eclipse_time && block_time >= *eclipse_time;
}

protocol::UpgradeActivation ChainConfig::upgrade_activation(BlockTime block_time) const noexcept {
    return {.is_regolith = is_regolith(block_time), .is_eclipse = is_eclipse(block_time)};
}

protocol::FeatureGate ChainConfig::l1_fee_gate() const noexcept {
    return optimism ? protocol::FeatureGate::kEnabled : protocol::FeatureGate::kDisabled;
}

nlohmann::json ChainConfig::to_json() const noexcept {
    nlohmann::json ret;

    ret["chainId"] = chain_id;

    member_to_json(ret, "regolithTime", regolith_time);
    member_to_json(ret, "eclipseTime", eclipse_time);

    if (optimism) {
        ret["optimism"] = {
            {"eip1559Elasticity", optimism->eip1559_elasticity},
            {"eip1559Denominator", optimism->eip1559_denominator},
        };
    }

    return ret;
}

std::optional<ChainConfig> ChainConfig::from_json(const nlohmann::json& json) noexcept {
    if (json.is_discarded() || !json.is_object() || !json.contains("chainId") ||
        !json["chainId"].is_number_unsigned()) {
        return std::nullopt;
    }

    ChainConfig config{};
    config.chain_id = json["chainId"].get<uint64_t>();

    if (!read_json_config_member(json, "regolithTime", config.regolith_time) ||
        !read_json_config_member(json, "eclipseTime", config.eclipse_time)) {
        return std::nullopt;
    }

    if (json.contains("optimism")) {
        const auto& section{json["optimism"]};
        if (!section.is_object()) {
            return std::nullopt;
        }
        std::optional<uint64_t> elasticity, denominator;
        if (!read_json_config_member(section, "eip1559Elasticity", elasticity) ||
            !read_json_config_member(section, "eip1559Denominator", denominator)) {
            return std::nullopt;
        }
        config.optimism = OptimismConfig{
            .eip1559_elasticity = elasticity.value_or(0),
            .eip1559_denominator = denominator.value_or(0),
        };
    }

    return config;
}

std::ostream& operator<<(std::ostream& out, const ChainConfig& obj) { return out << obj.to_json(); }

}  // namespace l1fee
