#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolbridge::tools {

// Unwraps a lone {"kwargs": {...}} wrapper and renames aliased argument names
// to their canonical form. A canonical name already present wins over aliases.
nlohmann::json normalize_arguments(const nlohmann::json& arguments,
                                   const protocol::ArgumentSynonyms& synonyms);

// Checks `arguments` against the supported JSON schema subset (required,
// per-property type/enum/minimum/maximum) and fills in declared defaults.
core::errors::Result<nlohmann::json> validate_arguments(const nlohmann::json& arguments,
                                                        const nlohmann::json& schema);

}  // namespace toolbridge::tools
