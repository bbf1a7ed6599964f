#include "tools/argument_schema.hpp"

#include <string>
#include <utility>

namespace toolbridge::tools {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
namespace codes = core::errors::codes;

namespace {

bool matches_type(const json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    // Unknown schema types are not enforced.
    return true;
}

BridgeError invalid_argument(const std::string& name, const std::string& reason) {
    return BridgeError{ErrorCategory::Input, "Invalid argument '" + name + "': " + reason,
                       codes::kInvalidArgument};
}

}  // namespace

json normalize_arguments(const json& arguments, const protocol::ArgumentSynonyms& synonyms) {
    json normalized = arguments.is_object() ? arguments : json::object();

    if (normalized.size() == 1 && normalized.contains("kwargs") &&
        normalized["kwargs"].is_object()) {
        json inner = normalized["kwargs"];
        normalized = std::move(inner);
    }

    for (const auto& [canonical, aliases] : synonyms) {
        if (normalized.contains(canonical)) {
            continue;
        }
        for (const auto& alias : aliases) {
            auto it = normalized.find(alias);
            if (it == normalized.end()) {
                continue;
            }
            json value = *it;
            normalized.erase(it);
            normalized[canonical] = std::move(value);
            break;
        }
    }
    return normalized;
}

core::errors::Result<json> validate_arguments(const json& arguments, const json& schema) {
    if (!arguments.is_object()) {
        return BridgeError{ErrorCategory::Input, "Tool arguments must be a JSON object",
                           codes::kInvalidArgument};
    }
    json validated = arguments;
    if (!schema.is_object()) {
        return validated;
    }

    const auto required_it = schema.find("required");
    if (required_it != schema.end() && required_it->is_array()) {
        for (const auto& name : *required_it) {
            if (!name.is_string()) {
                continue;
            }
            const auto key = name.get<std::string>();
            if (!validated.contains(key) || validated[key].is_null()) {
                return BridgeError{ErrorCategory::Input, "Missing required argument: " + key,
                                   codes::kMissingArgument};
            }
        }
    }

    const auto properties_it = schema.find("properties");
    if (properties_it == schema.end() || !properties_it->is_object()) {
        return validated;
    }

    for (const auto& [name, property] : properties_it->items()) {
        if (!property.is_object()) {
            continue;
        }
        if (!validated.contains(name) || validated[name].is_null()) {
            const auto default_it = property.find("default");
            if (default_it != property.end()) {
                validated[name] = *default_it;
            }
            continue;
        }

        const json& value = validated[name];
        const auto type_it = property.find("type");
        if (type_it != property.end() && type_it->is_string()) {
            const auto type = type_it->get<std::string>();
            if (!matches_type(value, type)) {
                return invalid_argument(name, "expected " + type);
            }
        }

        const auto enum_it = property.find("enum");
        if (enum_it != property.end() && enum_it->is_array()) {
            bool found = false;
            for (const auto& option : *enum_it) {
                if (option == value) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                return invalid_argument(name, "must be one of " + enum_it->dump());
            }
        }

        if (value.is_number()) {
            const double number = value.get<double>();
            const auto min_it = property.find("minimum");
            if (min_it != property.end() && min_it->is_number() &&
                number < min_it->get<double>()) {
                return invalid_argument(name, "must be >= " + min_it->dump());
            }
            const auto max_it = property.find("maximum");
            if (max_it != property.end() && max_it->is_number() &&
                number > max_it->get<double>()) {
                return invalid_argument(name, "must be <= " + max_it->dump());
            }
        }
    }
    return validated;
}

}  // namespace toolbridge::tools
