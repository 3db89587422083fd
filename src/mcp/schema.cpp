#include <snap_mcp/mcp/schema.hpp>

#include <cmath>

namespace snap_mcp {

namespace {

bool MatchesType(const std::string& type, const nlohmann::json& value) {
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "string")  return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "null")    return value.is_null();
    if (type == "number")  return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        // 3.0 is an integer as far as JSON Schema is concerned.
        if (value.is_number_float()) {
            const double d = value.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    return true;
}

std::string Join(const std::string& parent, const std::string& child) {
    return parent.empty() ? child : parent + "." + child;
}

std::optional<SchemaViolation> Check(const nlohmann::json& schema,
                                     const nlohmann::json& value,
                                     const std::string& path) {
    if (!schema.is_object()) {
        return std::nullopt;
    }

    if (auto it = schema.find("type"); it != schema.end() && it->is_string()) {
        const auto type = it->get<std::string>();
        if (!MatchesType(type, value)) {
            return SchemaViolation{path, "expected " + type + ", got " +
                                             std::string(value.type_name())};
        }
    }

    if (auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
        bool found = false;
        for (const auto& allowed : *it) {
            if (allowed == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return SchemaViolation{path, "must be one of " + it->dump()};
        }
    }

    if (value.is_number()) {
        const double d = value.get<double>();
        if (auto it = schema.find("minimum"); it != schema.end() && it->is_number() &&
            d < it->get<double>()) {
            return SchemaViolation{path, "must be >= " + it->dump()};
        }
        if (auto it = schema.find("maximum"); it != schema.end() && it->is_number() &&
            d > it->get<double>()) {
            return SchemaViolation{path, "must be <= " + it->dump()};
        }
    }

    if (value.is_object()) {
        if (auto req = schema.find("required"); req != schema.end() && req->is_array()) {
            for (const auto& name : *req) {
                if (name.is_string() && !value.contains(name.get<std::string>())) {
                    return SchemaViolation{Join(path, name.get<std::string>()),
                                           "is required"};
                }
            }
        }
        if (auto props = schema.find("properties");
            props != schema.end() && props->is_object()) {
            for (auto prop = props->begin(); prop != props->end(); ++prop) {
                auto member = value.find(prop.key());
                if (member == value.end()) continue;
                if (auto v = Check(prop.value(), *member, Join(path, prop.key()))) {
                    return v;
                }
            }
        }
    }

    if (value.is_array()) {
        if (auto items = schema.find("items"); items != schema.end()) {
            for (size_t i = 0; i < value.size(); ++i) {
                if (auto v = Check(*items, value[i],
                                   path + "[" + std::to_string(i) + "]")) {
                    return v;
                }
            }
        }
    }

    return std::nullopt;
}

} // anonymous namespace

std::optional<SchemaViolation> ValidateAgainstSchema(const nlohmann::json& schema,
                                                     const nlohmann::json& value) {
    return Check(schema, value, "");
}

} // namespace snap_mcp
