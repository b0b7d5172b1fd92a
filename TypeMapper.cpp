// TypeMapper.cpp
//
// Recursive descriptor -> static type mapping with fallback tracking.
#include "TypeMapper.hpp"
#include <cstdint>
#include <fmt/core.h>

namespace FlowGen {

StaticType StaticType::sequence(StaticType element) {
    StaticType t{StaticKind::Sequence, {}};
    t.args.push_back(std::move(element));
    return t;
}

StaticType StaticType::orderedDict(StaticType key, StaticType value) {
    StaticType t{StaticKind::OrderedDict, {}};
    t.args.push_back(std::move(key));
    t.args.push_back(std::move(value));
    return t;
}

StaticType StaticType::nullable(StaticType inner) {
    // Nullable(Nullable(T)) has no distinct meaning in either target
    if (inner.kind == StaticKind::Nullable) return inner;
    StaticType t{StaticKind::Nullable, {}};
    t.args.push_back(std::move(inner));
    return t;
}

bool StaticType::isComparableKey() const {
    return kind == StaticKind::Text || kind == StaticKind::Int64 || kind == StaticKind::Bool;
}

namespace {

std::string childPath(const std::string& path, const char* suffix) {
    if (path.empty()) return suffix[0] == '.' ? std::string(suffix + 1) : std::string(suffix);
    return path + suffix;
}

StaticType fallback(std::vector<TypeFallback>* fallbacks, const std::string& path, std::string reason) {
    if (fallbacks) fallbacks->push_back({path.empty() ? std::string("<root>") : path, std::move(reason)});
    return StaticType::dynamic();
}

} // namespace

StaticType mapType(const DynamicType& type, std::vector<TypeFallback>* fallbacks, const std::string& path) {
    switch (type.kind) {
    case DynamicKind::Primitive:
        switch (type.primitive) {
        case PrimitiveKind::String: return StaticType::text();
        case PrimitiveKind::Integer: return StaticType::int64();
        case PrimitiveKind::Float: return StaticType::float64();
        case PrimitiveKind::Bool: return StaticType::boolean();
        }
        return fallback(fallbacks, path, "unknown primitive kind");
    case DynamicKind::Collection:
        if (type.args.size() != 1) {
            return fallback(fallbacks, path, fmt::format("collection descriptor with {} element types", type.args.size()));
        }
        return StaticType::sequence(mapType(type.args[0], fallbacks, childPath(path, "[]")));
    case DynamicKind::Mapping: {
        if (type.args.size() != 2) {
            return fallback(fallbacks, path, fmt::format("mapping descriptor with {} type arguments", type.args.size()));
        }
        // Key fallbacks are subsumed by the mapping-level fallback below
        StaticType key = mapType(type.args[0], nullptr);
        if (!key.isComparableKey()) {
            return fallback(fallbacks, path,
                            fmt::format("mapping key {} is not a comparable static type", describe(type.args[0])));
        }
        return StaticType::orderedDict(std::move(key), mapType(type.args[1], fallbacks, childPath(path, ".value")));
    }
    case DynamicKind::Optional:
        if (type.args.size() != 1) {
            return fallback(fallbacks, path, fmt::format("optional descriptor with {} inner types", type.args.size()));
        }
        return StaticType::nullable(mapType(type.args[0], fallbacks, path));
    case DynamicKind::Opaque:
        return fallback(fallbacks, path,
                        type.hint.empty() ? std::string("opaque value") : fmt::format("opaque value '{}'", type.hint));
    }
    return fallback(fallbacks, path, "unknown descriptor kind");
}

bool defaultFits(const StaticType& type, const nlohmann::json& value) {
    switch (type.kind) {
    case StaticKind::Text: return value.is_string();
    case StaticKind::Int64:
        return value.is_number_integer() &&
               !(value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(INT64_MAX));
    case StaticKind::Float64: return value.is_number();
    case StaticKind::Bool: return value.is_boolean();
    case StaticKind::Sequence: return value.is_array() && value.empty();
    case StaticKind::OrderedDict: return value.is_object() && value.empty();
    case StaticKind::Nullable: return value.is_null() || (!type.args.empty() && defaultFits(type.args[0], value));
    case StaticKind::Dynamic: return value.is_null();
    }
    return false;
}

FieldTypeMap mapSchema(const StateSchema& schema, Diagnostics& diagnostics) {
    FieldTypeMap out;
    for (const auto& field : schema.fields) {
        std::vector<TypeFallback> fallbacks;
        StaticType type = mapType(field.dynamicType, &fallbacks, field.name);
        if (field.optional) type = StaticType::nullable(std::move(type));

        for (const auto& fb : fallbacks) {
            diagnostics.push_back({DiagnosticKind::OpaqueFallback, fb.path,
                                   fmt::format("{}; using {}", fb.reason, describe(StaticType::dynamic()))});
        }
        if (field.defaultValue && !defaultFits(type, *field.defaultValue)) {
            diagnostics.push_back({DiagnosticKind::DefaultValueIgnored, field.name,
                                   fmt::format("default {} cannot initialize {}; using the empty value",
                                               field.defaultValue->dump(), describe(type))});
        }
        out.emplace(field.name, std::move(type));
    }
    return out;
}

std::string describe(const StaticType& type) {
    auto arg = [&](size_t i) { return i < type.args.size() ? describe(type.args[i]) : std::string("?"); };
    switch (type.kind) {
    case StaticKind::Text: return "text";
    case StaticKind::Int64: return "int64";
    case StaticKind::Float64: return "float64";
    case StaticKind::Bool: return "bool";
    case StaticKind::Sequence: return fmt::format("sequence<{}>", arg(0));
    case StaticKind::OrderedDict: return fmt::format("ordered-dictionary<{}, {}>", arg(0), arg(1));
    case StaticKind::Nullable: return fmt::format("nullable<{}>", arg(0));
    case StaticKind::Dynamic: return "dynamic";
    }
    return "dynamic";
}

} // namespace FlowGen
