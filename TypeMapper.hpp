// Type mapper
//
// Converts runtime-observed field types into canonical static types. The
// mapping is total: shapes that have no faithful static form degrade to the
// dynamic value type and are reported, never rejected.
#pragma once
#include "Diagnostics.hpp"
#include "FlowGenIR.hpp"
#include <map>
#include <string>
#include <vector>

namespace FlowGen {

enum class StaticKind { Text, Int64, Float64, Bool, Sequence, OrderedDict, Nullable, Dynamic };

// Target-neutral static type. Children live in `args`:
// Sequence -> [element], OrderedDict -> [key, value], Nullable -> [inner].
struct StaticType {
    StaticKind kind = StaticKind::Dynamic;
    std::vector<StaticType> args;

    static StaticType text() { return StaticType{StaticKind::Text, {}}; }
    static StaticType int64() { return StaticType{StaticKind::Int64, {}}; }
    static StaticType float64() { return StaticType{StaticKind::Float64, {}}; }
    static StaticType boolean() { return StaticType{StaticKind::Bool, {}}; }
    static StaticType dynamic() { return StaticType{StaticKind::Dynamic, {}}; }
    static StaticType sequence(StaticType element);
    static StaticType orderedDict(StaticType key, StaticType value);
    static StaticType nullable(StaticType inner);

    // Text, integer and boolean keys have a total order in every target.
    bool isComparableKey() const;

    bool operator==(const StaticType& other) const { return kind == other.kind && args == other.args; }
    bool operator!=(const StaticType& other) const { return !(*this == other); }
};

// A point inside a descriptor where precision was given up.
struct TypeFallback {
    std::string path; // e.g. "scores.value", "users[]"
    std::string reason;
};

// Pure and total. Fallbacks are appended to `fallbacks` when given, with
// paths relative to `path`.
StaticType mapType(const DynamicType& type, std::vector<TypeFallback>* fallbacks = nullptr,
                   const std::string& path = std::string());

// Field name -> mapped type for a whole schema.
using FieldTypeMap = std::map<std::string, StaticType>;

// Maps every field, wrapping optional fields in Nullable, and reports each
// fallback as OpaqueFallback and each unusable default as DefaultValueIgnored.
FieldTypeMap mapSchema(const StateSchema& schema, Diagnostics& diagnostics);

// True if `value` can be rendered as an initializer for `type`: a matching
// primitive literal, null for Nullable, or an empty array/object for
// Sequence/OrderedDict.
bool defaultFits(const StaticType& type, const nlohmann::json& value);

// Compact readable form, e.g. "ordered-dictionary<text, dynamic>".
std::string describe(const StaticType& type);

} // namespace FlowGen
