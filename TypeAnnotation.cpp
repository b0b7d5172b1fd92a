// TypeAnnotation.cpp
//
// Recursive-descent reading of Python typing annotations.
#include "TypeAnnotation.hpp"
#include <cctype>

namespace FlowGen {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool isQuoted(const std::string& s) {
    return s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front();
}

bool isIntegerLiteral(const std::string& s) {
    size_t i = (!s.empty() && (s[0] == '-' || s[0] == '+')) ? 1 : 0;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}

bool isNone(const std::string& s) { return s == "None" || s == "NoneType"; }

std::vector<std::string> splitUnion(const std::string& text) {
    std::vector<std::string> parts;
    int depth = 0;
    std::string cur;
    for (char c : text) {
        if (c == '[') ++depth;
        else if (c == ']') --depth;
        if (c == '|' && depth == 0) {
            parts.push_back(trim(cur));
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    parts.push_back(trim(cur));
    return parts;
}

DynamicType unionOf(const std::vector<std::string>& parts, const std::string& hint) {
    std::vector<std::string> rest;
    bool hasNone = false;
    for (const auto& p : parts) {
        if (isNone(p)) hasNone = true;
        else rest.push_back(p);
    }
    if (rest.size() == 1) {
        DynamicType inner = parseTypeAnnotation(rest[0]);
        return hasNone ? DynamicType::makeOptional(std::move(inner)) : inner;
    }
    // A genuine sum type has no static counterpart
    DynamicType opaque = DynamicType::makeOpaque(hint);
    return hasNone ? DynamicType::makeOptional(std::move(opaque)) : opaque;
}

DynamicType literalOf(const std::vector<std::string>& params, const std::string& hint) {
    bool allStrings = !params.empty(), allInts = !params.empty(), allBools = !params.empty();
    for (const auto& p : params) {
        allStrings = allStrings && isQuoted(p);
        allInts = allInts && isIntegerLiteral(p);
        allBools = allBools && (p == "True" || p == "False");
    }
    if (allStrings) return DynamicType::makePrimitive(PrimitiveKind::String);
    if (allInts) return DynamicType::makePrimitive(PrimitiveKind::Integer);
    if (allBools) return DynamicType::makePrimitive(PrimitiveKind::Bool);
    return DynamicType::makeOpaque(hint);
}

} // namespace

std::vector<std::string> splitTopLevel(const std::string& params) {
    std::vector<std::string> parts;
    int depth = 0;
    char quote = 0;
    std::string cur;
    for (char c : params) {
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '[') {
            ++depth;
        } else if (c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            parts.push_back(trim(cur));
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    std::string last = trim(cur);
    if (!last.empty() || !parts.empty()) parts.push_back(last);
    return parts;
}

DynamicType parseTypeAnnotation(const std::string& raw) {
    std::string text = trim(raw);
    if (isQuoted(text)) text = trim(text.substr(1, text.size() - 2)); // forward reference
    for (const char* prefix : {"typing.", "typing_extensions.", "collections.abc."}) {
        const std::string p(prefix);
        if (text.compare(0, p.size(), p) == 0) text = text.substr(p.size());
    }

    auto unionParts = splitUnion(text);
    if (unionParts.size() > 1) return unionOf(unionParts, text);

    const auto open = text.find('[');
    if (open == std::string::npos || text.back() != ']') {
        if (text == "str") return DynamicType::makePrimitive(PrimitiveKind::String);
        if (text == "int") return DynamicType::makePrimitive(PrimitiveKind::Integer);
        if (text == "float") return DynamicType::makePrimitive(PrimitiveKind::Float);
        if (text == "bool") return DynamicType::makePrimitive(PrimitiveKind::Bool);
        if (text == "list" || text == "List" || text == "set" || text == "Set") {
            return DynamicType::makeCollection(DynamicType::makeOpaque());
        }
        if (text == "dict" || text == "Dict") {
            return DynamicType::makeMapping(DynamicType::makePrimitive(PrimitiveKind::String), DynamicType::makeOpaque());
        }
        // Any, object, None and user-defined classes
        return DynamicType::makeOpaque(text);
    }

    const std::string head = trim(text.substr(0, open));
    const auto params = splitTopLevel(text.substr(open + 1, text.size() - open - 2));

    if (head == "list" || head == "List" || head == "set" || head == "Set" || head == "frozenset" ||
        head == "FrozenSet" || head == "Sequence" || head == "MutableSequence" || head == "Iterable") {
        if (params.size() == 1) return DynamicType::makeCollection(parseTypeAnnotation(params[0]));
        return DynamicType::makeOpaque(text);
    }
    if (head == "tuple" || head == "Tuple") {
        // Only the homogeneous form tuple[T, ...] is a sequence
        if (params.size() == 2 && params[1] == "...") return DynamicType::makeCollection(parseTypeAnnotation(params[0]));
        return DynamicType::makeOpaque(text);
    }
    if (head == "dict" || head == "Dict" || head == "Mapping" || head == "MutableMapping" || head == "OrderedDict") {
        if (params.size() == 2) {
            return DynamicType::makeMapping(parseTypeAnnotation(params[0]), parseTypeAnnotation(params[1]));
        }
        return DynamicType::makeOpaque(text);
    }
    if (head == "Optional") {
        if (params.size() == 1) return DynamicType::makeOptional(parseTypeAnnotation(params[0]));
        return DynamicType::makeOptional(DynamicType::makeOpaque(text));
    }
    if (head == "Union") return unionOf(params, text);
    if (head == "Literal") return literalOf(params, text);
    if (head == "Annotated" || head == "Required" || head == "NotRequired") {
        if (!params.empty()) return parseTypeAnnotation(params[0]);
    }
    return DynamicType::makeOpaque(text);
}

} // namespace FlowGen
