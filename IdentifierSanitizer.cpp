// IdentifierSanitizer.cpp
//
// Character replacement, escaping and collision suffixing for generated
// symbols.
#include "IdentifierSanitizer.hpp"
#include <cctype>

namespace FlowGen {

namespace {

const std::unordered_set<std::string>& reservedWords() {
    static const std::unordered_set<std::string> words = {
        // Rust (strict, reserved and weak keywords)
        "as", "async", "await", "break", "const", "continue", "crate", "dyn", "else", "enum", "extern",
        "false", "fn", "for", "if", "impl", "in", "let", "loop", "match", "mod", "move", "mut", "pub",
        "ref", "return", "self", "Self", "static", "struct", "super", "trait", "true", "type", "unsafe",
        "use", "where", "while", "abstract", "become", "box", "do", "final", "macro", "override", "priv",
        "typeof", "unsized", "virtual", "yield", "try", "union", "gen",
        // C++
        "alignas", "alignof", "and", "and_eq", "asm", "auto", "bitand", "bitor", "bool", "case", "catch",
        "char", "char8_t", "char16_t", "char32_t", "class", "compl", "concept", "consteval", "constexpr",
        "constinit", "const_cast", "co_await", "co_return", "co_yield", "decltype", "default", "delete",
        "double", "dynamic_cast", "explicit", "export", "float", "friend", "goto", "inline", "int", "long",
        "mutable", "namespace", "new", "noexcept", "not", "not_eq", "nullptr", "operator", "or", "or_eq",
        "private", "protected", "public", "register", "reinterpret_cast", "requires", "short", "signed",
        "sizeof", "static_assert", "static_cast", "switch", "template", "this", "thread_local", "throw",
        "typedef", "typeid", "typename", "unsigned", "using", "void", "volatile", "wchar_t", "xor", "xor_eq",
        "NULL", "main",
        // Standard library macros visible through the generated includes
        "assert", "errno", "offsetof", "setjmp", "va_arg", "va_copy", "va_end", "va_start", "stdin",
        "stdout", "stderr", "EOF",
        // Primitive and prelude type names of either target
        "i8", "i16", "i32", "i64", "i128", "isize", "u8", "u16", "u32", "u64", "u128", "usize", "f32", "f64",
        "str", "String", "Vec", "Option", "Some", "None", "Result", "Ok", "Err", "Box", "std", "core",
        "alloc", "serde", "serde_json", "nlohmann", "tests",
    };
    return words;
}

// Runs of underscores are collapsed: C++ reserves "__" anywhere in a name.
std::string collapseUnderscores(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '_' && !out.empty() && out.back() == '_') continue;
        out.push_back(c);
    }
    return out;
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

bool isReservedWord(const std::string& name) {
    return reservedWords().count(name) != 0;
}

bool isValidIdentifier(const std::string& name) {
    if (name.empty()) return false;
    if (std::isdigit(static_cast<unsigned char>(name[0]))) return false;
    for (char c : name) {
        // ASCII only; isalnum on a signed high byte is locale dependent
        if (static_cast<unsigned char>(c) >= 0x80 || !isIdentChar(c)) return false;
    }
    return true;
}

std::string sanitize(const std::string& raw, std::unordered_set<std::string>& used) {
    std::string name;
    name.reserve(raw.size());
    for (char c : raw) {
        const bool ascii = static_cast<unsigned char>(c) < 0x80;
        name.push_back(ascii && isIdentChar(c) ? c : '_');
    }
    name = collapseUnderscores(name);
    if (name.empty() || name == "_") name = "unnamed";

    if (std::isdigit(static_cast<unsigned char>(name[0])) || name[0] == '_' || isReservedWord(name)) {
        name = collapseUnderscores(kEscapePrefix + name);
    }

    const std::string stem = name.back() == '_' ? name : name + "_";
    std::string candidate = name;
    for (int suffix = 2; used.count(candidate) || isReservedWord(candidate); ++suffix) {
        candidate = stem + std::to_string(suffix);
    }
    used.insert(candidate);
    return candidate;
}

const std::string& SymbolTable::assign(const std::string& key, const std::string& raw) {
    auto it = symbols.find(key);
    if (it != symbols.end()) return it->second;
    std::string symbol = sanitize(raw, used);
    return symbols.emplace(key, std::move(symbol)).first->second;
}

} // namespace FlowGen
