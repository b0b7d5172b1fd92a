// Identifier sanitizer
//
// Maps arbitrary node, router and field names onto identifiers that are
// valid in every target (letters, digits, underscore, not digit-leading),
// avoid both targets' reserved words and never collide within a scope.
#pragma once
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace FlowGen {

// Prefix applied to names that start with a digit or hit a reserved word.
inline constexpr const char* kEscapePrefix = "r_";

// Reserved words and prelude type names of Rust and C++.
bool isReservedWord(const std::string& name);
bool isValidIdentifier(const std::string& name);

// Returns a sanitized, collision-free form of `raw` and records it in `used`.
// Deterministic for identical (raw, used) inputs.
std::string sanitize(const std::string& raw, std::unordered_set<std::string>& used);

// One naming scope of a generation pass: remembers raw -> symbol so the
// same raw id always resolves to the symbol it was first assigned.
class SymbolTable {
public:
    // Marks a name as taken without binding it to a raw id.
    void reserve(const std::string& name) { used.insert(name); }
    const std::string& assign(const std::string& raw) { return assign(raw, raw); }
    // Binds `key` to a sanitized form of `raw`; lets distinct kinds of ids
    // (nodes, routers) share one scope without sharing keys.
    const std::string& assign(const std::string& key, const std::string& raw);
    // Symbol previously assigned to `key`; throws std::out_of_range otherwise.
    const std::string& lookup(const std::string& key) const { return symbols.at(key); }
    bool contains(const std::string& key) const { return symbols.count(key) != 0; }
    const std::unordered_set<std::string>& usedNames() const { return used; }

private:
    std::unordered_set<std::string> used;
    std::unordered_map<std::string, std::string> symbols;
};

} // namespace FlowGen
