// Python type annotation parsing
//
// Introspector dumps describe state fields by their annotation text
// ("dict[str, float]", "Optional[list[str]]"). This turns that text into a
// DynamicType; anything it does not recognize becomes Opaque.
#pragma once
#include "FlowGenIR.hpp"
#include <string>
#include <vector>

namespace FlowGen {

DynamicType parseTypeAnnotation(const std::string& text);

// Splits "K, dict[A, B]" on commas outside brackets, trimming each part.
std::vector<std::string> splitTopLevel(const std::string& params);

} // namespace FlowGen
