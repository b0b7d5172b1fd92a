// FlowGen conversion errors
//
// Fatal conversion-time failures. Anything thrown from here aborts the
// pipeline before any artifact is emitted.
#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace FlowGen {

enum class GraphErrorCode {
    UnreachableEntry,
    DanglingEdge,
    DuplicateNode,
    DuplicateField,
    EmptyBranchTable,
    GraphTooLarge,
    MalformedInput
};

const char* toString(GraphErrorCode code);

// Thrown when a graph cannot be converted. `subject` names the offending
// node, edge or field id exactly as it appeared in the IR.
class GraphError : public std::runtime_error {
public:
    GraphError(GraphErrorCode code, std::string subject, const std::string& message)
        : std::runtime_error(message)
        , errorCode(code)
        , errorSubject(std::move(subject)) {}

    GraphErrorCode code() const noexcept { return errorCode; }
    const std::string& subject() const noexcept { return errorSubject; }

private:
    GraphErrorCode errorCode;
    std::string errorSubject;
};

} // namespace FlowGen
