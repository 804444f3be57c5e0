#ifndef GRAPH_COMPLEX_ERRORS_HPP
#define GRAPH_COMPLEX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace graph_complex {

// Base for all failures raised by the computation stages.
class GraphComplexError : public std::runtime_error {
public:
    GraphComplexError(const std::string& category, const std::string& message)
        : std::runtime_error(category + ": " + message), category_(category) {}

    const std::string& category() const noexcept { return category_; }

private:
    std::string category_;
};

// The oracle cannot enumerate the requested parameters. Not retried.
class GraphEnumerationError : public GraphComplexError {
public:
    explicit GraphEnumerationError(const std::string& message)
        : GraphComplexError("Enumeration error", message) {}
};

// Orientation data contradicts the automorphism data of a generator.
class BasisInconsistencyError : public GraphComplexError {
public:
    explicit BasisInconsistencyError(const std::string& message)
        : GraphComplexError("Basis inconsistency", message) {}
};

// An operator image could not be placed in the target basis.
class OperatorConstructionError : public GraphComplexError {
public:
    explicit OperatorConstructionError(const std::string& message)
        : GraphComplexError("Operator construction error", message) {}
};

enum class SolverFailure {
    Launch,
    Timeout,
    ExitCode,
    Unparsable,
    Cancelled,
    Exhausted
};

inline const char* solver_failure_name(SolverFailure kind) {
    switch (kind) {
        case SolverFailure::Launch: return "launch";
        case SolverFailure::Timeout: return "timeout";
        case SolverFailure::ExitCode: return "exit code";
        case SolverFailure::Unparsable: return "unparsable output";
        case SolverFailure::Cancelled: return "cancelled";
        case SolverFailure::Exhausted: return "all backends failed";
    }
    return "unknown";
}

class RankSolverError : public GraphComplexError {
public:
    RankSolverError(SolverFailure kind, const std::string& message)
        : GraphComplexError("Rank solver error",
                            std::string(solver_failure_name(kind)) + ": " + message),
          kind_(kind) {}

    SolverFailure kind() const noexcept { return kind_; }

private:
    SolverFailure kind_;
};

// A computed cohomology dimension came out negative.
class CohomologyAssemblyError : public GraphComplexError {
public:
    explicit CohomologyAssemblyError(const std::string& message)
        : GraphComplexError("Cohomology assembly error", message) {}
};

class StoreCorruptionError : public GraphComplexError {
public:
    StoreCorruptionError(const std::string& path, const std::string& message)
        : GraphComplexError("Store corruption", path + ": " + message), path_(path) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

// A stage needed an artifact that no dependency produced.
class NotBuiltError : public GraphComplexError {
public:
    explicit NotBuiltError(const std::string& message)
        : GraphComplexError("Not built", message) {}
};

} // namespace graph_complex

#endif // GRAPH_COMPLEX_ERRORS_HPP
