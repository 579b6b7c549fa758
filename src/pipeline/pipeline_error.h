#pragma once

#include <stdexcept>
#include <string>

namespace csvsentry::pipeline {

enum class ErrorKind {
    NoFile,
    InvalidFilename,
    InvalidFileType,
    Empty,
    TooLarge,
    EmptyData,
    ParseFailure,
    TooManyRows,
    TooManyColumns,
    DuplicateColumns,
    NoNumericColumns,
    NoCategoricalColumns,
    AllZeroVariance,
    AllRowsInvalid,
    InvalidArgument,
    ScorerFailure,
    ReconstructionScorerFailure,
    Internal
};

enum class ErrorClass {
    ClientInput,   // 400
    ResourceLimit, // 413
    Internal       // 500
};

// Every stage reports failure by throwing one of these. The message is the
// human-readable detail string returned to the caller for client-side kinds.
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& details)
        : std::runtime_error(details), kind_(kind) {}

    [[nodiscard]] auto Kind() const -> ErrorKind { return kind_; }

private:
    ErrorKind kind_;
};

auto KindName(ErrorKind kind) -> const char*;
auto ErrorCodeFor(ErrorKind kind) -> const char*;
auto ClassOf(ErrorKind kind) -> ErrorClass;
auto HttpStatusFor(ErrorKind kind) -> int;

// Detail safe to show to a client. Internal kinds get a fixed message so that
// collaborator exception text stays in the logs.
auto PublicDetails(const PipelineError& error) -> std::string;

} // namespace csvsentry::pipeline
