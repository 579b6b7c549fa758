#include "pipeline/pipeline_error.h"

#include "obs/error_codes.h"

namespace csvsentry::pipeline {

auto KindName(ErrorKind kind) -> const char* {
    switch (kind) {
        case ErrorKind::NoFile: return "NoFile";
        case ErrorKind::InvalidFilename: return "InvalidFilename";
        case ErrorKind::InvalidFileType: return "InvalidFileType";
        case ErrorKind::Empty: return "Empty";
        case ErrorKind::TooLarge: return "TooLarge";
        case ErrorKind::EmptyData: return "EmptyData";
        case ErrorKind::ParseFailure: return "ParseFailure";
        case ErrorKind::TooManyRows: return "TooManyRows";
        case ErrorKind::TooManyColumns: return "TooManyColumns";
        case ErrorKind::DuplicateColumns: return "DuplicateColumns";
        case ErrorKind::NoNumericColumns: return "NoNumericColumns";
        case ErrorKind::NoCategoricalColumns: return "NoCategoricalColumns";
        case ErrorKind::AllZeroVariance: return "AllZeroVariance";
        case ErrorKind::AllRowsInvalid: return "AllRowsInvalid";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::ScorerFailure: return "ScorerFailure";
        case ErrorKind::ReconstructionScorerFailure: return "ReconstructionScorerFailure";
        case ErrorKind::Internal: return "Internal";
    }
    return "Internal";
}

auto ErrorCodeFor(ErrorKind kind) -> const char* {
    switch (kind) {
        case ErrorKind::NoFile: return obs::kErrUploadNoFile;
        case ErrorKind::InvalidFilename: return obs::kErrUploadInvalidFilename;
        case ErrorKind::InvalidFileType: return obs::kErrUploadInvalidFileType;
        case ErrorKind::Empty: return obs::kErrUploadEmpty;
        case ErrorKind::TooLarge: return obs::kErrUploadTooLarge;
        case ErrorKind::EmptyData: return obs::kErrCsvEmptyData;
        case ErrorKind::ParseFailure: return obs::kErrCsvParseFailed;
        case ErrorKind::TooManyRows: return obs::kErrCsvTooManyRows;
        case ErrorKind::TooManyColumns: return obs::kErrCsvTooManyColumns;
        case ErrorKind::DuplicateColumns: return obs::kErrCsvDuplicateColumns;
        case ErrorKind::NoNumericColumns: return obs::kErrDataNoNumericColumns;
        case ErrorKind::NoCategoricalColumns: return obs::kErrDataNoCategoricalColumns;
        case ErrorKind::AllZeroVariance: return obs::kErrDataAllZeroVariance;
        case ErrorKind::AllRowsInvalid: return obs::kErrDataAllRowsInvalid;
        case ErrorKind::InvalidArgument: return obs::kErrHttpInvalidArgument;
        case ErrorKind::ScorerFailure: return obs::kErrScorerFailed;
        case ErrorKind::ReconstructionScorerFailure: return obs::kErrReconstructionScorerFailed;
        case ErrorKind::Internal: return obs::kErrInternal;
    }
    return obs::kErrInternal;
}

auto ClassOf(ErrorKind kind) -> ErrorClass {
    switch (kind) {
        case ErrorKind::TooLarge:
        case ErrorKind::TooManyRows:
        case ErrorKind::TooManyColumns:
            return ErrorClass::ResourceLimit;
        case ErrorKind::ScorerFailure:
        case ErrorKind::ReconstructionScorerFailure:
        case ErrorKind::Internal:
            return ErrorClass::Internal;
        default:
            return ErrorClass::ClientInput;
    }
}

auto HttpStatusFor(ErrorKind kind) -> int {
    switch (ClassOf(kind)) {
        case ErrorClass::ClientInput:
            return 400;
        case ErrorClass::ResourceLimit:
            return 413;
        case ErrorClass::Internal:
            return 500;
    }
    return 500;
}

auto PublicDetails(const PipelineError& error) -> std::string {
    switch (error.Kind()) {
        case ErrorKind::ScorerFailure:
            return "Anomaly scoring failed";
        case ErrorKind::ReconstructionScorerFailure:
            return "Categorical anomaly scoring failed";
        case ErrorKind::Internal:
            return "Internal error while processing upload";
        default:
            return error.what();
    }
}

} // namespace csvsentry::pipeline
