#pragma once

namespace csvsentry {
namespace obs {

inline constexpr const char* kErrUploadNoFile = "E_UPLOAD_NO_FILE";
inline constexpr const char* kErrUploadInvalidFilename = "E_UPLOAD_INVALID_FILENAME";
inline constexpr const char* kErrUploadInvalidFileType = "E_UPLOAD_INVALID_FILE_TYPE";
inline constexpr const char* kErrUploadEmpty = "E_UPLOAD_EMPTY";
inline constexpr const char* kErrUploadTooLarge = "E_UPLOAD_TOO_LARGE";

inline constexpr const char* kErrCsvEmptyData = "E_CSV_EMPTY_DATA";
inline constexpr const char* kErrCsvParseFailed = "E_CSV_PARSE_FAILED";
inline constexpr const char* kErrCsvTooManyRows = "E_CSV_TOO_MANY_ROWS";
inline constexpr const char* kErrCsvTooManyColumns = "E_CSV_TOO_MANY_COLUMNS";
inline constexpr const char* kErrCsvDuplicateColumns = "E_CSV_DUPLICATE_COLUMNS";

inline constexpr const char* kErrDataNoNumericColumns = "E_DATA_NO_NUMERIC_COLUMNS";
inline constexpr const char* kErrDataNoCategoricalColumns = "E_DATA_NO_CATEGORICAL_COLUMNS";
inline constexpr const char* kErrDataAllZeroVariance = "E_DATA_ALL_ZERO_VARIANCE";
inline constexpr const char* kErrDataAllRowsInvalid = "E_DATA_ALL_ROWS_INVALID";

inline constexpr const char* kErrHttpInvalidArgument = "E_HTTP_INVALID_ARGUMENT";

inline constexpr const char* kErrScorerFailed = "E_SCORER_FAILED";
inline constexpr const char* kErrReconstructionScorerFailed = "E_RECONSTRUCTION_SCORER_FAILED";
inline constexpr const char* kErrExplainerFailed = "E_EXPLAINER_FAILED";

inline constexpr const char* kErrInternal = "E_INTERNAL";

} // namespace obs
} // namespace csvsentry
