#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <string>

#include "config.h"

namespace csvsentry::pipeline {

// Untrusted upload as received at ingress. The stream is consumed once.
struct RawUpload {
    std::string filename;
    std::string content_type;
    std::unique_ptr<std::istream> stream;
};

struct ValidatedUpload {
    std::string sanitized_filename;
    std::string bytes;     // the only buffered copy handed to the decoder
    bool seekable = false; // size came from seek-to-end rather than buffering
};

class FileValidator {
public:
    explicit FileValidator(SanitizationLimits limits) : limits_(limits) {}

    // Throws PipelineError (NoFile, InvalidFilename, InvalidFileType, Empty,
    // TooLarge). Size is checked before anything is decoded.
    auto Validate(RawUpload* upload) const -> ValidatedUpload;

    // Drops path components and replaces characters outside word, space,
    // hyphen and dot with '_'.
    static auto SanitizeFilename(const std::string& filename) -> std::string;

    static auto HasCsvExtension(const std::string& filename) -> bool;

    // Whole megabytes, or bytes when the limit is below 1 MiB.
    static auto TooLargeMessage(size_t max_bytes) -> std::string;

private:
    auto ReadSeekable(std::istream& in, std::streamoff size) const -> std::string;
    auto ReadBounded(std::istream& in) const -> std::string;

    SanitizationLimits limits_;
};

} // namespace csvsentry::pipeline
