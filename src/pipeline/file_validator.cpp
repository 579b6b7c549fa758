#include "pipeline/file_validator.h"

#include <algorithm>
#include <array>
#include <cctype>

#include "obs/logging.h"
#include "pipeline/pipeline_error.h"
#include "pipeline/text_encoding.h"

namespace csvsentry::pipeline {

namespace {

constexpr size_t kReadChunk = 64 * 1024;

auto IsWordChar(unsigned char c) -> bool {
    return std::isalnum(c) != 0 || c == '_';
}

auto IsAsciiSpace(unsigned char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

auto FileValidator::SanitizeFilename(const std::string& filename) -> std::string {
    std::string base = filename;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }
    std::string out;
    out.reserve(base.size());
    for (size_t i = 0; i < base.size();) {
        auto c = static_cast<unsigned char>(base[i]);
        if (c >= 0x80) {
            // Non-word characters collapse to one replacement each.
            size_t len = 1;
            char32_t cp = text::DecodeUtf8(base, i, &len);
            if (text::IsWordCodePoint(cp) || text::IsSpaceCodePoint(cp)) {
                out.append(base, i, len);
            } else {
                out.push_back('_');
            }
            i += len;
            continue;
        }
        if (IsWordChar(c) || IsAsciiSpace(c) || c == '-' || c == '.') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('_');
        }
        ++i;
    }
    return out;
}

auto FileValidator::TooLargeMessage(size_t max_bytes) -> std::string {
    constexpr size_t kMiB = 1024ULL * 1024ULL;
    if (max_bytes < kMiB) {
        return "File too large. Maximum size: " + std::to_string(max_bytes) + " bytes";
    }
    return "File too large. Maximum size: " + std::to_string(max_bytes / kMiB) + "MB";
}

auto FileValidator::HasCsvExtension(const std::string& filename) -> bool {
    if (filename.size() < 4) return false;
    std::string ext = filename.substr(filename.size() - 4);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext == ".csv";
}

auto FileValidator::Validate(RawUpload* upload) const -> ValidatedUpload {
    if (upload == nullptr || !upload->stream) {
        throw PipelineError(ErrorKind::NoFile, "No file provided");
    }
    if (upload->filename.empty()) {
        throw PipelineError(ErrorKind::InvalidFilename, "Invalid filename");
    }

    ValidatedUpload validated;
    validated.sanitized_filename = SanitizeFilename(upload->filename);
    if (!HasCsvExtension(validated.sanitized_filename)) {
        throw PipelineError(ErrorKind::InvalidFileType, "Only CSV files are supported");
    }
    obs::UpdateUploadName(validated.sanitized_filename);

    std::istream& in = *upload->stream;
    std::streampos start = in.tellg();
    std::streamoff size = -1;
    if (start != std::streampos(-1)) {
        in.seekg(0, std::ios::end);
        std::streampos end = in.tellg();
        in.seekg(start);
        if (end != std::streampos(-1) && in) {
            size = end - start;
        } else {
            in.clear();
        }
    }

    if (size >= 0) {
        validated.seekable = true;
        if (size == 0) {
            throw PipelineError(ErrorKind::Empty, "Empty file");
        }
        if (static_cast<size_t>(size) > limits_.max_file_size_bytes) {
            throw PipelineError(ErrorKind::TooLarge,
                                TooLargeMessage(limits_.max_file_size_bytes));
        }
        validated.bytes = ReadSeekable(in, size);
    } else {
        validated.bytes = ReadBounded(in);
        if (validated.bytes.empty()) {
            throw PipelineError(ErrorKind::Empty, "Empty file");
        }
        if (validated.bytes.size() > limits_.max_file_size_bytes) {
            throw PipelineError(ErrorKind::TooLarge,
                                TooLargeMessage(limits_.max_file_size_bytes));
        }
    }

    obs::LogEvent(obs::LogLevel::Info, "upload_validated", "file_validator",
                  {{"bytes", validated.bytes.size()}, {"seekable", validated.seekable}});
    return validated;
}

auto FileValidator::ReadSeekable(std::istream& in, std::streamoff size) const -> std::string {
    std::string bytes(static_cast<size_t>(size), '\0');
    in.read(bytes.data(), size);
    bytes.resize(static_cast<size_t>(in.gcount()));
    return bytes;
}

auto FileValidator::ReadBounded(std::istream& in) const -> std::string {
    std::string bytes;
    std::array<char, kReadChunk> chunk{};
    size_t cap = limits_.max_file_size_bytes + 1;
    while (bytes.size() < cap && in) {
        size_t want = std::min(chunk.size(), cap - bytes.size());
        in.read(chunk.data(), static_cast<std::streamsize>(want));
        auto got = in.gcount();
        if (got <= 0) break;
        bytes.append(chunk.data(), static_cast<size_t>(got));
    }
    return bytes;
}

} // namespace csvsentry::pipeline
