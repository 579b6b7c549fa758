#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "config.h"
#include "pipeline/table.h"
#include "pipeline/text_encoding.h"

namespace csvsentry::pipeline {

enum class MalformedRowPolicy {
    Error,
    Skip
};

enum class ParserMode {
    Strict,
    Tolerant
};

struct DecodeConfig {
    text::Encoding encoding;
    MalformedRowPolicy malformed_rows;
    ParserMode parser;
};

// Tried in order; the first configuration that yields a table wins.
inline constexpr std::array<DecodeConfig, 5> kDecodeFallbacks = {{
    {text::Encoding::Utf8, MalformedRowPolicy::Error, ParserMode::Strict},
    {text::Encoding::Utf8, MalformedRowPolicy::Skip, ParserMode::Strict},
    {text::Encoding::Utf8, MalformedRowPolicy::Skip, ParserMode::Tolerant},
    {text::Encoding::Latin1, MalformedRowPolicy::Skip, ParserMode::Strict},
    {text::Encoding::Latin1, MalformedRowPolicy::Skip, ParserMode::Tolerant},
}};

auto PolicyName(MalformedRowPolicy policy) -> const char*;
auto ParserModeName(ParserMode mode) -> const char*;

struct DecodeReport {
    DecodeConfig config{};
    size_t attempt = 0; // 1-based index into kDecodeFallbacks
    size_t skipped_rows = 0;
};

struct DecodedTable {
    Table table;
    DecodeReport report;
};

class TabularDecoder {
public:
    explicit TabularDecoder(SanitizationLimits limits) : limits_(limits) {}

    // Throws PipelineError: EmptyData and TooManyRows stop the fallback loop at
    // once, TooManyColumns is checked on the winning table, ParseFailure when
    // every configuration failed.
    auto Decode(const std::string& bytes) const -> DecodedTable;

    static auto IsMissingToken(std::string_view token) -> bool;
    static auto ParseNumber(std::string_view token) -> std::optional<double>;
    static auto IsIntegerLiteral(std::string_view token) -> bool;

private:
    auto Attempt(std::string_view bytes, const DecodeConfig& config, size_t* skipped_rows) const -> Table;

    SanitizationLimits limits_;
};

} // namespace csvsentry::pipeline
