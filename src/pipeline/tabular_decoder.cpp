#include "pipeline/tabular_decoder.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include "obs/logging.h"
#include "pipeline/pipeline_error.h"

namespace csvsentry::pipeline {

namespace {

// Failure of one decode configuration; the next one is tried.
class DecodeAttemptError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr std::array<std::string_view, 19> kMissingTokens = {
    "",     "#N/A", "#N/A N/A", "#NA",  "-1.#IND", "-1.#QNAN", "-NaN", "-nan", "1.#IND", "1.#QNAN",
    "<NA>", "N/A",  "NA",       "NULL", "NaN",     "None",     "n/a",  "nan",  "null",
};

auto IsBlank(char c) -> bool {
    return c == ' ' || c == '\t';
}

auto Trim(std::string_view s) -> std::string_view {
    while (!s.empty() && IsBlank(s.front())) s.remove_prefix(1);
    while (!s.empty() && IsBlank(s.back())) s.remove_suffix(1);
    return s;
}

auto EqualsIgnoreCase(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        char y = b[i];
        if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
        if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
        if (x != y) return false;
    }
    return true;
}

auto IsDigit(char c) -> bool {
    return c >= '0' && c <= '9';
}

// Pull parser over one decoded text buffer. Strict mode rejects stray quotes
// and unterminated quoted fields; tolerant mode keeps them as literal text.
class CsvTokenizer {
public:
    CsvTokenizer(std::string_view text, ParserMode mode) : text_(text), mode_(mode) {}

    // Returns false at end of input. Blank lines are skipped.
    auto Next(std::vector<std::string>& fields) -> bool {
        while (pos_ < text_.size()) {
            record_line_ = line_;
            ReadRecord(fields);
            if (!(fields.size() == 1 && fields[0].empty() && !saw_quote_)) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] auto RecordLine() const -> size_t { return record_line_; }

private:
    void ReadRecord(std::vector<std::string>& fields) {
        fields.clear();
        std::string field;
        bool in_quotes = false;
        bool after_quoted = false;
        saw_quote_ = false;

        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (in_quotes) {
                if (c == '"') {
                    if (pos_ + 1 < text_.size() && text_[pos_ + 1] == '"') {
                        field.push_back('"');
                        pos_ += 2;
                        continue;
                    }
                    in_quotes = false;
                    after_quoted = true;
                    ++pos_;
                    continue;
                }
                if (c == '\n') ++line_;
                field.push_back(c);
                ++pos_;
                continue;
            }

            if (c == ',') {
                fields.push_back(std::move(field));
                field.clear();
                after_quoted = false;
                ++pos_;
                continue;
            }
            if (c == '\r' || c == '\n') {
                ++pos_;
                if (c == '\r' && pos_ < text_.size() && text_[pos_] == '\n') ++pos_;
                ++line_;
                fields.push_back(std::move(field));
                return;
            }
            if (c == '"') {
                if (field.empty() && !after_quoted) {
                    in_quotes = true;
                    saw_quote_ = true;
                    ++pos_;
                    continue;
                }
                if (mode_ == ParserMode::Strict) {
                    throw DecodeAttemptError("unexpected quote character on line " + std::to_string(line_));
                }
                field.push_back(c);
                ++pos_;
                continue;
            }
            if (after_quoted && mode_ == ParserMode::Strict) {
                throw DecodeAttemptError("text after closing quote on line " + std::to_string(line_));
            }
            field.push_back(c);
            ++pos_;
        }

        if (in_quotes && mode_ == ParserMode::Strict) {
            throw DecodeAttemptError("unterminated quoted field starting on line " + std::to_string(record_line_));
        }
        fields.push_back(std::move(field));
    }

    std::string_view text_;
    ParserMode mode_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t record_line_ = 1;
    bool saw_quote_ = false;
};

auto ConfigFields(const DecodeConfig& config, size_t attempt) -> nlohmann::json {
    return {{"attempt", attempt},
            {"encoding", text::EncodingName(config.encoding)},
            {"malformed_rows", PolicyName(config.malformed_rows)},
            {"parser", ParserModeName(config.parser)}};
}

auto BuildColumn(std::string name, std::vector<std::string>& tokens) -> Column {
    bool numeric = true;
    bool integral = true;
    bool any_missing = false;
    std::vector<std::optional<double>> numbers;
    numbers.reserve(tokens.size());

    for (const auto& token : tokens) {
        if (TabularDecoder::IsMissingToken(token)) {
            numbers.emplace_back(std::nullopt);
            any_missing = true;
            continue;
        }
        auto value = TabularDecoder::ParseNumber(token);
        if (!value) {
            numeric = false;
            break;
        }
        if (integral && !TabularDecoder::IsIntegerLiteral(token)) {
            integral = false;
        }
        numbers.emplace_back(value);
    }

    if (numeric) {
        Column column = Column::MakeNumeric(std::move(name), std::move(numbers));
        column.integral = integral && !any_missing && !tokens.empty();
        return column;
    }

    std::vector<std::optional<std::string>> texts;
    texts.reserve(tokens.size());
    for (auto& token : tokens) {
        if (TabularDecoder::IsMissingToken(token)) {
            texts.emplace_back(std::nullopt);
        } else {
            texts.emplace_back(std::move(token));
        }
    }
    return Column::MakeText(std::move(name), std::move(texts));
}

} // namespace

auto PolicyName(MalformedRowPolicy policy) -> const char* {
    return policy == MalformedRowPolicy::Error ? "error" : "skip";
}

auto ParserModeName(ParserMode mode) -> const char* {
    return mode == ParserMode::Strict ? "strict" : "tolerant";
}

auto TabularDecoder::IsMissingToken(std::string_view token) -> bool {
    return std::find(kMissingTokens.begin(), kMissingTokens.end(), token) != kMissingTokens.end();
}

auto TabularDecoder::IsIntegerLiteral(std::string_view token) -> bool {
    std::string_view s = Trim(token);
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) s.remove_prefix(1);
    if (s.empty() || s.size() > 18) return false;
    return std::all_of(s.begin(), s.end(), IsDigit);
}

auto TabularDecoder::ParseNumber(std::string_view token) -> std::optional<double> {
    std::string_view s = Trim(token);
    if (s.empty()) return std::nullopt;

    std::string_view body = s;
    if (body.front() == '+' || body.front() == '-') body.remove_prefix(1);
    if (EqualsIgnoreCase(body, "inf") || EqualsIgnoreCase(body, "infinity")) {
        double inf = std::numeric_limits<double>::infinity();
        return s.front() == '-' ? -inf : inf;
    }

    // [digits][.digits][(e|E)[sign]digits] with at least one mantissa digit.
    size_t i = 0;
    size_t mantissa_digits = 0;
    while (i < body.size() && IsDigit(body[i])) {
        ++i;
        ++mantissa_digits;
    }
    if (i < body.size() && body[i] == '.') {
        ++i;
        while (i < body.size() && IsDigit(body[i])) {
            ++i;
            ++mantissa_digits;
        }
    }
    if (mantissa_digits == 0) return std::nullopt;
    if (i < body.size() && (body[i] == 'e' || body[i] == 'E')) {
        ++i;
        if (i < body.size() && (body[i] == '+' || body[i] == '-')) ++i;
        size_t exp_digits = 0;
        while (i < body.size() && IsDigit(body[i])) {
            ++i;
            ++exp_digits;
        }
        if (exp_digits == 0) return std::nullopt;
    }
    if (i != body.size()) return std::nullopt;

    std::string copy(s);
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size()) return std::nullopt;
    // Overflow gives +-HUGE_VAL which is infinity; the value policy handles it.
    return value;
}

auto TabularDecoder::Decode(const std::string& bytes) const -> DecodedTable {
    std::string last_error = "no decode configuration attempted";
    for (size_t i = 0; i < kDecodeFallbacks.size(); ++i) {
        const DecodeConfig& config = kDecodeFallbacks[i];
        size_t skipped = 0;
        try {
            Table table = Attempt(bytes, config, &skipped);
            if (table.ColumnCount() > limits_.max_columns) {
                throw PipelineError(ErrorKind::TooManyColumns,
                                    "File has too many columns. Maximum: " + std::to_string(limits_.max_columns));
            }
            DecodedTable decoded{std::move(table), DecodeReport{config, i + 1, skipped}};
            auto fields = ConfigFields(config, i + 1);
            fields["rows"] = decoded.table.RowCount();
            fields["columns"] = decoded.table.ColumnCount();
            fields["skipped_rows"] = skipped;
            obs::LogEvent(obs::LogLevel::Info, "csv_decoded", "tabular_decoder", fields);
            return decoded;
        } catch (const DecodeAttemptError& e) {
            last_error = e.what();
            auto fields = ConfigFields(config, i + 1);
            fields["error"] = last_error;
            obs::LogEvent(obs::LogLevel::Warn, "decode_attempt_failed", "tabular_decoder", fields);
        }
    }
    throw PipelineError(ErrorKind::ParseFailure, "Could not parse CSV file: " + last_error);
}

auto TabularDecoder::Attempt(std::string_view bytes, const DecodeConfig& config, size_t* skipped_rows) const
    -> Table {
    std::string_view raw = text::StripUtf8Bom(bytes);
    std::string transcoded;
    std::string_view decoded = raw;
    if (config.encoding == text::Encoding::Utf8) {
        size_t offset = 0;
        if (!text::IsValidUtf8(raw, &offset)) {
            throw DecodeAttemptError("invalid utf-8 byte at offset " + std::to_string(offset));
        }
    } else {
        transcoded = text::Latin1ToUtf8(raw);
        decoded = transcoded;
    }

    CsvTokenizer tokenizer(decoded, config.parser);
    std::vector<std::string> header;
    if (!tokenizer.Next(header)) {
        throw PipelineError(ErrorKind::EmptyData, "No columns to parse from file");
    }

    const size_t width = header.size();
    std::vector<std::vector<std::string>> cells(width);
    std::vector<std::string> record;
    size_t rows = 0;
    size_t skipped = 0;

    while (tokenizer.Next(record)) {
        if (record.size() > width) {
            if (config.malformed_rows == MalformedRowPolicy::Error) {
                throw DecodeAttemptError("expected " + std::to_string(width) + " fields on line " +
                                         std::to_string(tokenizer.RecordLine()) + ", saw " +
                                         std::to_string(record.size()));
            }
            ++skipped;
            continue;
        }
        if (rows == limits_.max_rows) {
            throw PipelineError(ErrorKind::TooManyRows,
                                "File has too many rows. Maximum: " + std::to_string(limits_.max_rows));
        }
        record.resize(width);
        for (size_t c = 0; c < width; ++c) {
            cells[c].push_back(std::move(record[c]));
        }
        ++rows;
    }

    if (skipped > 0) {
        obs::LogEvent(obs::LogLevel::Warn, "decode_rows_skipped", "tabular_decoder",
                      {{"skipped_rows", skipped}, {"expected_fields", width}});
    }
    if (rows == 0) {
        throw PipelineError(ErrorKind::EmptyData, "CSV file contains no data rows");
    }

    std::vector<Column> columns;
    columns.reserve(width);
    for (size_t c = 0; c < width; ++c) {
        columns.push_back(BuildColumn(std::move(header[c]), cells[c]));
    }
    *skipped_rows = skipped;
    return Table(std::move(columns));
}

} // namespace csvsentry::pipeline
