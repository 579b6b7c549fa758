#include "pipeline/name_sanitizer.h"

#include <cctype>
#include <unordered_map>

#include "obs/logging.h"
#include "pipeline/pipeline_error.h"
#include "pipeline/text_encoding.h"

namespace csvsentry::pipeline {

namespace {

auto IsSpace(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto IsTrigger(char c) -> bool {
    return c == '=' || c == '+' || c == '-' || c == '@' || c == '\t' || c == '\r';
}

auto Trim(const std::string& s) -> std::string {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && IsSpace(s[begin])) ++begin;
    while (end > begin && IsSpace(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

} // namespace

auto NameSanitizer::SanitizeName(const std::string& raw, size_t position) -> std::string {
    std::string trimmed = Trim(raw);

    std::string replaced;
    replaced.reserve(trimmed.size());
    for (size_t i = 0; i < trimmed.size();) {
        auto c = static_cast<unsigned char>(trimmed[i]);
        if (c >= 0x80) {
            size_t len = 1;
            char32_t cp = text::DecodeUtf8(trimmed, i, &len);
            if (text::IsWordCodePoint(cp) || text::IsSpaceCodePoint(cp)) {
                replaced.append(trimmed, i, len);
            } else {
                replaced.push_back('_');
            }
            i += len;
            continue;
        }
        if (std::isalnum(c) != 0 || c == '_' || IsSpace(static_cast<char>(c)) || c == '-') {
            replaced.push_back(static_cast<char>(c));
        } else {
            replaced.push_back('_');
        }
        ++i;
    }

    size_t lead = 0;
    while (lead < replaced.size() && IsTrigger(replaced[lead])) ++lead;
    replaced.erase(0, lead);

    if (replaced.empty()) {
        replaced = "column_" + std::to_string(position);
    }
    return text::TruncateCodePoints(replaced, kMaxNameLength);
}

auto NameSanitizer::SanitizeAll(const std::vector<std::string>& raw) -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(raw.size());
    std::unordered_map<std::string, size_t> seen;
    for (size_t i = 0; i < raw.size(); ++i) {
        std::string name = SanitizeName(raw[i], i);
        auto [it, inserted] = seen.emplace(name, i);
        if (!inserted) {
            throw PipelineError(ErrorKind::DuplicateColumns,
                                "Duplicate column names after sanitization: '" + name + "' (columns " +
                                    std::to_string(it->second) + " and " + std::to_string(i) + ")");
        }
        names.push_back(std::move(name));
    }
    return names;
}

void NameSanitizer::Apply(Table& table) {
    auto names = SanitizeAll(table.ColumnNames());
    auto& columns = table.Columns();
    size_t renamed = 0;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].name != names[i]) ++renamed;
        columns[i].name = std::move(names[i]);
    }
    if (renamed > 0) {
        obs::LogEvent(obs::LogLevel::Info, "column_names_sanitized", "name_sanitizer",
                      {{"renamed", renamed}, {"columns", columns.size()}});
    }
}

} // namespace csvsentry::pipeline
