#pragma once

#include <memory>
#include <sstream>
#include <streambuf>
#include <string>

#include "pipeline/file_validator.h"

inline auto MakeUpload(const std::string& content, const std::string& filename = "data.csv")
    -> std::unique_ptr<csvsentry::pipeline::RawUpload> {
    auto upload = std::make_unique<csvsentry::pipeline::RawUpload>();
    upload->filename = filename;
    upload->content_type = "text/csv";
    upload->stream = std::make_unique<std::istringstream>(content);
    return upload;
}

// Hands out one byte per underflow and cannot seek, like a socket body.
class NonSeekableBuf : public std::streambuf {
public:
    explicit NonSeekableBuf(std::string data) : data_(std::move(data)) {}

    [[nodiscard]] auto Delivered() const -> size_t { return pos_; }

protected:
    auto underflow() -> int_type override {
        if (pos_ >= data_.size()) return traits_type::eof();
        current_ = data_[pos_++];
        setg(&current_, &current_, &current_ + 1);
        return traits_type::to_int_type(current_);
    }

private:
    std::string data_;
    size_t pos_ = 0;
    char current_ = '\0';
};

class NonSeekableStream : public std::istream {
public:
    explicit NonSeekableStream(std::string data) : std::istream(nullptr), buf_(std::move(data)) {
        rdbuf(&buf_);
    }

    [[nodiscard]] auto Delivered() const -> size_t { return buf_.Delivered(); }

private:
    NonSeekableBuf buf_;
};
