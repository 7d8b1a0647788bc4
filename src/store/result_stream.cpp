#include "store/result_stream.h"

namespace multiquery {

ResultStream::ResultStream(std::unique_ptr<ResultSource> source)
    : source_(std::move(source)), exhausted_(source_ == nullptr) {}

ResultStream::ResultStream(ResultStream&& other) noexcept
    : source_(std::move(other.source_))
    , exhausted_(other.exhausted_)
    , consumed_(other.consumed_) {
    other.exhausted_ = true;
    other.consumed_ = 0;
}

ResultStream& ResultStream::operator=(ResultStream&& other) noexcept {
    if (this != &other) {
        source_ = std::move(other.source_);
        exhausted_ = other.exhausted_;
        consumed_ = other.consumed_;
        other.exhausted_ = true;
        other.consumed_ = 0;
    }
    return *this;
}

std::optional<ResultRow> ResultStream::next() {
    if (exhausted_ || !source_) {
        exhausted_ = true;
        return std::nullopt;
    }

    auto row = source_->next();
    if (!row) {
        exhausted_ = true;
        source_.reset();
        return std::nullopt;
    }
    ++consumed_;
    return row;
}

ResultStream::iterator ResultStream::begin() {
    return iterator(this);
}

std::vector<ResultRow> ResultStream::drain() {
    std::vector<ResultRow> rows;
    while (auto row = next()) {
        rows.push_back(std::move(*row));
    }
    return rows;
}

ResultStream::iterator::iterator(ResultStream* stream)
    : stream_(stream) {
    current_ = stream_->next();
    if (!current_) stream_ = nullptr;
}

ResultStream::iterator& ResultStream::iterator::operator++() {
    if (!stream_) return *this;
    current_ = stream_->next();
    if (!current_) stream_ = nullptr;
    return *this;
}

bool ResultStream::iterator::operator==(const iterator& other) const {
    // Only end-iterators compare equal; two live positions on a single-pass stream never do
    return stream_ == nullptr && other.stream_ == nullptr;
}

} // namespace multiquery
