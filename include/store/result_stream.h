#pragma once

#include "query/result_row.h"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <vector>

namespace multiquery {

/// Producer side of a result stream. next() returns nullopt once exhausted
/// and may throw (job failures surface here).
class ResultSource {
public:
    virtual ~ResultSource() = default;
    virtual std::optional<ResultRow> next() = 0;
};

/// Lazy, single-pass, finite sequence of result rows.
///
/// Rows are pulled from the source on demand; nothing is buffered here. A
/// second begin() continues where the previous iteration stopped. Move-only.
class ResultStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ResultRow;
        using difference_type = std::ptrdiff_t;
        using pointer = const ResultRow*;
        using reference = const ResultRow&;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++();
        // Post-increment on an input iterator only advances
        void operator++(int) { ++*this; }

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class ResultStream;
        explicit iterator(ResultStream* stream);

        ResultStream* stream_ = nullptr;
        std::optional<ResultRow> current_;
    };

    ResultStream() = default;
    explicit ResultStream(std::unique_ptr<ResultSource> source);

    // Moved-from streams are empty and exhausted
    ResultStream(ResultStream&& other) noexcept;
    ResultStream& operator=(ResultStream&& other) noexcept;
    ResultStream(const ResultStream&) = delete;
    ResultStream& operator=(const ResultStream&) = delete;

    /// Next row, nullopt when done
    std::optional<ResultRow> next();

    iterator begin();
    iterator end() { return iterator(); }

    /// Consume all remaining rows
    std::vector<ResultRow> drain();

    bool exhausted() const { return exhausted_; }

    /// Rows handed out so far
    size_t consumed() const { return consumed_; }

private:
    std::unique_ptr<ResultSource> source_;
    bool exhausted_ = true;
    size_t consumed_ = 0;
};

} // namespace multiquery
