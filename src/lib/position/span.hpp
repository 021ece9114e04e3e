#pragma once

// =============================================================================
// Span & LineOffsets: source positions for Lux
// =============================================================================
//
// A Span is a half-open byte range [start, end) into the source
// buffer. Spans are attached to tokens, AST nodes, diagnostics and runtime
// errors; they are only ever turned into something human-readable when an
// error is reported.
//
// LineOffsets maps a byte offset to a 1-indexed line number. It records the
// offset at which every line begins and answers queries by binary search.
//
// =============================================================================

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace lux
{

    struct Span
    {
        size_t start = 0;
        size_t end = 0;

        Span() = default;
        Span(size_t start, size_t end) : start(start), end(end) {}

        /// Smallest span covering both a and b
        static Span merge(const Span &a, const Span &b)
        {
            return Span(std::min(a.start, b.start), std::max(a.end, b.end));
        }

        bool operator==(const Span &o) const { return start == o.start && end == o.end; }
        bool operator!=(const Span &o) const { return !(*this == o); }
    };

    class LineOffsets
    {
    public:
        explicit LineOffsets(const std::string &source)
            : length_(source.size())
        {
            offsets_.push_back(0);
            for (size_t i = 0; i < source.size(); i++)
            {
                if (source[i] == '\n')
                    offsets_.push_back(i + 1);
            }
        }

        /// 1-indexed line containing the byte at `offset`.
        /// Offsets past the end clamp to the last line.
        int line(size_t offset) const
        {
            if (offset > length_)
                offset = length_;
            // First line start strictly greater than offset; the line is the one before it
            auto it = std::upper_bound(offsets_.begin(), offsets_.end(), offset);
            return static_cast<int>(it - offsets_.begin());
        }

        size_t lineCount() const { return offsets_.size(); }

    private:
        std::vector<size_t> offsets_;
        size_t length_;
    };

} // namespace lux
