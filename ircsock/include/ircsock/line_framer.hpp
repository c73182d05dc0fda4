#pragma once
/**
 * @file line_framer.hpp
 * @brief Split a byte stream into IRC protocol lines
 *
 */

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <string_view>
#include <vector>

namespace ircsock {

/**
 * @brief Growable buffer with line-oriented dispatch
 *
 * Bytes that do not yet form a complete line are carried over to the next
 * call. The storage is reused between calls so capacity is retained.
 */
class LineFramer
{
    // [begin(buffer_), end(buffer_)) contains carryover; it never holds a '\n'
    std::vector<char> buffer_;

public:
    LineFramer() = default;

    /**
     * @brief Append new bytes and dispatch each completed line
     *
     * Lines are terminated by LF with an optional preceding CR. The
     * callback receives the line without its terminator; the view is only
     * valid during the call and the callback must not re-enter the framer.
     *
     * @param bytes newly received bytes
     * @param line_cb callback run once per completed line
     * @return number of lines dispatched
     */
    auto append(std::string_view const bytes, std::invocable<std::string_view> auto&& line_cb) -> std::size_t
    {
        auto const old_size = buffer_.size();
        buffer_.insert(std::end(buffer_), std::begin(bytes), std::end(bytes));

        auto const first = std::begin(buffer_);
        auto const last = std::end(buffer_);

        // cursor marks the beginning of the current line
        auto cursor = first;
        std::size_t lines = 0;

        // the carryover had no newline, so only the new bytes are searched
        for (auto nl = std::find(first + old_size, last, '\n');
             nl != last;
             nl = std::find(cursor, last, '\n'))
        {
            // Support both \n and \r\n
            auto const eol = cursor < nl && *std::prev(nl) == '\r' ? std::prev(nl) : nl;

            line_cb(std::string_view{&*cursor, static_cast<std::size_t>(std::distance(cursor, eol))});
            lines++;

            cursor = std::next(nl);
        }

        // relocate incomplete line to front of buffer
        if (cursor != first)
        {
            buffer_.erase(first, cursor);
        }

        return lines;
    }

    /// @brief Bytes waiting for a line terminator
    auto carryover() const -> std::string_view
    {
        return {buffer_.data(), buffer_.size()};
    }

    /// @brief Discard any carryover while keeping the allocation
    auto clear() -> void
    {
        buffer_.clear();
    }

    auto capacity() const -> std::size_t
    {
        return buffer_.capacity();
    }
};

} // namespace ircsock
