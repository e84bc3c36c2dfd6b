/*

classifier.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Classification of signature lines into literal HTML and plain text segments.

*/


#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <htmlfooter/detail/ascii.hpp>


namespace htmlfooter::footer
{


/**
Line opening a literal HTML region.
**/
inline constexpr std::string_view HTML_BEGIN_MARKER{"<html>"};

/**
Line closing a literal HTML region.
**/
inline constexpr std::string_view HTML_END_MARKER{"</html>"};


enum class segment_kind_t {PLAIN, HTML};


/**
Contiguous run of signature lines of the same kind, each line ending with LF.
**/
struct text_segment
{
    segment_kind_t kind = segment_kind_t::PLAIN;

    std::string text;

    bool operator==(const text_segment&) const = default;
};


/**
Two state automaton splitting signature lines into segments.

The automaton starts in the plain state. A `<html>` line moves it to the HTML state, a `</html>` line back to the plain state; marker lines are
consumed by the transition and never emitted. Other lines are appended to the open segment of the current state. A state change or the end of input
closes the segment, empty segments are dropped.
**/
class signature_classifier
{
public:

    enum class state_t {PLAIN, HTML};

    enum class line_kind_t {BEGIN_MARKER, END_MARKER, TEXT};

    /**
    Kind of a line, without its line ending.
    **/
    static constexpr line_kind_t line_kind(std::string_view line) noexcept
    {
        if (line == HTML_BEGIN_MARKER)
            return line_kind_t::BEGIN_MARKER;
        if (line == HTML_END_MARKER)
            return line_kind_t::END_MARKER;
        return line_kind_t::TEXT;
    }

    /**
    Transition function of the automaton.
    **/
    static constexpr state_t transition(state_t state, line_kind_t kind) noexcept
    {
        switch (kind)
        {
            case line_kind_t::BEGIN_MARKER: return state_t::HTML;
            case line_kind_t::END_MARKER: return state_t::PLAIN;
            case line_kind_t::TEXT: return state;
        }
        return state;
    }

    state_t state() const noexcept
    {
        return state_;
    }

    /**
    Feeding a line, without its line ending.
    **/
    void feed(std::string_view line)
    {
        const line_kind_t kind = line_kind(line);
        const state_t next = transition(state_, kind);
        if (next != state_)
            close_segment();
        state_ = next;
        if (kind == line_kind_t::TEXT)
        {
            open_.append(line.data(), line.size());
            open_ += '\n';
        }
    }

    /**
    Closing the last segment and returning all of them in input order. The classifier is reset afterwards.
    **/
    std::vector<text_segment> finish()
    {
        close_segment();
        state_ = state_t::PLAIN;
        return std::exchange(segments_, {});
    }

private:

    void close_segment()
    {
        if (open_.empty())
            return;
        segments_.push_back(text_segment{state_ == state_t::HTML ? segment_kind_t::HTML : segment_kind_t::PLAIN, std::exchange(open_, {})});
    }

    state_t state_ = state_t::PLAIN;

    std::string open_;

    std::vector<text_segment> segments_;
};


/**
Classifying a signature.

@param signature Signature text, the delimiter line excluded.
@return          Segments in signature order.
**/
[[nodiscard]] inline std::vector<text_segment> classify(std::string_view signature)
{
    signature_classifier classifier;
    detail::for_each_line(signature, [&classifier](std::string_view line) { classifier.feed(line); });
    return classifier.finish();
}


/**
Checking if a signature has a line opening a literal HTML region.
**/
[[nodiscard]] inline bool has_html_marker(std::string_view signature)
{
    bool found = false;
    detail::for_each_line(signature, [&found](std::string_view line) {
        if (signature_classifier::line_kind(line) == signature_classifier::line_kind_t::BEGIN_MARKER)
            found = true;
    });
    return found;
}


/**
Concatenating the text of the segments of the given kind.
**/
[[nodiscard]] inline std::string join_segments(const std::vector<text_segment>& segments, segment_kind_t kind)
{
    std::string text;
    for (const auto& seg : segments)
        if (seg.kind == kind)
            text += seg.text;
    return text;
}


} // namespace htmlfooter::footer
