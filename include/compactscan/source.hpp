#pragma once

/**
 * @file source.hpp
 * @brief Source document and line scanner
 *
 * The scanner splits contract source into 1-based lines and computes, for each
 * line, a "code view": the same text with comment text and string-literal
 * contents replaced by spaces. Column positions in the code view match the raw
 * line, so matchers run on the code view and slice names out of the raw text.
 */

#include "compactscan/common.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace compactscan::source {

/// Default cap on accepted input size (256 KiB)
constexpr std::size_t kDefaultMaxSourceBytes = 256U * 1024U;

/// Default cap on a single physical line; matchers run line by line
constexpr std::size_t kDefaultMaxLineBytes = 4096U;

/// Failure codes reported through Error::code
constexpr std::string_view kEmptyInput = "EmptyInput";
constexpr std::string_view kInputTooLarge = "InputTooLarge";
constexpr std::string_view kInvalidContent = "InvalidContent";
constexpr std::string_view kLineTooLong = "LineTooLong";

struct ScanOptions
{
    std::size_t max_source_bytes = kDefaultMaxSourceBytes;
    std::size_t max_line_bytes = kDefaultMaxLineBytes;
};

/**
 * Lexical context of one line.
 * in_block_comment / in_string_literal describe the state at the start of the
 * line; in_line_comment is set when the line contains a // comment.
 */
struct LexicalFlags
{
    bool in_block_comment = false;
    bool in_line_comment = false;
    bool in_string_literal = false;
};

struct LineContext
{
    std::size_t number = 0;  ///< 1-based line number
    std::string text;        ///< Raw line without the newline
    std::string code;        ///< Code view, same length as text
    LexicalFlags flags{};
    int depth = 0;  ///< Brace depth at the start of the line
};

class SourceDocument
{
public:
    SourceDocument(std::string raw, std::vector<LineContext> lines);

    [[nodiscard]] const std::string& raw() const { return m_raw; }
    [[nodiscard]] const std::vector<LineContext>& lines() const { return m_lines; }
    [[nodiscard]] std::size_t line_count() const { return m_lines.size(); }

    /// Line by 1-based number; number must be in 1..line_count()
    [[nodiscard]] const LineContext& line(std::size_t number) const;

    /// Raw lines joined with '\n'
    [[nodiscard]] const std::string& joined_text() const { return m_joined_text; }

    /// Code views joined with '\n'; offsets match joined_text()
    [[nodiscard]] const std::string& joined_code() const { return m_joined_code; }

    /// 1-based line containing an offset into joined_text()/joined_code()
    [[nodiscard]] std::size_t line_at(std::size_t offset) const;

    /// Offset of the first character of a 1-based line in the joined views
    [[nodiscard]] std::size_t line_offset(std::size_t number) const;

private:
    std::string m_raw;
    std::vector<LineContext> m_lines;
    std::string m_joined_text;
    std::string m_joined_code;
    std::vector<std::size_t> m_line_offsets;
};

/**
 * Scan raw source into a SourceDocument.
 *
 * Fails with InputTooLarge, InvalidContent (NUL/control bytes or malformed
 * UTF-8), EmptyInput (whitespace only) or LineTooLong (a line longer than
 * max_line_bytes), checked in that order.
 */
[[nodiscard]] compactscan::Result<SourceDocument> scan(std::string_view source,
                                                       const ScanOptions& options = {});

}  // namespace compactscan::source
