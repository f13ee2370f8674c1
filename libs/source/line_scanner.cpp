/**
 * @file line_scanner.cpp
 * @brief Line scanner with lexical context tracking
 */

#include "compactscan/source.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <utility>

namespace compactscan::source {

namespace {

enum class LexState { kCode, kBlockComment, kString };

struct LexCursor
{
    LexState state = LexState::kCode;
    char quote = '"';
    int depth = 0;
};

[[nodiscard]] std::size_t utf8_sequence_length(unsigned char lead) noexcept
{
    if (lead < 0x80U) {
        return 1;
    }
    if ((lead & 0xE0U) == 0xC0U) {
        return lead >= 0xC2U ? 2 : 0;
    }
    if ((lead & 0xF0U) == 0xE0U) {
        return 3;
    }
    if ((lead & 0xF8U) == 0xF0U) {
        return lead <= 0xF4U ? 4 : 0;
    }
    return 0;
}

[[nodiscard]] bool is_allowed_control(unsigned char c) noexcept
{
    return c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

/**
 * Reject text that is not plausibly contract source: control bytes other
 * than whitespace, or malformed UTF-8.
 */
[[nodiscard]] compactscan::VoidResult check_content(std::string_view source)
{
    std::size_t i = 0;
    while (i < source.size()) {
        const auto lead = static_cast<unsigned char>(source[i]);
        if ((lead < 0x20U && !is_allowed_control(lead)) || lead == 0x7FU) {
            return std::unexpected(Error::make(
                std::string(kInvalidContent),
                std::format("Control byte 0x{:02x} at offset {}", static_cast<unsigned>(lead), i)));
        }
        const std::size_t length = utf8_sequence_length(lead);
        if (length == 0 || i + length > source.size()) {
            return std::unexpected(Error::make(std::string(kInvalidContent),
                                               std::format("Malformed UTF-8 at offset {}", i)));
        }
        for (std::size_t k = 1; k < length; ++k) {
            const auto cont = static_cast<unsigned char>(source[i + k]);
            if ((cont & 0xC0U) != 0x80U) {
                return std::unexpected(Error::make(
                    std::string(kInvalidContent),
                    std::format("Malformed UTF-8 at offset {}", i)));
            }
        }
        i += length;
    }
    return {};
}

[[nodiscard]] LineContext scan_line(std::string_view text, std::size_t number, LexCursor& cursor)
{
    LineContext line{
        .number = number,
        .text = std::string(text),
        .code = std::string(text.size(), ' '),
        .flags = {.in_block_comment = cursor.state == LexState::kBlockComment,
                  .in_line_comment = false,
                  .in_string_literal = cursor.state == LexState::kString},
        .depth = cursor.depth,
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        const char next = i + 1 < text.size() ? text[i + 1] : '\0';

        if (cursor.state == LexState::kBlockComment) {
            if (c == '*' && next == '/') {
                cursor.state = LexState::kCode;
                ++i;
            }
            continue;
        }
        if (cursor.state == LexState::kString) {
            if (c == '\\') {
                ++i;
            } else if (c == cursor.quote) {
                cursor.state = LexState::kCode;
                line.code[i] = c;
            }
            continue;
        }

        if (c == '/' && next == '/') {
            line.flags.in_line_comment = true;
            break;
        }
        if (c == '/' && next == '*') {
            cursor.state = LexState::kBlockComment;
            ++i;
            continue;
        }
        if (c == '"' || c == '\'') {
            cursor.state = LexState::kString;
            cursor.quote = c;
            line.code[i] = c;
            continue;
        }
        if (c == '{') {
            ++cursor.depth;
        } else if (c == '}' && cursor.depth > 0) {
            --cursor.depth;
        }
        line.code[i] = c;
    }
    return line;
}

}  // namespace

SourceDocument::SourceDocument(std::string raw, std::vector<LineContext> lines)
    : m_raw(std::move(raw))
    , m_lines(std::move(lines))
    , m_joined_text()
    , m_joined_code()
    , m_line_offsets()
{
    m_line_offsets.reserve(m_lines.size());
    for (const auto& line : m_lines) {
        if (!m_line_offsets.empty()) {
            m_joined_text.push_back('\n');
            m_joined_code.push_back('\n');
        }
        m_line_offsets.push_back(m_joined_text.size());
        m_joined_text += line.text;
        m_joined_code += line.code;
    }
}

const LineContext& SourceDocument::line(std::size_t number) const
{
    return m_lines.at(number - 1);
}

std::size_t SourceDocument::line_at(std::size_t offset) const
{
    auto it = std::ranges::upper_bound(m_line_offsets, offset);
    return static_cast<std::size_t>(std::distance(m_line_offsets.begin(), it));
}

std::size_t SourceDocument::line_offset(std::size_t number) const
{
    return m_line_offsets.at(number - 1);
}

compactscan::Result<SourceDocument> scan(std::string_view source, const ScanOptions& options)
{
    if (source.size() > options.max_source_bytes) {
        return std::unexpected(Error::make(
            std::string(kInputTooLarge),
            std::format("Source is {} bytes; the limit is {} bytes", source.size(),
                        options.max_source_bytes)));
    }
    if (auto content = check_content(source); !content) {
        return std::unexpected(content.error());
    }
    if (common::is_blank(source)) {
        return std::unexpected(
            Error::make(std::string(kEmptyInput), "Source contains no non-whitespace content"));
    }

    std::vector<LineContext> lines;
    LexCursor cursor;
    std::size_t start = 0;
    std::size_t number = 1;
    while (start < source.size()) {
        std::size_t end = source.find('\n', start);
        if (end == std::string_view::npos) {
            end = source.size();
        }
        std::string_view text = source.substr(start, end - start);
        if (text.ends_with('\r')) {
            text.remove_suffix(1);
        }
        if (text.size() > options.max_line_bytes) {
            return std::unexpected(Error::make(
                std::string(kLineTooLong),
                std::format("Line {} is {} bytes; the limit is {} bytes", number, text.size(),
                            options.max_line_bytes)));
        }
        lines.push_back(scan_line(text, number, cursor));
        ++number;
        start = end + 1;
    }

    return SourceDocument(std::string(source), std::move(lines));
}

}  // namespace compactscan::source
