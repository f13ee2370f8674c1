/**
 * @file structure_extractor.cpp
 * @brief Top-level declaration extraction
 */

#include "compactscan/structure.hpp"

#include "compactscan/common.hpp"

#include <cctype>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace compactscan::structure {

namespace {

/// Declaration heads longer than this are left unclassified
constexpr std::size_t kMaxHeaderBytes = 4096;

/// Offsets into the joined views of one top-level item
struct Item
{
    std::size_t begin = 0;
    std::size_t header_end = 0;  ///< End of the text before the body (or the ';')
    std::size_t body_begin = 0;
    std::size_t body_end = 0;
    std::size_t end = 0;
    bool has_body = false;
};

struct Span
{
    std::size_t begin = 0;
    std::size_t end = 0;
};

class Extractor
{
public:
    explicit Extractor(const source::SourceDocument& document)
        : m_document(document)
        , m_code(document.joined_code())
        , m_text(document.joined_text())
    {}

    void walk(std::size_t begin, std::size_t end, Structure& out) const;

private:
    [[nodiscard]] std::vector<Item> segment(std::size_t begin, std::size_t end) const;
    void classify(const Item& item, Structure& out) const;

    [[nodiscard]] std::string raw(std::size_t begin, std::size_t end) const
    {
        return common::collapse_whitespace(m_text.substr(begin, end - begin));
    }
    [[nodiscard]] std::size_t skip_space(std::size_t pos, std::size_t end) const;
    [[nodiscard]] std::size_t match_paren(std::size_t open, std::size_t end) const;
    [[nodiscard]] std::vector<Span> split_top_level(std::size_t begin,
                                                    std::size_t end,
                                                    std::string_view separators) const;
    [[nodiscard]] std::vector<Parameter> parameters(std::size_t begin,
                                                    std::size_t end,
                                                    std::string_view separators = ",") const;
    [[nodiscard]] std::string return_type(std::size_t begin, std::size_t end) const;

    void add_ledger_block(const Item& item, bool is_private, Structure& out) const;

    const source::SourceDocument& m_document;
    std::string_view m_code;
    std::string_view m_text;
};

[[nodiscard]] bool has_word(const std::string& modifiers, std::string_view word)
{
    static const std::regex kWords(R"(\w+)");
    for (auto it = std::sregex_iterator(modifiers.begin(), modifiers.end(), kWords);
         it != std::sregex_iterator();
         ++it) {
        if (it->str() == word) {
            return true;
        }
    }
    return false;
}

std::size_t Extractor::skip_space(std::size_t pos, std::size_t end) const
{
    while (pos < end && std::isspace(static_cast<unsigned char>(m_code[pos])) != 0) {
        ++pos;
    }
    return pos;
}

std::vector<Item> Extractor::segment(std::size_t begin, std::size_t end) const
{
    std::vector<Item> items;
    std::size_t i = begin;
    while (true) {
        i = skip_space(i, end);
        if (i >= end) {
            break;
        }
        if (m_code[i] == '}' || m_code[i] == ';') {
            // Stray closer or empty statement.
            ++i;
            continue;
        }

        Item item{.begin = i};
        int paren = 0;
        int bracket = 0;
        int brace = 0;
        bool closed = false;
        for (; i < end; ++i) {
            const char c = m_code[i];
            if (c == '(') {
                ++paren;
            } else if (c == ')' && paren > 0) {
                --paren;
            } else if (c == '[') {
                ++bracket;
            } else if (c == ']' && bracket > 0) {
                --bracket;
            } else if (c == '{') {
                if (brace == 0 && !item.has_body) {
                    item.has_body = true;
                    item.header_end = i;
                    item.body_begin = i + 1;
                }
                ++brace;
            } else if (c == '}') {
                if (brace == 0) {
                    // Closer of an enclosing block; leave it for the caller.
                    break;
                }
                --brace;
                if (brace == 0) {
                    item.body_end = i;
                    item.end = ++i;
                    closed = true;
                    break;
                }
            } else if (c == ';' && brace == 0 && paren == 0 && bracket == 0) {
                item.header_end = i;
                item.end = ++i;
                closed = true;
                break;
            }
        }
        if (!closed) {
            item.end = i;
            if (item.has_body) {
                item.body_end = i;
            } else {
                item.header_end = i;
            }
        }
        items.push_back(item);
    }
    return items;
}

std::size_t Extractor::match_paren(std::size_t open, std::size_t end) const
{
    int depth = 0;
    for (std::size_t i = open; i < end; ++i) {
        if (m_code[i] == '(') {
            ++depth;
        } else if (m_code[i] == ')') {
            if (--depth == 0) {
                return i;
            }
        }
    }
    return end;
}

std::vector<Span> Extractor::split_top_level(std::size_t begin,
                                             std::size_t end,
                                             std::string_view separators) const
{
    std::vector<Span> spans;
    int depth = 0;
    std::size_t start = begin;
    for (std::size_t i = begin; i < end; ++i) {
        const char c = m_code[i];
        if (c == '(' || c == '[' || c == '{' || c == '<') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            depth = depth > 0 ? depth - 1 : 0;
        } else if (c == '>') {
            if (i > begin && m_code[i - 1] == '=') {
                continue;
            }
            depth = depth > 0 ? depth - 1 : 0;
        } else if (depth == 0 && separators.find(c) != std::string_view::npos) {
            spans.push_back({start, i});
            start = i + 1;
        }
    }
    spans.push_back({start, end});
    std::erase_if(spans, [this](const Span& s) {
        return common::is_blank(m_code.substr(s.begin, s.end - s.begin));
    });
    return spans;
}

std::vector<Parameter> Extractor::parameters(std::size_t begin,
                                             std::size_t end,
                                             std::string_view separators) const
{
    std::vector<Parameter> params;
    for (const auto& span : split_top_level(begin, end, separators)) {
        // The first ':' at depth 0 separates the name from the type.
        std::size_t colon = span.end;
        int depth = 0;
        for (std::size_t i = span.begin; i < span.end; ++i) {
            const char c = m_code[i];
            if (c == '(' || c == '[' || c == '{' || c == '<') {
                ++depth;
            } else if (c == ')' || c == ']' || c == '}' || c == '>') {
                --depth;
            } else if (c == ':' && depth == 0) {
                colon = i;
                break;
            }
        }
        if (colon == span.end) {
            params.push_back({.name = raw(span.begin, span.end), .type = ""});
        } else {
            params.push_back({.name = raw(span.begin, colon), .type = raw(colon + 1, span.end)});
        }
    }
    return params;
}

std::string Extractor::return_type(std::size_t begin, std::size_t end) const
{
    const std::size_t pos = skip_space(begin, end);
    if (pos >= end || m_code[pos] != ':') {
        return "[]";
    }
    std::string type = raw(pos + 1, end);
    return type.empty() ? "[]" : type;
}

void Extractor::add_ledger_block(const Item& item, bool is_private, Structure& out) const
{
    for (const auto& span : split_top_level(item.body_begin, item.body_end, ";")) {
        const std::size_t first = skip_space(span.begin, span.end);
        const std::size_t colon = m_code.find(':', first);
        if (colon == std::string_view::npos || colon >= span.end) {
            continue;
        }
        std::string name = raw(first, colon);
        if (name.empty()) {
            continue;
        }
        out.ledger_items.push_back({
            .name = std::move(name),
            .declared_type = raw(colon + 1, span.end),
            .exported = false,
            .sealed = false,
            .is_private = is_private,
            .line = m_document.line_at(first),
        });
    }
}

void Extractor::classify(const Item& item, Structure& out) const
{
    static const std::regex kLedger(R"(((?:(?:export|sealed)\s+)*)ledger\b\s*)");
    static const std::regex kLedgerField(R"(\s*([A-Za-z_]\w*)\s*:)");
    static const std::regex kCircuit(
        R"(((?:(?:export|pure)\s+)*)circuit\s+([A-Za-z_]\w*)\s*(?:<[^()]*>\s*)?\()");
    static const std::regex kWitness(
        R"(((?:export\s+)*)witness\s+([A-Za-z_]\w*)\s*(?:<[^()]*>\s*)?([(:]))");
    static const std::regex kEnum(R"(((?:export\s+)*)enum\s+([A-Za-z_]\w*)\s*)");
    static const std::regex kStruct(R"(((?:export\s+)*)struct\s+([A-Za-z_]\w*)\s*(?:<[^{]*>)?\s*)");
    static const std::regex kTypeAlias(
        R"(((?:export\s+)*)(?:new\s+)?type\s+([A-Za-z_]\w*)\s*(?:<[^=]*>)?\s*=)");
    static const std::regex kConstructor(R"(constructor\s*\()");
    static const std::regex kModule(R"(((?:export\s+)*)module\s+([A-Za-z_]\w*)\s*(?:<[^{]*>)?\s*)");

    // Strip leading annotations.
    std::size_t pos = item.begin;
    bool is_private = false;
    while (pos < item.header_end && m_code[pos] == '@') {
        std::size_t word_end = pos + 1;
        while (word_end < item.header_end
               && (std::isalnum(static_cast<unsigned char>(m_code[word_end])) != 0
                   || m_code[word_end] == '_')) {
            ++word_end;
        }
        if (m_code.substr(pos + 1, word_end - pos - 1) == "private") {
            is_private = true;
        }
        pos = skip_space(word_end, item.header_end);
    }
    if (item.header_end - pos > kMaxHeaderBytes) {
        return;
    }

    const std::string header(m_code.substr(pos, item.header_end - pos));
    const auto at = [&](const std::smatch& m, int group) {
        return pos + static_cast<std::size_t>(m.position(group));
    };
    const auto header_rest_blank = [&](const std::smatch& m) {
        return common::is_blank(std::string_view(header).substr(
            static_cast<std::size_t>(m.position(0) + m.length(0))));
    };
    const auto line = m_document.line_at(pos);
    const auto end_line = m_document.line_at(item.end > 0 ? item.end - 1 : 0);
    constexpr auto kAnchored = std::regex_constants::match_continuous;

    std::smatch m;
    if (std::regex_search(header, m, kLedger, kAnchored)) {
        const std::string modifiers = m.str(1);
        if (item.has_body && header_rest_blank(m)) {
            add_ledger_block(item, is_private, out);
            return;
        }
        std::smatch field;
        const std::string rest = header.substr(static_cast<std::size_t>(m.length(0)));
        if (item.has_body || !std::regex_search(rest, field, kLedgerField, kAnchored)) {
            return;
        }
        const std::size_t type_begin = pos + static_cast<std::size_t>(m.length(0))
                                       + static_cast<std::size_t>(field.length(0));
        out.ledger_items.push_back({
            .name = field.str(1),
            .declared_type = raw(type_begin, item.header_end),
            .exported = has_word(modifiers, "export"),
            .sealed = has_word(modifiers, "sealed"),
            .is_private = is_private,
            .line = line,
        });
        return;
    }

    if (std::regex_search(header, m, kCircuit, kAnchored)) {
        const std::size_t open = at(m, 0) + static_cast<std::size_t>(m.length(0)) - 1;
        const std::size_t close = match_paren(open, item.header_end);
        out.circuits.push_back({
            .name = m.str(2),
            .parameters = parameters(open + 1, close),
            .return_type = close < item.header_end ? return_type(close + 1, item.header_end)
                                                   : std::string("[]"),
            .exported = has_word(m.str(1), "export"),
            .pure = has_word(m.str(1), "pure"),
            .line = line,
            .end_line = end_line,
        });
        return;
    }

    if (std::regex_search(header, m, kWitness, kAnchored)) {
        Witness witness{
            .name = m.str(2),
            .parameters = {},
            .return_type = "[]",
            .exported = has_word(m.str(1), "export"),
            .line = line,
        };
        const std::size_t delim = at(m, 3);
        if (m.str(3) == "(") {
            const std::size_t close = match_paren(delim, item.header_end);
            witness.parameters = parameters(delim + 1, close);
            if (close < item.header_end) {
                witness.return_type = return_type(close + 1, item.header_end);
            }
        } else {
            witness.return_type = return_type(delim, item.header_end);
        }
        out.witnesses.push_back(std::move(witness));
        return;
    }

    if (std::regex_search(header, m, kEnum, kAnchored)) {
        if (!item.has_body || !header_rest_blank(m)) {
            return;
        }
        EnumDecl decl{.name = m.str(2), .variants = {}, .exported = has_word(m.str(1), "export"),
                      .line = line};
        for (const auto& span : split_top_level(item.body_begin, item.body_end, ",")) {
            decl.variants.push_back(raw(span.begin, span.end));
        }
        out.enums.push_back(std::move(decl));
        return;
    }

    if (std::regex_search(header, m, kStruct, kAnchored)) {
        if (!item.has_body || !header_rest_blank(m)) {
            return;
        }
        // Fields are ','-separated; older sources terminate them with ';'.
        out.structs.push_back({
            .name = m.str(2),
            .fields = parameters(item.body_begin, item.body_end, ",;"),
            .exported = has_word(m.str(1), "export"),
            .line = line,
        });
        return;
    }

    if (std::regex_search(header, m, kTypeAlias, kAnchored)) {
        if (item.has_body) {
            return;
        }
        out.type_aliases.push_back({
            .name = m.str(2),
            .definition = raw(pos + static_cast<std::size_t>(m.length(0)), item.header_end),
            .exported = has_word(m.str(1), "export"),
            .line = line,
        });
        return;
    }

    if (std::regex_search(header, m, kConstructor, kAnchored)) {
        const std::size_t open = at(m, 0) + static_cast<std::size_t>(m.length(0)) - 1;
        const std::size_t close = match_paren(open, item.header_end);
        out.constructor = ConstructorDecl{
            .parameters = parameters(open + 1, close),
            .line = line,
            .end_line = end_line,
        };
        return;
    }

    if (std::regex_search(header, m, kModule, kAnchored)) {
        if (item.has_body && header_rest_blank(m)) {
            walk(item.body_begin, item.body_end, out);
        }
    }
}

void Extractor::walk(std::size_t begin, std::size_t end, Structure& out) const
{
    for (const auto& item : segment(begin, end)) {
        classify(item, out);
    }
}

}  // namespace

Structure extract_structure(const source::SourceDocument& document)
{
    Structure structure;
    Extractor extractor(document);
    extractor.walk(0, document.joined_code().size(), structure);
    return structure;
}

}  // namespace compactscan::structure
