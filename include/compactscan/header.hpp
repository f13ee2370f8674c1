#pragma once

/**
 * @file header.hpp
 * @brief Language versions, pragma and import extraction
 */

#include "compactscan/common.hpp"
#include "compactscan/source.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace compactscan::header {

/// Two-component language version (MAJOR.MINOR); major < 1000000, minor < 100
struct LanguageVersion
{
    int major = 0;
    int minor = 0;

    /// Comparable key: major * 100 + minor
    [[nodiscard]] constexpr int key() const noexcept { return major * 100 + minor; }

    [[nodiscard]] std::string to_string() const;

    /// Parse exactly "MAJOR.MINOR"; anything else yields nullopt
    [[nodiscard]] static std::optional<LanguageVersion> parse(std::string_view text);

    friend constexpr bool operator==(const LanguageVersion&, const LanguageVersion&) = default;
};

struct VersionRange
{
    LanguageVersion min;
    LanguageVersion max;

    [[nodiscard]] constexpr bool contains(const LanguageVersion& v) const noexcept
    {
        return v.key() >= min.key() && v.key() <= max.key();
    }
};

struct PragmaInfo
{
    std::optional<LanguageVersion> declared_min;
    std::optional<LanguageVersion> declared_max;
    std::optional<LanguageVersion> language_version;  ///< First version in the statement
    std::string raw_text;
    std::size_t line = 0;
    bool well_formed = true;  ///< False on patch versions or clauses without an operator
};

struct ImportDecl
{
    std::string name;  ///< Module identifier, or path for quoted imports
    std::optional<std::string> prefix;
    std::size_t line = 0;
};

struct Header
{
    std::optional<PragmaInfo> pragma;
    std::vector<ImportDecl> imports;
};

[[nodiscard]] Header extract_header(const source::SourceDocument& document);

}  // namespace compactscan::header
