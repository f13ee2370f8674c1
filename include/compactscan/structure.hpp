#pragma once

/**
 * @file structure.hpp
 * @brief Structural extraction of top-level contract declarations
 */

#include "compactscan/source.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace compactscan::structure {

struct Parameter
{
    std::string name;
    std::string type;  ///< Empty when the parameter carries no annotation
};

struct LedgerItem
{
    std::string name;
    std::string declared_type;
    bool exported = false;
    bool sealed = false;
    bool is_private = false;  ///< Preceded by an @private annotation
    std::size_t line = 0;
};

struct Circuit
{
    std::string name;
    std::vector<Parameter> parameters;
    std::string return_type;  ///< "[]" when the declaration has no annotation
    bool exported = false;
    bool pure = false;
    std::size_t line = 0;
    std::size_t end_line = 0;  ///< Line of the closing brace (or terminator)
};

struct Witness
{
    std::string name;
    std::vector<Parameter> parameters;
    std::string return_type;
    bool exported = false;
    std::size_t line = 0;
};

struct EnumDecl
{
    std::string name;
    std::vector<std::string> variants;
    bool exported = false;
    std::size_t line = 0;
};

struct StructDecl
{
    std::string name;
    std::vector<Parameter> fields;
    bool exported = false;
    std::size_t line = 0;
};

struct TypeAlias
{
    std::string name;
    std::string definition;
    bool exported = false;
    std::size_t line = 0;
};

struct ConstructorDecl
{
    std::vector<Parameter> parameters;
    std::size_t line = 0;
    std::size_t end_line = 0;
};

struct Structure
{
    std::vector<LedgerItem> ledger_items;
    std::vector<Circuit> circuits;
    std::vector<Witness> witnesses;
    std::vector<EnumDecl> enums;
    std::vector<StructDecl> structs;
    std::vector<TypeAlias> type_aliases;
    std::optional<ConstructorDecl> constructor;

    [[nodiscard]] bool has_constructor() const { return constructor.has_value(); }
};

/**
 * Walk the document's top-level items and classify declarations.
 *
 * An item runs from its first code character to a ';' at bracket depth 0, or
 * to the '}' closing a brace opened at depth 0, so declarations wrapped over
 * several lines are re-joined before classification. Items that match no
 * known declaration form are skipped. Declarations inside `module` blocks
 * are extracted as if they were top level.
 */
[[nodiscard]] Structure extract_structure(const source::SourceDocument& document);

}  // namespace compactscan::structure
