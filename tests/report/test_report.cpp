/**
 * @file test_report.cpp
 * @brief JSON and text rendering tests
 */

#include "compactscan/analyzer.hpp"
#include "compactscan/report.hpp"
#include "compactscan/rules.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace compactscan::report::test {

namespace {

analyzer::AnalysisResult analyze(std::string_view text)
{
    auto table = rules::load_rule_table(
        std::string(COMPACTSCAN_RULES_DIR) + "/compact_rules.v1.json", COMPACTSCAN_SCHEMA_DIR);
    if (!table) {
        throw std::runtime_error(table.error().message);
    }
    return analyzer::Analyzer(std::move(*table)).analyze(text);
}

rules::Issue make_issue(std::string id, rules::Severity severity, std::optional<std::size_t> line)
{
    return rules::Issue{
        .rule_id = std::move(id),
        .severity = severity,
        .message = "message",
        .suggested_fix = "",
        .line = line,
    };
}

}  // namespace

TEST(ReportJsonTest, SuccessDocumentShape)
{
    auto result = analyze("pragma language_version >= 0.16 && <= 0.18;\n"
                          "import CompactStandardLibrary;\n"
                          "import \"./utils\" prefix U_;\n"
                          "export ledger owner: Bytes<32>;\n"
                          "export circuit set(o: Bytes<32>): [] {\n"
                          "  owner = disclose(o);\n"
                          "}\n"
                          "constructor(o: Bytes<32>) {\n"
                          "  owner = disclose(o);\n"
                          "}\n"
                          "enum Mode { On }\n");
    ASSERT_TRUE(result) << result.error().message;
    const auto j = to_json(result);

    EXPECT_EQ(j.at("success"), true);
    EXPECT_EQ(j.at("languageVersion"), "0.16");

    const auto& pragma = j.at("pragma");
    EXPECT_EQ(pragma.at("declaredMin"), "0.16");
    EXPECT_EQ(pragma.at("declaredMax"), "0.18");
    EXPECT_EQ(pragma.at("rawText"), "pragma language_version >= 0.16 && <= 0.18;");
    EXPECT_EQ(pragma.at("lineNumber"), 1);
    EXPECT_EQ(pragma.at("wellFormed"), true);

    const auto& imports = j.at("imports");
    ASSERT_EQ(imports.size(), 2U);
    EXPECT_EQ(imports[0].at("name"), "CompactStandardLibrary");
    EXPECT_FALSE(imports[0].contains("prefix"));
    EXPECT_EQ(imports[1].at("name"), "./utils");
    EXPECT_EQ(imports[1].at("prefix"), "U_");
    EXPECT_EQ(imports[1].at("lineNumber"), 3);

    const auto& structure = j.at("structure");
    EXPECT_EQ(structure.at("hasConstructor"), true);
    EXPECT_EQ(structure.at("constructor").at("lineNumber"), 8);
    EXPECT_EQ(structure.at("constructor").at("parameters")[0].at("type"), "Bytes<32>");
    EXPECT_EQ(structure.at("circuits")[0].at("returnType"), "[]");
    EXPECT_EQ(structure.at("ledgerItems")[0].at("private"), false);
    EXPECT_EQ(structure.at("enums")[0].at("variants"), nlohmann::json::array({"On"}));
    EXPECT_EQ(structure.at("typeAliases"), nlohmann::json::array());

    EXPECT_EQ(j.at("exports").at("ledgerItems"), nlohmann::json::array({"owner"}));
    EXPECT_EQ(j.at("stats").at("lineCount"), 11);
    EXPECT_EQ(j.at("stats").at("enumCount"), 1);

    const auto& issues = j.at("potentialIssues");
    ASSERT_EQ(issues.size(), 1U);
    EXPECT_EQ(issues[0].at("ruleId"), "unexported_enum");
    EXPECT_EQ(issues[0].at("severity"), "warning");
    EXPECT_EQ(issues[0].at("lineNumber"), 11);
    EXPECT_EQ(issues[0].at("suggestedFix"), "Declare it as: export enum Mode");
}

TEST(ReportJsonTest, FailureDocumentHasOnlyTwoKeys)
{
    const auto j = to_json(analyze("   "));
    EXPECT_EQ(j.size(), 2U);
    EXPECT_EQ(j.at("success"), false);
    EXPECT_EQ(j.at("failureReason"), "EmptyInput");
}

TEST(ReportJsonTest, CanonicalFormSortsKeys)
{
    auto canonical = to_canonical_json(analyze("pragma language_version >= 0.16 && <= 0.18;\n"));
    ASSERT_TRUE(canonical) << canonical.error().message;
    EXPECT_TRUE(canonical->starts_with(R"({"exports":{"circuits":[],"ledgerItems":[],"witnesses":[]},)"));
    EXPECT_TRUE(canonical->ends_with(R"("success":true,"summary":"Empty contract"})"));
    EXPECT_EQ(canonical->find('\n'), std::string::npos);
}

TEST(ReportTextTest, CleanContract)
{
    auto text = render_text(analyze("pragma language_version >= 0.16 && <= 0.18;\n"
                                    "import CompactStandardLibrary;\n"
                                    "export ledger counter: Counter;\n"
                                    "export circuit increment(): [] { counter.increment(1); }\n"));
    EXPECT_EQ(text,
              "Language version: 0.16\n"
              "Imports: CompactStandardLibrary\n"
              "Summary: 1 circuit(s), 1 ledger item(s)\n"
              "No issues found.\n");
}

TEST(ReportTextTest, IssuesAreListedWithLocationAndFix)
{
    auto text = render_text(analyze("enum State { A }\n"));
    EXPECT_NE(text.find("Language version: none\n"), std::string::npos);
    EXPECT_NE(text.find("Issues (2):\n"), std::string::npos);
    EXPECT_NE(text.find("  warning -         [missing_pragma]"), std::string::npos);
    EXPECT_NE(text.find("  warning line 1    [unexported_enum] Enum is not exported"),
              std::string::npos);
    EXPECT_NE(text.find("            fix: Declare it as: export enum State\n"), std::string::npos);
}

TEST(ReportTextTest, FailureNamesTheReason)
{
    auto text = render_text(analyze(""));
    EXPECT_TRUE(text.starts_with("Analysis failed: EmptyInput ("));
}

TEST(ReportTest, HighestSeverity)
{
    using rules::Severity;
    EXPECT_FALSE(highest_severity({}).has_value());
    EXPECT_EQ(highest_severity({make_issue("a", Severity::kInfo, 1)}), Severity::kInfo);
    EXPECT_EQ(highest_severity({make_issue("a", Severity::kInfo, 1),
                                make_issue("b", Severity::kWarning, std::nullopt)}),
              Severity::kWarning);
    EXPECT_EQ(highest_severity({make_issue("a", Severity::kWarning, 1),
                                make_issue("b", Severity::kError, 2),
                                make_issue("c", Severity::kInfo, 3)}),
              Severity::kError);
}

}  // namespace compactscan::report::test
