/**
 * @file main.cpp
 * @brief CompactScan CLI entry point
 *
 * Commands:
 *   analyze   - Analyze a Compact contract and report structure and issues
 *   rules     - Validate a rule table and list its rules
 *   version   - Show version information
 */

#include "compactscan/analyzer.hpp"
#include "compactscan/common.hpp"
#include "compactscan/report.hpp"
#include "compactscan/rules.hpp"
#include "compactscan/schema_validate.hpp"
#include "compactscan/version.hpp"

#include <charconv>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace {

constexpr std::string_view kDefaultRules = "rules/compact_rules.v1.json";
constexpr std::string_view kDefaultSchemaDir = "schemas";

void print_version()
{
    std::println("compactscan {} ({})", compactscan::kVersion, compactscan::kBuildId);
    std::println("  rule_table:      {}", compactscan::kRuleTableSchemaVersion);
    std::println("  analysis_result: {}", compactscan::kAnalysisResultSchemaVersion);
}

void print_help()
{
    std::print(R"(CompactScan - static analysis for Compact smart contracts

Usage: compactscan <command> [options]

Commands:
  analyze     Analyze a contract source file
  rules       Validate a rule table and list its rules
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'compactscan <command> --help' for command-specific options.
)");
}

void print_analyze_help()
{
    std::print(R"(Usage: compactscan analyze [options]

Analyze a Compact contract and report its structure and potential issues

Options:
  --input FILE, -i          Contract source file, or - for stdin (required)
  --rules FILE              Rule table (default: rules/compact_rules.v1.json)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --format FMT              Output format: text or json (default: text)
  --output FILE, -o         Write the report to FILE instead of stdout
  --max-bytes N             Maximum accepted source size (default: 262144)
  --fail-on LEVEL           Exit 2 when an issue at or above LEVEL exists:
                            error, warning, info or never (default: error)
  --security                Also run the security rules of the table
  --help, -h                Show this help

Exit status:
  0  no blocking issues
  1  usage, configuration or I/O error, or the source could not be analyzed
  2  an issue at or above --fail-on was reported
)");
}

void print_rules_help()
{
    std::print(R"(Usage: compactscan rules [options]

Validate a rule table and list its rules

Options:
  --rules FILE              Rule table (default: rules/compact_rules.v1.json)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

enum class OutputFormat { kText, kJson };

struct AnalyzeOptions
{
    std::string input;
    std::string rules;
    std::string schema_dir;
    OutputFormat format;
    std::optional<std::string> output;
    std::size_t max_bytes;
    std::optional<compactscan::rules::Severity> fail_on;  ///< nullopt for "never"
    bool security;
    bool show_help;
};

struct RulesOptions
{
    std::string rules;
    std::string schema_dir;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> compactscan::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(compactscan::Error::make(
            "MissingArgument", std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] compactscan::Result<std::size_t> parse_size_value(std::string_view value)
{
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed == 0) {
        return std::unexpected(compactscan::Error::make(
            "InvalidArgument", std::string("Invalid --max-bytes value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] compactscan::Result<OutputFormat> parse_format_value(std::string_view value)
{
    if (value == "text") {
        return OutputFormat::kText;
    }
    if (value == "json") {
        return OutputFormat::kJson;
    }
    return std::unexpected(compactscan::Error::make(
        "InvalidArgument", std::string("Invalid --format value: ") + std::string(value)));
}

[[nodiscard]] compactscan::Result<std::optional<compactscan::rules::Severity>>
parse_fail_on_value(std::string_view value)
{
    if (value == "never") {
        return std::optional<compactscan::rules::Severity>{};
    }
    if (auto severity = compactscan::rules::parse_severity(value)) {
        return severity;
    }
    return std::unexpected(compactscan::Error::make(
        "InvalidArgument", std::string("Invalid --fail-on value: ") + std::string(value)));
}

[[nodiscard]] auto set_analyze_option(std::string_view arg,
                                      // CLI parsing signature is stable.
                                      // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                      std::span<char*> args,
                                      std::size_t idx,
                                      AnalyzeOptions& options,
                                      bool& skip_next) -> compactscan::Result<bool>
{
    const bool takes_value = arg == "--input" || arg == "-i" || arg == "--rules"
                             || arg == "--schema-dir" || arg == "--format" || arg == "--output"
                             || arg == "-o" || arg == "--max-bytes" || arg == "--fail-on";
    if (!takes_value) {
        return compactscan::Result<bool>{false};
    }
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    skip_next = true;

    if (arg == "--input" || arg == "-i") {
        options.input = *value;
    } else if (arg == "--rules") {
        options.rules = *value;
    } else if (arg == "--schema-dir") {
        options.schema_dir = *value;
    } else if (arg == "--output" || arg == "-o") {
        options.output = *value;
    } else if (arg == "--format") {
        auto format = parse_format_value(*value);
        if (!format) {
            return std::unexpected(format.error());
        }
        options.format = *format;
    } else if (arg == "--max-bytes") {
        auto bytes = parse_size_value(*value);
        if (!bytes) {
            return std::unexpected(bytes.error());
        }
        options.max_bytes = *bytes;
    } else {
        auto fail_on = parse_fail_on_value(*value);
        if (!fail_on) {
            return std::unexpected(fail_on.error());
        }
        options.fail_on = *fail_on;
    }
    return compactscan::Result<bool>{true};
}

[[nodiscard]] compactscan::Result<AnalyzeOptions> parse_analyze_args(std::span<char*> args)
{
    AnalyzeOptions options{.input = std::string{},
                           .rules = std::string(kDefaultRules),
                           .schema_dir = std::string(kDefaultSchemaDir),
                           .format = OutputFormat::kText,
                           .output = std::nullopt,
                           .max_bytes = compactscan::source::kDefaultMaxSourceBytes,
                           .fail_on = compactscan::rules::Severity::kError,
                           .security = false,
                           .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--security") {
            options.security = true;
            continue;
        }
        auto handled = set_analyze_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(compactscan::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] compactscan::Result<RulesOptions> parse_rules_args(std::span<char*> args)
{
    RulesOptions options{.rules = std::string(kDefaultRules),
                         .schema_dir = std::string(kDefaultSchemaDir),
                         .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--rules" || arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            (arg == "--rules" ? options.rules : options.schema_dir) = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(compactscan::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

[[nodiscard]] compactscan::Result<std::string> read_source(const std::string& input)
{
    if (input == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        if (std::cin.bad()) {
            return std::unexpected(
                compactscan::Error::make("IOError", "Failed to read source from stdin"));
        }
        return buffer.str();
    }
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        return std::unexpected(
            compactscan::Error::make("IOError", "Failed to open source file: " + input));
    }
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return std::unexpected(
            compactscan::Error::make("IOError", "Failed to read source file: " + input));
    }
    return text;
}

[[nodiscard]] compactscan::VoidResult write_output(const std::optional<std::string>& output,
                                                   const std::string& payload)
{
    if (!output) {
        std::print("{}", payload);
        return {};
    }
    std::ofstream out(*output);
    if (!out) {
        return std::unexpected(
            compactscan::Error::make("IOError", "Failed to open output file: " + *output));
    }
    out << payload;
    if (!out) {
        return std::unexpected(
            compactscan::Error::make("IOError", "Failed to write output file: " + *output));
    }
    return {};
}

[[nodiscard]] bool reaches_threshold(const compactscan::analyzer::AnalysisResult& result,
                                     std::optional<compactscan::rules::Severity> fail_on)
{
    if (!result || !fail_on) {
        return false;
    }
    const auto highest = compactscan::report::highest_severity(result->issues);
    return highest && static_cast<int>(*highest) <= static_cast<int>(*fail_on);
}

int run_analyze(const AnalyzeOptions& options)
{
    auto table = compactscan::rules::load_rule_table(options.rules, options.schema_dir);
    if (!table) {
        std::println(stderr, "Error: rule table rejected: {}", table.error().message);
        return 1;
    }
    auto source = read_source(options.input);
    if (!source) {
        std::println(stderr, "Error: {}", source.error().message);
        return 1;
    }

    const compactscan::analyzer::Analyzer analyzer(std::move(*table),
                                                   {.max_source_bytes = options.max_bytes,
                                                    .check_security = options.security});
    const auto result = analyzer.analyze(*source);

    const auto document = compactscan::report::to_json(result);
    if (auto validation = compactscan::common::validate_json(
            document, options.schema_dir, compactscan::kAnalysisResultSchemaVersion);
        !validation) {
        std::println(stderr, "Error: result failed schema validation: {}",
                     validation.error().message);
        return 1;
    }

    std::string payload;
    if (options.format == OutputFormat::kJson) {
        auto canonical = compactscan::report::to_canonical_json(result);
        if (!canonical) {
            std::println(stderr, "Error: {}", canonical.error().message);
            return 1;
        }
        payload = *canonical + "\n";
    } else {
        payload = compactscan::report::render_text(result);
    }
    if (auto written = write_output(options.output, payload); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return 1;
    }

    if (!result) {
        return 1;
    }
    if (options.output) {
        std::println("[analyze] {} issue(s); report written to {}", result->issues.size(),
                     *options.output);
    }
    return reaches_threshold(result, options.fail_on) ? 2 : 0;
}

int run_rules(const RulesOptions& options)
{
    auto table = compactscan::rules::load_rule_table(options.rules, options.schema_dir);
    if (!table) {
        std::println(stderr, "Error: rule table rejected: {}", table.error().message);
        return 1;
    }
    const auto& range = table->version_range();
    std::println("[rules] {} ({} rules) language {} {}-{}, updated {}",
                 options.rules,
                 table->rules().size(),
                 table->language(),
                 range.min.to_string(),
                 range.max.to_string(),
                 table->last_updated().empty() ? "unknown" : table->last_updated());
    for (const auto& rule : table->rules()) {
        std::println("  {:<32} {:<10} {:<7} {:<8} since {}",
                     rule.id,
                     compactscan::rules::kind_name(rule.matcher),
                     compactscan::rules::to_string(rule.severity),
                     compactscan::rules::to_string(rule.category),
                     rule.since ? rule.since->to_string() : "always");
    }
    return 0;
}

int cmd_analyze(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_analyze_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_analyze_help();
        return 0;
    }
    if (options->input.empty()) {
        std::println(stderr, "Error: --input is required");
        print_analyze_help();
        return 1;
    }
    return run_analyze(*options);
}

int cmd_rules(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_rules_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_rules_help();
        return 0;
    }
    return run_rules(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "analyze") {
            return cmd_analyze(sub_argc, sub_argv);
        }
        if (cmd == "rules") {
            return cmd_rules(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
