/**
 * @file Cli.cpp
 * @brief Command-line front end implementation
 */

#include "jsonexpect/Cli.hpp"
#include "jsonexpect/Assertion.hpp"
#include "jsonexpect/Errors.hpp"
#include "jsonexpect/Loader.hpp"
#include "jsonexpect/Rules.hpp"

#include <cxxopts.hpp>

#include <charconv>
#include <string>
#include <vector>

namespace jsonexpect {

namespace {

    struct PathFlag {
        const char* name;
        RuleKind kind;
        const char* help;
    };

    const PathFlag kPathFlags[] = {
        {"any-order",       RuleKind::AnyOrder,        "Let the array elements at PATH (e.g. items[*]) match in any order"},
        {"strict-order",    RuleKind::StrictOrder,     "Match the array elements at PATH positionally"},
        {"equal-count",     RuleKind::EqualCount,      "Require equal collection sizes at PATH"},
        {"flexible-count",  RuleKind::FlexibleCount,   "Allow extra actual entries at PATH"},
        {"exact-match",     RuleKind::ExactMatch,      "Require equal values at PATH"},
        {"type-match",      RuleKind::TypeMatch,       "Require only equal types at PATH"},
        {"key-absent",      RuleKind::KeyMustBeAbsent, "Fail if the actual document has key PATH"},
        {"value-not-equal", RuleKind::ValueNotEqual,   "Require actual to differ from expected at PATH"},
    };

    /**
     * @brief Split "PATH=N" into an element-count rule.
     */
    Rule parse_element_count(const std::string& arg) {
        auto eq = arg.rfind('=');
        if (eq == std::string::npos || eq + 1 == arg.size()) {
            throw JsonExpectError("Invalid --element-count '" + arg + "': expected PATH=N");
        }

        const std::string digits = arg.substr(eq + 1);
        std::size_t count = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), count);
        if (ec != std::errc() || ptr != digits.data() + digits.size()) {
            throw JsonExpectError("Invalid --element-count '" + arg + "': N must be a non-negative integer");
        }

        Rule rule;
        rule.kind = RuleKind::ElementCount;
        rule.paths.push_back(parse_rule_path(arg.substr(0, eq)));
        rule.count = count;
        return rule;
    }

    void apply_mode(JsonAssertion& assertion, const std::string& mode) {
        if (mode == "subset") {
            return;
        }
        if (mode == "equal") {
            assertion.equal_count({}, Scope::Subtree);
        } else if (mode == "type") {
            assertion.type_match({}, Scope::Subtree);
        } else {
            throw JsonExpectError("Unknown --mode '" + mode + "' (expected subset, equal or type)");
        }
    }

} // anonymous namespace

int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    try {
        cxxopts::Options options("jsonexpect", "Compare an actual JSON document against an expected one");
        options.positional_help("EXPECTED ACTUAL");

        auto adder = options.add_options("Paths");
        for (const auto& flag : kPathFlags) {
            adder(flag.name, flag.help, cxxopts::value<std::vector<std::string>>(), "PATH");
        }
        adder("element-count", "Require exactly N entries in the actual collection at PATH",
              cxxopts::value<std::vector<std::string>>(), "PATH=N");

        options.add_options()
            ("subtree", "Apply the path options above to whole subtrees")
            ("rules", "Load option rules from a JSON/TOML file", cxxopts::value<std::string>(), "FILE")
            ("mode", "Baseline: subset, equal or type", cxxopts::value<std::string>()->default_value("subset"))
            ("json", "Print failures as a JSON array")
            ("explain", "Print the configuration tree before validating")
            ("h,help", "Show help");

        options.add_options()
            ("documents", "Expected and actual documents", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"documents"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            out << options.help({"", "Paths"}) << "\n";
            out << "Use \"$\" as PATH to address the document root.\n";
            return kExitMatch;
        }

        if (!result.count("documents") ||
            result["documents"].as<std::vector<std::string>>().size() != 2) {
            err << "Error: expected exactly two documents: EXPECTED ACTUAL\n";
            return kExitError;
        }
        const auto documents = result["documents"].as<std::vector<std::string>>();

        Value expected = load_document(documents[0]);
        Value actual = load_document(documents[1]);

        JsonAssertion assertion(std::move(expected), std::move(actual));

        apply_mode(assertion, result["mode"].as<std::string>());

        if (result.count("rules")) {
            apply_rules(assertion, load_rules_file(result["rules"].as<std::string>()));
        }

        const Scope scope = result.count("subtree") ? Scope::Subtree : Scope::SingleNode;
        for (const auto& flag : kPathFlags) {
            if (!result.count(flag.name)) continue;

            Rule rule;
            rule.kind = flag.kind;
            rule.scope = scope;
            for (const auto& text : result[flag.name].as<std::vector<std::string>>()) {
                rule.paths.push_back(parse_rule_path(text));
            }
            apply_rule(assertion, rule);
        }

        if (result.count("element-count")) {
            for (const auto& arg : result["element-count"].as<std::vector<std::string>>()) {
                apply_rule(assertion, parse_element_count(arg));
            }
        }

        if (result.count("explain")) {
            out << assertion.config().describe() << "\n";
        }

        ValidationResult validation = assertion.validate();

        if (result.count("json")) {
            out << validation.to_json().dump(2, ' ', false, Value::error_handler_t::replace) << "\n";
        } else {
            out << validation << "\n";
        }

        return validation.is_valid() ? kExitMatch : kExitMismatch;

    } catch (const JsonExpectError& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitError;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitError;
    }
}

} // namespace jsonexpect
