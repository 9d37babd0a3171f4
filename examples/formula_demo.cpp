#include <formula/formula.hpp>
#include <formula/log.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace demo {

formula::FormulaContext sample_context() {
    using formula::Array;
    using formula::MentionRecord;
    using formula::Object;

    formula::ContextOverrides o;
    o.fields = Object{
        {"price", 12.5},
        {"quantity", 4},
        {"status", "open"},
        {"start", "2024-03-01"},
        {"end", "2024-03-09"},
    };
    o.mentions = std::vector<MentionRecord>{
        {"place-1", "place", "Paris", true, Object{{"latitude", 48.8566}, {"longitude", 2.3522}}},
        {"place-2", "place", "London", true, Object{{"latitude", 51.5074}, {"longitude", -0.1278}}},
    };
    o.siblings = Array{
        Object{{"fields", Object{{"status", "done"}, {"amount", 20}}}},
        Object{{"fields", Object{{"status", "open"}, {"amount", 35}}}},
    };
    return formula::create_formula_context(o);
}

void print_result(const std::string& source, const formula::FormulaResult& r) {
    std::cout << source << "\n  = " << r.display_value;
    if (r.success) {
        std::cout << "  (" << formula::to_string(r.value_type) << ")";
    } else {
        std::cout << "  [" << (r.error_code ? formula::to_string(*r.error_code) : "ERROR") << "] "
                  << r.error.value_or("");
    }
    std::cout << "\n";
}

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--strict] [--timeout-ms N] [--verbose] [formula ...]\n";
}

} // namespace demo

int main(int argc, char** argv) {
    formula::EvaluationOptions options;
    std::vector<std::string> formulas;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--strict") {
            options.strict_references = true;
        } else if (a == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (a == "--timeout-ms") {
            if (i + 1 >= argc) {
                demo::usage(argv[0]);
                return 2;
            }
            options.timeout = std::chrono::milliseconds(std::strtol(argv[++i], nullptr, 10));
        } else if (a == "--help" || a == "-h") {
            demo::usage(argv[0]);
            return 0;
        } else {
            formulas.push_back(a);
        }
    }

    // nothing on the command line: show a few of the built-ins
    if (formulas.empty()) {
        formulas = {
            "price * quantity",
            "Round(price / 3, 2)",
            "\"Status: \" + Upper(status)",
            "Duration(start, end, \"days\")",
            "Distance(@Paris, @London)",
            "Count(siblings, \"status\", \"done\")",
            "SumField(siblings, \"amount\")",
            "quantity > 3 ? \"bulk\" : \"single\"",
            "10 / 0",
        };
    }

    const formula::FormulaContext ctx = demo::sample_context();
    const formula::Evaluator evaluator(formula::FunctionRegistry::builtin(), nullptr, options);
    formula::logger()->debug("evaluating {} formula(s)", formulas.size());

    for (const auto& f : formulas) demo::print_result(f, evaluator.evaluate(f, ctx));

    std::cout << "\nsuggestions:";
    for (const auto& s : formula::suggest_formulas(ctx)) std::cout << " " << s;
    std::cout << "\n";

    return 0;
}
