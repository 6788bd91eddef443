#include <cellexpr/coerce.hpp>
#include <cellexpr/engine.hpp>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

// Usage: cellexpr-eval [--var name=value]... <formula>...
//
// Each formula is evaluated against the --var bindings plus a lazy {{now}}.
// Log level comes from SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=debug).

namespace {

// Numbers stay numbers; anything else is bound as text.
cellexpr::Value parse_binding(const std::string& raw) {
    cellexpr::Value text(raw);
    if (cellexpr::trim(raw).empty()) return text;
    try {
        return cellexpr::normalize_number(cellexpr::to_number(text));
    } catch (const cellexpr::FormulaError&) {
        return text;
    }
}

void usage() {
    std::cerr << "usage: cellexpr-eval [--var name=value]... <formula>...\n";
}

} // namespace

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    cellexpr::Context ctx;
    ctx["now"] = cellexpr::Lazy([] { return cellexpr::Value(cellexpr::local_now()); });

    std::vector<std::string> formulas;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--var") == 0) {
            if (i + 1 >= argc) {
                usage();
                return 2;
            }
            const std::string binding = argv[++i];
            const auto eq = binding.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "bad --var binding: " << binding << "\n";
                return 2;
            }
            ctx[binding.substr(0, eq)] = parse_binding(binding.substr(eq + 1));
            continue;
        }
        formulas.emplace_back(argv[i]);
    }
    if (formulas.empty()) {
        usage();
        return 2;
    }

    cellexpr::Engine engine;
    int status = 0;
    for (const auto& f : formulas) {
        try {
            const cellexpr::Value v = engine.evaluate(f, ctx);
            fmt::print("{}\n", cellexpr::to_text(v));
        } catch (const cellexpr::FormulaError& e) {
            spdlog::error("{}: {}", f, e.what());
            status = 1;
        }
    }
    return status;
}
