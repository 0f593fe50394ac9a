#pragma once

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"


namespace richenum::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level lvl;
        if (lcr::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace | debug | info | warn | error | fatal";
    },
    "Log level validator"
);

struct Params {
    std::string out_file;
    std::string in_file;
    std::string parse;
    std::string log_level = "warn";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Output    : " << (out_file.empty() ? "-" : out_file) << "\n"
           << "  Input     : " << (in_file.empty() ? "-" : in_file) << "\n"
           << "  Parse     : " << (parse.empty() ? "-" : parse) << "\n"
           << "  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    auto* out = app.add_option("-o,--out", params.out_file, "Write the entries as JSON to FILE ('-' for stdout)");
    auto* in  = app.add_option("-i,--in", params.in_file, "Read JSON entries from FILE and match them against the registry");
    app.add_option("-p,--parse", params.parse, "Resolve an oid, a value or a text to a member");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal")
        ->check(log_level_validator)->default_val(params.log_level);
    out->excludes(in);

    app.footer(
        "Without options, the visible members are listed by index.\n"
        "The log level can also be set with RICHENUM_LOG_LEVEL."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    (void)lcr::log::Logger::instance().set_level(params.log_level);
    return params;
}

} // namespace richenum::examples::cli
