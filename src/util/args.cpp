#include "util/args.hpp"

#include <stdexcept>

namespace ts::util {

std::optional<std::string> ParsedArgs::get(const std::string& name) const {
    if (const auto it = options.find(name); it != options.end()) return it->second;
    return std::nullopt;
}

std::vector<std::string> normalize_args(const int argc, const char* const* argv) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        if (a.starts_with("-") && a != "-" && a != "--") {
            const auto eq = a.find('=');
            if (eq != std::string::npos) {
                out.emplace_back(a.substr(0, eq));   // --key
                out.emplace_back(a.substr(eq + 1));  // value
                continue;
            }
        }

        out.emplace_back(std::move(a));
    }
    return out;
}

ParsedArgs parse_args(const std::vector<std::string>& tokens,
                      const std::set<std::string>& valueOptions,
                      const std::set<std::string>& booleanFlags) {
    ParsedArgs parsed;
    bool onlyPositional = false;

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];

        if (onlyPositional || tok == "-" || !tok.starts_with("-")) {
            parsed.positional.push_back(tok);
            continue;
        }
        if (tok == "--") {
            onlyPositional = true;
            continue;
        }

        const auto name = tok.substr(tok.starts_with("--") ? 2 : 1);
        if (booleanFlags.contains(name)) {
            parsed.flags.insert(name);
            continue;
        }
        if (!valueOptions.contains(name)) throw std::invalid_argument("unknown option: " + tok);
        if (i + 1 >= tokens.size()) throw std::invalid_argument("option " + tok + " requires a value");

        parsed.options[name] = tokens[++i];
    }

    return parsed;
}

}
