#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ts::util {

struct ParsedArgs {
    std::map<std::string, std::string> options;  // name without dashes -> value
    std::set<std::string> flags;
    std::vector<std::string> positional;

    [[nodiscard]] bool has(const std::string& flag) const { return flags.contains(flag); }
    [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
};

// Splits --key=value into two tokens; argv[0] is skipped.
std::vector<std::string> normalize_args(int argc, const char* const* argv);

// Accepts -name and --name alike. Names in booleanFlags take no value,
// everything else in valueOptions takes the next token. Unknown names and
// missing values throw std::invalid_argument.
ParsedArgs parse_args(const std::vector<std::string>& tokens,
                      const std::set<std::string>& valueOptions,
                      const std::set<std::string>& booleanFlags);

}
