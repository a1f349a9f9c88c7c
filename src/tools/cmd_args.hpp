#pragma once
#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <optional>

// trim whitespace (both ends)
inline std::string trim(std::string s) {
    auto isspace = [](unsigned char c){ return std::isspace(c); };
    auto b = std::find_if_not(s.begin(), s.end(), isspace);
    auto e = std::find_if_not(s.rbegin(), s.rend(), isspace).base();
    if (b >= e) return {};
    return {b, e};
}

// Option keys are trimmed; values and positionals are kept verbatim,
// whitespace is part of the payload for encode.
struct cmd_args {
    std::map<std::string, std::string> options;
    std::vector<std::string> positional;

    static cmd_args parse(int argc, char* argv[]) {
        cmd_args result;

        auto put = [&](std::string k, std::string v) {
            result.options[trim(std::move(k))] = std::move(v);
        };

        // A following argument is taken as a value unless it looks like an option
        auto takes_value = [&](int i) {
            if (i + 1 >= argc) return false;
            std::string next = argv[i + 1];
            return next.rfind('-', 0) != 0 && next != "=";
        };

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            // ----- END OF OPTIONS -----
            if (arg == "--") {
                for (++i; i < argc; ++i) result.positional.emplace_back(argv[i]);
                break;
            }

            // ----- LONG OPTIONS -----
            if (arg.rfind("--", 0) == 0) {
                std::string rest = arg.substr(2);
                // handle --key[=value] and --key = value
                auto eq = rest.find('=');
                if (eq != std::string::npos) {
                    std::string key = rest.substr(0, eq);
                    std::string val = rest.substr(eq + 1);
                    // Consistent behavior with short options: --key= becomes "true"
                    put(key, val.empty() ? "true" : val);
                } else if (i + 2 < argc && std::string(argv[i + 1]) == "=") {
                    put(rest, argv[i + 2]);
                    i += 2;
                } else if (takes_value(i)) {
                    put(rest, argv[++i]);
                } else {
                    put(rest, "true");
                }
                continue;
            }

            // ----- SHORT OPTIONS (including grouped) -----
            if (arg.size() >= 2 && arg[0] == '-') {
                std::string s = arg.substr(1);

                // -x=value  (explicit value for short)
                auto eq = s.find('=');
                if (eq != std::string::npos && eq >= 1) {
                    std::string key(1, s[0]);
                    std::string val = s.substr(eq + 1);
                    put(key, val.empty() ? "true" : val);
                    continue;
                }

                if (s.size() > 1) {
                    // Treat as grouped flags: -abc => a=true,b=true,c=true
                    for (char ch : s) put(std::string(1, ch), "true");
                } else if (i + 2 < argc && std::string(argv[i + 1]) == "=") {
                    put(s, argv[i + 2]);
                    i += 2;
                } else if (takes_value(i)) {
                    put(s, argv[++i]);
                } else {
                    put(s, "true");
                }
                continue;
            }
            result.positional.push_back(std::move(arg));
        }

        return result;
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const {
        if (const auto it = options.find(std::string(key)); it != options.end()) return it->second;
        return std::nullopt;
    }

    /// true if the option was given as a bare flag or with value "true"
    [[nodiscard]] bool flag(std::string_view key) const {
        auto value = get(key);
        return value && *value == "true";
    }

    /// true if any of the given spellings was supplied
    [[nodiscard]] bool has(std::string_view key, std::string_view alias = {}) const {
        return get(key).has_value() || (!alias.empty() && get(alias).has_value());
    }
};
