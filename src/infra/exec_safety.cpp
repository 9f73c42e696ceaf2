#include "daicgate/infra/exec_safety.hpp"

#include <algorithm>
#include <array>

namespace daicgate::infra {

namespace {

struct WrapperSyntax {
    std::string_view name;
    std::vector<std::string_view> value_options;   // consume the next word
    std::vector<std::string_view> opaque_options;  // effect not statically known
    std::vector<std::string_view> query_options;   // no command is run
    bool leading_operand = false;                   // e.g. timeout's DURATION
    bool accepts_assignments = false;               // env NAME=value
};

// ---------------------------------------------------------------------------
// Per-wrapper option syntax
// ---------------------------------------------------------------------------

const std::array<WrapperSyntax, 10>& wrapper_table() {
    static const std::array<WrapperSyntax, 10> table = {{
        {"env", {"-u", "--unset", "-C", "--chdir"}, {"-S", "--split-string"}, {}, false, true},
        {"nice", {"-n", "--adjustment"}, {}, {}, false, false},
        {"nohup", {}, {}, {}, false, false},
        {"timeout", {"-s", "--signal", "-k", "--kill-after"}, {}, {}, true, false},
        {"time", {"-f", "--format"}, {"-o", "--output"}, {}, false, false},
        {"stdbuf", {"-i", "-o", "-e", "--input", "--output", "--error"}, {}, {}, false, false},
        {"ionice", {"-c", "--class", "-n", "--classdata"},
         {"-p", "--pid", "-P", "--pgid", "-u", "--uid"}, {}, false, false},
        {"command", {}, {}, {"-v", "-V"}, false, false},
        {"builtin", {}, {}, {}, false, false},
        {"exec", {"-a"}, {}, {}, false, false},
    }};
    return table;
}

auto find_syntax(std::string_view wrapper) -> const WrapperSyntax* {
    const auto& table = wrapper_table();
    auto it = std::find_if(table.begin(), table.end(),
                           [&](const WrapperSyntax& s) { return s.name == wrapper; });
    return it == table.end() ? nullptr : &*it;
}

auto listed(const std::vector<std::string_view>& options, std::string_view name) -> bool {
    return std::find(options.begin(), options.end(), name) != options.end();
}

auto is_assignment(std::string_view word) -> bool {
    auto eq = word.find('=');
    return eq != std::string_view::npos && eq > 0;
}

} // anonymous namespace

auto unwrap_command_wrapper_argv(std::string_view wrapper,
                                 const std::vector<std::string>& args)
    -> std::optional<std::size_t> {
    const auto* syntax = find_syntax(wrapper);
    if (!syntax) return std::nullopt;

    std::size_t idx = 0;
    while (idx < args.size()) {
        std::string_view arg = args[idx];

        if (arg == "--") {
            ++idx;
            break;
        }

        if (arg.starts_with("--")) {
            auto eq = arg.find('=');
            auto name = arg.substr(0, eq);
            if (listed(syntax->opaque_options, name)) return std::nullopt;
            if (listed(syntax->query_options, name)) return args.size();
            idx += (listed(syntax->value_options, name) && eq == std::string_view::npos) ? 2 : 1;
            continue;
        }

        if (arg.size() > 1 && arg.front() == '-') {
            auto name = arg.substr(0, 2);
            if (listed(syntax->opaque_options, name)) return std::nullopt;
            if (listed(syntax->query_options, name)) return args.size();
            // "-n 5" takes the next word, "-n5" / "-oL" carry the value inline
            idx += (listed(syntax->value_options, name) && arg.size() == 2) ? 2 : 1;
            continue;
        }

        if (syntax->accepts_assignments && is_assignment(arg)) {
            ++idx;
            continue;
        }
        break;
    }

    if (syntax->leading_operand && idx < args.size()) {
        ++idx;
    }
    return std::min(idx, args.size());
}

auto resolve_inline_command_token_index(const std::vector<std::string>& args)
    -> std::optional<std::size_t> {
    bool inline_flag = false;

    std::size_t idx = 0;
    while (idx < args.size()) {
        std::string_view arg = args[idx];

        if (arg == "--" || arg == "-") {
            // Remaining words are operands
            ++idx;
            break;
        }

        if (arg.starts_with("--")) {
            idx += (arg == "--rcfile" || arg == "--init-file") ? 2 : 1;
            continue;
        }

        if (arg.size() > 1 && (arg.front() == '-' || arg.front() == '+')) {
            auto cluster = arg.substr(1);
            if (cluster.find('c') != std::string_view::npos) {
                inline_flag = true;
            }
            // -o / +o / -O take an option name
            bool takes_value = cluster.find('o') != std::string_view::npos ||
                               cluster.find('O') != std::string_view::npos;
            idx += takes_value ? 2 : 1;
            continue;
        }
        break;
    }

    if (inline_flag && idx < args.size()) {
        return idx;
    }
    return std::nullopt;
}

} // namespace daicgate::infra
