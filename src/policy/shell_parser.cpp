#include "daicgate/policy/shell_parser.hpp"

#include "daicgate/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace daicgate::policy {

namespace {

auto is_reserved_word(std::string_view word) -> bool {
    return word == "!" || word == "{" || word == "}" || word == "if" ||
           word == "then" || word == "else" || word == "elif" || word == "fi" ||
           word == "do" || word == "done" || word == "while" || word == "until";
}

auto is_assignment(std::string_view word) -> bool {
    auto eq = word.find('=');
    if (eq == std::string_view::npos || eq == 0) return false;
    auto name = word.substr(0, eq);
    if (name.back() == '+') name.remove_suffix(1);  // NAME+=value
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

auto parse_error(std::string message, std::string_view command) -> Error {
    return make_error(ErrorCode::InvalidArgument, std::move(message), std::string(command));
}

/// Single-pass tokenizer over one command line.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input) : in_(input) {}

    auto run() -> Result<CommandLine> {
        while (pos_ < in_.size()) {
            char c = in_[pos_];
            char next = peek(1);

            switch (c) {
                case ' ':
                case '\t':
                case '\r':
                    end_word();
                    ++pos_;
                    break;

                case '\n':
                case ';':
                case '(':
                case ')':
                    end_word();
                    end_segment();
                    ++pos_;
                    break;

                case '&':
                    end_word();
                    if (next == '>') {
                        // &> and &>> redirect, they do not end the command
                        pos_ += 2;
                        if (peek(0) == '>') ++pos_;
                        break;
                    }
                    end_segment();
                    pos_ += (next == '&') ? 2 : 1;
                    break;

                case '|':
                    end_word();
                    end_segment();
                    pos_ += (next == '|' || next == '&') ? 2 : 1;
                    break;

                case '<':
                case '>':
                    if (next == '(') {
                        pos_ += 2;
                        auto inner = capture_group('(', ')');
                        if (!inner) return std::unexpected(inner.error());
                        line_.substitutions.push_back(*inner);
                        word_ += std::string(1, c) + "(" + *inner + ")";
                        in_word_ = true;
                    } else {
                        // Redirection operators separate words; the target stays an argument.
                        // >>, <<, >|, >&N and <&N are consumed whole.
                        end_word();
                        ++pos_;
                        if (peek(0) == c) ++pos_;
                        if (peek(0) == '&' || peek(0) == '|') ++pos_;
                    }
                    break;

                case '\'': {
                    auto close = in_.find('\'', pos_ + 1);
                    if (close == std::string_view::npos) {
                        return std::unexpected(parse_error("Unterminated single quote", in_));
                    }
                    word_ += in_.substr(pos_ + 1, close - pos_ - 1);
                    in_word_ = true;
                    pos_ = close + 1;
                    break;
                }

                case '"': {
                    auto ok = read_double_quoted();
                    if (!ok) return std::unexpected(ok.error());
                    break;
                }

                case '\\':
                    if (pos_ + 1 >= in_.size()) {
                        return std::unexpected(parse_error("Trailing backslash", in_));
                    }
                    if (next != '\n') {
                        word_ += next;
                        in_word_ = true;
                    }
                    pos_ += 2;
                    break;

                case '`': {
                    auto ok = read_backtick();
                    if (!ok) return std::unexpected(ok.error());
                    break;
                }

                case '$': {
                    auto ok = read_dollar();
                    if (!ok) return std::unexpected(ok.error());
                    break;
                }

                case '#':
                    if (!in_word_ && word_.empty()) {
                        auto eol = in_.find('\n', pos_);
                        pos_ = (eol == std::string_view::npos) ? in_.size() : eol;
                    } else {
                        word_ += c;
                        ++pos_;
                    }
                    break;

                default:
                    word_ += c;
                    in_word_ = true;
                    ++pos_;
                    break;
            }
        }

        end_word();
        end_segment();
        return std::move(line_);
    }

private:
    auto peek(std::size_t offset) const -> char {
        return pos_ + offset < in_.size() ? in_[pos_ + offset] : '\0';
    }

    void end_word() {
        if (in_word_ || !word_.empty()) {
            words_.push_back(std::move(word_));
            word_.clear();
            in_word_ = false;
        }
    }

    void end_segment() {
        auto first = std::find_if(words_.begin(), words_.end(), [](const std::string& w) {
            return !is_assignment(w) && !is_reserved_word(w);
        });
        // A `for NAME in …` / `select` header runs nothing itself; any
        // substitutions in its word list were captured already.
        bool loop_header = first != words_.end() && (*first == "for" || *first == "select");
        if (first != words_.end() && !loop_header) {
            line_.segments.push_back(
                make_shell_command(std::vector<std::string>(first, words_.end())));
        }
        words_.clear();
    }

    /// Reads up to the `close` that balances an already consumed `open`.
    /// Quotes inside the group are honoured. Leaves pos_ after the close.
    auto capture_group(char open, char close) -> Result<std::string> {
        auto start = pos_;
        int depth = 1;
        while (pos_ < in_.size()) {
            char c = in_[pos_];
            if (c == '\\') {
                pos_ += 2;
                continue;
            }
            if (c == '\'') {
                auto end = in_.find('\'', pos_ + 1);
                if (end == std::string_view::npos) break;
                pos_ = end + 1;
                continue;
            }
            if (c == '"') {
                ++pos_;
                while (pos_ < in_.size() && in_[pos_] != '"') {
                    pos_ += (in_[pos_] == '\\') ? 2 : 1;
                }
                if (pos_ >= in_.size()) break;
                ++pos_;
                continue;
            }
            if (c == open) {
                ++depth;
            } else if (c == close && --depth == 0) {
                auto inner = std::string(in_.substr(start, pos_ - start));
                ++pos_;
                return inner;
            }
            ++pos_;
        }
        return std::unexpected(parse_error("Unterminated substitution", in_));
    }

    auto read_backtick() -> VoidResult {
        ++pos_;
        std::string inner;
        while (pos_ < in_.size() && in_[pos_] != '`') {
            if (in_[pos_] == '\\' && pos_ + 1 < in_.size()) {
                char escaped = in_[pos_ + 1];
                if (escaped != '`' && escaped != '\\' && escaped != '$') inner += '\\';
                inner += escaped;
                pos_ += 2;
                continue;
            }
            inner += in_[pos_++];
        }
        if (pos_ >= in_.size()) {
            return std::unexpected(parse_error("Unterminated backtick substitution", in_));
        }
        ++pos_;
        word_ += "`" + inner + "`";
        in_word_ = true;
        line_.substitutions.push_back(std::move(inner));
        return {};
    }

    auto read_dollar() -> VoidResult {
        char next = peek(1);
        if (next == '(') {
            bool arithmetic = peek(2) == '(';
            pos_ += 2;
            auto inner = capture_group('(', ')');
            if (!inner) return std::unexpected(inner.error());
            word_ += "$(" + *inner + ")";
            in_word_ = true;
            if (!arithmetic) {
                line_.substitutions.push_back(std::move(*inner));
            }
            return {};
        }
        if (next == '{') {
            pos_ += 2;
            auto inner = capture_group('{', '}');
            if (!inner) return std::unexpected(inner.error());
            word_ += "${" + *inner + "}";
            in_word_ = true;
            return {};
        }
        word_ += '$';
        in_word_ = true;
        ++pos_;
        return {};
    }

    auto read_double_quoted() -> VoidResult {
        ++pos_;
        in_word_ = true;
        while (pos_ < in_.size()) {
            char c = in_[pos_];
            if (c == '"') {
                ++pos_;
                return {};
            }
            if (c == '\\') {
                char next = peek(1);
                if (next == '$' || next == '`' || next == '"' || next == '\\') {
                    word_ += next;
                    pos_ += 2;
                } else if (next == '\n') {
                    pos_ += 2;
                } else {
                    word_ += c;
                    ++pos_;
                }
                continue;
            }
            if (c == '$') {
                auto ok = read_dollar();
                if (!ok) return ok;
                continue;
            }
            if (c == '`') {
                auto ok = read_backtick();
                if (!ok) return ok;
                continue;
            }
            word_ += c;
            ++pos_;
        }
        return std::unexpected(parse_error("Unterminated double quote", in_));
    }

    std::string_view in_;
    std::size_t pos_ = 0;
    std::string word_;
    bool in_word_ = false;
    std::vector<std::string> words_;
    CommandLine line_;
};

} // anonymous namespace

auto has_output_redirection(std::string_view command) -> bool {
    enum class Quote { None, Single, Double };
    Quote quote = Quote::None;

    for (std::size_t i = 0; i < command.size(); ++i) {
        char c = command[i];
        switch (quote) {
            case Quote::Single:
                if (c == '\'') quote = Quote::None;
                break;
            case Quote::Double:
                if (c == '\\') ++i;
                else if (c == '"') quote = Quote::None;
                break;
            case Quote::None:
                if (c == '\\') ++i;
                else if (c == '\'') quote = Quote::Single;
                else if (c == '"') quote = Quote::Double;
                else if (c == '>') return true;
                break;
        }
    }
    return false;
}

auto parse_command_line(std::string_view command) -> Result<CommandLine> {
    return Tokenizer(command).run();
}

auto make_shell_command(std::vector<std::string> words) -> ShellCommand {
    ShellCommand cmd;
    if (words.empty()) return cmd;

    auto name = std::filesystem::path(words.front()).filename().string();
    cmd.base = utils::to_lower(name.empty() ? words.front() : name);
    cmd.args.assign(std::make_move_iterator(words.begin() + 1),
                    std::make_move_iterator(words.end()));
    return cmd;
}

} // namespace daicgate::policy
