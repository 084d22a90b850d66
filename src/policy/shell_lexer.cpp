#include "policy/shell_lexer.hpp"

#include <cctype>
#include <utility>

namespace cmdgate::policy {

namespace {

bool is_blank(const char c) {
    return c == ' ' || c == '\t' || c == '\r';
}

bool is_operator_char(const char c) {
    return c == '|' || c == '&' || c == ';' || c == '(' || c == ')' || c == '<' ||
           c == '>';
}

bool is_name_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_special_parameter(const char c) {
    return c == '?' || c == '#' || c == '@' || c == '*' || c == '$' || c == '!' ||
           c == '-';
}

// ">&2", "2>&1", "<&-" duplicate or close a descriptor and take no target word.
bool is_fd_duplication(const std::string& op) {
    const auto amp = op.find('&');
    if (amp == std::string::npos || amp == 0 || amp + 1 >= op.size()) {
        return false;
    }
    return op[amp - 1] == '>' || op[amp - 1] == '<';
}

}  // namespace

bool is_redirection_operator(const std::string& op) {
    return op.find_first_of("<>") != std::string::npos;
}

ShellLexer::ShellLexer(std::string input) : input_(std::move(input)) {}

bool ShellLexer::eof() const { return pos_ >= input_.size(); }

char ShellLexer::peek(const std::size_t ahead) const {
    return pos_ + ahead < input_.size() ? input_[pos_ + ahead] : '\0';
}

char ShellLexer::get() { return eof() ? '\0' : input_[pos_++]; }

void ShellLexer::skip_blanks() {
    while (!eof() && is_blank(peek())) {
        get();
    }
}

bool ShellLexer::at_operator() const {
    return !eof() && is_operator_char(peek());
}

bool ShellLexer::at_fd_redirection() const {
    return std::isdigit(static_cast<unsigned char>(peek())) != 0 &&
           (peek(1) == '>' || peek(1) == '<');
}

void ShellLexer::error(const std::string& message) {
    analysis_.well_formed = false;
    analysis_.syntax_errors.push_back(message);
}

std::string ShellLexer::lex_operator() {
    std::string op;
    if (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
        op.push_back(get());
    }
    const char c = get();
    op.push_back(c);
    switch (c) {
        case '|':
            if (op == "|" && peek() == '|') op.push_back(get());
            break;
        case '&':
            if (peek() == '&') {
                op.push_back(get());
            } else if (peek() == '>') {
                op.push_back(get());
                if (peek() == '>') op.push_back(get());
            }
            break;
        case '>':
            if (peek() == '>' || peek() == '|') op.push_back(get());
            if (peek() == '&') {
                op.push_back(get());
                while (std::isdigit(static_cast<unsigned char>(peek())) != 0 || peek() == '-') {
                    op.push_back(get());
                }
            }
            break;
        case '<':
            if (peek() == '<') {
                op.push_back(get());
                if (peek() == '<') op.push_back(get());
            } else if (peek() == '>') {
                op.push_back(get());
            } else if (peek() == '&') {
                op.push_back(get());
                while (std::isdigit(static_cast<unsigned char>(peek())) != 0 || peek() == '-') {
                    op.push_back(get());
                }
            }
            break;
        default:
            break;
    }
    return op;
}

void ShellLexer::scan_single_quoted(ShellWord& word) {
    while (true) {
        if (eof()) {
            error("unterminated single quote");
            return;
        }
        const char c = get();
        if (c == '\'') {
            return;
        }
        word.text.push_back(c);
    }
}

void ShellLexer::scan_double_quoted(ShellWord& word) {
    while (true) {
        if (eof()) {
            error("unterminated double quote");
            return;
        }
        const char c = peek();
        if (c == '"') {
            get();
            return;
        }
        if (c == '$') {
            scan_dollar(word);
            continue;
        }
        if (c == '`') {
            scan_backtick(word);
            continue;
        }
        get();
        if (c == '\\' && !eof()) {
            const char n = peek();
            if (n == '"' || n == '\\' || n == '$' || n == '`') {
                word.text.push_back(get());
                continue;
            }
            if (n == '\n') {
                get();
                continue;
            }
        }
        word.text.push_back(c);
    }
}

void ShellLexer::scan_dollar(ShellWord& word) {
    get();  // '$'
    if (peek() == '(') {
        word.text += "$";
        word.has_expansion = true;
        int depth = 0;
        while (true) {
            if (eof()) {
                error("unterminated command substitution");
                return;
            }
            const char c = get();
            word.text.push_back(c);
            if (c == '\'') {
                while (!eof() && peek() != '\'') word.text.push_back(get());
                if (!eof()) word.text.push_back(get());
            } else if (c == '"') {
                while (!eof() && peek() != '"') {
                    if (peek() == '\\') word.text.push_back(get());
                    if (!eof()) word.text.push_back(get());
                }
                if (!eof()) word.text.push_back(get());
            } else if (c == '(') {
                ++depth;
            } else if (c == ')') {
                --depth;
                if (depth == 0) {
                    return;
                }
            }
        }
    }
    if (peek() == '{') {
        word.text += "$";
        word.has_expansion = true;
        while (true) {
            if (eof()) {
                error("unterminated parameter expansion");
                return;
            }
            const char c = get();
            word.text.push_back(c);
            if (c == '}') {
                return;
            }
        }
    }
    if (is_name_char(peek()) || is_special_parameter(peek())) {
        word.has_expansion = true;
        word.text.push_back('$');
        if (!is_name_char(peek())) {
            word.text.push_back(get());
            return;
        }
        while (is_name_char(peek())) {
            word.text.push_back(get());
        }
        return;
    }
    word.text.push_back('$');
}

void ShellLexer::scan_backtick(ShellWord& word) {
    get();  // '`'
    word.has_expansion = true;
    word.text.push_back('`');
    while (true) {
        if (eof()) {
            error("unterminated backtick");
            return;
        }
        const char c = get();
        if (c == '\\' && !eof()) {
            word.text.push_back(c);
            word.text.push_back(get());
            continue;
        }
        word.text.push_back(c);
        if (c == '`') {
            return;
        }
    }
}

ShellWord ShellLexer::lex_word() {
    ShellWord word;
    word.position = pos_;
    word.tilde = peek() == '~';
    // Unquoted {a,b} and {1..3} expand into several words.
    int brace_depth = 0;
    bool brace_list = false;
    while (!eof()) {
        const char c = peek();
        if (is_blank(c) || c == '\n' || is_operator_char(c)) {
            break;
        }
        if (c == '\'') {
            get();
            word.quoted = true;
            scan_single_quoted(word);
            continue;
        }
        if (c == '"') {
            get();
            word.quoted = true;
            scan_double_quoted(word);
            continue;
        }
        if (c == '\\') {
            get();
            if (eof()) {
                error("dangling escape at end of command");
                break;
            }
            const char n = get();
            if (n != '\n') {
                word.text.push_back(n);
                word.quoted = true;
            }
            continue;
        }
        if (c == '$') {
            scan_dollar(word);
            continue;
        }
        if (c == '`') {
            scan_backtick(word);
            continue;
        }
        if (c == '*' || c == '?' || c == '[') {
            word.has_glob = true;
        } else if (c == '{') {
            ++brace_depth;
        } else if (c == '}' && brace_depth > 0) {
            --brace_depth;
            if (brace_list) {
                word.has_expansion = true;
            }
        } else if (brace_depth > 0 && (c == ',' || (c == '.' && peek(1) == '.'))) {
            brace_list = true;
        }
        word.text.push_back(get());
    }
    return word;
}

void ShellLexer::finish_command(const std::string& control_op) {
    if (!current_.empty()) {
        analysis_.commands.push_back(std::move(current_));
        current_ = SimpleCommand{};
        last_control_ = control_op;
        return;
    }
    if (control_op == "\n" || control_op == ")") {
        if (control_op == ")") last_control_ = control_op;
        return;
    }
    error("empty command before '" + control_op + "'");
    last_control_ = control_op;
}

CommandAnalysis ShellLexer::run() {
    analysis_ = CommandAnalysis{};
    analysis_.source = input_;
    pos_ = 0;
    paren_depth_ = 0;
    last_control_.clear();
    current_ = SimpleCommand{};

    while (true) {
        skip_blanks();
        if (eof()) {
            break;
        }
        if (peek() == '\n') {
            get();
            finish_command("\n");
            continue;
        }
        if (peek() == '#') {
            while (!eof() && peek() != '\n') get();
            continue;
        }
        if (at_fd_redirection() || at_operator()) {
            const std::string op = lex_operator();
            if (is_redirection_operator(op)) {
                Redirection redirection;
                redirection.op = op;
                redirection.writes = op.find('>') != std::string::npos;
                if (!is_fd_duplication(op)) {
                    skip_blanks();
                    if (eof() || peek() == '\n' || at_operator()) {
                        error("redirection '" + op + "' has no target");
                    } else {
                        redirection.target = lex_word();
                    }
                }
                current_.redirections.push_back(std::move(redirection));
                continue;
            }
            if (op == "(") {
                if (!current_.empty()) {
                    error("unexpected '('");
                }
                ++paren_depth_;
                continue;
            }
            if (op == ")") {
                if (paren_depth_ == 0) {
                    error("unbalanced ')'");
                } else {
                    --paren_depth_;
                }
            }
            finish_command(op);
            continue;
        }
        current_.words.push_back(lex_word());
    }

    if (!current_.empty()) {
        analysis_.commands.push_back(std::move(current_));
        current_ = SimpleCommand{};
    } else if (last_control_ == "|" || last_control_ == "||" || last_control_ == "&&") {
        error("command ends with '" + last_control_ + "'");
    }
    if (paren_depth_ > 0) {
        error("unbalanced '('");
    }
    return analysis_;
}

CommandAnalysis analyze_command(const std::string& command) {
    return ShellLexer(command).run();
}

}  // namespace cmdgate::policy
