#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace cmdgate::policy {

// One shell word after quote removal.
struct ShellWord {
    std::string text;
    std::size_t position = 0;
    bool quoted = false;         // some part of the word was quoted
    bool has_expansion = false;  // $VAR, ${...}, $(...), `...` or an unquoted {a,b} list
    bool has_glob = false;       // unquoted * ? [
    bool tilde = false;          // unquoted leading ~
};

struct Redirection {
    std::string op;      // ">", ">>", "<", "2>", "&>", ">|", "<<", "<<<", "2>&1", ...
    ShellWord target;    // empty for fd duplications such as 2>&1
    bool writes = false;
};

// Words and redirections between two control operators (| || && ; & ( )).
struct SimpleCommand {
    std::vector<ShellWord> words;
    std::vector<Redirection> redirections;

    bool empty() const { return words.empty() && redirections.empty(); }
};

struct CommandAnalysis {
    std::string source;
    std::vector<SimpleCommand> commands;
    bool well_formed = true;
    std::vector<std::string> syntax_errors;
};

class ShellLexer {
public:
    explicit ShellLexer(std::string input);

    // Best-effort split even when the input is malformed; problems are
    // listed in syntax_errors and clear well_formed.
    CommandAnalysis run();

private:
    bool eof() const;
    char peek(std::size_t ahead = 0) const;
    char get();
    void skip_blanks();
    bool at_operator() const;
    bool at_fd_redirection() const;
    std::string lex_operator();
    ShellWord lex_word();
    void scan_single_quoted(ShellWord& word);
    void scan_double_quoted(ShellWord& word);
    void scan_dollar(ShellWord& word);
    void scan_backtick(ShellWord& word);
    void finish_command(const std::string& control_op);
    void error(const std::string& message);

    std::string input_;
    std::size_t pos_ = 0;
    int paren_depth_ = 0;
    std::string last_control_;
    SimpleCommand current_;
    CommandAnalysis analysis_;
};

// Convenience wrapper: ShellLexer(command).run()
CommandAnalysis analyze_command(const std::string& command);

bool is_redirection_operator(const std::string& op);

}  // namespace cmdgate::policy
