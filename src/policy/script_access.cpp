#include "policy/script_access.hpp"

#include <cctype>
#include <cstddef>

namespace cmdgate::policy {

namespace {

bool is_blank(const char c) { return c == ' ' || c == '\t'; }

bool is_digit(const char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

bool is_word_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// `i` is just past an opening delimiter; returns the index past the closing one.
std::size_t skip_delimited(const std::string& text, std::size_t i, const char delim) {
    while (i < text.size()) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            i += 2;
            continue;
        }
        if (text[i] == delim) {
            return i + 1;
        }
        ++i;
    }
    return i;
}

std::size_t skip_blanks(const std::string& text, std::size_t i) {
    while (i < text.size() && is_blank(text[i])) {
        ++i;
    }
    return i;
}

std::size_t line_end(const std::string& text, std::size_t i) {
    while (i < text.size() && text[i] != '\n') {
        ++i;
    }
    return i;
}

// Filename arguments run to the end of the line, ';' and '}' included.
std::size_t take_filename(const std::string& text, std::size_t i, std::vector<std::string>& out) {
    i = skip_blanks(text, i);
    const std::size_t end = line_end(text, i);
    if (end > i) {
        out.push_back(text.substr(i, end - i));
    }
    return end;
}

// Line numbers, $, first~step, +N, /regex/ and \cregexc, with I/M modifiers.
std::size_t skip_sed_address(const std::string& script, std::size_t i) {
    if (i < script.size() && script[i] == '/') {
        i = skip_delimited(script, i + 1, '/');
    } else if (i + 1 < script.size() && script[i] == '\\') {
        i = skip_delimited(script, i + 2, script[i + 1]);
    } else {
        while (i < script.size() && (is_digit(script[i]) || script[i] == '$' ||
                                     script[i] == '~' || script[i] == '+')) {
            ++i;
        }
        return i;
    }
    while (i < script.size() && (script[i] == 'I' || script[i] == 'M')) {
        ++i;
    }
    return i;
}

bool starts_sed_address(const char c) { return c == '/' || c == '\\' || c == '$' || is_digit(c); }

// Regex literals may only start where an operand is expected.
bool awk_regex_allowed_after(const char previous) {
    switch (previous) {
    case '\0': case '(': case ',': case '{': case '}': case ';': case '\n':
    case '!': case '~': case '&': case '|': case '=': case '?': case ':':
        return true;
    default:
        return false;
    }
}

}  // namespace

ScriptFileAccess sed_script_access(const std::string& script) {
    ScriptFileAccess access;
    const std::size_t n = script.size();
    std::size_t i = 0;
    while (i < n) {
        const char c = script[i];
        if (is_blank(c) || c == '\n' || c == ';' || c == '{' || c == '}' || c == '!') {
            ++i;
            continue;
        }
        if (starts_sed_address(c)) {
            i = skip_blanks(script, skip_sed_address(script, i));
            if (i < n && script[i] == ',') {
                i = skip_sed_address(script, skip_blanks(script, i + 1));
            }
            continue;
        }

        ++i;
        switch (c) {
        case 'r':
        case 'R':
            i = take_filename(script, i, access.reads);
            break;
        case 'w':
        case 'W':
            i = take_filename(script, i, access.writes);
            break;
        case 'e':
            access.runs_commands = true;
            i = line_end(script, i);
            break;
        case 's': {
            if (i >= n) {
                return access;
            }
            const char delim = script[i];
            i = skip_delimited(script, skip_delimited(script, i + 1, delim), delim);
            while (i < n) {
                const char flag = script[i];
                if (flag == 'w') {
                    i = take_filename(script, i + 1, access.writes);
                    break;
                }
                if (flag == 'e') {
                    access.runs_commands = true;
                } else if (!is_digit(flag) && flag != 'g' && flag != 'p' && flag != 'i' &&
                           flag != 'I' && flag != 'm' && flag != 'M') {
                    break;
                }
                ++i;
            }
            break;
        }
        case 'y':
            if (i < n) {
                const char delim = script[i];
                i = skip_delimited(script, skip_delimited(script, i + 1, delim), delim);
            }
            break;
        case 'a':
        case 'i':
        case 'c':
        case '#':
            // Text runs to the end of the line; backslash-newline continues it.
            while (i < n && script[i] != '\n') {
                i += script[i] == '\\' ? 2 : 1;
            }
            break;
        case ':':
        case 'b':
        case 't':
        case 'T':
            while (i < n && script[i] != ';' && script[i] != '\n') {
                ++i;
            }
            break;
        default:
            break;
        }
    }
    return access;
}

bool awk_program_does_io(const std::string& program) {
    const std::size_t n = program.size();
    int paren_depth = 0;
    bool in_print = false;
    bool saw_getline = false;
    char previous = '\0';

    for (std::size_t i = 0; i < n; ++i) {
        const char c = program[i];
        if (c == '"') {
            i = skip_delimited(program, i + 1, '"') - 1;
            previous = '"';
            continue;
        }
        if (c == '/' && awk_regex_allowed_after(previous)) {
            i = skip_delimited(program, i + 1, '/') - 1;
            previous = '/';
            continue;
        }
        if (c == '#') {
            i = line_end(program, i) - 1;
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_') {
            std::size_t end = i;
            while (end < n && is_word_char(program[end])) {
                ++end;
            }
            const std::string word = program.substr(i, end - i);
            if (word == "system") {
                return true;
            }
            if (word == "print" || word == "printf") {
                in_print = true;
            } else if (word == "getline") {
                saw_getline = true;
            }
            i = end - 1;
            previous = 'a';
            continue;
        }
        if (is_blank(c)) {
            continue;
        }

        switch (c) {
        case '(':
            ++paren_depth;
            break;
        case ')':
            --paren_depth;
            break;
        case ';':
        case '\n':
        case '{':
        case '}':
            in_print = false;
            saw_getline = false;
            break;
        case '|':
            if (i + 1 < n && program[i + 1] == '|') {
                ++i;
                break;
            }
            return true;
        case '>':
            if (in_print && paren_depth <= 0) {
                return true;
            }
            break;
        case '<':
            if (saw_getline) {
                return true;
            }
            break;
        default:
            break;
        }
        previous = c;
    }
    return false;
}

}  // namespace cmdgate::policy
