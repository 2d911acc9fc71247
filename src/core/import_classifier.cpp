#include "pystyle/core/import_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <tuple>
#include <unordered_set>

namespace pystyle {

namespace {

// Top-level modules shipped with CPython 3
const std::unordered_set<std::string_view> standard_library_modules{
    "__future__", "_thread", "abc", "aifc", "argparse", "array", "ast", "asynchat", "asyncio",
    "asyncore", "atexit", "audioop", "base64", "bdb", "binascii", "bisect", "builtins", "bz2",
    "calendar", "cgi", "cgitb", "chunk", "cmath", "cmd", "code", "codecs", "codeop",
    "collections", "colorsys", "compileall", "concurrent", "configparser", "contextlib",
    "contextvars", "copy", "copyreg", "cProfile", "crypt", "csv", "ctypes", "curses",
    "dataclasses", "datetime", "dbm", "decimal", "difflib", "dis", "distutils", "doctest",
    "email", "encodings", "ensurepip", "enum", "errno", "faulthandler", "fcntl", "filecmp",
    "fileinput", "fnmatch", "fractions", "ftplib", "functools", "gc", "getopt", "getpass",
    "gettext", "glob", "graphlib", "grp", "gzip", "hashlib", "heapq", "hmac", "html", "http",
    "idlelib", "imaplib", "imghdr", "imp", "importlib", "inspect", "io", "ipaddress",
    "itertools", "json", "keyword", "lib2to3", "linecache", "locale", "logging", "lzma",
    "mailbox", "mailcap", "marshal", "math", "mimetypes", "mmap", "modulefinder", "msilib",
    "msvcrt", "multiprocessing", "netrc", "nis", "nntplib", "numbers", "operator", "optparse",
    "os", "ossaudiodev", "pathlib", "pdb", "pickle", "pickletools", "pipes", "pkgutil",
    "platform", "plistlib", "poplib", "posix", "posixpath", "pprint", "profile", "pstats",
    "pty", "pwd", "py_compile", "pyclbr", "pydoc", "queue", "quopri", "random", "re",
    "readline", "reprlib", "resource", "rlcompleter", "runpy", "sched", "secrets", "select",
    "selectors", "shelve", "shlex", "shutil", "signal", "site", "smtpd", "smtplib", "sndhdr",
    "socket", "socketserver", "spwd", "sqlite3", "ssl", "stat", "statistics", "string",
    "stringprep", "struct", "subprocess", "sunau", "symtable", "sys", "sysconfig", "syslog",
    "tabnanny", "tarfile", "telnetlib", "tempfile", "termios", "textwrap", "threading", "time",
    "timeit", "tkinter", "token", "tokenize", "tomllib", "trace", "traceback", "tracemalloc",
    "tty", "turtle", "turtledemo", "types", "typing", "unicodedata", "unittest", "urllib",
    "uu", "uuid", "venv", "warnings", "wave", "weakref", "webbrowser", "winreg", "winsound",
    "wsgiref", "xdrlib", "xml", "xmlrpc", "zipapp", "zipfile", "zipimport", "zlib",
    "zoneinfo"};

auto top_level_name(std::string_view module_path) -> std::string_view {
    return module_path.substr(0, module_path.find('.'));
}

auto to_lowercase(std::string_view text) -> std::string {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto is_blank(const std::string& text) -> bool {
    return text.find_first_not_of(" \t\f") == std::string::npos;
}

// Module-level logical lines that hold nothing but one import statement
auto standalone_import_lines(const SourceDocument& document) -> std::map<size_t, size_t> {
    std::map<size_t, size_t> start_to_end;
    for (const auto& logical : logical_lines(document.tokens)) {
        const auto& first = logical.tokens.front();
        if (first.column != 0 || !(is_name(first, "import") || is_name(first, "from"))) {
            continue;
        }
        bool has_separator = std::any_of(
            logical.tokens.begin(), logical.tokens.end(),
            [](const Token& token) { return is_op(token, ";") && token.depth == 0; });
        if (!has_separator) {
            start_to_end[logical.start_line] = logical.end_line;
        }
    }
    return start_to_end;
}

} // namespace

auto classify_module(std::string_view module_path, const std::vector<std::string>& local_packages)
    -> ImportGroup {
    if (module_path.empty() || module_path.front() == '.') {
        return ImportGroup::LOCAL;
    }

    auto top = top_level_name(module_path);
    if (top == "__future__") {
        return ImportGroup::FUTURE;
    }
    if (std::find(local_packages.begin(), local_packages.end(), top) != local_packages.end()) {
        return ImportGroup::LOCAL;
    }
    if (is_standard_library_module(top)) {
        return ImportGroup::STANDARD_LIBRARY;
    }
    return ImportGroup::THIRD_PARTY;
}

auto import_group_name(ImportGroup group) -> std::string {
    switch (group) {
    case ImportGroup::FUTURE:
        return "future";
    case ImportGroup::STANDARD_LIBRARY:
        return "standard library";
    case ImportGroup::THIRD_PARTY:
        return "third party";
    case ImportGroup::LOCAL:
        return "local";
    }
    return "unknown";
}

auto is_standard_library_module(std::string_view top_level_name) -> bool {
    return standard_library_modules.contains(top_level_name);
}

auto find_import_blocks(const SourceDocument& document,
                        const std::vector<std::string>& local_packages)
    -> std::vector<ImportBlock> {
    if (document.tokens.error || document.parse_error) {
        return {};
    }

    auto standalone = standalone_import_lines(document);

    // Declarations are ordered by line then column, so the first one per line is the key
    std::vector<ImportStatement> statements;
    for (const auto& declaration : document.declarations) {
        if (declaration.kind != DeclarationKind::IMPORT) {
            continue;
        }
        auto it = standalone.find(declaration.start_line);
        if (it == standalone.end()) {
            continue;
        }
        if (!statements.empty() && statements.back().start_line == declaration.start_line) {
            continue;
        }
        statements.push_back(ImportStatement{.module = declaration.name,
                                             .group = classify_module(declaration.name,
                                                                      local_packages),
                                             .start_line = it->first,
                                             .end_line = it->second});
    }

    std::vector<ImportBlock> blocks;
    for (const auto& statement : statements) {
        bool joins_previous = false;
        if (!blocks.empty()) {
            const auto& previous = blocks.back().statements.back();
            joins_previous = true;
            for (size_t line = previous.end_line + 1; line < statement.start_line; ++line) {
                if (!is_blank(document.lines[line - 1].text)) {
                    joins_previous = false;
                    break;
                }
            }
        }

        if (joins_previous) {
            blocks.back().statements.push_back(statement);
        } else {
            blocks.push_back(ImportBlock{.statements = {statement}});
        }
    }

    return blocks;
}

auto import_less(const ImportStatement& a, const ImportStatement& b) -> bool {
    return std::make_tuple(a.group, to_lowercase(a.module), a.module)
           < std::make_tuple(b.group, to_lowercase(b.module), b.module);
}

auto expected_order(const ImportBlock& block) -> std::vector<ImportStatement> {
    auto sorted = block.statements;
    std::stable_sort(sorted.begin(), sorted.end(), import_less);
    return sorted;
}

} // namespace pystyle
