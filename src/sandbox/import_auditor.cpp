#include "sandbox/import_auditor.hpp"
#include "analysis/source_analysis.hpp"
#include "common/exceptions.hpp"

namespace vibe {
using namespace std;

// clang-format off
static const set<string> stdlib = {
    "__future__", "__main__", "_thread", "abc", "aifc", "argparse", "array", "ast",
    "asynchat", "asyncio", "asyncore", "atexit", "audioop", "base64", "bdb", "binascii",
    "binhex", "bisect", "builtins", "bz2", "calendar", "cgi", "cgitb", "chunk", "cmath",
    "cmd", "code", "codecs", "codeop", "collections", "colorsys", "compileall", "concurrent",
    "configparser", "contextlib", "contextvars", "copy", "copyreg", "cProfile", "crypt",
    "csv", "ctypes", "curses", "dataclasses", "datetime", "dbm", "decimal", "difflib", "dis",
    "distutils", "doctest", "email", "encodings", "enum", "errno", "faulthandler", "fcntl",
    "filecmp", "fileinput", "fnmatch", "fractions", "ftplib", "functools", "gc", "getopt",
    "getpass", "gettext", "glob", "graphlib", "grp", "gzip", "hashlib", "heapq", "hmac",
    "html", "http", "idlelib", "imaplib", "imghdr", "imp", "importlib", "inspect", "io",
    "ipaddress", "itertools", "json", "keyword", "lib2to3", "linecache", "locale", "logging",
    "lzma", "mailbox", "mailcap", "marshal", "math", "mimetypes", "mmap", "modulefinder",
    "multiprocessing", "netrc", "nis", "nntplib", "numbers", "operator", "optparse", "os",
    "ossaudiodev", "pathlib", "pdb", "pickle", "pickletools", "pipes", "pkgutil", "platform",
    "plistlib", "poplib", "posix", "posixpath", "pprint", "profile", "pstats", "pty", "pwd",
    "py_compile", "pyclbr", "pydoc", "queue", "quopri", "random", "re", "readline", "reprlib",
    "resource", "rlcompleter", "runpy", "sched", "secrets", "select", "selectors", "shelve",
    "shlex", "shutil", "signal", "site", "smtpd", "smtplib", "sndhdr", "socket", "socketserver",
    "spwd", "sqlite3", "ssl", "stat", "statistics", "string", "stringprep", "struct",
    "subprocess", "sunau", "symtable", "sys", "sysconfig", "syslog", "tabnanny", "tarfile",
    "telnetlib", "tempfile", "termios", "test", "textwrap", "threading", "time", "timeit",
    "tkinter", "token", "tokenize", "tomllib", "trace", "traceback", "tracemalloc", "tty",
    "turtle", "turtledemo", "types", "typing", "typing_extensions", "unicodedata", "unittest",
    "urllib", "uu", "uuid", "venv", "warnings", "wave", "weakref", "webbrowser", "winreg",
    "winsound", "wsgiref", "xdrlib", "xml", "xmlrpc", "zipapp", "zipfile", "zipimport", "zlib",
    "zoneinfo",
    // 常用子包
    "collections.abc", "concurrent.futures", "email.mime", "html.parser", "http.client",
    "http.server", "http.cookies", "importlib.util", "importlib.metadata", "logging.handlers",
    "multiprocessing.pool", "os.path", "unittest.mock", "urllib.request", "urllib.parse",
    "urllib.error", "xml.etree", "xml.etree.ElementTree", "xml.dom", "xml.sax"
};
// clang-format on

const set<string> &stdlib_modules() {
    return stdlib;
}

bool is_stdlib_module(const string &name) {
    return stdlib.count(name) > 0;
}

import_audit audit_imports(const set<string> &imports) {
    import_audit audit;
    // set 有序，所以 illegal 也是有序的
    for (auto &name : imports)
        if (!is_stdlib_module(name))
            audit.illegal.push_back(name);
    audit.valid = audit.illegal.empty();
    return audit;
}

import_audit audit_source(const string &source, const string &filename) {
    python_source_adapter adapter;
    source_analysis analysis = adapter.analyze(source, filename);
    if (analysis.error)
        throw syntax_error(analysis.error->description, analysis.error->line);
    return audit_imports(analysis.imports);
}

}  // namespace vibe
