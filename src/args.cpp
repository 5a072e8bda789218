#include "args.hpp"
#include "errors.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

size_t Args::limit() const {
    return has_top ? top : std::numeric_limits<size_t>::max();
}

void usage(std::ostream& os, const char* argv0) {
    os << "Usage:\n"
       << "  " << argv0 << " [OPTIONS] [INPUT]\n"
       << "\n"
       << "Counts identical lines of INPUT (or stdin when omitted or '-')\n"
       << "and prints <line><TAB><count> rows.\n"
       << "\n"
       << "Options:\n"
       << "  -s, --sortby <Key|Count|None>  ordering, case-insensitive [default: Count]\n"
       << "      --top <N>                  print only the first N rows\n"
       << "  -t, --threads <N>              OpenMP threads for sorting\n"
       << "  -v, --verbose                  print run statistics to stderr\n"
       << "      --bar-width <W>            bar width in the statistics [default: 40]\n"
       << "  -h, --help                     print this help\n"
       << "  -V, --version                  print version\n";
}

namespace {

// Digits only; strtoull would silently accept "-1", "+3" and " 7".
unsigned long long parse_uint(const std::string& opt, const std::string& s) {
    if (s.empty()) throw ArgumentError("missing value for " + opt);
    for (unsigned char c : s) {
        if (!std::isdigit(c)) throw ArgumentError("invalid value '" + s + "' for " + opt + ": expected a non-negative integer");
    }
    errno = 0;
    unsigned long long v = std::strtoull(s.c_str(), nullptr, 10);
    if (errno == ERANGE) throw ArgumentError("value '" + s + "' for " + opt + " is too large");
    return v;
}

int parse_positive_int(const std::string& opt, const std::string& s) {
    unsigned long long v = parse_uint(opt, s);
    if (v == 0 || v > (unsigned long long)std::numeric_limits<int>::max()) {
        throw ArgumentError("invalid value '" + s + "' for " + opt + ": expected a positive integer");
    }
    return (int)v;
}

struct Seen {
    bool sortby = false, top = false, threads = false, verbose = false, bar_width = false;
};

void once(bool& seen, const std::string& opt) {
    if (seen) throw ArgumentError("option " + opt + " given more than once");
    seen = true;
}

} // namespace

Args parse_args(int argc, char** argv) {
    Args a;
    Seen seen;
    bool have_path = false;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s.empty()) throw ArgumentError("empty input path");

        if (options_done || s == "-" || s[0] != '-') {
            if (have_path) throw ArgumentError("unexpected argument '" + s + "'");
            a.path = s;
            have_path = true;
            continue;
        }
        if (s == "--") { options_done = true; continue; }

        // --opt=value
        std::string opt = s, inline_val;
        bool has_inline = false;
        size_t eq = s.find('=');
        if (s.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            opt = s.substr(0, eq);
            inline_val = s.substr(eq + 1);
            has_inline = true;
        }
        auto value = [&]() -> std::string {
            if (has_inline) return inline_val;
            if (i + 1 >= argc) throw ArgumentError("missing value for " + opt);
            return argv[++i];
        };
        auto no_value = [&]() {
            if (has_inline) throw ArgumentError("option " + opt + " takes no value");
        };

        if (opt == "-s" || opt == "--sortby") {
            once(seen.sortby, "--sortby");
            a.sort_by = parse_sorting_order(value());
        } else if (opt == "--top") {
            once(seen.top, "--top");
            std::string v = value();
            unsigned long long n = parse_uint(opt, v);
            if (n > (unsigned long long)std::numeric_limits<size_t>::max()) {
                throw ArgumentError("value '" + v + "' for --top is too large");
            }
            a.top = (size_t)n;
            a.has_top = true;
        } else if (opt == "-t" || opt == "--threads") {
            once(seen.threads, "--threads");
            a.threads = parse_positive_int("--threads", value());
        } else if (opt == "--bar-width") {
            once(seen.bar_width, "--bar-width");
            a.bar_width = parse_positive_int(opt, value());
        } else if (opt == "-v" || opt == "--verbose") {
            no_value();
            once(seen.verbose, "--verbose");
            a.verbose = true;
        } else if (opt == "-h" || opt == "--help") {
            no_value();
            a.show_help = true;
        } else if (opt == "-V" || opt == "--version") {
            no_value();
            a.show_version = true;
        } else {
            throw ArgumentError("unknown option '" + s + "'");
        }
    }
    return a;
}
