#include "builtins.hpp"
#include "cellexpr/coerce.hpp"
#include "cellexpr/error.hpp"

#include <cctype>
#include <cmath>
#include <ctime>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/regex.hpp>
#include <fmt/core.h>
#include <fmt/format.h>

namespace cellexpr::builtins {

namespace {

// Positions and lengths are counted in UTF-8 code points.
std::size_t cp_length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

// Byte offset of code point `cp`, clamped to the end of the string.
std::size_t cp_offset(const std::string& s, std::size_t cp) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
        if (seen == cp) return i;
        ++seen;
    }
    return s.size();
}

constexpr double kMaxCount = 1e15; // past the length of any string

// Truncated count, clamped to [0, kMaxCount].
std::size_t clamp_count(double d) {
    if (!std::isfinite(d)) throw FormulaError("expected a finite whole number");
    d = std::trunc(d);
    if (d <= 0.0) return 0;
    return static_cast<std::size_t>(d < kMaxCount ? d : kMaxCount);
}

std::size_t non_negative(const Value& v) {
    return clamp_count(to_number(v));
}

// 1-based position argument as a 0-based code point index.
std::size_t zero_based(const Value& v) {
    return clamp_count(to_number(v) - 1.0);
}

std::string lower_ascii(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string upper_ascii(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> words(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> split(const std::string& s, const std::string& sep) {
    if (sep.empty()) throw std::invalid_argument("empty separator");
    std::vector<std::string> out;
    std::size_t start = 0;
    for (;;) {
        const std::size_t at = s.find(sep, start);
        if (at == std::string::npos) break;
        out.push_back(s.substr(start, at - start));
        start = at + sep.size();
    }
    out.push_back(s.substr(start));
    return out;
}

std::string replace_all(const std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) {
        // an empty pattern matches before every code point and at the end
        std::string out = to;
        for (std::size_t i = 0; i < s.size(); ++i) {
            out.push_back(s[i]);
            const bool boundary = i + 1 == s.size() || (static_cast<unsigned char>(s[i + 1]) & 0xC0) != 0x80;
            if (boundary) out += to;
        }
        return out;
    }
    return join(split(s, from), to);
}

std::string concat_text(const Args& a) {
    std::string out;
    for (const auto& v : flatten(a)) {
        if (!v.is_null()) out += to_text(v);
    }
    return out;
}

Value fn_len(const Args& a, const CallEnv&) {
    require_args(a, 1, 1, "LEN");
    return vectorize_unary(a[0], [](const Value& v) {
        return Value(static_cast<long long>(cp_length(to_text(v))));
    });
}

Value fn_concat(const Args& a, const CallEnv&) {
    return Value(concat_text(a));
}

Value fn_textjoin(const Args& a, const CallEnv&) {
    require_args(a, 2, static_cast<std::size_t>(-1), "TEXTJOIN");
    const std::string sep = to_text(a[0]);
    const Value flag = a[1].force();
    const bool ignore_empty = flag.is_text()
        ? (upper_ascii(trim(flag.as_text())) == "TRUE" || trim(flag.as_text()) == "1")
        : truthy(flag);

    std::vector<std::string> pieces;
    for (const auto& v : flatten(Args(a.begin() + 2, a.end()))) {
        if (ignore_empty && is_blank(v)) continue;
        pieces.push_back(to_text(v));
    }
    return Value(join(pieces, sep));
}

Value fn_lower(const Args& a, const CallEnv&) {
    require_args(a, 1, 1, "LOWER");
    return vectorize_unary(a[0], [](const Value& v) { return Value(lower_ascii(to_text(v))); });
}

Value fn_upper(const Args& a, const CallEnv&) {
    require_args(a, 1, 1, "UPPER");
    return vectorize_unary(a[0], [](const Value& v) { return Value(upper_ascii(to_text(v))); });
}

Value fn_proper(const Args& a, const CallEnv&) {
    require_args(a, 1, 1, "PROPER");
    return vectorize_unary(a[0], [](const Value& v) {
        std::vector<std::string> ws = words(to_text(v));
        for (auto& w : ws) {
            w = lower_ascii(std::move(w));
            w[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(w[0])));
        }
        return Value(join(ws, " "));
    });
}

Value fn_trim(const Args& a, const CallEnv&) {
    require_args(a, 1, 1, "TRIM");
    return vectorize_unary(a[0], [](const Value& v) { return Value(join(words(to_text(v)), " ")); });
}

// SUBSTITUTE(text, old, new, [occurrence])
Value fn_substitute(const Args& a, const CallEnv&) {
    require_args(a, 3, 4, "SUBSTITUTE");
    const std::string source = to_text(a[0]);
    const std::string from = to_text(a[1]);
    const std::string to = to_text(a[2]);
    const Value occurrence = arg_or(a, 3, Value()).force();
    if (occurrence.is_null()) return Value(replace_all(source, from, to));

    const std::size_t index = non_negative(occurrence);
    if (index == 0) return Value(source);
    const std::vector<std::string> parts = split(source, from);
    if (parts.size() <= index) return Value(source);

    std::string out;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        out += parts[i];
        out += (i + 1 == index) ? to : from;
    }
    out += parts.back();
    return Value(std::move(out));
}

// REPLACE(text, start, length, new_text)
Value fn_replace(const Args& a, const CallEnv&) {
    require_args(a, 4, 4, "REPLACE");
    const std::string source = to_text(a[0]);
    const std::size_t start = zero_based(a[1]);
    const std::size_t count = non_negative(a[2]);
    const std::size_t b = cp_offset(source, start);
    const std::size_t e = cp_offset(source, start + count);
    return Value(source.substr(0, b) + to_text(a[3]) + source.substr(e));
}

Value fn_left(const Args& a, const CallEnv&) {
    require_args(a, 1, 2, "LEFT");
    return vectorize_binary(a[0], arg_or(a, 1, Value(1)), [](const Value& text, const Value& n) {
        const std::string s = to_text(text);
        return Value(s.substr(0, cp_offset(s, non_negative(n))));
    });
}

Value fn_right(const Args& a, const CallEnv&) {
    require_args(a, 1, 2, "RIGHT");
    return vectorize_binary(a[0], arg_or(a, 1, Value(1)), [](const Value& text, const Value& n) {
        const std::string s = to_text(text);
        const std::size_t len = cp_length(s);
        const std::size_t take = non_negative(n);
        if (take >= len) return Value(s);
        return Value(s.substr(cp_offset(s, len - take)));
    });
}

Value fn_mid(const Args& a, const CallEnv&) {
    require_args(a, 3, 3, "MID");
    const std::string s = to_text(a[0]);
    const std::size_t start = zero_based(a[1]);
    const std::size_t b = cp_offset(s, start);
    const std::size_t e = cp_offset(s, start + non_negative(a[2]));
    return Value(s.substr(b, e - b));
}

Value find_text(const Args& a, bool ignore_case, const char* name) {
    require_args(a, 2, 3, name);
    std::string needle = to_text(a[0]);
    std::string haystack = to_text(a[1]);
    if (ignore_case) {
        needle = lower_ascii(std::move(needle));
        haystack = lower_ascii(std::move(haystack));
    }
    const std::size_t start = zero_based(arg_or(a, 2, Value(1)));
    const std::size_t at = start > cp_length(haystack)
        ? std::string::npos
        : haystack.find(needle, cp_offset(haystack, start));
    if (at == std::string::npos) throw FormulaError(fmt::format("{} could not find the specified text", name));
    return Value(static_cast<long long>(cp_length(haystack.substr(0, at)) + 1));
}

Value fn_search(const Args& a, const CallEnv&) { return find_text(a, true, "SEARCH"); }
Value fn_find(const Args& a, const CallEnv&)   { return find_text(a, false, "FIND"); }

Value fn_split(const Args& a, const CallEnv&) {
    require_args(a, 2, 2, "SPLIT");
    Sequence out;
    for (auto& part : split(to_text(a[0]), to_text(a[1]))) out.emplace_back(std::move(part));
    return Value(std::move(out));
}

// A single scalar passes through; everything else is flattened.
Value fn_arrayformula(const Args& a, const CallEnv&) {
    if (a.empty()) return Value(Sequence{});
    Args flat = flatten(a);
    if (flat.size() == 1 && a.size() == 1 && !a[0].force().is_sequence()) return a[0];
    return Value(Sequence(std::move(flat)));
}

Value fn_to_text(const Args& a, const CallEnv&) {
    require_args(a, 1, 1, "TO_TEXT");
    return Value(to_text(a[0]));
}

void replace_token(std::string& s, const std::string& token, const std::string& directive) {
    std::size_t at = 0;
    while ((at = s.find(token, at)) != std::string::npos) {
        s.replace(at, token.size(), directive);
        at += directive.size();
    }
}

std::string format_datetime(const DateTime& dt, std::string pattern) {
    static const std::pair<const char*, const char*> kTokens[] = {
        {"YYYY", "%Y"}, {"YY", "%y"}, {"MM", "%m"}, {"DD", "%d"},
        {"HH", "%H"},   {"hh", "%I"}, {"mm", "%M"}, {"ss", "%S"},
    };
    for (const auto& [token, directive] : kTokens) replace_token(pattern, token, directive);
    if (pattern.empty()) return std::string();

    std::tm tm{};
    tm.tm_year = dt.year - 1900;
    tm.tm_mon = dt.month - 1;
    tm.tm_mday = dt.day;
    tm.tm_hour = dt.hour;
    tm.tm_min = dt.minute;
    tm.tm_sec = dt.second;
    const long days = days_from_civil(dt.year, dt.month, dt.day);
    tm.tm_wday = static_cast<int>(((days % 7) + 11) % 7); // 1970-01-01 was a Thursday
    tm.tm_yday = static_cast<int>(days - days_from_civil(dt.year, 1, 1));

    std::string buf(pattern.size() * 4 + 64, '\0');
    for (int attempt = 0; attempt < 4; ++attempt) {
        const std::size_t n = std::strftime(&buf[0], buf.size(), pattern.c_str(), &tm);
        if (n > 0) return buf.substr(0, n);
        buf.resize(buf.size() * 4);
    }
    return std::string();
}

std::string format_number(double number, const std::string& pattern) {
    if (pattern.find_first_of("#0") != std::string::npos) {
        const std::size_t dot = pattern.find('.');
        if (dot == std::string::npos) return to_text(normalize_number(round_half_up(number, 0)));
        const int decimals = static_cast<int>(pattern.size() - dot - 1);
        return fmt::format("{:.{}f}", round_half_up(number, decimals), decimals);
    }
    try {
        return fmt::format(fmt::runtime("{:" + pattern + "}"), number);
    } catch (const fmt::format_error&) {
        return to_text(normalize_number(number));
    }
}

// TEXT(value, format)
Value fn_text(const Args& a, const CallEnv&) {
    require_args(a, 2, 2, "TEXT");
    const Value v = a[0].force();
    const std::string pattern = to_text(a[1]);
    if (v.is_datetime()) return Value(format_datetime(to_datetime(v), pattern));

    double number = 0.0;
    try {
        number = to_number(v);
    } catch (const FormulaError&) {
        try {
            return Value(fmt::format(fmt::runtime(pattern), fmt::arg("value", to_text(v))));
        } catch (const fmt::format_error&) {
            return Value(to_text(v));
        }
    }
    return Value(format_number(number, pattern));
}

// Backslash group references (\1, \g<1>, \g<0>) to Boost format syntax
// (${1}, $&). Literal '$' and '\' are escaped for the formatter.
std::string format_replacement(const std::string& repl) {
    std::string out;
    for (std::size_t i = 0; i < repl.size(); ++i) {
        const char c = repl[i];
        if (c == '$') {
            out += "$$";
            continue;
        }
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (i + 1 >= repl.size()) throw FormulaError("invalid replacement string: bad escape (end of pattern)");
        const char e = repl[++i];
        if (std::isdigit(static_cast<unsigned char>(e))) {
            if (e == '0') out.push_back('\0');
            else out += std::string("${") + e + "}";
        } else if (e == 'g') {
            const std::size_t close = repl.find('>', i);
            if (i + 1 >= repl.size() || repl[i + 1] != '<' || close == std::string::npos) {
                throw FormulaError("invalid replacement string: missing group name");
            }
            const std::string group = repl.substr(i + 2, close - i - 2);
            if (group.empty() || group.find_first_not_of("0123456789") != std::string::npos) {
                throw FormulaError(fmt::format("invalid replacement string: unknown group name '{}'", group));
            }
            out += group == "0" ? std::string("$&") : "${" + group + "}";
            i = close;
        } else if (e == 'n') {
            out.push_back('\n');
        } else if (e == 't') {
            out.push_back('\t');
        } else if (e == 'r') {
            out.push_back('\r');
        } else if (e == '\\') {
            out += "\\\\";
        } else if (std::isalpha(static_cast<unsigned char>(e))) {
            throw FormulaError(fmt::format("invalid replacement string: bad escape \\{}", e));
        } else {
            out += "\\\\";
            out.push_back(e);
        }
    }
    return out;
}

// REGEXREPLACE(text, pattern, replacement) with Perl-style patterns. A match
// that outgrows the matcher's state limit throws std::runtime_error.
Value fn_regexreplace(const Args& a, const CallEnv&) {
    require_args(a, 3, 3, "REGEXREPLACE");
    const std::string source = to_text(a[0]);
    boost::regex re;
    try {
        re.assign(to_text(a[1]), boost::regex::perl);
    } catch (const boost::regex_error& e) {
        throw FormulaError(fmt::format("invalid regular expression: {}", e.what()));
    }
    const std::string repl = format_replacement(to_text(a[2]));
    return Value(boost::regex_replace(source, re, repl, boost::format_default));
}

} // namespace

void add_text(FunctionTable& t) {
    t["LEN"]          = Function{fn_len};
    t["CONCAT"]       = Function{fn_concat};
    t["CONCATENATE"]  = Function{fn_concat};
    t["TEXTJOIN"]     = Function{fn_textjoin};
    t["LOWER"]        = Function{fn_lower};
    t["UPPER"]        = Function{fn_upper};
    t["PROPER"]       = Function{fn_proper};
    t["TRIM"]         = Function{fn_trim};
    t["SUBSTITUTE"]   = Function{fn_substitute};
    t["REPLACE"]      = Function{fn_replace};
    t["LEFT"]         = Function{fn_left};
    t["RIGHT"]        = Function{fn_right};
    t["MID"]          = Function{fn_mid};
    t["SEARCH"]       = Function{fn_search};
    t["FIND"]         = Function{fn_find};
    t["SPLIT"]        = Function{fn_split};
    t["ARRAYFORMULA"] = Function{fn_arrayformula};
    t["TO_TEXT"]      = Function{fn_to_text};
    t["TEXT"]         = Function{fn_text};
    t["REGEXREPLACE"] = Function{fn_regexreplace};
}

} // namespace cellexpr::builtins
