#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace cellexpr {

/// Calendar date, time of day, or both.
struct DateTime {
    enum class Kind { Date, Time, DateTime };

    Kind kind{Kind::DateTime};
    int year{1899};
    int month{12};
    int day{30};
    int hour{0};
    int minute{0};
    int second{0};

    static DateTime make_date(int y, int m, int d);
    static DateTime make_time(int h, int m, int s = 0);
    static DateTime make_datetime(int y, int m, int d, int h, int mi, int s = 0);

    bool has_date() const noexcept { return kind != Kind::Time; }
    bool has_time() const noexcept { return kind != Kind::Date; }
};

bool operator==(const DateTime& a, const DateTime& b);
bool operator!=(const DateTime& a, const DateTime& b);
bool operator<(const DateTime& a, const DateTime& b);

class Value;

using Sequence = std::vector<Value>;
using Lazy     = std::function<Value()>;

/// A formula value. Lazy values are deferred bindings resolved by force().
class Value {
public:
    enum class Type { Null, Boolean, Integer, Float, Text, DateTime, Sequence, Lazy };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<std::int64_t>(i)) {}
    Value(long i) : data_(static_cast<std::int64_t>(i)) {}
    Value(long long i) : data_(static_cast<std::int64_t>(i)) {}
    Value(double d) : data_(d) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(DateTime dt) : data_(dt) {}
    Value(Sequence seq) : data_(std::move(seq)) {}
    Value(Lazy fn) : data_(std::move(fn)) {}

    Type type() const noexcept { return static_cast<Type>(data_.index()); }

    bool is_null() const noexcept     { return type() == Type::Null; }
    bool is_bool() const noexcept     { return type() == Type::Boolean; }
    bool is_integer() const noexcept  { return type() == Type::Integer; }
    bool is_float() const noexcept    { return type() == Type::Float; }
    bool is_number() const noexcept   { return is_integer() || is_float(); }
    bool is_text() const noexcept     { return type() == Type::Text; }
    bool is_datetime() const noexcept { return type() == Type::DateTime; }
    bool is_sequence() const noexcept { return type() == Type::Sequence; }
    bool is_lazy() const noexcept     { return type() == Type::Lazy; }

    bool as_bool() const                  { return std::get<bool>(data_); }
    std::int64_t as_integer() const       { return std::get<std::int64_t>(data_); }
    double as_float() const               { return std::get<double>(data_); }
    const std::string& as_text() const    { return std::get<std::string>(data_); }
    const DateTime& as_datetime() const   { return std::get<DateTime>(data_); }
    const Sequence& as_sequence() const   { return std::get<Sequence>(data_); }
    const Lazy& as_lazy() const           { return std::get<Lazy>(data_); }

    /// Numeric payload of an Integer or Float value.
    double number() const { return is_integer() ? static_cast<double>(as_integer()) : as_float(); }

    /// Invoke Lazy bindings until a concrete value is produced.
    Value force() const;

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string, DateTime, Sequence, Lazy> data_{};
};

/// Structural equality. Integer and Float compare by numeric value; Lazy
/// values are forced first.
bool operator==(const Value& a, const Value& b);
bool operator!=(const Value& a, const Value& b);

const char* type_name(Value::Type t);

/// Variable bindings for one evaluation, keyed by the name used in {{name}}.
using Context = std::map<std::string, Value>;

} // namespace cellexpr
