#include "cellexpr/value.hpp"
#include "cellexpr/error.hpp"

#include <tuple>

namespace cellexpr {

DateTime DateTime::make_date(int y, int m, int d) {
    DateTime dt;
    dt.kind = Kind::Date;
    dt.year = y;
    dt.month = m;
    dt.day = d;
    return dt;
}

DateTime DateTime::make_time(int h, int m, int s) {
    DateTime dt;
    dt.kind = Kind::Time;
    dt.hour = h;
    dt.minute = m;
    dt.second = s;
    return dt;
}

DateTime DateTime::make_datetime(int y, int m, int d, int h, int mi, int s) {
    DateTime dt = make_date(y, m, d);
    dt.kind = Kind::DateTime;
    dt.hour = h;
    dt.minute = mi;
    dt.second = s;
    return dt;
}

static auto key(const DateTime& dt) {
    return std::make_tuple(dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
}

bool operator==(const DateTime& a, const DateTime& b) { return a.kind == b.kind && key(a) == key(b); }
bool operator!=(const DateTime& a, const DateTime& b) { return !(a == b); }
bool operator<(const DateTime& a, const DateTime& b)  { return key(a) < key(b); }

Value Value::force() const {
    Value v = *this;
    while (v.is_lazy()) {
        const Lazy& fn = v.as_lazy();
        if (!fn) throw FormulaError("lazy binding has no callable");
        Value next = fn();
        v = std::move(next);
    }
    return v;
}

bool operator==(const Value& lhs, const Value& rhs) {
    const Value a = lhs.force();
    const Value b = rhs.force();

    const bool a_num = a.is_number() || a.is_bool();
    const bool b_num = b.is_number() || b.is_bool();
    if (a_num && b_num && (a.is_number() || b.is_number())) {
        const double x = a.is_bool() ? (a.as_bool() ? 1.0 : 0.0) : a.number();
        const double y = b.is_bool() ? (b.as_bool() ? 1.0 : 0.0) : b.number();
        return x == y;
    }
    if (a.type() != b.type()) return false;

    switch (a.type()) {
        case Value::Type::Null:     return true;
        case Value::Type::Boolean:  return a.as_bool() == b.as_bool();
        case Value::Type::Text:     return a.as_text() == b.as_text();
        case Value::Type::DateTime: return a.as_datetime() == b.as_datetime();
        case Value::Type::Sequence: return a.as_sequence() == b.as_sequence();
        default:                    return false;
    }
}

bool operator!=(const Value& a, const Value& b) { return !(a == b); }

const char* type_name(Value::Type t) {
    switch (t) {
        case Value::Type::Null:     return "null";
        case Value::Type::Boolean:  return "boolean";
        case Value::Type::Integer:  return "integer";
        case Value::Type::Float:    return "float";
        case Value::Type::Text:     return "text";
        case Value::Type::DateTime: return "datetime";
        case Value::Type::Sequence: return "sequence";
        case Value::Type::Lazy:     return "lazy";
    }
    return "?";
}

} // namespace cellexpr
