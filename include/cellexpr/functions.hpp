#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cellexpr/value.hpp"

namespace cellexpr {

class FunctionRegistry;

using Args = std::vector<Value>;

/// What a function receives besides its arguments. Pointers are only set
/// for the capabilities the function declared.
struct CallEnv {
    const Context* context{nullptr};
    FunctionRegistry* registry{nullptr};
};

using Callable = std::function<Value(const Args&, const CallEnv&)>;

enum Needs : unsigned {
    kNeedsNothing  = 0,
    kNeedsContext  = 1u << 0,
    kNeedsRegistry = 1u << 1,
};

struct Function {
    Callable fn;
    unsigned needs{kNeedsNothing};
};

using FunctionTable = std::map<std::string, Function>;

/// Default implementations of every built-in, keyed by upper-case name.
const FunctionTable& builtin_functions();

/// Table of callable functions keyed by upper-case name.
///
/// Built-ins are self-healing: any built-in name missing from the table is
/// restored with its default before each lookup or registration, so remove()
/// of a built-in only lasts until the next access. Names re-registered by the
/// caller are never overwritten. All members are safe to call concurrently.
class FunctionRegistry {
public:
    FunctionRegistry();

    /// Process-wide registry used when no registry is passed explicitly.
    static FunctionRegistry& shared();

    void register_function(std::string_view name, Callable fn, unsigned needs = kNeedsNothing);
    bool remove(std::string_view name);
    std::optional<Function> lookup(std::string_view name);
    bool contains(std::string_view name);
    std::vector<std::string> names();

private:
    void restore_defaults();

    std::mutex mu_;
    FunctionTable table_;
};

/// Depth-first flattening of nested sequences into scalars.
void flatten(const Value& v, Args& out);
Args flatten(const Args& args);

/// Apply fn element-wise when v is a sequence (recursively), else directly.
Value vectorize_unary(const Value& v, const std::function<Value(const Value&)>& fn);

/// Pairs two sequences by index (up to the shorter one) and broadcasts a
/// scalar against a sequence.
Value vectorize_binary(const Value& a, const Value& b,
                       const std::function<Value(const Value&, const Value&)>& fn);

} // namespace cellexpr
