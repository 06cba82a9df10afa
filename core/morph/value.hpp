#pragma once

#include "morph/errors.hpp"
#include <any>
#include <functional>
#include <string>
#include <type_traits>
#include <typeinfo>

namespace morpheus {

/// Type-erased payload flowing between morphs.
using Value = std::any;

/// Opaque execution context threaded through every apply() call.
/// The engine never reads or writes it.
using Context = std::any;

/// Signature every morph body is reduced to.
using MorphFn = std::function<Value(const Value&, Context&)>;

/// Read a payload as T, raising TypeMismatchError (tagged with `where`)
/// instead of std::bad_any_cast.
template <typename T>
const T& valueAs(const Value& value, const std::string& where) {
    const T* ptr = std::any_cast<T>(&value);
    if (!ptr) {
        throw TypeMismatchError(
            where + ": expected payload of type " + typeid(T).name() +
            " but got " + (value.has_value() ? value.type().name() : "<empty>"));
    }
    return *ptr;
}

namespace detail {

/// Call `fn` with a typed view of `input`. `fn` may take the context or not.
/// With In = Value the payload is handed over untouched.
template <typename In, typename Fn>
decltype(auto) invokeTyped(Fn& fn, const Value& input, Context& ctx,
                           const std::string& where) {
    if constexpr (std::is_same_v<In, Value>) {
        if constexpr (std::is_invocable_v<Fn&, const Value&, Context&>) {
            return fn(input, ctx);
        } else {
            return fn(input);
        }
    } else {
        const In& typed = valueAs<In>(input, where);
        if constexpr (std::is_invocable_v<Fn&, const In&, Context&>) {
            return fn(typed, ctx);
        } else {
            return fn(typed);
        }
    }
}

/// Lift a typed callable into a MorphFn.
template <typename In, typename Out, typename Fn>
MorphFn liftTyped(Fn fn, std::string where) {
    return [fn = std::move(fn), where = std::move(where)](
               const Value& input, Context& ctx) -> Value {
        if constexpr (std::is_same_v<Out, Value>) {
            return invokeTyped<In>(fn, input, ctx, where);
        } else {
            return Value(static_cast<Out>(invokeTyped<In>(fn, input, ctx, where)));
        }
    };
}

/// Lift a typed predicate into an erased one.
template <typename T, typename Pred>
std::function<bool(const Value&, Context&)> liftPredicate(Pred pred, std::string where) {
    return [pred = std::move(pred), where = std::move(where)](
               const Value& input, Context& ctx) -> bool {
        return static_cast<bool>(invokeTyped<T>(pred, input, ctx, where));
    };
}

} // namespace detail

} // namespace morpheus
