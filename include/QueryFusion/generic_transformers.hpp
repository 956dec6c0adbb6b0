#pragma once
#include <concepts>
#include <memory>
#include <utility>

namespace QueryFusion {
namespace transformers {

// Field stored as StoredT that travels on the wire as WireT.
//   FromFn: bool(StoredT &, const WireT &)   decode side
//   ToFn:   bool(const StoredT &, WireT &)   encode side
// Returning false from either one fails the call with TRANSFORMER_ERROR.
template <class StoredT, class WireT, auto FromFn, auto ToFn>
struct Transformed {
    using stored_type = StoredT;
    using wire_type   = WireT;

    StoredT value{};

    constexpr Transformed() = default;

    template<class U>
        requires std::convertible_to<U, StoredT>
    constexpr Transformed(U && u): value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, StoredT>
    constexpr Transformed & operator=(U && u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr bool transform_from(const WireT & wire) {
        return FromFn(value, wire);
    }

    constexpr bool transform_to(WireT & wire) const {
        return ToFn(value, wire);
    }

    constexpr StoredT &       get()       { return value; }
    constexpr const StoredT & get() const { return value; }

    constexpr StoredT *       operator->()       { return std::addressof(value); }
    constexpr const StoredT * operator->() const { return std::addressof(value); }

    constexpr bool operator==(const Transformed & other) const {
        return value == other.value;
    }
};

} // namespace transformers
} // namespace QueryFusion
