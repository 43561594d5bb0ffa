#pragma once

#include <any-of/assert.hh>
#include <any-of/fwd.hh>

#include <new>
#include <type_traits>

// =========================================================================================================
// Utility functions shared by the variant types
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Callable utilities:
//   identify_function           - callable that returns its argument (identity function)
//
// Storage:
//   placement_new               - tag for placement new into raw storage
//   storage_for<T>              - uninitialized storage with size and alignment of T
//

namespace ao
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   auto b = ao::move(a);
///   return ao::move(*this).map(fl, fr);
template <class T>
[[nodiscard]] AO_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Usage:
///   template <class FL>
///   auto map_left(FL&& f) { return map(ao::forward<FL>(f), ao::identify_function{}); }
template <class T>
[[nodiscard]] AO_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] AO_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Callable utilities
// =========================================================================================================

/// Callable that returns its argument with perfect forwarding
/// Used as the untouched side of map_left / map_right
/// Usage:
///   auto v = ao::identify_function{}(x);     // copies x
///   auto w = ao::identify_function{}(ao::move(x)); // moves x
struct identify_function
{
    template <class T>
    constexpr T&& operator()(T&& arg) const noexcept
    {
        return ao::forward<T>(arg);
    }
};

// =========================================================================================================
// Storage
// =========================================================================================================

/// Tag type selecting the placement operator new declared below
/// Avoids depending on the reserved global placement new overloads
struct placement_new_t
{
    explicit constexpr placement_new_t() = default;
};

/// Usage:
///   new (ao::placement_new, &storage.value) T(ao::forward<Args>(args)...);
constexpr placement_new_t placement_new{};

/// Uninitialized storage for exactly one T
/// The value member is not constructed by storage_for itself; the owner starts and ends its lifetime.
/// Trivially destructible (and trivially copyable) exactly when T is.
template <class T>
union storage_for
{
    constexpr storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    storage_for(storage_for const&) = default;
    storage_for(storage_for&&) = default;
    storage_for& operator=(storage_for const&) = default;
    storage_for& operator=(storage_for&&) = default;

    T value;
};

} // namespace ao

/// Placement new into raw storage (see ao::placement_new)
[[nodiscard]] AO_FORCE_INLINE void* operator new(std::size_t, ao::placement_new_t, void* ptr) noexcept
{
    return ptr;
}

/// Only called if a constructor throws during placement new, nothing to release
AO_FORCE_INLINE void operator delete(void*, ao::placement_new_t, void*) noexcept {}
