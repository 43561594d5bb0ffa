#pragma once

#include <any-of/assert.hh>
#include <any-of/fwd.hh>
#include <any-of/hash.hh>
#include <any-of/to_debug_string.hh>
#include <any-of/utility.hh>

#include <string>
#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Construct as ao::nullopt to explicitly assign or compare against empty optionals.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T> = {}.
struct ao::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace ao
{
/// The canonical instance of nullopt_t.
/// Usage: optional<int> slot = ao::nullopt; or any_of<int>::create(ao::nullopt, 3).
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace ao

/// Slot type: either a value of type T or no value (T | none).
/// Every side of either_of / both_of / any_of decomposes into one of these (see opt2_of).
/// No operator* or operator-> to avoid unchecked access; value() asserts presence.
/// Equality comparison available; other relational operators deliberately omitted.
/// Trivially copyable when T is trivially copyable; otherwise uses T's move/copy semantics.
template <class T>
struct ao::optional
{
    using value_type = T;

    // construction
public:
    /// Default optional is empty: has_value() == false.
    optional() = default;

    /// Constructs an optional holding the given value; conditionally explicit.
    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _has_value(true) // NOLINT
    {
        new (ao::placement_new, &_storage.value) T(ao::forward<U>(value));
    }

    /// Constructs an empty optional from ao::nullopt.
    constexpr optional(nullopt_t) {}

    // trivial copy/move/destroy
public:
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // non-trivial copy/move/destroy
public:
    /// Moves the value out of rhs and leaves rhs empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
        {
            new (ao::placement_new, &_storage.value) T(ao::move(rhs._storage.value));
            rhs._storage.value.~T();
            rhs._has_value = false;
        }
    }

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
      : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (ao::placement_new, &_storage.value) T(rhs._storage.value);
    }

    /// Leaves rhs engaged with a moved-from value (matches std::optional behavior).
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            if (_has_value)
                _storage.value = ao::move(rhs._storage.value);
            else
                new (ao::placement_new, &_storage.value) T(ao::move(rhs._storage.value));

            _has_value = true;
        }
        else if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }

        return *this;
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            if (rhs._has_value)
            {
                if (_has_value)
                    _storage.value = rhs._storage.value;
                else
                    new (ao::placement_new, &_storage.value) T(rhs._storage.value);

                _has_value = true;
            }
            else if (_has_value)
            {
                _storage.value.~T();
                _has_value = false;
            }
        }

        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        if (_has_value)
            _storage.value.~T();
    }

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }

    /// Precondition: has_value() == true.
    [[nodiscard]] constexpr T& value() &
    {
        AO_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] constexpr T const& value() const&
    {
        AO_ASSERT(_has_value, "attempted to access value of empty optional");
        return _storage.value;
    }
    [[nodiscard]] constexpr T&& value() &&
    {
        AO_ASSERT(_has_value, "attempted to access value of empty optional");
        return ao::move(_storage.value);
    }

    /// Returns the held value or the given fallback.
    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) const&
    {
        return _has_value ? _storage.value : static_cast<T>(ao::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) &&
    {
        return _has_value ? ao::move(_storage.value) : static_cast<T>(ao::forward<U>(fallback));
    }

    // debug
public:
    /// "nullopt" or the debug string of the value (picked up by ao::to_debug_string).
    [[nodiscard]] std::string to_string() const { return _has_value ? ao::to_debug_string(_storage.value) : "nullopt"; }

    // comparison
public:
    /// Two optionals are equal if both are empty or both hold equal values.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        if (lhs._has_value)
            return lhs._storage.value == rhs._storage.value;
        return true;
    }

    /// An optional equals a value if it holds an equal value.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, T const& rhs)
        requires requires(T v) { bool(v == v); }
    {
        return lhs._has_value && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

    /// Deleted when T is not bool so that optional<int> does not compare with true/false.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // members
private:
    ao::storage_for<T> _storage;
    bool _has_value = false;
};

/// Borrowing slot: either a reference to a T or nothing.
/// Returned by every probe (left(), right(), opt2(), composite accessors) so that
/// probing never copies a payload. Holds a pointer, so it is always trivially copyable.
/// Rebinding on assignment (never assigns through).
template <class T>
struct ao::optional<T&>
{
    using value_type = T&;

    // construction
public:
    optional() = default;
    constexpr optional(nullopt_t) {}

    /// Binds to value; the referenced object must outlive the optional.
    constexpr optional(T& value) : _ptr(&value) {} // NOLINT

    /// optional<T&> converts to optional<T const&>
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U*, T*>)
    constexpr optional(optional<U&> const& rhs) : _ptr(rhs.has_value() ? &rhs.value() : nullptr) // NOLINT
    {
    }

    optional(T&& value) = delete; // no binding to temporaries

    // queries and access
public:
    [[nodiscard]] constexpr bool has_value() const { return _ptr != nullptr; }

    /// Precondition: has_value() == true.
    [[nodiscard]] constexpr T& value() const
    {
        AO_ASSERT(_ptr != nullptr, "attempted to access value of empty optional");
        return *_ptr;
    }

    /// Copies the referenced value into an owning optional.
    [[nodiscard]] constexpr optional<std::remove_cv_t<T>> to_value() const
    {
        if (_ptr == nullptr)
            return {};
        return optional<std::remove_cv_t<T>>(*_ptr);
    }

    // debug
public:
    [[nodiscard]] std::string to_string() const { return _ptr ? ao::to_debug_string(*_ptr) : "nullopt"; }

    // comparison
public:
    /// Compares referenced values, not addresses.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        if (lhs.has_value() != rhs.has_value())
            return false;
        return !lhs.has_value() || *lhs._ptr == *rhs._ptr;
    }

    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, std::remove_cv_t<T> const& rhs)
        requires requires(T& v) { bool(v == v); }
    {
        return lhs._ptr != nullptr && *lhs._ptr == rhs;
    }

    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, nullopt_t) { return lhs._ptr == nullptr; }

    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<std::remove_cv_t<T>, bool>)
    = delete;

    // members
private:
    T* _ptr = nullptr;
};

namespace std
{
/// Equal optionals hash equally; the empty optional hashes like a distinct tag.
template <class T>
    requires ao::hashable<std::remove_cvref_t<T>>
struct hash<ao::optional<T>>
{
    [[nodiscard]] std::size_t operator()(ao::optional<T> const& v) const noexcept
    {
        if (!v.has_value())
            return ao::hash_tagged(0);
        return ao::hash_tagged(1, v.value());
    }
};
} // namespace std
