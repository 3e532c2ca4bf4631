#pragma once

#include <alt-finalize/fwd.hh>
#include <alt-finalize/macros.hh>

// =========================================================================================================
// Low-level helpers shared by the lifetime primitives
// =========================================================================================================
//
//   move(value)                  - cast to rvalue reference
//   forward<T>(value)            - perfect forwarding
//   exchange(obj, new_val)       - replace obj, return old value
//   new (af::placement_new, p) T - placement new without <new>
//   storage_for<T>               - raw storage for one T, never constructs or destroys it
//

namespace af
{
template <class T>
[[nodiscard]] AF_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] AF_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] AF_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Assigns new_val to obj and returns the previous value
/// Usage:
///   bool const was_armed = af::exchange(_armed, false);
template <class T, class U = T>
[[nodiscard]] AF_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

/// Tag selecting the placement operator new declared below
/// Avoids pulling in <new> and cannot collide with user overloads of the standard placement new
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new{};

/// Uninitialized storage with size and alignment of T
/// The union never runs T's constructor or destructor on its own: whoever owns it starts and ends the
/// lifetime of `value` explicitly (placement new / value.~T()).
/// Copying the storage is only possible when T is trivially copyable.
template <class T>
union storage_for
{
    storage_for() {}
    ~storage_for() {}

    T value;
};
} // namespace af

inline void* operator new(std::size_t, af::placement_new_t, void* buffer) noexcept
{
    return buffer;
}

// matching placement delete, only called if a constructor throws during placement new
inline void operator delete(void*, af::placement_new_t, void*) noexcept {}
