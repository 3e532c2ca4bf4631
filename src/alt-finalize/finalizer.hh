#pragma once

#include <alt-finalize/fwd.hh>

#include <type_traits>

// =========================================================================================================
// Alternate finalizer capability
// =========================================================================================================
//
// A type is "alternately finalizable" if af::finalizer<T>::finalize(T&) is valid.
// That function is what af::finalize_guard<T> runs INSTEAD of ~T() when the guard goes out of scope.
//
// Opting in:
//   - give the type a member `void finalize()` (picked up by the primary template), or
//   - specialize af::finalizer<T> with `static void finalize(T&)` for types you cannot modify.
//
// UNCHECKED CONTRACT for implementers:
//   - finalize is called at most once per object. Calling it twice is undefined behavior and is NOT
//     detected. finalize_guard guarantees this for you, direct calls of af::finalize_in_place do not.
//   - ~T() does not run afterwards, and neither do the destructors of T's members.
//     Members whose cleanup matters have to be handled explicitly, via af::destroy_in_place (normal
//     destructor) and/or af::finalize_in_place (their own alternate finalizer), in any order.
//   - do not silently drop cleanup that is required for correctness (releasing memory, unlocking, ...).
//   - finalize is run from a destructor: if it throws, std::terminate is called.
//
// Example:
//   struct connection
//   {
//       socket sock;
//       ~connection() { sock.send_goodbye(); }
//
//       // finalize_guard<connection> closes without the goodbye
//       void finalize() { af::destroy_in_place(sock); }
//   };
//

/// Customization point for the alternate finalizer of T
/// The primary template forwards to a member `finalize()`; specialize it to opt in non-intrusively:
///   template <>
///   struct af::finalizer<legacy_handle>
///   {
///       static void finalize(legacy_handle& h) { h.release_without_flush(); }
///   };
template <class T>
struct af::finalizer
{
    static void finalize(T& value)
        requires requires(T& v) { v.finalize(); }
    {
        value.finalize();
    }
};

/// The empty type. Its alternate finalizer does nothing.
struct af::unit
{
    constexpr void finalize() {}

    friend constexpr bool operator==(unit, unit) = default;
};

namespace af
{
/// True if T has an alternate finalizer, i.e. can be held in a finalize_guard
template <class T>
concept alternately_finalizable = std::is_object_v<T> && requires(T& v) { af::finalizer<T>::finalize(v); };

/// Runs the alternate finalizer of value right now
/// Does NOT run ~T(), value stays alive in the language sense.
/// Mainly for alternate finalizers of aggregates that want to forward to their members:
///   void finalize()
///   {
///       af::finalize_in_place(inner);
///   }
/// Precondition: not called before for this object (unchecked, see contract above)
template <alternately_finalizable T>
void finalize_in_place(T& value)
{
    af::finalizer<T>::finalize(value);
}

/// Runs the normal destructor ~T() of value right now, without releasing its storage
/// Used from alternate finalizers to explicitly destroy members (or *this), since nothing is destroyed
/// implicitly under a finalize_guard.
/// The caller must make sure nothing uses value afterwards, except where T explicitly tolerates it.
template <class T>
constexpr void destroy_in_place(T& value) noexcept(std::is_nothrow_destructible_v<T>)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_destructible_v<T>, "T must be destructible");

    value.~T();
}
} // namespace af
