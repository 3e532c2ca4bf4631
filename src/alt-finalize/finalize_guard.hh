#pragma once

#include <alt-finalize/assert.hh>
#include <alt-finalize/finalizer.hh>
#include <alt-finalize/fwd.hh>
#include <alt-finalize/manually_finalized.hh>
#include <alt-finalize/to_debug_string.hh>
#include <alt-finalize/utility.hh>

#include <string>
#include <type_traits>

/// Owning wrapper that runs T's alternate finalizer instead of ~T() when it goes out of scope
///
/// The value lives in an af::manually_finalized<T>, so nothing destroys it implicitly.
/// The guard carries one "obligation" (the armed flag) that is discharged exactly once:
///   - ~finalize_guard() on an armed guard calls af::finalizer<T>::finalize, never ~T()
///   - af::move(guard).extract() hands the value back to ordinary ownership, no finalizer call
/// Both paths go through the same flag, so the finalizer cannot run twice through the guard.
///
/// Usage:
///   {
///       auto conn = af::finalize_guard<connection>(open_connection());
///       conn->send(payload);          // transparent access
///   }                                 // connection::finalize() runs here, ~connection() does not
///
///   auto keep = af::move(conn).extract(); // alternatively: back to normal, ~connection() runs later
///
/// Copy: copies the value into an independent guard with its own obligation (requires copyable T).
/// Move: the obligation moves with the value; the source becomes inert and never finalizes.
///       The moved-from remnant of T inside the source is forgotten: neither ~T() nor the finalizer runs on it.
///       ~T() runs exactly once per value, and only for a value that was extracted.
/// Assignment: an armed target is finalized first, then takes over (a copy of) the source's value.
///
/// An inert guard (extracted or moved from) may only be destroyed, assigned to or queried via is_armed().
template <class T>
struct [[nodiscard("a discarded finalize_guard finalizes immediately, use af::finalize_now(value) to say so")]] af::finalize_guard
{
    static_assert(af::alternately_finalizable<T>,
                  "T has no alternate finalizer: add a member `void finalize()` or specialize af::finalizer<T>");

    // construction
public:
    /// Takes ownership of value (perfect-forwarded into the slot) and arms the guard
    template <class U = T>
        requires(!std::is_same_v<std::remove_cvref_t<U>, finalize_guard>
                 && !std::is_same_v<std::remove_cvref_t<U>, af::manually_finalized<T>> && std::is_constructible_v<T, U &&>)
    explicit finalize_guard(U&& value) : _slot(af::forward<U>(value)), _armed(true)
    {
    }

    /// Takes over a value that already lives in a manually finalized slot
    /// The value is moved into the guard. The remnant in `slot` is forgotten,
    /// so `slot` must not be accessed afterwards (same as after slot.take()).
    explicit finalize_guard(af::manually_finalized<T>&& slot)
        requires std::is_move_constructible_v<T>
      : _slot(af::move(slot)), _armed(true)
    {
    }

    /// Constructs T in place, also works for non-movable T
    template <class... Args>
    [[nodiscard]] static finalize_guard create_from(Args&&... args)
    {
        return finalize_guard(in_place_tag{}, af::forward<Args>(args)...);
    }

    finalize_guard(finalize_guard const& rhs)
        requires std::is_copy_constructible_v<T>
      : _slot(uninitialized())
    {
        if (rhs._armed)
        {
            _slot.emplace(rhs._slot.value());
            _armed = true;
        }
    }

    finalize_guard(finalize_guard&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires std::is_move_constructible_v<T>
      : _slot(uninitialized())
    {
        take_over(rhs);
    }

    finalize_guard& operator=(finalize_guard const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            discharge();
            if (rhs._armed)
            {
                _slot.emplace(rhs._slot.value());
                _armed = true;
            }
        }
        return *this;
    }

    finalize_guard& operator=(finalize_guard&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires std::is_move_constructible_v<T>
    {
        if (this != &rhs)
        {
            discharge();
            take_over(rhs);
        }
        return *this;
    }

    /// Runs the alternate finalizer if still armed, never ~T()
    ~finalize_guard() { discharge(); }

    // ownership
public:
    /// Releases the value back to ordinary ownership and cancels the finalizer
    /// The guard is disarmed before this returns, its destructor becomes a no-op.
    /// The returned T gets destroyed normally (~T()) whenever the caller lets it go.
    /// If T's move constructor throws, the guard stays inert and the value is neither finalized nor destroyed.
    /// Precondition: is_armed()
    [[nodiscard]] T extract() &&
        requires std::is_move_constructible_v<T>
    {
        AF_ASSERT(_armed, "finalize_guard::extract: guard is inert (value already extracted or moved out)");
        _armed = false;
        return _slot.take();
    }

    /// True while the guard owns a value and will finalize it
    [[nodiscard]] bool is_armed() const { return _armed; }

    // transparent access
    // none of these touch the obligation
public:
    [[nodiscard]] T& value()
    {
        AF_ASSERT(_armed, "finalize_guard: accessing the value of an inert guard");
        return _slot.value();
    }
    [[nodiscard]] T const& value() const
    {
        AF_ASSERT(_armed, "finalize_guard: accessing the value of an inert guard");
        return _slot.value();
    }

    [[nodiscard]] T& operator*() { return value(); }
    [[nodiscard]] T const& operator*() const { return value(); }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] T const* operator->() const { return &value(); }

    // inspection
public:
    /// "finalize_guard(<value>)" with the value rendered by af::to_debug_string,
    /// or "finalize_guard(<inert>)" after extraction / move
    [[nodiscard]] std::string to_string() const
    {
        if (!_armed)
            return "finalize_guard(<inert>)";
        return "finalize_guard(" + af::to_debug_string(_slot.value()) + ")";
    }

private:
    struct in_place_tag
    {
    };

    template <class... Args>
    explicit finalize_guard(in_place_tag, Args&&... args)
      : _slot(af::manually_finalized<T>::create_from(af::forward<Args>(args)...)), _armed(true)
    {
    }

    static af::manually_finalized<T> uninitialized()
    {
        return af::manually_finalized<T>(typename af::manually_finalized<T>::uninitialized_tag{});
    }

    // the single discharge point of the destructor path
    void discharge()
    {
        if (af::exchange(_armed, false))
            af::finalize_in_place(_slot.value());
    }

    // precondition: !_armed
    void take_over(finalize_guard& rhs)
    {
        if (!rhs._armed)
            return;

        _slot.emplace(af::move(rhs._slot.value()));
        _armed = true;

        rhs._armed = false;
    }

    af::manually_finalized<T> _slot;
    bool _armed = false;
};

namespace af
{
/// Runs the alternate finalizer of value before returning
/// Same as creating a finalize_guard and dropping it immediately, but states the intent.
/// Usage:
///   af::finalize_now(af::move(conn)); // conn's finalize() runs now, ~connection() never for that value
template <class T>
    requires alternately_finalizable<std::remove_cvref_t<T>>
void finalize_now(T&& value)
{
    auto const guard = finalize_guard<std::remove_cvref_t<T>>(af::forward<T>(value));
}
} // namespace af
