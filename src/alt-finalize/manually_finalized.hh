#pragma once

#include <alt-finalize/finalizer.hh>
#include <alt-finalize/fwd.hh>
#include <alt-finalize/utility.hh>

#include <type_traits>

/// Holds exactly one T whose destructor is never run automatically
/// The slot starts the lifetime of its value on construction and then forgets about it:
///   - ~manually_finalized() does nothing to the value
///   - destroy() runs ~T() explicitly
///   - take() moves the value out, the moved-from remnant is forgotten (no ~T())
/// There is no "empty" tracking. After destroy() or take(), the slot must not be accessed, destroyed,
/// taken or copied again (undefined behavior, unchecked). The owner is responsible for that bookkeeping,
/// see af::finalize_guard for an owner that does it.
///
/// Copying a slot copy-constructs an independent value into the new slot.
/// Moving a slot move-constructs the value into the new slot; the source keeps the moved-from value
/// (still alive, still never destroyed automatically).
/// Assignment is deleted: overwriting a slot would have to decide what happens to the old value.
template <class T>
struct af::manually_finalized
{
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "manually_finalized requires a non-array object type");
    static_assert(std::is_destructible_v<T>, "T must be destructible (destroy() and take() need ~T())");

    // construction
public:
    /// Perfect-forwards value into the slot
    template <class U = T>
        requires(!std::is_same_v<std::remove_cvref_t<U>, manually_finalized> && std::is_constructible_v<T, U &&>)
    explicit manually_finalized(U&& value)
    {
        new (af::placement_new, &_storage.value) T(af::forward<U>(value));
    }

    /// Constructs T in place from args, works for non-movable T
    template <class... Args>
    [[nodiscard]] static manually_finalized create_from(Args&&... args)
    {
        return manually_finalized(in_place_tag{}, af::forward<Args>(args)...);
    }

    manually_finalized(manually_finalized const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        new (af::placement_new, &_storage.value) T(rhs._storage.value);
    }

    manually_finalized(manually_finalized&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires std::is_move_constructible_v<T>
    {
        new (af::placement_new, &_storage.value) T(af::move(rhs._storage.value));
    }

    manually_finalized& operator=(manually_finalized const&) = delete;
    manually_finalized& operator=(manually_finalized&&) = delete;

    /// Intentionally leaves the value alone
    ~manually_finalized() = default;

    // access
public:
    [[nodiscard]] T& value() { return _storage.value; }
    [[nodiscard]] T const& value() const { return _storage.value; }

    [[nodiscard]] T& operator*() { return _storage.value; }
    [[nodiscard]] T const& operator*() const { return _storage.value; }

    [[nodiscard]] T* operator->() { return &_storage.value; }
    [[nodiscard]] T const* operator->() const { return &_storage.value; }

    // explicit lifetime end
public:
    /// Runs ~T() on the contained value
    /// Precondition: value still alive (unchecked)
    void destroy() noexcept(std::is_nothrow_destructible_v<T>) { af::destroy_in_place(_storage.value); }

    /// Moves the contained value out, the moved-from remnant is left in the slot and never destroyed
    /// ~T() therefore runs exactly once for the value, when the returned T goes out of scope.
    /// Precondition: value still alive (unchecked)
    [[nodiscard]] T take()
        requires std::is_move_constructible_v<T>
    {
        return T(af::move(_storage.value));
    }

private:
    struct in_place_tag
    {
    };
    struct uninitialized_tag
    {
    };

    template <class... Args>
    explicit manually_finalized(in_place_tag, Args&&... args)
    {
        new (af::placement_new, &_storage.value) T(af::forward<Args>(args)...);
    }

    // finalize_guard keeps a slot around after its value is gone (extracted or moved from)
    // and refills it on assignment
    explicit manually_finalized(uninitialized_tag) {}

    template <class... Args>
    void emplace(Args&&... args)
    {
        new (af::placement_new, &_storage.value) T(af::forward<Args>(args)...);
    }

    template <class U>
    friend struct af::finalize_guard;

    af::storage_for<T> _storage;
};
