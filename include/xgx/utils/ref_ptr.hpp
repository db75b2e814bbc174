#pragma once

#include <cassert>
#include <cstddef>

#include <type_traits>
#include <utility>

namespace xgx::utils
{
enum class ref_ptr_acquire_tag
{
};
constexpr static ref_ptr_acquire_tag ref_ptr_acquire{};

enum class ref_ptr_import_tag
{
};
constexpr static ref_ptr_import_tag ref_ptr_import{};

// intrusive reference counting smart pointer
// T needs to provide add_reference() and release() which may be const
template <class T>
class ref_ptr final
{
    template <class U>
    friend class ref_ptr;

public:
    using element_type = T;

    inline ref_ptr() noexcept;
    inline ref_ptr(std::nullptr_t) noexcept;
    // acquires ownership of ptr (-> calls add_reference_impl)
    inline ref_ptr(T *ptr, ref_ptr_acquire_tag) noexcept;
    // imports ownership of an already acquired reference
    inline ref_ptr(T *ptr, ref_ptr_import_tag) noexcept;
    inline ref_ptr(ref_ptr const &other) noexcept;
    inline ref_ptr(ref_ptr &&other) noexcept;
    template <typename U>
        requires std::is_convertible_v<U *, T *>
    inline ref_ptr(ref_ptr<U> const &other) noexcept;
    template <typename U>
        requires std::is_convertible_v<U *, T *>
    inline ref_ptr(ref_ptr<U> &&other) noexcept;
    inline ~ref_ptr() noexcept;

    inline auto operator=(std::nullptr_t) noexcept -> ref_ptr &;
    inline auto operator=(ref_ptr const &other) noexcept -> ref_ptr &;
    inline auto operator=(ref_ptr &&other) noexcept -> ref_ptr &;

    inline explicit operator bool() const noexcept;

    inline auto operator*() const noexcept -> T &;
    inline auto operator->() const noexcept -> T *;

    [[nodiscard]] inline auto get() const noexcept -> T *;
    auto release() noexcept -> T *;

    friend inline void swap(ref_ptr &lhs, ref_ptr &rhs) noexcept
    {
        using std::swap;
        swap(lhs.mPtr, rhs.mPtr);
    }

    friend inline auto operator==(ref_ptr const &lhs,
                                  ref_ptr const &rhs) noexcept -> bool
    {
        return lhs.mPtr == rhs.mPtr;
    }

private:
    void add_reference_impl() noexcept;
    void release_impl() noexcept;

    T *mPtr;
};

template <class T, typename... Args>
inline auto make_ref_counted(Args &&...args) -> ref_ptr<T>
{
    return ref_ptr<T>{new T(std::forward<Args>(args)...), ref_ptr_import};
}

// the reference count is shared, i.e. the returned pointer keeps the
// same object alive
template <class U, class T>
inline auto dynamic_ref_cast(ref_ptr<T> const &ptr) noexcept -> ref_ptr<U>
{
    return ref_ptr<U>{dynamic_cast<U *>(ptr.get()), ref_ptr_acquire};
}

template <class T>
inline ref_ptr<T>::ref_ptr() noexcept
    : mPtr{nullptr}
{
}

template <class T>
inline ref_ptr<T>::ref_ptr(std::nullptr_t) noexcept
    : ref_ptr{}
{
}

template <class T>
inline void ref_ptr<T>::add_reference_impl() noexcept
{
    mPtr->add_reference();
}

template <class T>
inline void ref_ptr<T>::release_impl() noexcept
{
    mPtr->release();
}

template <class T>
inline ref_ptr<T>::ref_ptr(T *ptr, ref_ptr_acquire_tag) noexcept
    : mPtr{ptr}
{
    if (mPtr)
    {
        add_reference_impl();
    }
}

template <class T>
inline ref_ptr<T>::ref_ptr(T *ptr, ref_ptr_import_tag) noexcept
    : mPtr{ptr}
{
}

template <class T>
inline ref_ptr<T>::ref_ptr(ref_ptr const &other) noexcept
    : ref_ptr{other.mPtr, ref_ptr_acquire}
{
}

template <class T>
inline ref_ptr<T>::ref_ptr(ref_ptr &&other) noexcept
    : ref_ptr{std::exchange(other.mPtr, nullptr), ref_ptr_import}
{
}

template <class T>
template <typename U>
    requires std::is_convertible_v<U *, T *>
inline ref_ptr<T>::ref_ptr(ref_ptr<U> const &other) noexcept
    : ref_ptr{other.mPtr, ref_ptr_acquire}
{
}

template <class T>
template <typename U>
    requires std::is_convertible_v<U *, T *>
inline ref_ptr<T>::ref_ptr(ref_ptr<U> &&other) noexcept
    : ref_ptr{other.release(), ref_ptr_import}
{
}

template <class T>
inline ref_ptr<T>::~ref_ptr() noexcept
{
    if (mPtr)
    {
        release_impl();
    }
}

template <class T>
inline auto ref_ptr<T>::operator=(std::nullptr_t) noexcept -> ref_ptr<T> &
{
    if (mPtr)
    {
        release_impl();
    }
    mPtr = nullptr;

    return *this;
}

template <class T>
inline auto ref_ptr<T>::operator=(ref_ptr const &other) noexcept -> ref_ptr<T> &
{
    // acquire first, other may be kept alive by *this only
    ref_ptr acquired{other};
    swap(*this, acquired);

    return *this;
}

template <class T>
inline auto ref_ptr<T>::operator=(ref_ptr &&other) noexcept -> ref_ptr<T> &
{
    ref_ptr moved{std::move(other)};
    swap(*this, moved);

    return *this;
}

template <class T>
inline ref_ptr<T>::operator bool() const noexcept
{
    return mPtr != nullptr;
}

template <class T>
inline auto ref_ptr<T>::operator*() const noexcept -> T &
{
    assert(mPtr);
    return *mPtr;
}

template <class T>
inline auto ref_ptr<T>::operator->() const noexcept -> T *
{
    assert(mPtr);
    return mPtr;
}

template <class T>
inline auto ref_ptr<T>::get() const noexcept -> T *
{
    return mPtr;
}

template <class T>
inline auto ref_ptr<T>::release() noexcept -> T *
{
    return std::exchange(mPtr, nullptr);
}
} // namespace xgx::utils
