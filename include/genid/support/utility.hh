#pragma once

#include <new> // IWYU pragma: export

#if defined(__clang__)
#define GENID_GLOBAL(...)                                                                                              \
    _Pragma("clang diagnostic push") _Pragma("clang diagnostic ignored \"-Wglobal-constructors\"")                    \
        _Pragma("clang diagnostic ignored \"-Wexit-time-destructors\"") __VA_ARGS__ _Pragma("clang diagnostic pop")
#else
#define GENID_GLOBAL(...) __VA_ARGS__
#endif

namespace genid {
namespace detail {

template <typename T>
struct StripReference {
    using type = T;
};
template <typename T>
struct StripReference<T &> {
    using type = T;
};
template <typename T>
struct StripReference<T &&> {
    using type = T;
};

} // namespace detail

template <typename T>
using remove_ref = typename detail::StripReference<T>::type;

template <typename T, typename U>
inline constexpr bool is_same = __is_same(T, U);

template <typename T>
inline constexpr bool is_trivially_copyable = __is_trivially_copyable(T);

template <typename T>
constexpr remove_ref<T> &&move(T &&value) {
    return static_cast<remove_ref<T> &&>(value);
}

template <typename T>
constexpr T &&forward(remove_ref<T> &value) {
    return static_cast<T &&>(value);
}

template <typename T, typename U>
constexpr T exchange(T &target, U &&replacement) {
    T previous = genid::move(target);
    target = genid::forward<U>(replacement);
    return previous;
}

template <typename T>
constexpr const T &min(const T &a, const T &b) {
    return b < a ? b : a;
}

template <typename T>
constexpr const T &max(const T &a, const T &b) {
    return a < b ? b : a;
}

} // namespace genid
