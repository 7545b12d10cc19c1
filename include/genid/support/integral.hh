#pragma once

#include <genid/support/utility.hh>

namespace genid {
namespace detail {

template <typename T, typename... Candidates>
inline constexpr bool is_any_of = (is_same<T, Candidates> || ...);

} // namespace detail

template <typename T>
inline constexpr bool is_integral =
    detail::is_any_of<T, bool, char, signed char, unsigned char, short, unsigned short, int, unsigned, long,
                      unsigned long, long long, unsigned long long
#ifdef __SIZEOF_INT128__
                      ,
                      __int128, unsigned __int128
#endif
                      >;

template <typename T>
concept Integral = is_integral<T>;

// Every integer type except bool and plain char, whose values aren't really numbers.
template <typename T>
concept NumericIntegral = Integral<T> && !is_same<T, bool> && !is_same<T, char>;

#ifdef __SIZEOF_INT128__
using widest_uint_t = unsigned __int128;
#else
using widest_uint_t = unsigned long long;
#endif

template <Integral T>
inline constexpr bool is_signed = static_cast<T>(-1) < static_cast<T>(0);

template <Integral T>
inline constexpr T integral_max = is_signed<T> ? static_cast<T>(~(static_cast<T>(1) << (sizeof(T) * 8 - 1)))
                                               : static_cast<T>(~static_cast<T>(0));

template <Integral T>
inline constexpr T integral_min = is_signed<T> ? static_cast<T>(-integral_max<T> - 1) : static_cast<T>(0);

/**
 * @brief Returns true if value is representable as a To.
 *
 * Works across any pair of widths and signedness without going through the usual arithmetic conversions, so a
 * negative value never compares equal to a large unsigned one.
 */
template <Integral To, Integral From>
constexpr bool integral_fits(From value) {
    if constexpr (is_signed<From>) {
        if (value < 0) {
            if constexpr (!is_signed<To>) {
                return false;
            } else if constexpr (sizeof(From) <= sizeof(To)) {
                return true;
            } else {
                return value >= static_cast<From>(integral_min<To>);
            }
        }
    }

    // Value is non-negative from here on, so both sides can be widened without changing meaning.
    return static_cast<widest_uint_t>(value) <= static_cast<widest_uint_t>(integral_max<To>);
}

/**
 * @brief True if every value of From is representable as a To.
 */
template <Integral To, Integral From>
inline constexpr bool integral_widens_to =
    integral_fits<To>(integral_min<From>) && integral_fits<To>(integral_max<From>);

} // namespace genid
