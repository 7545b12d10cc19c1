#pragma once

#include <genid/support/assert.hh>
#include <genid/support/optional.hh>
#include <genid/support/utility.hh>

// Evaluates to the value of a Result, or returns its error from the enclosing function.
#define GENID_TRY(expr)                                                                                                \
    ({                                                                                                                 \
        auto _genid_try = (expr);                                                                                      \
        if (_genid_try.is_error()) {                                                                                   \
            return _genid_try.error();                                                                                 \
        }                                                                                                              \
        _genid_try.value();                                                                                            \
    })

namespace genid {

/**
 * @brief A value of type T, or an error of type E explaining why there is none.
 *
 * Both types must be trivially copyable; E is typically an enum class.
 */
template <typename T, typename E>
class [[nodiscard]] Result {
    static_assert(!is_same<T, E>);
    static_assert(is_trivially_copyable<T> && is_trivially_copyable<E>);

    union {
        T m_value;
        E m_error;
    };
    bool m_is_error;

public:
    constexpr Result(const T &value) : m_value(value), m_is_error(false) {}
    constexpr Result(E error) : m_error(error), m_is_error(true) {}

    constexpr explicit operator bool() const { return !m_is_error; }
    constexpr bool is_error() const { return m_is_error; }

    constexpr const T &value() const {
        GENID_ASSERT(!m_is_error);
        return m_value;
    }
    constexpr E error() const {
        GENID_ASSERT(m_is_error);
        return m_error;
    }
    constexpr Optional<T> to_optional() const { return m_is_error ? Optional<T>() : Optional<T>(m_value); }
};

} // namespace genid
