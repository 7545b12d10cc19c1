#pragma once

#include <genid/support/assert.hh>
#include <genid/support/utility.hh>

#include <stdint.h>

namespace genid {

/**
 * @brief A growable array which owns its elements.
 *
 * Storage doubles when full. Elements are moved, never copied, on growth.
 */
template <typename T>
class Vector {
    T *m_data{nullptr};
    uint32_t m_size{0};
    uint32_t m_capacity{0};

public:
    Vector() = default;
    template <typename It>
    Vector(It first, It last) {
        for (; first != last; ++first) {
            emplace(*first);
        }
    }
    Vector(const Vector &) = delete;
    Vector(Vector &&other)
        : m_data(genid::exchange(other.m_data, nullptr)), m_size(genid::exchange(other.m_size, 0u)),
          m_capacity(genid::exchange(other.m_capacity, 0u)) {}
    ~Vector();

    Vector &operator=(const Vector &) = delete;
    Vector &operator=(Vector &&other);

    void clear();
    void ensure_capacity(uint32_t capacity);
    template <typename Container>
    void extend(const Container &container);

    template <typename... Args>
    T &emplace(Args &&...args);
    void push(const T &value) { emplace(value); }
    void push(T &&value) { emplace(genid::move(value)); }

    T *begin() { return m_data; }
    T *end() { return m_data + m_size; }
    const T *begin() const { return m_data; }
    const T *end() const { return m_data + m_size; }

    T &operator[](uint32_t index) {
        GENID_ASSERT(index < m_size);
        return m_data[index];
    }
    const T &operator[](uint32_t index) const {
        GENID_ASSERT(index < m_size);
        return m_data[index];
    }

    const T *data() const { return m_data; }
    bool empty() const { return m_size == 0; }
    uint32_t size() const { return m_size; }
};

template <typename T>
Vector<T>::~Vector() {
    clear();
    ::operator delete(m_data);
}

template <typename T>
Vector<T> &Vector<T>::operator=(Vector &&other) {
    if (this != &other) {
        clear();
        ::operator delete(m_data);
        m_data = genid::exchange(other.m_data, nullptr);
        m_size = genid::exchange(other.m_size, 0u);
        m_capacity = genid::exchange(other.m_capacity, 0u);
    }
    return *this;
}

template <typename T>
void Vector<T>::clear() {
    while (m_size > 0) {
        m_data[--m_size].~T();
    }
}

template <typename T>
void Vector<T>::ensure_capacity(uint32_t capacity) {
    if (capacity <= m_capacity) {
        return;
    }
    const uint32_t new_capacity = genid::max(capacity, m_capacity * 2);
    auto *new_data = static_cast<T *>(::operator new(sizeof(T) * new_capacity));
    for (uint32_t i = 0; i < m_size; i++) {
        new (new_data + i) T(genid::move(m_data[i]));
        m_data[i].~T();
    }
    ::operator delete(m_data);
    m_data = new_data;
    m_capacity = new_capacity;
}

template <typename T>
template <typename Container>
void Vector<T>::extend(const Container &container) {
    ensure_capacity(m_size + static_cast<uint32_t>(container.end() - container.begin()));
    for (const auto &element : container) {
        new (m_data + m_size++) T(element);
    }
}

template <typename T>
template <typename... Args>
T &Vector<T>::emplace(Args &&...args) {
    if (m_size == m_capacity) {
        ensure_capacity(m_capacity == 0 ? 8 : m_capacity + 1);
    }
    return *new (m_data + m_size++) T(genid::forward<Args>(args)...);
}

} // namespace genid
