#ifndef PARADOX_DATA_RESULT_HPP
#define PARADOX_DATA_RESULT_HPP

#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace paradox_data {

struct Bad_Result_Access : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// @brief Holds either a value of type `T` or an error of type `Error`.
/// `Error` and `T` shall be distinct types so that implicit construction is unambiguous.
template <typename T, typename Error>
struct Result {
private:
    union {
        T m_value;
        Error m_error;
    };
    bool m_has_value;

public:
    [[nodiscard]] constexpr Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        requires std::is_copy_constructible_v<T>
        : m_value(value)
        , m_has_value(true)
    {
    }

    [[nodiscard]] constexpr Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : m_value(std::move(value))
        , m_has_value(true)
    {
    }

    [[nodiscard]] constexpr Result(const Error& error) noexcept(
        std::is_nothrow_copy_constructible_v<Error>)
        : m_error(error)
        , m_has_value(false)
    {
    }

    [[nodiscard]] constexpr Result(Error&& error) noexcept(
        std::is_nothrow_move_constructible_v<Error>)
        : m_error(std::move(error))
        , m_has_value(false)
    {
    }

    [[nodiscard]] constexpr Result(const Result& other)
        requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<Error>)
        : m_has_value(other.m_has_value)
    {
        if (other.m_has_value) {
            std::construct_at(std::addressof(m_value), other.m_value);
        }
        else {
            std::construct_at(std::addressof(m_error), other.m_error);
        }
    }

    [[nodiscard]] constexpr Result(Result&& other) noexcept(
        std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<Error>)
        : m_has_value(other.m_has_value)
    {
        if (other.m_has_value) {
            std::construct_at(std::addressof(m_value), std::move(other.m_value));
        }
        else {
            std::construct_at(std::addressof(m_error), std::move(other.m_error));
        }
    }

    constexpr Result& operator=(Result&& other)
    {
        if (this == &other) {
            // do nothing
        }
        else if (m_has_value && other.m_has_value) {
            m_value = std::move(other.m_value);
        }
        else if (!m_has_value && !other.m_has_value) {
            m_error = std::move(other.m_error);
        }
        else {
            this->~Result();
            std::construct_at(this, std::move(other));
        }
        return *this;
    }

    constexpr ~Result()
    {
        if (m_has_value) {
            std::destroy_at(std::addressof(m_value));
        }
        else {
            std::destroy_at(std::addressof(m_error));
        }
    }

    [[nodiscard]] constexpr bool has_value() const noexcept
    {
        return m_has_value;
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept
    {
        return m_has_value;
    }

    [[nodiscard]] constexpr const T* operator->() const
    {
        return std::addressof(value());
    }

    [[nodiscard]] constexpr T* operator->()
    {
        return std::addressof(value());
    }

    [[nodiscard]] constexpr const T& operator*() const&
    {
        return value();
    }

    [[nodiscard]] constexpr T& operator*() &
    {
        return value();
    }

    [[nodiscard]] constexpr T&& operator*() &&
    {
        return std::move(value());
    }

    [[nodiscard]] constexpr const T& value() const&
    {
        if (!m_has_value) {
            throw Bad_Result_Access { "bad result access in value()" };
        }
        return m_value;
    }

    [[nodiscard]] constexpr T& value() &
    {
        if (!m_has_value) {
            throw Bad_Result_Access { "bad result access in value()" };
        }
        return m_value;
    }

    [[nodiscard]] constexpr T&& value() &&
    {
        if (!m_has_value) {
            throw Bad_Result_Access { "bad result access in value()" };
        }
        return std::move(m_value);
    }

    [[nodiscard]] constexpr const Error& error() const&
    {
        if (m_has_value) {
            throw Bad_Result_Access { "bad result access in error()" };
        }
        return m_error;
    }

    [[nodiscard]] constexpr Error& error() &
    {
        if (m_has_value) {
            throw Bad_Result_Access { "bad result access in error()" };
        }
        return m_error;
    }
};

} // namespace paradox_data

#endif
