/**
 * @file Result.hpp
 * @brief A success-or-MalformedInput outcome for callers that prefer
 * error values over exceptions.
 *
 * The codecs themselves throw MalformedInput. attempt() converts one
 * codec call into a Result, and andThen() chains further steps so that
 * the first failure short-circuits the rest and is propagated unchanged.
 *
 * Usage:
 *   auto r = attempt([&] { return Int16::read(buf); })
 *       .andThen([](const Decoded<uint16_t>& d) {
 *           return attempt([&] { return Int32::read(d.rest); });
 *       });
 */

#pragma once

#include "Error.hpp"
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace ninep
{
    template <typename T> class Result;

    template <typename T> inline constexpr bool is_result = false;
    template <typename T> inline constexpr bool is_result<Result<T>> = true;

    template <typename T>
    class Result
    {
        static_assert(!std::is_same_v<T, MalformedInput>, "T must not be the error type");
        static_assert(!std::is_void_v<T>, "Result<void> is not supported");

    public:
        using ValueType = T;

        Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
        Result(MalformedInput error) : m_state(std::in_place_index<1>, std::move(error)) {}

        bool ok() const { return m_state.index() == 0; }
        explicit operator bool() const { return ok(); }

        /**
         * @brief Gets the success value.
         * @throws MalformedInput (the stored error) if this is a failure.
         */
        const T& value() const &
        {
            if (!ok()) throw std::get<1>(m_state);
            return std::get<0>(m_state);
        }

        T& value() &
        {
            if (!ok()) throw std::get<1>(m_state);
            return std::get<0>(m_state);
        }

        T&& value() &&
        {
            if (!ok()) throw std::get<1>(m_state);
            return std::get<0>(std::move(m_state));
        }

        /**
         * @brief Gets the failure.
         * @throws std::logic_error if this is a success.
         */
        const MalformedInput& error() const
        {
            if (ok()) throw std::logic_error("Result::error() called on a success");
            return std::get<1>(m_state);
        }

        /**
         * @brief Runs f on the success value, or propagates the failure.
         * @param f A callable taking the value and returning a Result<U>.
         */
        template <typename F>
        auto andThen(F&& f) const & -> std::invoke_result_t<F, const T&>
        {
            using R = std::invoke_result_t<F, const T&>;
            static_assert(is_result<R>, "andThen continuation must return a Result");
            if (!ok()) return R(std::get<1>(m_state));
            return std::invoke(std::forward<F>(f), std::get<0>(m_state));
        }

        template <typename F>
        auto andThen(F&& f) && -> std::invoke_result_t<F, T&&>
        {
            using R = std::invoke_result_t<F, T&&>;
            static_assert(is_result<R>, "andThen continuation must return a Result");
            if (!ok()) return R(std::get<1>(std::move(m_state)));
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(m_state)));
        }

    private:
        std::variant<T, MalformedInput> m_state;
    };

    /**
     * @brief Runs a throwing codec call and captures MalformedInput.
     *
     * Any other exception type passes through untouched.
     */
    template <typename F>
    auto attempt(F&& f) -> Result<std::invoke_result_t<F>>
    {
        try
        {
            return std::invoke(std::forward<F>(f));
        }
        catch (const MalformedInput& e)
        {
            return e;
        }
    }

} // namespace ninep
