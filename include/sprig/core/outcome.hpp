#pragma once

#include <expected>
#include <type_traits>
#include <utility>

namespace sprig {

/// Success value or failure value.
///
/// A success is constructed from a plain `T`, a failure from
/// `std::unexpected(E)`. Outcomes are never thrown.
template <typename T, typename E>
using Outcome = std::expected<T, E>;

/// Transform the success payload of an outcome; failures pass through unchanged.
template <typename T, typename E, typename F>
[[nodiscard]] auto map(Outcome<T, E>&& outcome, F&& f)
    -> Outcome<std::invoke_result_t<F, T&&>, E> {
    if (!outcome.has_value()) {
        return std::unexpected(std::move(outcome.error()));
    }
    return std::forward<F>(f)(std::move(*outcome));
}

template <typename T, typename E, typename F>
[[nodiscard]] auto map(const Outcome<T, E>& outcome, F&& f)
    -> Outcome<std::invoke_result_t<F, const T&>, E> {
    if (!outcome.has_value()) {
        return std::unexpected(outcome.error());
    }
    return std::forward<F>(f)(*outcome);
}

}  // namespace sprig
