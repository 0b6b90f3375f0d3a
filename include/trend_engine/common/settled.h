/**
 * Settle-all helpers: run independent tasks and keep each outcome
 */

#pragma once

#include <exception>
#include <future>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace trend_engine {
namespace common {

// Outcome of one task: a value or the message of the exception it threw
template <typename T>
struct Settled {
    std::optional<T> value;
    std::string error;

    bool ok() const { return value.has_value(); }
};

// Run fn, converting anything it throws into a failed outcome
template <typename F>
auto settle(F&& fn) -> Settled<std::invoke_result_t<F>> {
    Settled<std::invoke_result_t<F>> result;
    try {
        result.value.emplace(std::forward<F>(fn)());
    } catch (const std::exception& e) {
        result.error = e.what();
    } catch (...) {
        result.error = "unknown error";
    }
    return result;
}

// Run fn on its own thread; the future never throws
template <typename F>
auto settleAsync(F fn) -> std::future<Settled<std::invoke_result_t<F>>> {
    return std::async(std::launch::async, [fn = std::move(fn)]() mutable {
        return settle(fn);
    });
}

} // namespace common
} // namespace trend_engine
