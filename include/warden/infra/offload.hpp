#pragma once

#include <type_traits>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace warden::infra {

using boost::asio::awaitable;

/// Runs the blocking callable `fn` on `executor` and resumes the awaiting
/// coroutine with its result. Pass a thread_pool executor to keep blocking
/// filesystem and process calls off the caller's io_context.
///
/// The result type must be default-constructible (co_spawn requirement).
template <typename F>
auto offload(boost::asio::any_io_executor executor, F fn)
    -> awaitable<std::invoke_result_t<F&>> {
    using R = std::invoke_result_t<F&>;
    auto result = co_await boost::asio::co_spawn(
        executor,
        [fn = std::move(fn)]() mutable -> awaitable<R> {
            co_return fn();
        },
        boost::asio::use_awaitable);
    co_return std::move(result);
}

} // namespace warden::infra
