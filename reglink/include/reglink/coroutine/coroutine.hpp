#pragma once

#include "Channel.hpp"
#include "Context.hpp"
#include "Task.hpp"

#include <functional>

namespace reglink::coro
{
    namespace detail
    {
        template<typename Ex, typename Coro>
        auto co_spawn_impl(Ex& ex, Coro coro) -> DetachedTask
        {
            co_await std::invoke(std::move(coro), ex);
        }

        template<typename T>
        struct SyncResult
        {
            std::optional<T> value;
        };

        template<>
        struct SyncResult<void>
        {
        };
    }

    template<Executor Ex, std::invocable<Ex&> Coro>
    void co_spawn(Ex& ex, Coro&& coro)
    {
        auto detached{ detail::co_spawn_impl(ex, std::forward<Coro>(coro)) };
        ex.schedule(detached.getHandle());
    }

    /**
     * Runs a task to completion on a private Context owned by the calling thread.
     */
    template<typename T>
    auto syncWait(Task<T> task) -> T
    {
        Context ctx;
        detail::SyncResult<T> result;
        std::exception_ptr error;

        co_spawn(ctx, [&](IExecutor& ex) -> Task<void> {
            try {
                if constexpr (std::is_void_v<T>) {
                    co_await std::move(task);
                }
                else {
                    result.value.emplace(co_await std::move(task));
                }
            } catch (...) {
                error = std::current_exception();
            }
            ex.stop();
        });
        ctx.run();

        if (error) {
            std::rethrow_exception(error);
        }
        if constexpr (!std::is_void_v<T>) {
            return std::move(*result.value);
        }
    }
}
