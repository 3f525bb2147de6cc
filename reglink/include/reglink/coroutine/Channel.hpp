#pragma once

#include "Context.hpp"
#include "Task.hpp"

#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace reglink::coro
{
    namespace detail
    {
        template<typename T>
        struct ChannelAwaiter;
    }

    /**
     * Typed multi-producer queue. Consumers co_await next() and receive
     * std::nullopt once the channel is closed and drained.
     */
    template<typename T>
    class Channel
    {
      public:
        Channel()
          : m_state(std::make_shared<State>())
        {
        }

        auto push(T value) -> void
        {
            std::unique_lock lock(m_state->mutex);
            if (m_state->closed) {
                return;
            }

            if (m_state->waiters.empty()) {
                m_state->queue.push_back(std::move(value));
                return;
            }

            auto waiter{ std::move(m_state->waiters.front()) };
            m_state->waiters.pop_front();
            *waiter.dest = std::move(value);

            lock.unlock();
            resume(waiter);
        }

        auto close() -> void
        {
            std::list<Waiter> toResume;
            {
                std::lock_guard lock(m_state->mutex);
                if (m_state->closed) {
                    return;
                }
                m_state->closed = true;
                toResume = std::move(m_state->waiters);
            }

            for (auto& waiter : toResume) {
                resume(waiter);
            }
        }

        auto next() -> detail::ChannelAwaiter<T> { return detail::ChannelAwaiter<T>{ m_state }; }

      private:
        struct Waiter
        {
            std::coroutine_handle<> handle;
            IExecutor* executor{ nullptr };
            std::weak_ptr<void> lifeToken;
            std::optional<T>* dest{ nullptr };
        };

        struct State
        {
            std::mutex mutex;
            std::deque<T> queue;
            std::list<Waiter> waiters;
            bool closed{ false };
        };

        static auto resume(Waiter& waiter) -> void
        {
            if (waiter.executor) {
                if (auto token = waiter.lifeToken.lock()) {
                    waiter.executor->schedule(waiter.handle);
                }
            }
            else {
                waiter.handle.resume();
            }
        }

        std::shared_ptr<State> m_state;

        friend struct detail::ChannelAwaiter<T>;
    };

    namespace detail
    {
        template<typename T>
        struct ChannelAwaiter
        {
            using State = typename Channel<T>::State;

            std::shared_ptr<State> state;
            std::optional<T> result{};

            auto await_ready() -> bool
            {
                std::lock_guard lock(state->mutex);
                if (!state->queue.empty()) {
                    result = std::move(state->queue.front());
                    state->queue.pop_front();
                    return true;
                }
                return state->closed;
            }

            template<typename P>
            auto await_suspend(std::coroutine_handle<P> handle) -> bool
            {
                std::lock_guard lock(state->mutex);

                // a push may have landed between await_ready and here
                if (!state->queue.empty()) {
                    result = std::move(state->queue.front());
                    state->queue.pop_front();
                    return false;
                }
                if (state->closed) {
                    return false;
                }

                typename Channel<T>::Waiter waiter{ handle, nullptr, {}, &result };
                if constexpr (requires { handle.promise().executor; }) {
                    waiter.executor = handle.promise().executor;
                    if (waiter.executor) {
                        waiter.lifeToken = waiter.executor->getLifeToken();
                    }
                }
                state->waiters.push_back(std::move(waiter));
                return true;
            }

            auto await_resume() -> std::optional<T> { return std::move(result); }
        };
    }
}
