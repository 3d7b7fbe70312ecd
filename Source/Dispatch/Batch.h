#pragma once

#include "Common/Errors.h"
#include "Common/Result.h"
#include <algorithm>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace nasync::dispatch {
    namespace detail {
        struct verdicts {
            std::vector<char> truth;
            std::size_t remaining;
        };

        template <class T, class Pred>
        asio::awaitable<void> judge(Pred pred, T item, std::size_t index, std::shared_ptr<verdicts> state,
                                    result_promise<void> done) {
            std::exception_ptr error;
            try {
                state->truth[index] = static_cast<bool>(co_await std::invoke(pred, std::as_const(item)));
                if (--state->remaining == 0) done.resolve();
                co_return;
            }
            catch (...) {
                error = std::current_exception();
            }
            // the first failure settles the batch, later ones are dropped
            done.reject(std::move(error));
        }

        // Runs pred on every item at once and waits for all verdicts.
        template <class T, class Pred>
        asio::awaitable<std::vector<char>> judge_all(const std::vector<T> &items, Pred pred) {
            if (items.empty()) co_return std::vector<char>{};
            const auto executor = co_await asio::this_coro::executor;
            auto state = std::make_shared<verdicts>(verdicts{std::vector<char>(items.size(), 0), items.size()});
            result_promise<void> done;
            const auto handle = done.handle();
            for (std::size_t i = 0; i < items.size(); ++i)
                asio::co_spawn(executor, judge(pred, items[i], i, state, done), report_escaped{"batch"});
            co_await handle.get();
            co_return state->truth;
        }
    }

    // True when pred (returning asio::awaitable<bool>) holds for every item.
    // Predicates run concurrently; the first one to throw fails the call.
    template <class T, class Pred>
    asio::awaitable<bool> async_every(std::vector<T> items, Pred pred) {
        const auto truth = co_await detail::judge_all(items, std::move(pred));
        co_return std::all_of(truth.begin(), truth.end(), [](const char passed) { return passed != 0; });
    }

    // Items for which pred holds, in input order. Same concurrency as async_every.
    template <class T, class Pred>
    asio::awaitable<std::vector<T>> async_filter(std::vector<T> items, Pred pred) {
        const auto truth = co_await detail::judge_all(items, std::move(pred));
        std::vector<T> kept;
        for (std::size_t i = 0; i < items.size(); ++i)
            if (truth[i]) kept.push_back(std::move(items[i]));
        co_return kept;
    }
}
