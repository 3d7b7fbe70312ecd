#include <gtest/gtest.h>
#include "Dispatch/Batch.h"
#include "Support.h"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace nasync::test {
    namespace {
        using dispatch::async_every;
        using dispatch::async_filter;
        using namespace std::chrono_literals;

        asio::awaitable<bool> is_odd_later(const int value) {
            co_await delay(std::chrono::milliseconds(value));
            co_return value % 2 == 1;
        }

        class BatchTest : public ::testing::Test {
        protected:
            asio::io_context context;
        };
    }

    TEST_F(BatchTest, EveryHoldsOnlyWhenAllPredicatesPass) {
        std::optional<bool> all_odd, mixed, empty;
        spawn(context, [&]() -> asio::awaitable<void> {
            std::vector<int> all_odd_items{5, 1, 3};
            all_odd = co_await async_every(std::move(all_odd_items), is_odd_later);
            std::vector<int> mixed_items{1, 4, 3};
            mixed = co_await async_every(std::move(mixed_items), is_odd_later);
            std::vector<int> empty_items{};
            empty = co_await async_every(std::move(empty_items), is_odd_later);
        });

        context.run();
        EXPECT_EQ(all_odd, true);
        EXPECT_EQ(mixed, false);
        EXPECT_EQ(empty, true);
    }

    TEST_F(BatchTest, FilterKeepsPassingItemsInInputOrder) {
        std::vector<int> kept;
        std::vector<std::string> none;
        spawn(context, [&]() -> asio::awaitable<void> {
            std::vector<int> kept_items{5, 1, 4, 2, 3};
            kept = co_await async_filter(std::move(kept_items), is_odd_later);
            std::vector<std::string> none_items{"a", "b"};
            none = co_await async_filter(std::move(none_items),
                                         [](const std::string &) -> asio::awaitable<bool> { co_return false; });
        });

        context.run();
        EXPECT_EQ(kept, (std::vector<int>{5, 1, 3}));
        EXPECT_TRUE(none.empty());
    }

    TEST_F(BatchTest, PredicatesRunConcurrently) {
        auto in_flight = 0;
        auto peak = 0;
        const auto tracked = [&in_flight, &peak](const int value) -> asio::awaitable<bool> {
            peak = std::max(peak, ++in_flight);
            co_await delay(10ms);
            --in_flight;
            co_return value > 0;
        };
        std::optional<bool> result;
        spawn(context, [&]() -> asio::awaitable<void> {
            std::vector<int> items{1, 2, 3, 4, 5, 6};
            result = co_await async_every(std::move(items), tracked);
        });

        const auto start = test_clock::now();
        context.run();
        EXPECT_EQ(result, true);
        EXPECT_EQ(peak, 6);
        EXPECT_LT(since(start), 50ms);
    }

    TEST_F(BatchTest, FirstPredicateFailureFailsTheBatch) {
        std::string message;
        auto completed = false;
        spawn(context, [&]() -> asio::awaitable<void> {
            try {
                std::vector<int> items{1, 2, 3};
                co_await async_filter(std::move(items), [](const int value) -> asio::awaitable<bool> {
                    co_await delay(std::chrono::milliseconds(value));
                    if (value >= 2) throw std::runtime_error("bad item " + std::to_string(value));
                    co_return true;
                });
                completed = true;
            }
            catch (std::runtime_error &e) {
                message = e.what();
            }
        });

        context.run();
        EXPECT_FALSE(completed);
        EXPECT_EQ(message, "bad item 2");
    }
}
