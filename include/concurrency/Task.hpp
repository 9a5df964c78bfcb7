#pragma once

#include <exception>
#include <functional>
#include <future>
#include <type_traits>

namespace bob::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

// Runs a callable and reports its result, or the exception it threw, through a future.
template <typename R>
struct PromisedTask : Task {
    std::function<R()> fn;
    std::promise<R> promise;

    explicit PromisedTask(std::function<R()> f) : fn(std::move(f)) {}

    std::future<R> getFuture() { return promise.get_future(); }

    void operator()() override {
        try {
            if constexpr (std::is_void_v<R>) {
                fn();
                promise.set_value();
            } else {
                promise.set_value(fn());
            }
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }
};

}
