#pragma once

#include <changefeed/core/result.hpp>
#include <changefeed/fiber/config.hpp>

#include <boost/fiber/buffered_channel.hpp>
#include <boost/fiber/future/future.hpp>
#include <boost/fiber/future/promise.hpp>
#if __has_include(<boost/outcome/experimental/status-code/status-code/generic_code.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <functional>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

CHANGEFEED_FIBER_NAMESPACE_BEGIN

//! \brief A fixed set of threads, each hosting `n_fibers` fibers, which
//! execute submitted tasks in submission order per fiber.
//!
//! Waiting on the result of `run()` suspends only the calling fiber when the
//! caller is itself a fiber, and blocks the calling thread otherwise.
class IoPool final
{
    boost::fibers::buffered_channel<std::function<void()>> channel_{1024};

    std::vector<std::thread> threads_{};

public:
    IoPool(unsigned n_threads, unsigned n_fibers);

    IoPool(IoPool const &) = delete;
    IoPool &operator=(IoPool const &) = delete;

    ~IoPool();

    //! \brief Returns false if the pool has been shut down
    bool submit(std::function<void()> task);

    void shutdown();

    template <class T>
    Result<T> run(std::function<Result<T>()> task)
    {
        // the worker may still be inside set_value() when the waiter wakes, so
        // the promise must outlive this function
        auto promise = std::make_shared<boost::fibers::promise<Result<T>>>();
        auto future = promise->get_future();
        if (!submit([promise, task = std::move(task)] {
                promise->set_value(task());
            })) {
            return outcome::experimental::errc::operation_canceled;
        }
        return future.get();
    }
};

CHANGEFEED_FIBER_NAMESPACE_END
