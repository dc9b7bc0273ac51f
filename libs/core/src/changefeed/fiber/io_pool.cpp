#include <changefeed/core/assert.h>
#include <changefeed/fiber/config.hpp>
#include <changefeed/fiber/io_pool.hpp>

#include <boost/fiber/channel_op_status.hpp>
#include <boost/fiber/fiber.hpp>
#include <boost/fiber/operations.hpp>

#include <cstdio>
#include <functional>
#include <thread>
#include <utility>
#include <vector>

#include <pthread.h>

CHANGEFEED_FIBER_NAMESPACE_BEGIN

IoPool::IoPool(unsigned const n_threads, unsigned const n_fibers)
{
    CHANGEFEED_ASSERT(n_threads > 0);
    CHANGEFEED_ASSERT(n_fibers > 0);

    threads_.reserve(n_threads);
    for (unsigned i = 0; i < n_threads; ++i) {
        threads_.emplace_back([this, i, n_fibers] {
            char name[16];
            std::snprintf(name, sizeof name, "io_%02u", i);
            pthread_setname_np(pthread_self(), name);

            std::vector<boost::fibers::fiber> fibers;
            fibers.reserve(n_fibers);
            for (unsigned j = 0; j < n_fibers; ++j) {
                fibers.emplace_back([this] {
                    std::function<void()> task;
                    while (channel_.pop(task) ==
                           boost::fibers::channel_op_status::success) {
                        task();
                    }
                });
            }
            for (auto &fiber : fibers) {
                fiber.join();
            }
        });
    }
}

IoPool::~IoPool()
{
    shutdown();
}

bool IoPool::submit(std::function<void()> task)
{
    return channel_.push(std::move(task)) ==
           boost::fibers::channel_op_status::success;
}

void IoPool::shutdown()
{
    channel_.close();
    while (!threads_.empty()) {
        auto &thread = threads_.back();
        thread.join();
        threads_.pop_back();
    }
}

CHANGEFEED_FIBER_NAMESPACE_END
