#include "waypoint/infrastructure/net/io_context_pool.h"

#include <iostream>
#include <stdexcept>

namespace waypoint::infrastructure::net {

IoContextPool::IoContextPool(std::size_t pool_size) {
    if (pool_size == 0) {
        throw std::invalid_argument("IoContextPool: pool size must be > 0");
    }
    contexts_.reserve(pool_size);

    for (std::size_t i = 0; i < pool_size; ++i) {
        auto io = std::make_unique<boost::asio::io_context>(1);
        auto guard = std::make_unique<WorkGuard>(boost::asio::make_work_guard(*io));
        contexts_.push_back(ContextEntry{std::move(io), std::move(guard)});
    }
}

IoContextPool::~IoContextPool() {
    stop();
}

void IoContextPool::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    threads_.reserve(contexts_.size());
    for (auto& entry : contexts_) {
        threads_.emplace_back([ctx = entry.io_context.get()] {
            // A throwing handler must not take the thread down; keep serving.
            for (;;) {
                try {
                    ctx->run();
                    return;
                } catch (const std::exception& e) {
                    std::cerr << "[IoContextPool] handler threw: " << e.what() << std::endl;
                }
            }
        });
    }
}

void IoContextPool::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    for (auto& entry : contexts_) {
        entry.work_guard.reset();
        entry.io_context->stop();
    }

    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
}

boost::asio::io_context& IoContextPool::next_context() {
    auto index = next_.fetch_add(1, std::memory_order_relaxed);
    return *contexts_[index % contexts_.size()].io_context;
}

std::size_t IoContextPool::size() const noexcept {
    return contexts_.size();
}

} // namespace waypoint::infrastructure::net
