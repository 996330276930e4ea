#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace waypoint::infrastructure::net {

// One io_context per thread; connections are spread over them round-robin.
class IoContextPool {
public:
    // Throws std::invalid_argument when pool_size is 0.
    explicit IoContextPool(std::size_t pool_size);
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void start();

    // Idempotent; joins every thread.
    void stop();

    boost::asio::io_context& next_context();
    std::size_t size() const noexcept;

private:
    using IoContextPtr = std::unique_ptr<boost::asio::io_context>;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    struct ContextEntry {
        IoContextPtr io_context;
        std::unique_ptr<WorkGuard> work_guard;
    };

    std::vector<ContextEntry> contexts_;
    std::vector<std::thread> threads_;
    std::atomic<std::size_t> next_{0};
    std::atomic<bool> running_{false};
};

} // namespace waypoint::infrastructure::net
