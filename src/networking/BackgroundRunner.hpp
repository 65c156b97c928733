#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <utility>

namespace meshirc::networking {

// Runs blocking work (HTTP lookups) off the server thread and posts the
// result back onto the server io_context.
class BackgroundRunner {
public:
    BackgroundRunner(boost::asio::io_context& ioc, std::size_t threads)
        : ioc_(ioc), pool_(threads == 0 ? 1 : threads) {}

    ~BackgroundRunner() { stop(); }

    BackgroundRunner(const BackgroundRunner&) = delete;
    BackgroundRunner& operator=(const BackgroundRunner&) = delete;

    // `work` runs on the pool and must not throw; `done(result)` runs on the
    // io_context. The io_context is kept busy until `done` has been posted.
    template <typename Work, typename Done>
    void submit(Work work, Done done) {
        auto guard = boost::asio::make_work_guard(ioc_);
        boost::asio::post(pool_, [this, guard = std::move(guard), work = std::move(work), done = std::move(done)]() mutable {
            auto result = work();
            boost::asio::post(ioc_, [done = std::move(done), result = std::move(result)]() mutable {
                done(std::move(result));
            });
            guard.reset();
        });
    }

    // Waits for submitted work to finish.
    void stop() { pool_.join(); }

private:
    boost::asio::io_context& ioc_;
    boost::asio::thread_pool pool_;
};

} // namespace meshirc::networking
