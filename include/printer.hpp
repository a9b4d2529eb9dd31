#ifndef UTIL_PRINTER_HPP
#define UTIL_PRINTER_HPP

#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>

#include "print.hpp"
#include "thread/affinity.hpp"

namespace util
{

// Asynchronous line printer.  Worker threads format and enqueue; one
// background thread (optionally pinned to a core) writes whole lines, so
// output from many threads never interleaves mid-line.  Lines queued
// before stop() or destruction are always written.
class printer final
{
public:
    inline explicit printer(int core_id = -1);
    inline ~printer() noexcept;

    template <typename... Args>
    void print(const std::string& message, const Args&... args)
    {
        this->push(line{false, detail::format(message, args...)});
    }

    template <typename... Args>
    void error(const std::string& message, const Args&... args)
    {
        this->push(line{true, detail::format(message, args...)});
    }

    // Drains the queue and joins the background thread.  Idempotent.
    inline void stop() noexcept;

    printer(const printer&)            = delete;
    printer(printer&&)                 = delete;
    printer& operator=(const printer&) = delete;
    printer& operator=(printer&&)      = delete;

private:
    struct line
    {
        bool        to_stderr;
        std::string text;
    };

    void push(line value)
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            queue_.push(std::move(value));
        }
        cv_.notify_one();
    }

    inline void flush();

    std::queue<line>        queue_;
    std::mutex              queue_mutex_;
    std::condition_variable cv_;
    bool                    running_;  // guarded by queue_mutex_
    std::thread             printer_thread_;
};

printer::printer(int core_id)
    : running_(true)
{
    this->printer_thread_ = std::thread([this, core_id]
    {
        if (core_id >= 0)
        {
            [[maybe_unused]] bool pinned = use_core(core_id);
        }
        this->flush();
    });
}

printer::~printer() noexcept
{
    this->stop();
}

void printer::stop() noexcept
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        this->running_ = false;
    }
    cv_.notify_one();
    if (this->printer_thread_.joinable()) this->printer_thread_.join();
}

void printer::flush()
{
    std::unique_lock<std::mutex> lock(this->queue_mutex_);
    for (;;)
    {
        cv_.wait(lock, [this] { return !queue_.empty() || !this->running_; });

        while (!this->queue_.empty())
        {
            line content = std::move(this->queue_.front());
            this->queue_.pop();

            lock.unlock();
            (content.to_stderr ? std::cerr : std::cout) << content.text << '\n';
            lock.lock();
        }

        if (!this->running_)
        {
            std::cout.flush();
            return;
        }
    }
}

}  // namespace util

#endif  // UTIL_PRINTER_HPP
