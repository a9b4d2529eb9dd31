#ifndef UTIL_START_GATE_HPP
#define UTIL_START_GATE_HPP

#include <atomic>
#include <thread>

namespace util
{

// Holds worker threads at wait() until the coordinator sees `expected`
// arrivals and opens the gate, so they all start at the same instant.
// Single use.
class start_gate final
{
public:
    void wait()
    {
        ready_.fetch_add(1);
        while (!open_.load(std::memory_order_acquire))
            std::this_thread::yield();
    }

    void open_when(int expected)
    {
        while (ready_.load() < expected)
            std::this_thread::yield();
        open_.store(true, std::memory_order_release);
    }

private:
    std::atomic<int>  ready_{0};
    std::atomic<bool> open_{false};
};

}  // namespace util

#endif  // UTIL_START_GATE_HPP
