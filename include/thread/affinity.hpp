#ifndef UTIL_AFFINITY_HPP
#define UTIL_AFFINITY_HPP

#include <thread>

#ifdef _WIN32
#include <windows.h>
#elif defined(__linux__)
#include <pthread.h>
#include <sched.h>
#elif defined(__APPLE__)
#include <mach/mach.h>
#include <mach/thread_policy.h>
#include <pthread.h>
#endif

namespace util
{

// Pins the calling thread to core `id`.  Returns false when the id is out
// of range or the platform refuses; the thread keeps running unpinned.
inline bool use_core(int id)
{
    const unsigned cores = std::thread::hardware_concurrency();
    if (id < 0 || (cores != 0 && static_cast<unsigned>(id) >= cores))
        return false;

#ifdef _WIN32
    const DWORD_PTR mask = DWORD_PTR{1} << id;
    return SetThreadAffinityMask(GetCurrentThread(), mask) != 0;
#elif defined(__linux__)
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(id, &cpuset);
    return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0;
#elif defined(__APPLE__)
    thread_affinity_policy_data_t policy = {id + 1};  // tag 0 means "no affinity"
    return thread_policy_set(pthread_mach_thread_np(pthread_self()),
                             THREAD_AFFINITY_POLICY,
                             reinterpret_cast<thread_policy_t>(&policy),
                             THREAD_AFFINITY_POLICY_COUNT) == KERN_SUCCESS;
#else
    return false;
#endif
}

}  // namespace util

#endif  // UTIL_AFFINITY_HPP
