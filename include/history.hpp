#ifndef UTIL_HISTORY_HPP
#define UTIL_HISTORY_HPP

#include <atomic>
#include <cstdint>
#include <limits>
#include <mutex>
#include <set>
#include <stdexcept>
#include <utility>
#include <vector>

namespace util
{

// One completed call: what was asked, what came back, and the logical
// timestamps taken just before the call and just after it returned.
struct event
{
    int      op;
    int      key;
    int      arg;
    int      result;
    uint64_t invoked;
    uint64_t returned;
};

// Collects events from many threads.  The clock is a single seq_cst
// counter, so returned(a) < invoked(b) means a finished before b started.
class history_recorder final
{
public:
    template <typename Call>
    int call(int op, int key, int arg, Call&& body)
    {
        event e{op, key, arg, 0, tick(), 0};
        e.result   = body();
        e.returned = tick();

        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(e);
        return e.result;
    }

    std::vector<event> events() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    uint64_t tick() { return clock_.fetch_add(1); }

    std::atomic<uint64_t> clock_{0};
    mutable std::mutex    mutex_;
    std::vector<event>    events_;
};

/*-----------------------------------------------------------------------------
 *  linearizable(history, model)
 *-----------------------------------------------------------------------------
 *  Exhaustive search (Wing & Gong with memoisation) for a sequential order
 *  of `history` that respects real-time precedence and in which every
 *  event's result matches `model`.  An event may be placed next only if no
 *  other unplaced event returned before it was invoked.
 *
 *  Model interface:
 *      uint64_t initial() const;
 *      bool     apply(uint64_t& state, const event& e) const;
 *
 *  Histories are limited to 64 events.
 *---------------------------------------------------------------------------*/
template <typename Model>
class linearizability_checker final
{
public:
    linearizability_checker(std::vector<event> history, Model model)
        : history_(std::move(history)), model_(std::move(model))
    {
        if (history_.size() > 64)
            throw std::length_error("linearizability_checker: at most 64 events");
        full_ = history_.size() == 64 ? ~uint64_t{0}
                                      : (uint64_t{1} << history_.size()) - 1;
    }

    bool check() { return search(0, model_.initial()); }

private:
    bool search(uint64_t placed, uint64_t state)
    {
        if (placed == full_)
            return true;
        if (!visited_.emplace(placed, state).second)
            return false;

        uint64_t horizon = std::numeric_limits<uint64_t>::max();
        for (size_t i = 0; i < history_.size(); ++i)
            if (!(placed & (uint64_t{1} << i)) && history_[i].returned < horizon)
                horizon = history_[i].returned;

        for (size_t i = 0; i < history_.size(); ++i)
        {
            const uint64_t bit = uint64_t{1} << i;
            if ((placed & bit) || history_[i].invoked > horizon)
                continue;

            uint64_t next = state;
            if (model_.apply(next, history_[i]) && search(placed | bit, next))
                return true;
        }
        return false;
    }

    std::vector<event>                       history_;
    Model                                    model_;
    uint64_t                                 full_;
    std::set<std::pair<uint64_t, uint64_t>>  visited_;
};

template <typename Model>
bool linearizable(std::vector<event> history, Model model)
{
    return linearizability_checker<Model>(std::move(history), std::move(model)).check();
}

// Sequential set over keys 0..63: state bit k set <=> k is a member.
// Results are 0 / 1.
struct set_model
{
    enum : int { ADD, REMOVE, CONTAINS };

    uint64_t initial() const { return 0; }

    bool apply(uint64_t& state, const event& e) const
    {
        const uint64_t bit     = uint64_t{1} << e.key;
        const int      present = (state & bit) ? 1 : 0;
        switch (e.op)
        {
        case ADD:
            state |= bit;
            return e.result == 1 - present;
        case REMOVE:
            state &= ~bit;
            return e.result == present;
        default:
            return e.result == present;
        }
    }
};

// Sequential map over keys 0..7 with values 0..254: byte k of the state is
// 0 when k is absent, value + 1 otherwise.  Results are the previous (or
// current, for GET) value, -1 meaning "none".
struct map_model
{
    enum : int { PUT, GET, REMOVE };

    uint64_t initial() const { return 0; }

    bool apply(uint64_t& state, const event& e) const
    {
        const int      shift   = 8 * e.key;
        const int      current = static_cast<int>((state >> shift) & 0xff) - 1;
        const uint64_t cleared = state & ~(uint64_t{0xff} << shift);
        switch (e.op)
        {
        case PUT:
            state = cleared | (static_cast<uint64_t>(e.arg + 1) << shift);
            break;
        case REMOVE:
            state = cleared;
            break;
        default:
            break;
        }
        return e.result == current;
    }
};

}  // namespace util

#endif  // UTIL_HISTORY_HPP
