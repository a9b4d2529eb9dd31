// fine_grained_set.hpp
// Thread-safe ordered set using hand-over-hand (lock coupling) traversal.
// -----------------------------------------------------------
// * Each node owns a std::mutex.  A traversal holds pred and curr; to
//   advance it releases pred, keeps curr (now the new pred) and only then
//   locks curr's successor.  At most two adjacent locks are ever held by
//   a thread, always taken in list order, so no cycle of waiting threads
//   can form, and a traversal blocked on node k holds node k-1 only.
// * A node can only be unlinked by a thread holding both its lock and its
//   predecessor's lock.  Any other traversal resting on (or waiting for)
//   that node must hold one of those two locks, so nobody can observe a
//   half-unlinked node and the remover may delete it after unlinking.
// * Removal is physical: the node is unlinked and freed immediately.
// * Operations on disjoint regions of the list proceed in parallel.

#ifndef SYNCDS_FINE_GRAINED_SET_HPP
#define SYNCDS_FINE_GRAINED_SET_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "list_node.hpp"

namespace syncds
{

    template <typename T, typename Compare = std::less<T>>
    class FineGrainedSet
    {
    public:
        using NodeT = LockedNode<T>;
        using handle = std::shared_ptr<FineGrainedSet>;

        explicit FineGrainedSet(std::size_t capacity_hint = 0, Compare c = Compare{})
            : comp(std::move(c))
        {
            (void)capacity_hint; // lists do not preallocate
            auto h = std::make_unique<NodeT>(Bound::HEAD);
            auto t = std::make_unique<NodeT>(Bound::TAIL);
            h->next = t.release();
            head = h.release();
        }

        static handle make(std::size_t capacity_hint = 0, Compare c = Compare{})
        {
            return std::make_shared<FineGrainedSet>(capacity_hint, std::move(c));
        }

        /*  No thread may hold a handle while the destructor runs, so the
            node locks are not taken here.                                */
        ~FineGrainedSet() { destroy_chain(head); }

        FineGrainedSet(const FineGrainedSet &) = delete;
        FineGrainedSet &operator=(const FineGrainedSet &) = delete;

        // ────────────────────────────────────────────────────────────────────
        //  contains(key)
        //
        //  Couple-traverse to the first node that does not precede `key`,
        //  test equivalence while pred/curr are both still locked, release.
        // ────────────────────────────────────────────────────────────────────
        bool contains(const T &key) const
        {
            Window w = locate(key);
            return holds(w.curr, key, comp);
        }

        // ────────────────────────────────────────────────────────────────────
        //  add(key)
        //
        //  • locate() returns the bracketing pair (pred, curr) with both
        //    locks held: pred precedes key, curr does not.
        //  • If curr already holds the key → false.
        //  • Otherwise allocate the node (may throw; nothing linked yet) and
        //    splice it between pred and curr while both remain locked.  The
        //    write to pred->next is the linearization point.
        // ────────────────────────────────────────────────────────────────────
        bool add(T key)
        {
            Window w = locate(key);
            if (holds(w.curr, key, comp))
                return false;

            NodeT *node = new NodeT(std::move(key));
            node->next = w.curr;
            w.pred->next = node;
            count.fetch_add(1, std::memory_order_relaxed);
            return true;
        }

        // ────────────────────────────────────────────────────────────────────
        //  remove(key)
        //
        //  • locate() leaves pred and curr locked.
        //  • If curr holds the key, redirect pred->next past it (the
        //    linearization point).  The victim is now unreachable; the only
        //    thread that could be waiting for its lock would have to hold
        //    pred's lock, which we own.
        //  • Release the victim's lock, then delete it.
        // ────────────────────────────────────────────────────────────────────
        bool remove(const T &key)
        {
            Window w = locate(key);
            if (!holds(w.curr, key, comp))
                return false;

            NodeT *victim = w.curr;
            w.pred->next = victim->next;
            count.fetch_sub(1, std::memory_order_relaxed);

            w.curr_lock.unlock();
            delete victim;
            return true;
        }

        std::size_t size() const noexcept { return count.load(std::memory_order_relaxed); }

        bool empty() const noexcept { return size() == 0; }

        /*  Ordered copy of the keys gathered by a coupled walk.  Not an
            atomic snapshot: regions already passed may change meanwhile. */
        std::vector<T> snapshot() const
        {
            std::vector<T> out;
            walk([&out](const NodeT *n)
                 { out.push_back(*n->key); return true; });
            return out;
        }

        /*────────────────────────────────────────────────────────────────────
          validate()
          ──────────
          Coupled walk from HEAD to TAIL checking that interior keys are
          strictly increasing.  When called while no writer is active it
          also checks that the interior count equals size().
         ────────────────────────────────────────────────────────────────────*/
        bool validate(bool quiescent = true) const
        {
            const NodeT *prev = nullptr;
            std::size_t seen = 0;
            bool ordered = walk([&](const NodeT *n)
                                {
                if (prev != nullptr && !comp(*prev->key, *n->key))
                    return false;
                prev = n;
                ++seen;
                return true; });
            return ordered && (!quiescent || seen == size());
        }

    private:
        /*────────────────────────────────────────────────────────────────────
          struct Window
          ─────────────
          Result of a coupled search: adjacent nodes pred → curr with both
          locks held.  pred precedes the search key, curr does not (curr may
          be TAIL).  Locks are released when the Window goes out of scope.
         ────────────────────────────────────────────────────────────────────*/
        struct Window
        {
            NodeT *pred;
            NodeT *curr;
            std::unique_lock<std::mutex> pred_lock;
            std::unique_lock<std::mutex> curr_lock;
        };

        Window locate(const T &key) const
        {
            NodeT *pred = head;
            std::unique_lock<std::mutex> pred_lock(pred->lock);

            NodeT *curr = pred->next;
            std::unique_lock<std::mutex> curr_lock(curr->lock);

            // A Compare that throws unwinds both unique_locks; no link has
            // been touched yet.
            while (precedes(curr, key, comp))
            {
                // curr's lock stays held across the step: nobody can unlink
                // curr->next without it, so releasing pred first is safe.
                pred_lock.unlock();
                pred = curr;
                pred_lock = std::move(curr_lock);
                curr = curr->next;
                curr_lock = std::unique_lock<std::mutex>(curr->lock);
            }

            return Window{pred, curr, std::move(pred_lock), std::move(curr_lock)};
        }

        /*  Coupled walk over interior nodes; visit(n) returns false to stop
            early, which makes walk() return false.                         */
        template <typename Visit>
        bool walk(Visit &&visit) const
        {
            std::unique_lock<std::mutex> pred_lock(head->lock);

            const NodeT *curr = head->next;
            std::unique_lock<std::mutex> curr_lock(curr->lock);

            while (curr->bound == Bound::INTERIOR)
            {
                if (!visit(curr))
                    return false;

                pred_lock.unlock();
                pred_lock = std::move(curr_lock);
                curr = curr->next;
                curr_lock = std::unique_lock<std::mutex>(curr->lock);
            }
            return curr->bound == Bound::TAIL && curr->next == nullptr;
        }

        NodeT *head;
        std::atomic<std::size_t> count{0};
        Compare comp;
    };

} // namespace syncds

#endif // SYNCDS_FINE_GRAINED_SET_HPP
