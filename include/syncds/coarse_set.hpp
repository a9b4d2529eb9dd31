// coarse_set.hpp
// Thread-safe ordered set: sorted singly linked list behind ONE mutex.
// -----------------------------------------------------------
// * Every operation (add / remove / contains and the introspection
//   helpers) takes the list-wide mutex for its whole duration, so all
//   operations are fully serialised.  The lock acquisition is the
//   linearization point.
// * The list is bounded by HEAD / TAIL sentinels (see list_node.hpp).
// * Critical sections modify links only after every call that may throw
//   (Compare, key move, node allocation) has completed, so an exception
//   leaves the set unmodified and the mutex released.

#ifndef SYNCDS_COARSE_SET_HPP
#define SYNCDS_COARSE_SET_HPP

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
    class CoarseSet
    {
    public:
        using NodeT = ListNode<T>;
        using handle = std::shared_ptr<CoarseSet>;

        /*───────────────────────────────────────────────────────────────────────
          Constructor
          ───────────
          • Allocates the HEAD / TAIL sentinels and links them.
          • capacity_hint is accepted for parity with the maps; a linked
            list has nothing to preallocate.
         ──────────────────────────────────────────────────────────────────────*/
        explicit CoarseSet(std::size_t capacity_hint = 0, Compare c = Compare{})
            : comp(std::move(c))
        {
            (void)capacity_hint;
            auto h = std::make_unique<NodeT>(Bound::HEAD);
            auto t = std::make_unique<NodeT>(Bound::TAIL);
            h->next = t.release();
            head = h.release();
        }

        /*  Shared handle; copies of it may be handed to any number of threads. */
        static handle make(std::size_t capacity_hint = 0, Compare c = Compare{})
        {
            return std::make_shared<CoarseSet>(capacity_hint, std::move(c));
        }

        ~CoarseSet() { destroy_chain(head); }

        CoarseSet(const CoarseSet &) = delete;
        CoarseSet &operator=(const CoarseSet &) = delete;

        // ────────────────────────────────────────────────────────────────────
        //  add(key)
        //  Returns true iff key was absent and has been inserted.
        // ────────────────────────────────────────────────────────────────────
        bool add(T key)
        {
            std::lock_guard<std::mutex> guard(mtx);

            NodeT *pred = locate(key);
            NodeT *curr = pred->next;
            if (holds(curr, key, comp))
                return false;

            NodeT *node = new NodeT(std::move(key)); // may throw: nothing linked yet
            node->next = curr;
            pred->next = node;
            ++count;
            return true;
        }

        // ────────────────────────────────────────────────────────────────────
        //  remove(key)
        //  Returns true iff key was present and has been unlinked.
        // ────────────────────────────────────────────────────────────────────
        bool remove(const T &key)
        {
            std::lock_guard<std::mutex> guard(mtx);

            NodeT *pred = locate(key);
            NodeT *curr = pred->next;
            if (!holds(curr, key, comp))
                return false;

            pred->next = curr->next;
            --count;
            delete curr;
            return true;
        }

        bool contains(const T &key) const
        {
            std::lock_guard<std::mutex> guard(mtx);
            return holds(locate(key)->next, key, comp);
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> guard(mtx);
            return count;
        }

        bool empty() const { return size() == 0; }

        /*  Ordered copy of the current keys (one consistent snapshot). */
        std::vector<T> snapshot() const
        {
            std::lock_guard<std::mutex> guard(mtx);
            std::vector<T> out;
            out.reserve(count);
            for (const NodeT *n = head->next; n->bound == Bound::INTERIOR; n = n->next)
                out.push_back(*n->key);
            return out;
        }

        /*────────────────────────────────────────────────────────────────────
          validate()
          ──────────
          Checks the structural invariants under the list mutex:
            • HEAD first, TAIL last, only INTERIOR nodes in between;
            • interior keys strictly increasing under Compare;
            • number of interior nodes equals the cached size.
         ────────────────────────────────────────────────────────────────────*/
        bool validate() const
        {
            std::lock_guard<std::mutex> guard(mtx);

            if (head == nullptr || head->bound != Bound::HEAD)
                return false;

            std::size_t seen = 0;
            const NodeT *prev = head;
            const NodeT *n = head->next;
            while (n != nullptr && n->bound == Bound::INTERIOR)
            {
                if (prev->bound == Bound::INTERIOR && !comp(*prev->key, *n->key))
                    return false;
                ++seen;
                prev = n;
                n = n->next;
            }
            return n != nullptr && n->bound == Bound::TAIL && n->next == nullptr &&
                   seen == count;
        }

    private:
        /*  Last node that precedes `key`.  Its successor is the first node
            that does not (possibly TAIL).  Caller holds mtx.              */
        NodeT *locate(const T &key) const
        {
            NodeT *pred = head;
            while (precedes(pred->next, key, comp))
                pred = pred->next;
            return pred;
        }

        NodeT *head;
        std::size_t count{0};
        Compare comp;
        mutable std::mutex mtx;
    };

} // namespace syncds

#endif // SYNCDS_COARSE_SET_HPP
