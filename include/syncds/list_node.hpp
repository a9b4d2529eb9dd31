// list_node.hpp
// Link elements shared by the list-based sets (coarse and fine-grained).
// -----------------------------------------------------------
// * Every list is bounded by two permanent sentinels: HEAD orders before
//   every key and TAIL after every key.  Traversal therefore never needs
//   a null successor check and never compares against a missing key.
// * A node owns its successor through a raw pointer.  Ownership moves to
//   the removing operation at unlink time; that operation deletes it.

#ifndef SYNCDS_LIST_NODE_HPP
#define SYNCDS_LIST_NODE_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace syncds
{

    /*-------------------------------------------------------------------------
     *  enum Bound
     *-------------------------------------------------------------------------
     *  Position class of a node inside a list.  Only INTERIOR nodes carry a
     *  key; HEAD and TAIL act as -inf / +inf for every comparison.
     *-------------------------------------------------------------------------*/
    enum class Bound : uint8_t
    {
        HEAD,
        INTERIOR,
        TAIL
    };

    /*-------------------------------------------------------------------------
     *  struct ListNode<T>
     *-------------------------------------------------------------------------
     *  key    - engaged on INTERIOR nodes only, so T needs no default value.
     *  bound  - HEAD / INTERIOR / TAIL.
     *  next   - owning successor link; nullptr only on TAIL.
     *
     *  Used by CoarseSet, where a single list-wide mutex protects all links.
     *-------------------------------------------------------------------------*/
    template <typename T>
    struct ListNode
    {
        std::optional<T> key;
        Bound bound;
        ListNode *next{nullptr};

        explicit ListNode(Bound b) noexcept : bound(b) {}
        explicit ListNode(T k) : key(std::move(k)), bound(Bound::INTERIOR) {}
    };

    /*-------------------------------------------------------------------------
     *  struct LockedNode<T>
     *-------------------------------------------------------------------------
     *  Same shape as ListNode plus a per-node mutex.  The mutex protects the
     *  node's `next` field; a node's key never changes after construction.
     *
     *  Used by FineGrainedSet for hand-over-hand (lock coupling) traversal.
     *-------------------------------------------------------------------------*/
    template <typename T>
    struct LockedNode
    {
        std::optional<T> key;
        Bound bound;
        LockedNode *next{nullptr};

        mutable std::mutex lock; // guards `next`

        explicit LockedNode(Bound b) noexcept : bound(b) {}
        explicit LockedNode(T k) : key(std::move(k)), bound(Bound::INTERIOR) {}
    };

    /*  precedes(n, k): does node n order strictly before key k?
        HEAD precedes everything, TAIL precedes nothing.               */
    template <typename Node, typename T, typename Compare>
    inline bool precedes(const Node *n, const T &k, const Compare &comp)
    {
        switch (n->bound)
        {
        case Bound::HEAD:
            return true;
        case Bound::TAIL:
            return false;
        default:
            return comp(*n->key, k);
        }
    }

    /*  holds(n, k): n is an INTERIOR node equivalent to k.
        Only called on the first node that does not precede k, so
        !comp(n->key, k) is already known and one comparison remains.  */
    template <typename Node, typename T, typename Compare>
    inline bool holds(const Node *n, const T &k, const Compare &comp)
    {
        return n->bound == Bound::INTERIOR && !comp(k, *n->key);
    }

    /*  Delete every node reachable from `head`, sentinels included.
        Only for destructors: no other thread may reference the list.  */
    template <typename Node>
    void destroy_chain(Node *head) noexcept
    {
        while (head != nullptr)
        {
            Node *next = head->next;
            delete head;
            head = next;
        }
    }

} // namespace syncds

#endif // SYNCDS_LIST_NODE_HPP
