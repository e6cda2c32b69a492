#ifndef PEERLEND_BUCKETS_HPP
#define PEERLEND_BUCKETS_HPP

#include <list>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace peerlend {

// =============================================================================
// MatchingQueue - Users Bucketed by Balance Magnitude
//
// A value lands in the bucket of its highest set bit. get_match(amount) picks
// the head of the smallest non-empty bucket at or above amount's bucket, so a
// single counterpart is likely to cover the amount; failing that, the head of
// the largest bucket below it. Order inside a bucket is insertion order, with
// head insertion available for users re-queued by the matching engine.
// =============================================================================

class MatchingQueue {
public:
    MatchingQueue() = default;

    // Current value of a user (0 when absent)
    U128 value_of(const Address& user) const;

    // Set a user's value. Zero removes the user. A user whose bucket does not
    // change keeps its place in the queue.
    void update(const Address& user, U128 new_value, bool head);

    // Counterpart selection for an amount; nullopt when the queue is empty
    std::optional<Address> get_match(U128 amount) const;

    bool contains(const Address& user) const { return entries_.count(user) != 0; }
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    // Sum of all values
    U128 total() const { return total_; }

    // Every user, largest bucket first, queue order within a bucket
    std::vector<Address> users() const;

    // Highest set bit of a non-zero value
    static uint32_t bucket_of(U128 value);

private:
    using Bucket = std::list<Address>;

    struct Entry {
        U128 value;
        uint32_t bucket;
        Bucket::iterator pos;
    };

    void insert(const Address& user, U128 value, bool head);
    void remove(const Address& user);

    std::map<uint32_t, Bucket> buckets_;  // only non-empty buckets
    std::unordered_map<Address, Entry, AddressHash> entries_;
    U128 total_ = 0;
};

} // namespace peerlend

#endif // PEERLEND_BUCKETS_HPP
