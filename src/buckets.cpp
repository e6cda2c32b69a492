// =============================================================================
// buckets.cpp - MatchingQueue Implementation
// =============================================================================

#include "peerlend/buckets.hpp"
#include "peerlend/math.hpp"

#include <iterator>

namespace peerlend {

uint32_t MatchingQueue::bucket_of(U128 value) {
    uint32_t bit = 0;
    while (value >>= 1) ++bit;
    return bit;
}

U128 MatchingQueue::value_of(const Address& user) const {
    auto it = entries_.find(user);
    return it != entries_.end() ? it->second.value : 0;
}

void MatchingQueue::update(const Address& user, U128 new_value, bool head) {
    auto it = entries_.find(user);

    if (it == entries_.end()) {
        if (new_value == 0) return;
        insert(user, new_value, head);
        return;
    }

    if (new_value == 0) {
        remove(user);
        return;
    }

    Entry& entry = it->second;
    U128 new_total = checked_add(total_ - entry.value, new_value);
    uint32_t new_bucket = bucket_of(new_value);
    if (new_bucket != entry.bucket) {
        remove(user);
        insert(user, new_value, head);
        return;
    }

    total_ = new_total;
    entry.value = new_value;
}

std::optional<Address> MatchingQueue::get_match(U128 amount) const {
    if (buckets_.empty()) return std::nullopt;

    auto next = buckets_.lower_bound(amount == 0 ? 0 : bucket_of(amount));
    if (next != buckets_.end()) {
        return next->second.front();
    }

    // Nothing at or above the amount's bucket: take the largest one below
    return buckets_.rbegin()->second.front();
}

std::vector<Address> MatchingQueue::users() const {
    std::vector<Address> out;
    out.reserve(entries_.size());
    for (auto it = buckets_.rbegin(); it != buckets_.rend(); ++it) {
        for (const auto& user : it->second) {
            out.push_back(user);
        }
    }
    return out;
}

void MatchingQueue::insert(const Address& user, U128 value, bool head) {
    U128 new_total = checked_add(total_, value);
    uint32_t bucket = bucket_of(value);
    Bucket& list = buckets_[bucket];

    Bucket::iterator pos;
    if (head) {
        list.push_front(user);
        pos = list.begin();
    } else {
        list.push_back(user);
        pos = std::prev(list.end());
    }

    total_ = new_total;
    entries_[user] = Entry{value, bucket, pos};
}

void MatchingQueue::remove(const Address& user) {
    auto it = entries_.find(user);
    if (it == entries_.end()) return;

    auto bucket_it = buckets_.find(it->second.bucket);
    bucket_it->second.erase(it->second.pos);
    if (bucket_it->second.empty()) {
        buckets_.erase(bucket_it);
    }

    total_ -= it->second.value;
    entries_.erase(it);
}

} // namespace peerlend
