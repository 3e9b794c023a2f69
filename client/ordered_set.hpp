#pragma once

#include <list>
#include <unordered_set>
#include <vector>

/**
 * @brief A set that remembers insertion order.
 *
 * Iteration yields each distinct value once, in the order it was first
 * inserted. Used to collapse repeated access-log lines.
 */
template <typename T, typename Hash = std::hash<T>>
class OrderedSet {
    std::list<T> order_;
    std::unordered_set<T, Hash> seen_;

public:
    using const_iterator = typename std::list<T>::const_iterator;

    OrderedSet() = default;

    template <typename InputIt>
    OrderedSet(InputIt first, InputIt last) {
        for (; first != last; ++first) insert(*first);
    }

    // Returns false when the value was already present.
    bool insert(const T& value) {
        if (!seen_.insert(value).second) {
            return false;
        }
        order_.push_back(value);
        return true;
    }

    bool contains(const T& value) const { return seen_.count(value) != 0; }
    size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    const_iterator begin() const { return order_.begin(); }
    const_iterator end() const { return order_.end(); }

    std::vector<T> to_vector() const { return std::vector<T>(order_.begin(), order_.end()); }
};
