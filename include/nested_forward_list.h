#ifndef FORTS_NESTED_FORWARD_LIST_H
#define FORTS_NESTED_FORWARD_LIST_H

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ForTS {

// === Exceptions ===
class NestedForwardListException : public ForTSException {
public:
    explicit NestedForwardListException(const std::string& message)
        : ForTSException("NestedForwardList: " + message) {}
};

class InvalidIndexException : public NestedForwardListException {
public:
    explicit InvalidIndexException(std::int64_t found)
        : NestedForwardListException("Invalid index: " + std::to_string(found)), found_(found) {}

    std::int64_t found() const noexcept { return found_; }

private:
    std::int64_t found_;
};

class NullTailException : public NestedForwardListException {
public:
    explicit NullTailException(std::int64_t list)
        : NestedForwardListException("Tail is null for list " + std::to_string(list)) {}
};

// -----------------------------------------------------------------------------
// NestedForwardList<Value>
//
// Many independent forward linked lists flattened into four parallel vectors.
// head_[k] / tail_[k] are record indexes of the first and last element of
// list k, next_[r] links record r to the next record of the same list and
// data_[r] owns the value.  null() marks the end of a list and empty lists.
//
// Records are never removed one at a time.  clear() and reset() drop all of
// them; nullify_list() only detaches a list from traversal.
//
// Typical use:
//
//     NestedForwardList<int> l;
//     l.reset(4);              // four empty lists
//     l.extend(2, -1);
//     for (auto n = l.head(2); n != l.null(); n = l.next(n)) { use(l.fetch(n)); }
//     l.for_each(2, [](const int& x) { return x > 0; }); // false stops
//
// All index arguments are bounds checked; a negative index or one past the
// end of the relevant vector throws InvalidIndexException.
// -----------------------------------------------------------------------------
template <typename Value>
class NestedForwardList {
public:
    using IndexType = std::int32_t;
    using value_type = Value;

    NestedForwardList() = default;

    static constexpr IndexType null() noexcept { return -1; }

    // Append v to list k, growing the list of heads if k is new.
    void extend(IndexType k, Value v) {
        check_key(k);
        const auto idx = static_cast<std::size_t>(k);
        if (idx >= head_.size()) {
            head_.resize(idx + 1, null());
            tail_.resize(idx + 1, null());
        }
        if (head_[idx] == null()) {
            insert_new_record(idx, std::move(v));
            return;
        }
        const IndexType t = tail_[idx];
        if (t == null()) {
            throw NullTailException(k);
        }
        data_.push_back(std::move(v));
        next_.push_back(null());
        tail_[idx] = static_cast<IndexType>(data_.size() - 1);
        next_[static_cast<std::size_t>(t)] = tail_[idx];
    }

    const Value& fetch(IndexType at) const {
        check_key(at);
        check_key_range(at, data_.size());
        return data_[static_cast<std::size_t>(at)];
    }

    Value& fetch_mut(IndexType at) {
        check_key(at);
        check_key_range(at, data_.size());
        return data_[static_cast<std::size_t>(at)];
    }

    IndexType head(IndexType at) const {
        check_key(at);
        check_key_range(at, head_.size());
        return head_[static_cast<std::size_t>(at)];
    }

    IndexType tail(IndexType at) const {
        check_key(at);
        check_key_range(at, tail_.size());
        return tail_[static_cast<std::size_t>(at)];
    }

    IndexType next(IndexType at) const {
        check_key(at);
        check_key_range(at, next_.size());
        return next_[static_cast<std::size_t>(at)];
    }

    // Visit list `at` in insertion order.  The visitor takes a const Value&
    // and returns false to stop the traversal early.
    template <typename Visitor>
    void for_each(IndexType at, Visitor&& f) const {
        IndexType itr = head(at);
        while (itr != null()) {
            if (!f(fetch(itr))) {
                break;
            }
            itr = next(itr);
        }
    }

    // Detach list `at` from traversal.  Its records stay in place and are
    // still reachable through fetch().
    // TODO: keep a stack of nullified records so extend() can reuse them.
    void nullify_list(IndexType at) {
        check_key(at);
        check_key_range(at, head_.size());
        check_key_range(at, tail_.size());
        head_[static_cast<std::size_t>(at)] = null();
        tail_[static_cast<std::size_t>(at)] = null();
    }

    // Clears all data.  Capacity is kept.
    void clear() noexcept {
        head_.clear();
        tail_.clear();
        next_.clear();
        data_.clear();
    }

    // Clear, then hold `newsize` empty lists.
    void reset(std::size_t newsize) {
        clear();
        head_.assign(newsize, null());
        tail_.assign(newsize, null());
    }

    const std::vector<IndexType>& head_itr() const noexcept { return head_; }

    std::size_t len() const noexcept { return head_.size(); }
    bool is_empty() const noexcept { return head_.empty(); }

    // Number of stored records, including those of nullified lists.
    std::size_t num_records() const noexcept { return data_.size(); }

private:
    std::vector<IndexType> head_;
    std::vector<IndexType> tail_;
    std::vector<IndexType> next_;
    std::vector<Value> data_;

    void insert_new_record(std::size_t k, Value v) {
        data_.push_back(std::move(v));
        next_.push_back(null());
        head_[k] = static_cast<IndexType>(data_.size() - 1);
        tail_[k] = head_[k];
    }

    static void check_key(IndexType k) {
        if (k < 0) {
            throw InvalidIndexException(k);
        }
    }

    static void check_key_range(IndexType k, std::size_t n) {
        if (static_cast<std::size_t>(k) >= n) {
            throw InvalidIndexException(k);
        }
    }
};

} // namespace ForTS

#endif // FORTS_NESTED_FORWARD_LIST_H
