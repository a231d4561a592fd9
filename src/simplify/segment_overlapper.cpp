#include "simplification.h"

#include <algorithm>

namespace ForTS {

void SegmentOverlapper::enqueue(Position left, Position right, IdType node)
{
    if (finalized_) {
        // reopen: drop the sentinel
        segment_queue_.pop_back();
        finalized_ = false;
    }
    segment_queue_.emplace_back(left, right, node);
}

void SegmentOverlapper::finalize_queue(Position maxlen)
{
    if (finalized_) {
        segment_queue_.pop_back();
    }
    // Keep the sweep inside [0, maxlen)
    segment_queue_.erase(
        std::remove_if(segment_queue_.begin(), segment_queue_.end(),
            [maxlen](const Segment& s) { return s.left >= maxlen; }),
        segment_queue_.end());
    for (auto& s : segment_queue_) {
        s.right = std::min(s.right, maxlen);
    }
    // ties keep their insertion order
    std::stable_sort(segment_queue_.begin(), segment_queue_.end(),
        [](const Segment& a, const Segment& b) { return a.left < b.left; });
    segment_queue_.emplace_back(maxlen, maxlen, NULL_ID);
    finalized_ = true;
}

void SegmentOverlapper::clear_queue() noexcept
{
    segment_queue_.clear();
    finalized_ = false;
}

std::size_t SegmentOverlapper::queue_size() const noexcept
{
    return finalized_ ? segment_queue_.size() - 1 : segment_queue_.size();
}

void SegmentOverlapper::clear() noexcept
{
    clear_queue();
    overlapping_.clear();
    left_ = 0;
    right_ = 0;
    qbeg_ = 0;
    qend_ = 0;
}

void SegmentOverlapper::initialize()
{
    if (!finalized_) {
        throw SimplificationException("segment queue used before finalize_queue()");
    }
    left_ = 0;
    right_ = 0;
    qbeg_ = 0;
    qend_ = segment_queue_.size() - 1;
    overlapping_.clear();
}

// Drop overlapping segments that end at or before left_ and return the
// smallest right end among the survivors.
Position SegmentOverlapper::set_partition()
{
    Position tright = MAX_POSITION;
    std::size_t b = 0;
    for (std::size_t i = 0; i < overlapping_.size(); ++i) {
        if (overlapping_[i].right > left_) {
            overlapping_[b] = overlapping_[i];
            tright = std::min(tright, overlapping_[b].right);
            ++b;
        }
    }
    overlapping_.resize(b);
    return tright;
}

bool SegmentOverlapper::advance()
{
    if (qbeg_ < qend_) {
        left_ = right_;
        Position tright = set_partition();
        if (num_overlaps() == 0) {
            // gap: jump to the next queued segment
            left_ = segment_queue_[qbeg_].left;
        }
        while (qbeg_ < qend_ && segment_queue_[qbeg_].left == left_) {
            tright = std::min(tright, segment_queue_[qbeg_].right);
            overlapping_.push_back(segment_queue_[qbeg_]);
            ++qbeg_;
        }
        // segment_queue_[qend_] is the sentinel at maxlen
        right_ = std::min(segment_queue_[qbeg_].left, tright);
        return true;
    }

    left_ = right_;
    right_ = MAX_POSITION;
    const Position tright = set_partition();
    if (num_overlaps() > 0) {
        right_ = tright;
        return true;
    }
    return false;
}

} // namespace ForTS
