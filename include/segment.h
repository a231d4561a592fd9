#ifndef FORTS_SEGMENT_H
#define FORTS_SEGMENT_H

#include "config.hpp"

namespace ForTS {

// Half-open interval [left, right) tied to a node.
// Producers are expected to keep left < right.
struct Segment {
    Position left{ 0 };
    Position right{ 0 };
    IdType node{ NULL_ID };

    Segment() = default;
    Segment(Position l, Position r, IdType n)
        : left{ l }, right{ r }, node{ n } {
    }

    bool overlaps(Position l, Position r) const { return right > l && r > left; }

    bool operator==(const Segment& other) const {
        return left == other.left && right == other.right && node == other.node;
    }
};

} // namespace ForTS

#endif // FORTS_SEGMENT_H
