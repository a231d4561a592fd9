#ifndef FORTS_EDGE_BUFFER_H
#define FORTS_EDGE_BUFFER_H

#include "nested_forward_list.h"
#include "segment.h"

namespace ForTS {

/* ---------- EdgeBuffer ----------
 * Append-only log of births since the last simplification.
 * The list key is the PARENT id and every entry (left, right, node) says
 * that `node` (the child) inherited [left, right) from that parent.
 *
 * A forward simulation appends with
 *     buffer.extend(parent, Segment(left, right, child));
 * and hands the buffer to simplify_from_edge_buffer(), which resets it to
 * the new number of nodes once the tables are committed.
 */
using EdgeBuffer = NestedForwardList<Segment>;

/* ---------- AncestryList ----------
 * Current ancestry of already processed nodes, keyed by input node id.
 * Each entry (left, right, node) maps an interval to the OUTPUT node it is
 * ancestral to.  Only valid for nodes processed earlier in the same pass.
 */
using AncestryList = NestedForwardList<Segment>;

// Convenience wrapper for recording one transmission event.
inline void buffer_birth(EdgeBuffer& buffer, IdType parent, Position left, Position right, IdType child) {
    buffer.extend(parent, Segment(left, right, child));
}

} // namespace ForTS

#endif // FORTS_EDGE_BUFFER_H
