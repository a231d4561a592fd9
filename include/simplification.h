#ifndef FORTS_SIMPLIFICATION_H
#define FORTS_SIMPLIFICATION_H

#include "config.hpp"
#include "edge_buffer.h"
#include "segment.h"
#include "tables.h"

#include <cstddef>
#include <string>
#include <vector>

namespace ForTS {

class SimplificationException : public ForTSException {
public:
    explicit SimplificationException(const std::string& message)
        : ForTSException("Simplification error: " + message) {}
};

// Input description for one simplification pass.
struct SamplesInfo {
    // Nodes whose ancestry is kept.  They become output nodes 0..n-1.
    std::vector<IdType> samples;
    // Nodes that existed at the previous simplification and may have
    // edges both in the tables and in the EdgeBuffer.
    std::vector<IdType> edge_buffer_founder_nodes;
};

struct SimplificationOutput {
    // idmap[input node] is the output node id, or NULL_ID if pruned
    std::vector<IdType> idmap;

    void clear() noexcept { idmap.clear(); }
};

// -----------------------------------------------------------------------------
// SegmentOverlapper
//
// Sweep over the segments queued for one parent.  After finalize_queue() and
// initialize(), each call to advance() moves to the next maximal interval
// [get_left(), get_right()) on which the set of overlapping segments does not
// change, and returns false when the sweep is done.
// -----------------------------------------------------------------------------
class SegmentOverlapper {
public:
    SegmentOverlapper() = default;

    void enqueue(Position left, Position right, IdType node);
    // Stable sort by left and close the queue with a sentinel at maxlen
    void finalize_queue(Position maxlen);
    void clear_queue() noexcept;

    void initialize();
    bool advance();

    std::size_t num_overlaps() const noexcept { return overlapping_.size(); }
    const Segment& overlap(std::size_t i) const { return overlapping_.at(i); }
    Position get_left() const noexcept { return left_; }
    Position get_right() const noexcept { return right_; }

    // Number of segments queued, sentinel excluded
    std::size_t queue_size() const noexcept;

    void clear() noexcept;

private:
    std::vector<Segment> segment_queue_;
    std::vector<Segment> overlapping_;
    Position left_{ 0 };
    Position right_{ 0 };
    std::size_t qbeg_{ 0 };
    std::size_t qend_{ 0 };
    bool finalized_{ false };

    Position set_partition();
};

// Scratch space reused between simplification passes.
struct SimplificationBuffers {
    NodeTable new_nodes;
    EdgeTable new_edges;
    AncestryList ancestry;
    SegmentOverlapper overlapper;
    // Output edges of the parent being merged, before squashing
    EdgeTable temp_edge_buffer;

    void clear() noexcept {
        new_nodes.clear();
        new_edges.clear();
        ancestry.clear();
        overlapper.clear();
        temp_edge_buffer.clear();
    }
};

// === Building blocks shared by the simplifiers ===

// Validate (per flags), clear buffers, seed the sample nodes.
void setup_simplification(const SamplesInfo& samples, const TableCollection& tables, SimplificationFlags flags,
                          SimplificationBuffers& state, SimplificationOutput& output);

// Check edge rows and parent time ordering of an edge table.
void validate_edge_table(const TableCollection& tables);

// Enqueue the parts of child's ancestry that overlap [left, right).
void queue_children(IdType child, Position left, Position right, const AncestryList& ancestry,
                    SegmentOverlapper& overlapper);

// Append (left, right, node) to the ancestry of input_id, joining it with the
// last segment when they abut and map to the same node.
void add_ancestry(IdType input_id, Position left, Position right, IdType node, AncestryList& ancestry);

// Sweep the queued segments of `parent_input_node` and record its output.
void merge_ancestors(const NodeTable& input_nodes, Position maxlen, IdType parent_input_node,
                     SimplificationBuffers& state, std::vector<IdType>& idmap);

// Queue and merge the run of edges of parent u that starts at edge_index.
// Returns the index one past the run.
std::size_t process_parent(IdType u, std::size_t edge_index, const TableCollection& tables,
                           SimplificationBuffers& state, SimplificationOutput& output);

// === Entry points ===

// Simplify a table collection whose edges are sorted for simplification.
void simplify_tables(const SamplesInfo& samples, SimplificationFlags flags, SimplificationBuffers& state,
                     TableCollection& tables, SimplificationOutput& output);

// Simplify the sorted tables together with the births buffered since the
// last simplification.  On return the tables hold the simplified nodes and
// edges and edge_buffer is reset to the new number of nodes.
//
// The buffered edges are not checked for a valid order.  An exception
// leaves tables and edge_buffer in an unspecified state.
void simplify_from_edge_buffer(const SamplesInfo& samples, SimplificationFlags flags, SimplificationBuffers& state,
                               EdgeBuffer& edge_buffer, TableCollection& tables, SimplificationOutput& output);

} // namespace ForTS

#endif // FORTS_SIMPLIFICATION_H
