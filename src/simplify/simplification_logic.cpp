#include "simplification.h"

#include <algorithm>
#include <tuple>

namespace ForTS {

namespace {

void record_sample_nodes(const std::vector<IdType>& samples, const TableCollection& tables,
                         SimplificationBuffers& state, std::vector<IdType>& idmap)
{
    for (const auto s : samples) {
        if (s == NULL_ID) {
            throw SimplificationException("sample node is NULL_ID");
        }
        if (s < 0 || static_cast<std::size_t>(s) >= tables.num_nodes()) {
            throw SimplificationException("sample node " + std::to_string(s) + " is out of range");
        }
        if (idmap[static_cast<std::size_t>(s)] != NULL_ID) {
            throw SimplificationException("sample node " + std::to_string(s) + " listed more than once");
        }
        const Node& n = tables.node(s);
        const IdType new_id = node_table_add_row(state.new_nodes, n.time, n.deme);
        add_ancestry(s, 0, tables.genome_length(), new_id, state.ancestry);
        idmap[static_cast<std::size_t>(s)] = new_id;
    }
}

// Sort the parent's pending edges by (child, left), join abutting intervals
// for the same child, and append them to the output edge table.
void squash_and_flush_edges(EdgeTable& pending, EdgeTable& new_edges)
{
    if (pending.empty()) {
        return;
    }
    std::sort(pending.begin(), pending.end(), [](const Edge& a, const Edge& b) {
        return std::tie(a.child, a.left) < std::tie(b.child, b.left);
    });
    std::size_t j = 0;
    for (std::size_t k = 1; k < pending.size(); ++k) {
        if (pending[j].child != pending[k].child || pending[k - 1].right != pending[k].left) {
            edge_table_add_row(new_edges, pending[j].left, pending[k - 1].right, pending[j].parent, pending[j].child);
            j = k;
        }
    }
    edge_table_add_row(new_edges, pending[j].left, pending.back().right, pending[j].parent, pending[j].child);
    pending.clear();
}

} // namespace

void validate_edge_table(const TableCollection& tables)
{
    const auto& edges = tables.edges();
    // parents whose run of edges has already ended
    std::vector<bool> closed(tables.num_nodes(), false);

    for (std::size_t i = 0; i < edges.size(); ++i) {
        const Edge& e = edges[i];
        if (e.right <= e.left) {
            throw InvalidLeftRightException(e.left, e.right);
        }
        if (e.left < 0) {
            throw InvalidPositionException(e.left);
        }
        if (e.right > tables.genome_length()) {
            throw InvalidPositionException(e.right);
        }
        const Time ptime = tables.node(e.parent).time;
        if (tables.node(e.child).time <= ptime) {
            throw SimplificationException("child " + std::to_string(e.child) + " is not younger than parent " +
                                          std::to_string(e.parent));
        }
        if (i == 0) {
            continue;
        }
        const Edge& prev = edges[i - 1];
        if (tables.node(prev.parent).time < ptime) {
            throw SimplificationException("edges are not sorted by decreasing parent time");
        }
        if (prev.parent != e.parent) {
            if (closed[static_cast<std::size_t>(e.parent)]) {
                throw SimplificationException("edges of parent " + std::to_string(e.parent) + " are not contiguous");
            }
            closed[static_cast<std::size_t>(prev.parent)] = true;
        }
    }
}

void setup_simplification(const SamplesInfo& samples, const TableCollection& tables, SimplificationFlags flags,
                          SimplificationBuffers& state, SimplificationOutput& output)
{
    if (contains(flags, SimplificationFlags::VALIDATE_EDGES)) {
        validate_edge_table(tables);
    }
    state.clear();
    state.ancestry.reset(tables.num_nodes());
    output.idmap.assign(tables.num_nodes(), NULL_ID);
    record_sample_nodes(samples.samples, tables, state, output.idmap);
}

void queue_children(IdType child, Position left, Position right, const AncestryList& ancestry,
                    SegmentOverlapper& overlapper)
{
    ancestry.for_each(child, [&](const Segment& seg) {
        if (seg.overlaps(left, right)) {
            overlapper.enqueue(std::max(seg.left, left), std::min(seg.right, right), seg.node);
        }
        return true;
    });
}

void add_ancestry(IdType input_id, Position left, Position right, IdType node, AncestryList& ancestry)
{
    if (ancestry.head(input_id) == AncestryList::null()) {
        ancestry.extend(input_id, Segment(left, right, node));
        return;
    }
    Segment& last = ancestry.fetch_mut(ancestry.tail(input_id));
    if (last.right == left && last.node == node) {
        last.right = right;
    }
    else {
        ancestry.extend(input_id, Segment(left, right, node));
    }
}

void merge_ancestors(const NodeTable& input_nodes, Position maxlen, IdType parent_input_node,
                     SimplificationBuffers& state, std::vector<IdType>& idmap)
{
    if (parent_input_node < 0 || static_cast<std::size_t>(parent_input_node) >= idmap.size()
        || static_cast<std::size_t>(parent_input_node) >= input_nodes.size()) {
        throw InvalidNodeValueException(parent_input_node);
    }
    const auto p = static_cast<std::size_t>(parent_input_node);
    IdType output_id = idmap[p];
    const bool is_sample = output_id != NULL_ID;
    if (is_sample) {
        // recomputed below, gaps included
        state.ancestry.nullify_list(parent_input_node);
    }

    auto& overlapper = state.overlapper;
    Position previous_right = 0;
    overlapper.initialize();
    state.temp_edge_buffer.clear();

    while (overlapper.advance()) {
        const Position left = overlapper.get_left();
        const Position right = overlapper.get_right();
        IdType ancestry_node = NULL_ID;

        if (overlapper.num_overlaps() == 1) {
            ancestry_node = overlapper.overlap(0).node;
            if (is_sample) {
                edge_table_add_row(state.temp_edge_buffer, left, right, output_id, ancestry_node);
                ancestry_node = output_id;
            }
        }
        else {
            if (output_id == NULL_ID) {
                const Node& n = input_nodes[p];
                output_id = node_table_add_row(state.new_nodes, n.time, n.deme);
                idmap[p] = output_id;
                spdlog::trace("[merge_ancestors] input node {} -> output node {}", parent_input_node, output_id);
            }
            for (std::size_t i = 0; i < overlapper.num_overlaps(); ++i) {
                edge_table_add_row(state.temp_edge_buffer, left, right, output_id, overlapper.overlap(i).node);
            }
            ancestry_node = output_id;
        }

        if (is_sample && left != previous_right) {
            add_ancestry(parent_input_node, previous_right, left, output_id, state.ancestry);
        }
        add_ancestry(parent_input_node, left, right, ancestry_node, state.ancestry);
        previous_right = right;
    }

    if (is_sample && previous_right != maxlen) {
        add_ancestry(parent_input_node, previous_right, maxlen, output_id, state.ancestry);
    }

    squash_and_flush_edges(state.temp_edge_buffer, state.new_edges);
}

std::size_t process_parent(IdType u, std::size_t edge_index, const TableCollection& tables,
                           SimplificationBuffers& state, SimplificationOutput& output)
{
    const auto& edges = tables.edges();
    state.overlapper.clear_queue();
    while (edge_index < edges.size() && edges[edge_index].parent == u) {
        const Edge& e = edges[edge_index];
        queue_children(e.child, e.left, e.right, state.ancestry, state.overlapper);
        ++edge_index;
    }
    state.overlapper.finalize_queue(tables.genome_length());
    merge_ancestors(tables.nodes(), tables.genome_length(), u, state, output.idmap);
    return edge_index;
}

void simplify_tables(const SamplesInfo& samples, SimplificationFlags flags, SimplificationBuffers& state,
                     TableCollection& tables, SimplificationOutput& output)
{
    setup_simplification(samples, tables, flags, state, output);

    const std::size_t num_edges = tables.num_edges();
    std::size_t edge_i = 0;
    while (edge_i < num_edges) {
        edge_i = process_parent(tables.edges()[edge_i].parent, edge_i, tables, state, output);
    }

    spdlog::debug("[simplify_tables] {} nodes / {} edges -> {} nodes / {} edges",
        tables.num_nodes(), num_edges, state.new_nodes.size(), state.new_edges.size());
    tables.replace_nodes_and_edges(state.new_nodes, state.new_edges);
}

} // namespace ForTS
