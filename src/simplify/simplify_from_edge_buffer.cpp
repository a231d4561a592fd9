#include "simplification.h"

#include <algorithm>
#include <iterator>
#include <limits>

namespace ForTS {

namespace {

constexpr std::size_t NOT_FOUND = std::numeric_limits<std::size_t>::max();

// Run [start, stop) of a founder's edges in the pre-existing edge table.
// start == stop == NOT_FOUND if the founder has none.
struct ParentLocation {
    IdType parent;
    std::size_t start;
    std::size_t stop;

    ParentLocation(IdType p, std::size_t start_, std::size_t stop_)
        : parent(p), start(start_), stop(stop_) {
    }
};

Time node_time(const TableCollection& tables, IdType id)
{
    return tables.node(id).time;
}

std::vector<ParentLocation> find_pre_existing_edges(const TableCollection& tables,
                                                    const std::vector<IdType>& edge_buffer_founder_nodes,
                                                    const EdgeBuffer& edge_buffer)
{
    std::vector<IdType> alive_with_new_edges;
    for (const auto a : edge_buffer_founder_nodes) {
        // founders past the end of the buffer have no buffered births
        if (a >= 0 && static_cast<std::size_t>(a) >= edge_buffer.len()) {
            continue;
        }
        if (edge_buffer.head(a) != EdgeBuffer::null()) {
            alive_with_new_edges.push_back(a);
        }
    }
    if (alive_with_new_edges.empty()) {
        return {};
    }

    std::vector<std::size_t> starts(tables.num_nodes(), NOT_FOUND);
    std::vector<std::size_t> stops(tables.num_nodes(), NOT_FOUND);
    const auto& edges = tables.edges();
    for (std::size_t i = 0; i < edges.size(); ++i) {
        const IdType parent = edges[i].parent;
        tables.check_node_id(parent);
        const auto p = static_cast<std::size_t>(parent);
        if (starts[p] == NOT_FOUND) {
            starts[p] = i;
        }
        stops[p] = i + 1;
    }

    std::vector<ParentLocation> rv;
    rv.reserve(alive_with_new_edges.size());
    for (const auto a : alive_with_new_edges) {
        tables.check_node_id(a);
        rv.emplace_back(a, starts[static_cast<std::size_t>(a)], stops[static_cast<std::size_t>(a)]);
    }

    std::sort(rv.begin(), rv.end(), [&tables](const ParentLocation& a, const ParentLocation& b) {
        const Time ta = node_time(tables, a.parent);
        const Time tb = node_time(tables, b.parent);
        if (ta != tb) {
            return ta > tb;
        }
        if (a.start != b.start) {
            return a.start < b.start;
        }
        return a.parent < b.parent;
    });

    // Only a partial check of the documented sort order: times must not
    // increase and located runs must appear in table order.
    std::size_t last_start = 0;
    for (std::size_t i = 0; i < rv.size(); ++i) {
        if (i > 0 && node_time(tables, rv[i - 1].parent) < node_time(tables, rv[i].parent)) {
            spdlog::error("[find_pre_existing_edges] founder {} out of time order", rv[i].parent);
            throw SimplificationException("existing edges not properly sorted by time");
        }
        if (rv[i].start != NOT_FOUND) {
            if (rv[i].start < last_start) {
                spdlog::error("[find_pre_existing_edges] edges of founder {} start at {}, before {}",
                    rv[i].parent, rv[i].start, last_start);
                throw SimplificationException("existing edges not properly sorted by time");
            }
            last_start = rv[i].start;
        }
    }
    return rv;
}

// Queue, for every birth buffered under `parent`, the child's ancestry.
void process_births_from_buffer(IdType parent, const EdgeBuffer& edge_buffer, SimplificationBuffers& state)
{
    edge_buffer.for_each(parent, [&state](const Segment& seg) {
        queue_children(seg.node, seg.left, seg.right, state.ancestry, state.overlapper);
        return true;
    });
}

} // namespace

void simplify_from_edge_buffer(const SamplesInfo& samples, SimplificationFlags flags, SimplificationBuffers& state,
                               EdgeBuffer& edge_buffer, TableCollection& tables, SimplificationOutput& output)
{
    setup_simplification(samples, tables, flags, state, output);

    const Position maxlen = tables.genome_length();

    Time max_time = std::numeric_limits<Time>::min();
    for (const auto n : samples.edge_buffer_founder_nodes) {
        max_time = std::max(max_time, node_time(tables, n));
    }

    // 1. Parents born after the last simplification: their edges are all in
    //    the buffer.  Newest first.
    std::size_t num_new_parents = 0;
    const auto& heads = edge_buffer.head_itr();
    for (auto itr = heads.rbegin(); itr != heads.rend(); ++itr) {
        if (*itr == EdgeBuffer::null()) {
            continue;
        }
        const auto head = static_cast<IdType>(std::distance(itr, heads.rend()) - 1);
        if (node_time(tables, head) <= max_time) {
            break;
        }
        state.overlapper.clear_queue();
        process_births_from_buffer(head, edge_buffer, state);
        state.overlapper.finalize_queue(maxlen);
        merge_ancestors(tables.nodes(), maxlen, head, state, output.idmap);
        ++num_new_parents;
    }

    // 2. Founders with new births, and where their old edges are.
    const auto existing_edges = find_pre_existing_edges(tables, samples.edge_buffer_founder_nodes, edge_buffer);
    spdlog::debug("[simplify_from_edge_buffer] {} new parents, {} founders with new births",
        num_new_parents, existing_edges.size());
    const auto num_buffered_parents = static_cast<std::size_t>(
        std::count_if(heads.begin(), heads.end(), [](IdType h) { return h != EdgeBuffer::null(); }));
    if (num_buffered_parents != num_new_parents + existing_edges.size()) {
        spdlog::warn("[simplify_from_edge_buffer] {} buffered parents are neither new nor founders; their births are ignored",
            num_buffered_parents - num_new_parents - existing_edges.size());
    }

    // 3. Walk the old edges and the founders together, newest first.
    const auto& edges = tables.edges();
    const std::size_t num_edges = edges.size();
    std::size_t edge_i = 0;

    for (const auto& ex : existing_edges) {
        const Time ex_time = node_time(tables, ex.parent);
        while (edge_i < num_edges && node_time(tables, edges[edge_i].parent) > ex_time) {
            edge_i = process_parent(edges[edge_i].parent, edge_i, tables, state, output);
        }
        if (ex.start != NOT_FOUND) {
            while (edge_i < ex.start && node_time(tables, edges[edge_i].parent) >= ex_time) {
                edge_i = process_parent(edges[edge_i].parent, edge_i, tables, state, output);
            }
        }

        // old and new children of ex.parent go through one sweep
        state.overlapper.clear_queue();
        if (ex.start != NOT_FOUND) {
            if (edge_i > ex.start) {
                spdlog::error("[simplify_from_edge_buffer] edges of parent {} were already consumed", ex.parent);
                throw SimplificationException("Unexpected parent node");
            }
            while (edge_i < ex.stop) {
                const Edge& e = edges[edge_i];
                if (e.parent != ex.parent) {
                    spdlog::error("[simplify_from_edge_buffer] expected parent {} at edge {}, found {}",
                        ex.parent, edge_i, e.parent);
                    throw SimplificationException("Unexpected parent node");
                }
                queue_children(e.child, e.left, e.right, state.ancestry, state.overlapper);
                ++edge_i;
            }
            if (edge_i < num_edges && edges[edge_i].parent == ex.parent) {
                throw SimplificationException("error traversing pre-existing edges for parent");
            }
        }
        process_births_from_buffer(ex.parent, edge_buffer, state);
        state.overlapper.finalize_queue(maxlen);
        merge_ancestors(tables.nodes(), maxlen, ex.parent, state, output.idmap);
    }

    // 4. Whatever is older than the last founder.
    while (edge_i < num_edges) {
        edge_i = process_parent(edges[edge_i].parent, edge_i, tables, state, output);
    }

    spdlog::debug("[simplify_from_edge_buffer] {} nodes / {} edges -> {} nodes / {} edges",
        tables.num_nodes(), num_edges, state.new_nodes.size(), state.new_edges.size());

    // 5. Commit
    tables.replace_nodes_and_edges(state.new_nodes, state.new_edges);
    edge_buffer.reset(tables.num_nodes());
}

} // namespace ForTS
