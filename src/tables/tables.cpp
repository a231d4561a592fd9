#include "tables.h"

#include <algorithm>
#include <tuple>

namespace ForTS {

namespace {

void position_non_negative(Position x) {
    if (x < 0) throw InvalidPositionException(x);
}

void node_non_negative(IdType x) {
    if (x < 0) throw InvalidNodeValueException(x);
}

void time_non_negative(Time x) {
    if (x < 0) throw InvalidTimeException(x);
}

void deme_non_negative(Deme x) {
    if (x < 0) throw InvalidDemeException(x);
}

} // namespace

IdType node_table_add_row(NodeTable& nodes, Time time, Deme deme) {
    time_non_negative(time);
    deme_non_negative(deme);
    nodes.push_back(Node{ time, deme });
    return static_cast<IdType>(nodes.size() - 1);
}

std::size_t edge_table_add_row(EdgeTable& edges, Position left, Position right, IdType parent, IdType child) {
    if (right <= left) {
        throw InvalidLeftRightException(left, right);
    }
    position_non_negative(left);
    position_non_negative(right);
    node_non_negative(parent);
    node_non_negative(child);

    edges.push_back(Edge{ left, right, parent, child });
    return edges.size() - 1;
}

std::size_t site_table_add_row(SiteTable& sites, Position position, std::int8_t ancestral_state) {
    position_non_negative(position);
    sites.push_back(Site{ position, ancestral_state });
    return sites.size() - 1;
}

std::size_t mutation_table_add_row(MutationTable& mutations, IdType node, std::size_t key, std::size_t site,
                                   std::int8_t derived_state, bool neutral) {
    node_non_negative(node);
    mutations.push_back(Mutation{ node, key, site, derived_state, neutral });
    return mutations.size() - 1;
}

// ────────────────────────────────────────────
//  TableCollection
// ────────────────────────────────────────────
TableCollection::TableCollection(Position genome_length)
    : length_(genome_length)
{
    if (genome_length < 1) {
        throw InvalidGenomeLengthException(genome_length);
    }
}

IdType TableCollection::add_node(Time time, Deme deme)
{
    return node_table_add_row(nodes_, time, deme);
}

std::size_t TableCollection::add_edge(Position left, Position right, IdType parent, IdType child)
{
    return edge_table_add_row(edges_, left, right, parent, child);
}

std::size_t TableCollection::add_site(Position position, std::int8_t ancestral_state)
{
    if (position >= length_) {
        throw InvalidPositionException(position);
    }
    return site_table_add_row(sites_, position, ancestral_state);
}

std::size_t TableCollection::add_mutation(IdType node, std::size_t key, std::size_t site,
                                          std::int8_t derived_state, bool neutral)
{
    return mutation_table_add_row(mutations_, node, key, site, derived_state, neutral);
}

void TableCollection::check_node_id(IdType id) const
{
    if (id < 0 || static_cast<std::size_t>(id) >= nodes_.size()) {
        throw InvalidNodeValueException(id);
    }
}

const Node& TableCollection::node(IdType id) const
{
    check_node_id(id);
    return nodes_[static_cast<std::size_t>(id)];
}

void TableCollection::sort_tables_for_simplification()
{
    // Every edge must name an existing parent before times can be compared
    for (const auto& e : edges_) {
        check_node_id(e.parent);
    }

    std::sort(edges_.begin(), edges_.end(), [this](const Edge& a, const Edge& b) {
        const Time ta = nodes_[static_cast<std::size_t>(a.parent)].time;
        const Time tb = nodes_[static_cast<std::size_t>(b.parent)].time;
        if (ta != tb) {
            return ta > tb;
        }
        return std::tie(a.parent, a.left, a.child) < std::tie(b.parent, b.left, b.child);
    });

    for (const auto& m : mutations_) {
        if (m.site >= sites_.size()) {
            throw TablesException("Mutation refers to missing site " + std::to_string(m.site));
        }
    }
    std::stable_sort(mutations_.begin(), mutations_.end(), [this](const Mutation& a, const Mutation& b) {
        return sites_[a.site].position > sites_[b.site].position;
    });
}

} // namespace ForTS
