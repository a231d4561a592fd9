#ifndef FORTS_TABLES_H
#define FORTS_TABLES_H

#include "config.hpp"

#include <cereal/types/vector.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ForTS {

// === Exceptions ===
class TablesException : public ForTSException {
public:
    explicit TablesException(const std::string& message) : ForTSException("Tables: " + message) {}
};

class InvalidGenomeLengthException : public TablesException {
public:
    explicit InvalidGenomeLengthException(Position found)
        : TablesException("Invalid genome length: " + std::to_string(found)), found_(found) {}
    Position found() const noexcept { return found_; }

private:
    Position found_;
};

class InvalidNodeValueException : public TablesException {
public:
    explicit InvalidNodeValueException(IdType found)
        : TablesException("Invalid node: " + std::to_string(found)), found_(found) {}
    IdType found() const noexcept { return found_; }

private:
    IdType found_;
};

class InvalidPositionException : public TablesException {
public:
    explicit InvalidPositionException(Position found)
        : TablesException("Invalid value for position: " + std::to_string(found)), found_(found) {}
    Position found() const noexcept { return found_; }

private:
    Position found_;
};

class InvalidLeftRightException : public TablesException {
public:
    InvalidLeftRightException(Position left, Position right)
        : TablesException("Invalid position range: [" + std::to_string(left) + ", " + std::to_string(right) + ")"),
          found_(left, right) {}
    const std::pair<Position, Position>& found() const noexcept { return found_; }

private:
    std::pair<Position, Position> found_;
};

class InvalidTimeException : public TablesException {
public:
    explicit InvalidTimeException(Time found)
        : TablesException("Invalid value for time: " + std::to_string(found)), found_(found) {}
    Time found() const noexcept { return found_; }

private:
    Time found_;
};

class InvalidDemeException : public TablesException {
public:
    explicit InvalidDemeException(Deme found)
        : TablesException("Invalid value for deme: " + std::to_string(found)), found_(found) {}
    Deme found() const noexcept { return found_; }

private:
    Deme found_;
};

// === Row types ===

// A node of a tree sequence.  Time is the birth time, counted forwards.
struct Node {
    Time time{ 0 };                 // birth time
    Deme deme{ 0 };                 // subpopulation

    template <class Archive> void serialize(Archive& ar) { ar(time, deme); }
};

// `child` inherited [left, right) from `parent`
struct Edge {
    Position left{ 0 };             // inclusive
    Position right{ 0 };            // exclusive
    IdType parent{ NULL_ID };
    IdType child{ NULL_ID };

    bool operator==(const Edge& other) const {
        return left == other.left && right == other.right && parent == other.parent && child == other.child;
    }

    template <class Archive> void serialize(Archive& ar) { ar(left, right, parent, child); }
};

struct Site {
    Position position{ 0 };         // in [0, L)
    std::int8_t ancestral_state{ 0 };

    template <class Archive> void serialize(Archive& ar) { ar(position, ancestral_state); }
};

struct Mutation {
    IdType node{ NULL_ID };         // node carrying the mutation
    std::size_t key{ 0 };           // index into the simulator's mutation store
    std::size_t site{ 0 };          // row in the site table
    std::int8_t derived_state{ 0 };
    bool neutral{ true };

    template <class Archive> void serialize(Archive& ar) { ar(node, key, site, derived_state, neutral); }
};

using NodeTable = std::vector<Node>;
using EdgeTable = std::vector<Edge>;
using SiteTable = std::vector<Site>;
using MutationTable = std::vector<Mutation>;

// Validated row insertion.  Each returns the index of the new row.
IdType node_table_add_row(NodeTable& nodes, Time time, Deme deme);
std::size_t edge_table_add_row(EdgeTable& edges, Position left, Position right, IdType parent, IdType child);
std::size_t site_table_add_row(SiteTable& sites, Position position, std::int8_t ancestral_state);
std::size_t mutation_table_add_row(MutationTable& mutations, IdType node, std::size_t key, std::size_t site,
                                   std::int8_t derived_state, bool neutral);

// -----------------------------------------------------------------------------
// TableCollection
//
// Node, edge, site and mutation tables for a genome of length L.  Rows are
// validated on insertion; the tables themselves are plain vectors exposed
// read-only.  The simplifiers replace nodes and edges in one swap.
// -----------------------------------------------------------------------------
class TableCollection {
public:
    explicit TableCollection(Position genome_length);

    IdType add_node(Time time, Deme deme);
    std::size_t add_edge(Position left, Position right, IdType parent, IdType child);
    std::size_t add_site(Position position, std::int8_t ancestral_state);
    std::size_t add_mutation(IdType node, std::size_t key, std::size_t site, std::int8_t derived_state, bool neutral);

    Position get_length() const noexcept { return length_; }
    Position genome_length() const noexcept { return length_; }

    const NodeTable& nodes() const noexcept { return nodes_; }
    const EdgeTable& edges() const noexcept { return edges_; }
    const SiteTable& sites() const noexcept { return sites_; }
    const MutationTable& mutations() const noexcept { return mutations_; }

    std::size_t num_nodes() const noexcept { return nodes_.size(); }
    std::size_t num_edges() const noexcept { return edges_.size(); }

    // Bounds checked node lookup
    const Node& node(IdType id) const;
    // Throws InvalidNodeValueException unless id names a row of the node table
    void check_node_id(IdType id) const;

    // Edges: parent birth time descending, then parent id, left, child.
    // Mutations: site position descending.
    void sort_tables_for_simplification();

    // Exchange node and edge tables with the given buffers.
    void replace_nodes_and_edges(NodeTable& nodes, EdgeTable& edges) noexcept {
        nodes_.swap(nodes);
        edges_.swap(edges);
    }

    template <class Archive> void serialize(Archive& ar) {
        ar(length_, nodes_, edges_, sites_, mutations_);
    }

private:
    Position length_;

    NodeTable nodes_;
    EdgeTable edges_;
    SiteTable sites_;
    MutationTable mutations_;
};

} // namespace ForTS

#endif // FORTS_TABLES_H
