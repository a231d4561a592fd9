#include <gtest/gtest.h>

#include "simplification.h"

#include <numeric>
#include <vector>

using namespace ForTS;

class SimplifyTablesTest : public ::testing::Test {
protected:
    TableCollection tables{ 10 };
    SimplificationBuffers state;
    SimplificationOutput output;

    void simplify(std::vector<IdType> samples, SimplificationFlags flags = SimplificationFlags::VALIDATE_ALL) {
        tables.sort_tables_for_simplification();
        SamplesInfo info;
        info.samples = std::move(samples);
        simplify_tables(info, flags, state, tables, output);
    }
};

// === BASIC TOPOLOGIES ===

TEST_F(SimplifyTablesTest, CherryKeepsRoot) {
    tables.add_node(0, 0);
    tables.add_node(1, 0);
    tables.add_node(1, 0);
    tables.add_edge(0, 10, 0, 1);
    tables.add_edge(0, 10, 0, 2);

    simplify({ 1, 2 });

    ASSERT_EQ(tables.num_nodes(), 3u);
    EXPECT_EQ(tables.node(0).time, 1);
    EXPECT_EQ(tables.node(1).time, 1);
    EXPECT_EQ(tables.node(2).time, 0);
    const EdgeTable expected{ { 0, 10, 2, 0 }, { 0, 10, 2, 1 } };
    EXPECT_EQ(tables.edges(), expected);
    EXPECT_EQ(output.idmap, (std::vector<IdType>{ 2, 0, 1 }));
}

TEST_F(SimplifyTablesTest, UnaryLineageIsPruned) {
    tables.add_node(0, 0);
    tables.add_node(1, 0);
    tables.add_node(2, 0);
    tables.add_edge(0, 10, 0, 1);
    tables.add_edge(0, 10, 1, 2);

    simplify({ 2 });

    EXPECT_EQ(tables.num_nodes(), 1u);
    EXPECT_EQ(tables.num_edges(), 0u);
    EXPECT_EQ(output.idmap, (std::vector<IdType>{ NULL_ID, NULL_ID, 0 }));
}

TEST_F(SimplifyTablesTest, PartialOverlapCoalescesOnSharedInterval) {
    tables.add_node(0, 0);
    tables.add_node(1, 0);
    tables.add_node(1, 0);
    tables.add_edge(0, 6, 0, 1);
    tables.add_edge(4, 10, 0, 2);

    simplify({ 1, 2 });

    ASSERT_EQ(tables.num_nodes(), 3u);
    const EdgeTable expected{ { 4, 6, 2, 0 }, { 4, 6, 2, 1 } };
    EXPECT_EQ(tables.edges(), expected);

    // ancestry of the root: passthrough, coalescence, passthrough
    std::vector<Segment> ancestry;
    state.ancestry.for_each(0, [&ancestry](const Segment& s) {
        ancestry.push_back(s);
        return true;
    });
    const std::vector<Segment> expected_ancestry{ { 0, 4, 0 }, { 4, 6, 2 }, { 6, 10, 1 } };
    EXPECT_EQ(ancestry, expected_ancestry);
}

TEST_F(SimplifyTablesTest, SampleAncestorKeepsUnaryEdge) {
    tables.add_node(0, 0);
    tables.add_node(1, 0);
    tables.add_edge(0, 10, 0, 1);

    simplify({ 1, 0 });

    ASSERT_EQ(tables.num_nodes(), 2u);
    EXPECT_EQ(tables.node(0).time, 1);
    EXPECT_EQ(tables.node(1).time, 0);
    const EdgeTable expected{ { 0, 10, 1, 0 } };
    EXPECT_EQ(tables.edges(), expected);
}

TEST_F(SimplifyTablesTest, AbuttingEdgesAreSquashed) {
    tables.add_node(0, 0);
    tables.add_node(1, 0);
    tables.add_edge(0, 5, 0, 1);
    tables.add_edge(5, 10, 0, 1);

    simplify({ 1, 0 });

    const EdgeTable expected{ { 0, 10, 1, 0 } };
    EXPECT_EQ(tables.edges(), expected);

    // the sample's own ancestry is one segment covering the genome
    const auto head = state.ancestry.head(0);
    ASSERT_NE(head, AncestryList::null());
    EXPECT_EQ(state.ancestry.fetch(head), (Segment{ 0, 10, 1 }));
    EXPECT_EQ(state.ancestry.next(head), AncestryList::null());
}

TEST_F(SimplifyTablesTest, DemeIsCarriedToOutputNodes) {
    tables.add_node(0, 3);
    tables.add_node(1, 1);
    tables.add_node(1, 2);
    tables.add_edge(0, 10, 0, 1);
    tables.add_edge(0, 10, 0, 2);

    simplify({ 1, 2 });

    EXPECT_EQ(tables.node(0).deme, 1);
    EXPECT_EQ(tables.node(1).deme, 2);
    EXPECT_EQ(tables.node(2).deme, 3);
}

TEST_F(SimplifyTablesTest, SecondPassIsIdempotent) {
    tables.add_node(0, 0);
    tables.add_node(1, 0);
    tables.add_node(1, 0);
    tables.add_node(2, 0);
    tables.add_edge(0, 6, 0, 1);
    tables.add_edge(4, 10, 0, 2);
    tables.add_edge(0, 10, 2, 3);

    simplify({ 1, 3 });
    const NodeTable nodes = tables.nodes();
    const EdgeTable edges = tables.edges();

    std::vector<IdType> samples(2);
    std::iota(samples.begin(), samples.end(), 0);
    simplify(samples);

    ASSERT_EQ(tables.nodes().size(), nodes.size());
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        EXPECT_EQ(tables.nodes()[i].time, nodes[i].time);
        EXPECT_EQ(tables.nodes()[i].deme, nodes[i].deme);
    }
    EXPECT_EQ(tables.edges(), edges);
    std::vector<IdType> identity(nodes.size());
    std::iota(identity.begin(), identity.end(), 0);
    EXPECT_EQ(output.idmap, identity);
}

TEST_F(SimplifyTablesTest, BuffersAreReusableAcrossPasses) {
    tables.add_node(0, 0);
    tables.add_node(1, 0);
    tables.add_node(1, 0);
    tables.add_edge(0, 10, 0, 1);
    tables.add_edge(0, 10, 0, 2);
    simplify({ 1, 2 });

    TableCollection other(10);
    other.add_node(0, 0);
    other.add_node(1, 0);
    other.add_edge(0, 10, 0, 1);
    SamplesInfo info;
    info.samples = { 1 };
    simplify_tables(info, SimplificationFlags::NONE, state, other, output);

    EXPECT_EQ(other.num_nodes(), 1u);
    EXPECT_EQ(other.num_edges(), 0u);
    EXPECT_EQ(output.idmap.size(), 2u);
}

// === INPUT ERRORS ===

TEST_F(SimplifyTablesTest, RejectsBadSamples) {
    tables.add_node(0, 0);
    tables.add_node(1, 0);
    tables.add_edge(0, 10, 0, 1);

    EXPECT_THROW(simplify({ NULL_ID }), SimplificationException);
    EXPECT_THROW(simplify({ 2 }), SimplificationException);
    EXPECT_THROW(simplify({ 1, 1 }), SimplificationException);
}

TEST_F(SimplifyTablesTest, ValidationRejectsUnsortedEdges) {
    tables.add_node(0, 0);
    tables.add_node(1, 0);
    tables.add_node(2, 0);
    tables.add_edge(0, 10, 0, 1);
    tables.add_edge(0, 10, 1, 2);

    SamplesInfo info;
    info.samples = { 2 };
    EXPECT_THROW(simplify_tables(info, SimplificationFlags::VALIDATE_EDGES, state, tables, output),
                 SimplificationException);
}

TEST_F(SimplifyTablesTest, ValidationRejectsParentYoungerThanChild) {
    tables.add_node(1, 0);
    tables.add_node(0, 0);
    tables.add_edge(0, 10, 0, 1);
    EXPECT_THROW(simplify({ 1 }), SimplificationException);
}

TEST_F(SimplifyTablesTest, ValidationRejectsEdgesPastGenomeEnd) {
    tables.add_node(0, 0);
    tables.add_node(1, 0);
    tables.add_edge(0, 11, 0, 1);
    EXPECT_THROW(simplify({ 1 }), InvalidPositionException);
}

TEST_F(SimplifyTablesTest, ValidationRejectsSplitParentRuns) {
    tables.add_node(0, 0);
    tables.add_node(0, 0);
    tables.add_node(1, 0);
    tables.add_node(1, 0);
    tables.add_edge(0, 10, 0, 2);
    tables.add_edge(0, 10, 1, 3);
    tables.add_edge(0, 10, 0, 3);

    SamplesInfo info;
    info.samples = { 2, 3 };
    EXPECT_THROW(simplify_tables(info, SimplificationFlags::VALIDATE_ALL, state, tables, output),
                 SimplificationException);
}

// === BUILDING BLOCKS ===

TEST(AddAncestryTest, JoinsAbuttingSegmentsWithSameNode) {
    AncestryList ancestry;
    ancestry.reset(1);
    add_ancestry(0, 0, 3, 7, ancestry);
    add_ancestry(0, 3, 5, 7, ancestry);
    add_ancestry(0, 5, 8, 2, ancestry);
    add_ancestry(0, 9, 10, 2, ancestry);

    std::vector<Segment> out;
    ancestry.for_each(0, [&out](const Segment& s) {
        out.push_back(s);
        return true;
    });
    const std::vector<Segment> expected{ { 0, 5, 7 }, { 5, 8, 2 }, { 9, 10, 2 } };
    EXPECT_EQ(out, expected);
}

TEST(QueueChildrenTest, IntersectsChildAncestryWithEdge) {
    AncestryList ancestry;
    ancestry.reset(2);
    ancestry.extend(1, Segment(0, 4, 10));
    ancestry.extend(1, Segment(4, 8, 11));
    ancestry.extend(1, Segment(8, 12, 12));

    SegmentOverlapper overlapper;
    queue_children(1, 3, 9, ancestry, overlapper);
    queue_children(0, 0, 12, ancestry, overlapper);
    EXPECT_EQ(overlapper.queue_size(), 3u);

    overlapper.finalize_queue(12);
    overlapper.initialize();
    std::vector<Segment> seen;
    while (overlapper.advance()) {
        seen.push_back(overlapper.overlap(0));
    }
    const std::vector<Segment> expected{ { 3, 4, 10 }, { 4, 8, 11 }, { 8, 9, 12 } };
    EXPECT_EQ(seen, expected);
}

TEST(MergeAncestorsTest, RejectsUnknownParent) {
    NodeTable nodes{ { 0, 0 } };
    SimplificationBuffers state;
    std::vector<IdType> idmap{ NULL_ID };
    state.overlapper.finalize_queue(10);
    EXPECT_THROW(merge_ancestors(nodes, 10, 4, state, idmap), InvalidNodeValueException);
}
