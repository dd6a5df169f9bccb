#include <gtest/gtest.h>
#include "graph/node_store.hpp"
#include "graph/errors.hpp"

using namespace dats;

class NodeStoreTest : public ::testing::Test {
protected:
    NodeStore store;
};

// ==========================================
// Deduplication Tests
// ==========================================

TEST_F(NodeStoreTest, SameContentSameHandle) {
    Node* first = store.create("Subject", {{"name", "GTEX-1"}});
    Node* second = store.create("Subject", {{"name", "GTEX-1"}});
    Node* other = store.create("Subject", {{"name", "GTEX-2"}});

    EXPECT_EQ(first, second);
    EXPECT_NE(first, other);
    EXPECT_NE(first->id(), other->id());
    EXPECT_EQ(store.size(), 2);
    EXPECT_EQ(store.statistics().nodes_created, 2);
    EXPECT_EQ(store.statistics().nodes_reused, 1);
}

TEST_F(NodeStoreTest, DerivedIdentityFormat) {
    Node* node = store.create("Material", {{"name", "GTEX-1"}});
    const std::string& id = node->id();

    EXPECT_EQ(id.rfind("_:Material-", 0), 0u);
    EXPECT_EQ(id.size(), std::string("_:Material-").size() + 16);
    EXPECT_FALSE(node->has_explicit_id());
}

TEST_F(NodeStoreTest, IdentityIsReproducible) {
    NodeStore other;
    Node* a = store.create("Annotation", {{"value", "AGE"}});
    Node* b = other.create("Annotation", {{"value", "AGE"}});
    EXPECT_EQ(a->id(), b->id());
}

TEST_F(NodeStoreTest, TypeContributesToIdentity) {
    Node* a = store.create("Annotation", {{"value", "x"}});
    Node* b = store.create("Identifier", {{"value", "x"}});
    EXPECT_NE(a->id(), b->id());
}

TEST_F(NodeStoreTest, PropertyOrderDoesNotMatter) {
    Node* a = store.create("Identifier", {{"identifier", "phs000424"}, {"identifierSource", "dbGaP"}});
    Node* b = store.create("Identifier", {{"identifierSource", "dbGaP"}, {"identifier", "phs000424"}});
    EXPECT_EQ(a, b);
}

TEST_F(NodeStoreTest, UnorderedListsArePermutationInvariant) {
    Node* a = store.create("ConsentInfo", {
        {"name", "GRU"},
        {"codes", Value::unordered(std::vector<Value>{"NPU", "IRB", "GSO"})}
    });
    Node* b = store.create("ConsentInfo", {
        {"codes", Value::unordered(std::vector<Value>{"GSO", "NPU", "IRB"})},
        {"name", "GRU"}
    });
    EXPECT_EQ(a, b);
}

TEST_F(NodeStoreTest, OrderedListsAreOrderSensitive) {
    Node* a = store.create("Dataset", {{"files", std::vector<Value>{"a.txt", "b.txt"}}});
    Node* b = store.create("Dataset", {{"files", std::vector<Value>{"b.txt", "a.txt"}}});
    EXPECT_NE(a, b);
}

TEST_F(NodeStoreTest, NestedNodeAndReferenceAreSameEdge) {
    Node* group = store.create("StudyGroup", {{"name", "all subjects"}});
    Node* via_node = store.create("Dimension", {{"values", std::vector<Value>{group}}});
    Node* via_ref = store.create("Dimension", {{"values", std::vector<Value>{store.reference(group)}}});
    EXPECT_EQ(via_node, via_ref);
}

TEST_F(NodeStoreTest, FirstWriterWins) {
    Node* first = store.create("Material", {{"@id", "SUBJ-1"}, {"name", "GTEX-1"}});
    Node* again = store.create("Material", {{"name", "GTEX-1"}, {"@id", "SUBJ-1"}});
    EXPECT_EQ(first, again);
    EXPECT_EQ(first->properties().size(), 1);
}

// ==========================================
// Explicit Identity Tests
// ==========================================

TEST_F(NodeStoreTest, ExplicitIdentityWins) {
    Node* dim = store.create("Dimension", {{"@id", "phv00169061.v7.p2"}, {"description", "Age"}});
    EXPECT_EQ(dim->id(), "phv00169061.v7.p2");
    EXPECT_TRUE(dim->has_explicit_id());
    EXPECT_FALSE(dim->has("@id"));
    EXPECT_EQ(store.find("phv00169061.v7.p2"), dim);
}

TEST_F(NodeStoreTest, ExplicitIdentityConflictIsFatal) {
    store.create("Dimension", {{"@id", "phv1"}, {"description", "Age"}});
    EXPECT_THROW(store.create("Dimension", {{"@id", "phv1"}, {"description", "Sex"}}), IdentityError);
}

TEST_F(NodeStoreTest, IdentityErrorIsGraphError) {
    EXPECT_THROW(store.create("", {{"name", "x"}}), GraphError);
}

TEST_F(NodeStoreTest, UnderivableIdentityIsFatal) {
    EXPECT_THROW(store.create("Material", {}), IdentityError);
    EXPECT_THROW(store.create("Material", {{"@id", "only-an-id"}}), IdentityError);
    EXPECT_THROW(store.create("Material", {{"@id", ""}, {"name", "x"}}), IdentityError);
    EXPECT_THROW(store.create("Material", {{"@id", 42}, {"name", "x"}}), IdentityError);
}

TEST_F(NodeStoreTest, NullNodeInListIsFatal) {
    std::vector<Value> members{static_cast<Node*>(nullptr)};
    EXPECT_THROW(store.create("StudyGroup", {{"members", members}}), IdentityError);

    std::vector<Value> nested{Value(std::vector<Value>{static_cast<Node*>(nullptr)})};
    EXPECT_THROW(store.create("StudyGroup", {{"members", nested}}), IdentityError);
}

TEST_F(NodeStoreTest, IdentifiersWithDelimitersDoNotMerge) {
    Node* a = store.create("Material", {{"@id", "a"}, {"name", "a"}});
    Node* b = store.create("Material", {{"@id", "b"}, {"name", "b"}});
    Node* ab = store.create("Material", {{"@id", "a>,<b"}, {"name", "a>,<b"}});

    Node* pair = store.create("StudyGroup", {{"members", std::vector<Value>{a, b}}});
    Node* single = store.create("StudyGroup", {{"members", std::vector<Value>{ab}}});
    EXPECT_NE(pair, single);
    EXPECT_NE(pair->id(), single->id());
}

TEST_F(NodeStoreTest, InvalidPropertyNamesRejected) {
    EXPECT_THROW(store.create("Material", {{"@type", "Study"}}), IdentityError);
    EXPECT_THROW(store.create("Material", {{"name", "a"}, {"name", "b"}}), IdentityError);
    EXPECT_THROW(store.create("Material", {{"", "a"}}), IdentityError);
}

// ==========================================
// Property Access Tests
// ==========================================

TEST_F(NodeStoreTest, MissingPropertyIsReported) {
    Node* node = store.create("Material", {{"name", "GTEX-1"}});

    EXPECT_EQ(node->get("name").as_string(), "GTEX-1");
    EXPECT_EQ(node->find("description"), nullptr);

    try {
        node->get("description");
        FAIL() << "expected MissingPropertyError";
    } catch (const MissingPropertyError& e) {
        EXPECT_EQ(e.property(), "description");
    }
}

TEST_F(NodeStoreTest, MutationKeepsIdentity) {
    Node* node = store.create("Material", {{"name", "GTEX-1"}});
    std::string id = node->id();

    node->append("characteristics", "extra");
    node->set("description", "subject GTEX-1");

    EXPECT_EQ(node->id(), id);
    EXPECT_EQ(store.create("Material", {{"name", "GTEX-1"}}), node);
    EXPECT_THROW(node->append("description", "x"), std::invalid_argument);
}

// ==========================================
// Back-link Tests
// ==========================================

TEST_F(NodeStoreTest, LinkBackAppendsReference) {
    Node* subject = store.create("Material", {{"name", "GTEX-1"}});
    Node* group = store.create("StudyGroup", {{"name", "all subjects"}});

    EXPECT_TRUE(store.link_back(subject, "characteristics", group));

    const Value& slot = subject->get("characteristics");
    ASSERT_TRUE(slot.is_list());
    ASSERT_EQ(slot.items.size(), 1);
    ASSERT_TRUE(slot.items[0].is_reference());
    EXPECT_EQ(slot.items[0].reference, group->reference());
    EXPECT_EQ(store.statistics().back_links_added, 1);
}

TEST_F(NodeStoreTest, QualifiedLinkBackIsSharedDimension) {
    Node* s1 = store.create("Material", {{"name", "GTEX-1"}});
    Node* s2 = store.create("Material", {{"name", "GTEX-2"}});
    Node* group = store.create("StudyGroup", {{"name", "all subjects"}});

    store.link_back(s1, "characteristics", group, "member of study group");
    store.link_back(s2, "characteristics", group, "member of study group");

    const Value& d1 = s1->get("characteristics").items.at(0);
    const Value& d2 = s2->get("characteristics").items.at(0);
    ASSERT_TRUE(d1.is_node());
    EXPECT_EQ(d1.node, d2.node);
    EXPECT_EQ(d1.node->type(), "Dimension");
    EXPECT_EQ(d1.node->get("name").as_string(), "member of study group");
}

TEST(NodeStoreBackLinkTest, DisabledLinkBackIsNoOp) {
    NodeStore store(false);
    Node* subject = store.create("Material", {{"name", "GTEX-1"}});
    Node* group = store.create("StudyGroup", {{"name", "all subjects"}});
    size_t before = store.size();

    EXPECT_FALSE(store.link_back(subject, "characteristics", group, "member of study group"));
    EXPECT_FALSE(subject->has("characteristics"));
    EXPECT_EQ(store.size(), before);
    EXPECT_EQ(store.statistics().back_links_suppressed, 1);
}

// ==========================================
// Hash Tests
// ==========================================

TEST(IdentityTest, Fnv1aKnownValues) {
    EXPECT_EQ(NodeStore::fnv1a_64(""), 14695981039346656037ULL);
    EXPECT_EQ(NodeStore::fnv1a_64("a"), 0xaf63dc4c8601ec8cULL);
}

TEST(IdentityTest, CanonicalContentIgnoresExplicitId) {
    PropertyList with_id = {{"@id", "x"}, {"name", "n"}};
    PropertyList without_id = {{"name", "n"}};
    EXPECT_EQ(NodeStore::canonical_content("Material", with_id),
              NodeStore::canonical_content("Material", without_id));
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
