#include "engine/flat_index.hpp"
#include "vellum/errors.hpp"
#include "test_support.hpp"

#include <cmath>
#include <vector>

using namespace vellum::engine;
using vellum::test::near;

TEST(nearest_neighbors_in_distance_order) {
    FlatIndex index(2);
    index.add({0.0f, 0.0f}, 1);
    index.add({1.0f, 0.0f}, 2);
    index.add({5.0f, 5.0f}, 3);

    auto hits = index.search({0.0f, 0.0f}, 2);
    ASSERT(hits.size() == 2, "expected two neighbors");
    ASSERT(hits[0].id == 1 && hits[1].id == 2, "expected ids 1, 2");
    ASSERT(near(hits[0].distance, 0.0f) && near(hits[1].distance, 1.0f), "distances should be Euclidean");

    auto all = index.search({0.0f, 0.0f}, 10);
    ASSERT(all.size() == 3, "k above count should return every vector");
    ASSERT(near(all[2].distance, std::sqrt(50.0f)), "distance to (5,5) should be sqrt(50)");
}

TEST(equal_distances_ordered_by_id) {
    FlatIndex index(2);
    index.add({1.0f, 0.0f}, 9);
    index.add({0.0f, 1.0f}, 4);
    index.add({-1.0f, 0.0f}, 6);

    auto hits = index.search({0.0f, 0.0f}, 3);
    ASSERT(hits.size() == 3, "expected three neighbors");
    ASSERT(hits[0].id == 4 && hits[1].id == 6 && hits[2].id == 9, "ties should be ordered by ascending id");
}

TEST(tie_at_k_boundary_keeps_lowest_id) {
    FlatIndex index(2);
    // Stored in descending id order, all at distance 1 from the origin.
    index.add({0.0f, 1.0f}, 9);
    index.add({1.0f, 0.0f}, 5);
    index.add({0.0f, -1.0f}, 2);
    index.add({-1.0f, 0.0f}, 7);
    index.add({3.0f, 3.0f}, 1);

    auto hits = index.search({0.0f, 0.0f}, 1);
    ASSERT(hits.size() == 1 && hits[0].id == 2, "lowest id should win a tie at the k-th position");

    hits = index.search({0.0f, 0.0f}, 2);
    ASSERT(hits.size() == 2 && hits[0].id == 2 && hits[1].id == 5, "expected ids 2, 5");
}

TEST(remove_middle_and_last) {
    FlatIndex index(2);
    index.add({0.0f, 0.0f}, 1);
    index.add({1.0f, 0.0f}, 2);
    index.add({2.0f, 0.0f}, 3);

    ASSERT(index.remove(2), "remove of middle entry should succeed");
    ASSERT(!index.contains(2) && index.count() == 2, "middle entry should be gone");
    auto moved = index.get(3);
    ASSERT(moved && (*moved)[0] == 2.0f, "entry stored after the removed one should keep its vector");

    ASSERT(index.remove(3), "remove of last entry should succeed");
    ASSERT(!index.contains(3) && index.count() == 1, "last entry should be gone");
    ASSERT(!index.remove(3), "second remove should report absence");

    auto hits = index.search({2.0f, 0.0f}, 5);
    ASSERT(hits.size() == 1 && hits[0].id == 1, "only id 1 should remain searchable");

    index.add({3.0f, 0.0f}, 3);
    ASSERT(index.contains(3) && index.count() == 2, "removed id can be added again");
}

TEST(rejects_bad_input) {
    FlatIndex index(3);
    ASSERT_THROWS(index.add({1.0f, 2.0f}, 1), DimensionMismatchError, "short vector should be rejected");

    index.add({1.0f, 2.0f, 3.0f}, 1);
    ASSERT_THROWS(index.add({1.0f, 2.0f, 3.0f}, 1), std::invalid_argument, "duplicate id should be rejected");

    ASSERT(index.search({1.0f, 2.0f}, 3).empty(), "query of wrong dimension should yield nothing");
    ASSERT(index.search({1.0f, 2.0f, 3.0f}, 0).empty(), "k = 0 should yield nothing");
}

TEST(empty_index_and_for_each) {
    FlatIndex index(2);
    ASSERT(index.is_trained(), "exact index needs no training");
    ASSERT(index.search({0.0f, 0.0f}, 3).empty(), "empty index should yield nothing");

    index.add({1.0f, 1.0f}, 8);
    index.add({2.0f, 2.0f}, 3);
    std::vector<InternalId> ids;
    index.for_each([&](InternalId id, const Vector& v) {
        ids.push_back(id);
        if (v.size() != 2) throw std::runtime_error("for_each vector has wrong size");
    });
    ASSERT(ids == std::vector<InternalId>({3, 8}), "for_each should visit ids in ascending order");
}

int main() {
    RUN_TEST(nearest_neighbors_in_distance_order);
    RUN_TEST(equal_distances_ordered_by_id);
    RUN_TEST(tie_at_k_boundary_keeps_lowest_id);
    RUN_TEST(remove_middle_and_last);
    RUN_TEST(rejects_bad_input);
    RUN_TEST(empty_index_and_for_each);
    return vellum::test::summary("flat_index");
}
