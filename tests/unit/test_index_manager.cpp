#include "engine/index_manager.hpp"
#include "engine/flat_index.hpp"
#include "engine/persistence.hpp"
#include "vellum/errors.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <limits>
#include <thread>

using namespace vellum::engine;
using vellum::test::AbstractTextSource;
using vellum::test::MemoryStore;
using vellum::test::TempDir;
using vellum::test::VectorTextEmbedder;
using vellum::test::near;

namespace {

    struct Fixture {
        TempDir dir;
        Config config;
        VectorTextEmbedder* embedder = nullptr;
        EmbeddingGenerator generator;
        MemoryStore store;
        AbstractTextSource text;

        explicit Fixture(const std::string& name, IndexVariant variant = IndexVariant::Exact, size_t dim = 2)
            : dir(name), generator(track(std::make_unique<VectorTextEmbedder>(dim))) {
            config.index_dir = dir.path() / "index";
            config.index_type = variant;
            config.nlist = 100;
            config.checkpoint_interval = 10;
            config.batch_size = 50;
        }

        std::unique_ptr<IndexManager> open() {
            auto manager = std::make_unique<IndexManager>(config, generator, store, text);
            manager->initialize();
            return manager;
        }

    private:
        std::unique_ptr<Embedder> track(std::unique_ptr<VectorTextEmbedder> backend) {
            embedder = backend.get();
            return backend;
        }
    };

    std::vector<DocumentRef> line_of_points(size_t n) {
        std::vector<DocumentRef> docs;
        for (size_t i = 0; i < n; ++i) {
            docs.push_back({"doc-" + std::to_string(i), std::to_string(i) + ",0"});
        }
        return docs;
    }

    std::vector<std::string> keys_of(const std::vector<SearchHit>& hits) {
        std::vector<std::string> keys;
        for (const auto& hit : hits) keys.push_back(hit.key);
        return keys;
    }

    void overwrite(const std::filesystem::path& path, const std::string& data) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << data;
    }

}

TEST(nearest_and_after_removal) {
    Fixture f("im_scenario");
    auto manager = f.open();

    ASSERT(manager->add_document("A", "0,0"), "add A failed");
    ASSERT(manager->add_document("B", "1,0"), "add B failed");
    ASSERT(manager->add_document("C", "5,5"), "add C failed");

    auto hits = manager->find_similar_by_vector({0.0f, 0.0f}, 2);
    ASSERT(keys_of(hits) == std::vector<std::string>({"A", "B"}), "expected A, B");

    ASSERT(manager->remove_document("B"), "remove B failed");
    hits = manager->find_similar_by_vector({0.0f, 0.0f}, 2);
    ASSERT(keys_of(hits) == std::vector<std::string>({"A", "C"}), "after removing B expected A, C");
    ASSERT(near(hits[1].distance, 7.0710678f), "distance to C should be sqrt(50)");
    ASSERT(manager->is_consistent(), "index and id map should agree");
    ASSERT(!f.store.is_indexed("B"), "store should be told B is no longer indexed");
}

TEST(search_bounds) {
    Fixture f("im_bounds");
    auto manager = f.open();

    ASSERT(manager->find_similar_by_vector({0.0f, 0.0f}, 5).empty(), "empty index should return nothing");
    ASSERT(manager->find_similar_by_text("1,1", 5).empty(), "empty index should return nothing for text");

    for (const auto& doc : line_of_points(4)) manager->add_document(doc.key, doc.text);
    auto hits = manager->find_similar_by_vector({0.0f, 0.0f}, 10);
    ASSERT(hits.size() == 4, "no more than count results");
    for (size_t i = 1; i < hits.size(); ++i) {
        ASSERT(hits[i - 1].distance <= hits[i].distance, "distances should be non-decreasing");
    }
    ASSERT(manager->find_similar_by_vector({0.0f, 0.0f}, 0).empty(), "k = 0 should return nothing");
    ASSERT(manager->find_similar_by_vector({0.0f, 0.0f, 0.0f}, 3).empty(), "wrong dimension should return nothing");
}

TEST(replace_keeps_one_entry) {
    Fixture f("im_replace");
    auto manager = f.open();

    ASSERT(manager->add_document("A", "0,0"), "first add failed");
    ASSERT(manager->add_document("A", "9,9"), "replacing add failed");
    ASSERT(manager->size() == 1, "replace should leave a single entry");

    auto hits = manager->find_similar_by_vector({9.0f, 9.0f}, 1);
    ASSERT(hits.size() == 1 && hits[0].key == "A" && near(hits[0].distance, 0.0f), "vector should be the latest one");
    ASSERT(manager->stats().next_id == 3, "replacement should take a fresh id");
    ASSERT(manager->is_consistent(), "index and id map should agree");
}

TEST(add_remove_inverse) {
    Fixture f("im_inverse");
    auto manager = f.open();
    manager->add_document("A", "0,0");
    manager->add_document("B", "1,0");

    auto keys_before = manager->keys();
    size_t count_before = manager->size();

    ASSERT(manager->add_document("X", "3,3"), "add X failed");
    ASSERT(manager->contains("X"), "X should be present");
    ASSERT(manager->remove_document("X"), "remove X failed");

    ASSERT(manager->keys() == keys_before && manager->size() == count_before, "add then remove should be a no-op");
    ASSERT(manager->remove_document("never-added"), "removing an absent key is a successful no-op");
}

TEST(encode_failure_changes_nothing) {
    Fixture f("im_encode_fail");
    auto manager = f.open();
    manager->add_document("A", "0,0");
    size_t marks = f.store.mark_calls;

    ASSERT(!manager->add_document("K", "fail"), "backend failure should return false");
    ASSERT(!manager->add_document("K", "   "), "empty text should return false");
    ASSERT(!manager->add_document("A", "fail"), "failed replace should return false");

    ASSERT(manager->size() == 1 && !manager->contains("K"), "failed adds should not change the index");
    auto hits = manager->find_similar_by_vector({0.0f, 0.0f}, 1);
    ASSERT(hits.size() == 1 && near(hits[0].distance, 0.0f), "A should keep its old vector");
    ASSERT(f.store.mark_calls == marks, "store should not be notified");
}

TEST(notification_failure_rolls_back) {
    Fixture f("im_rollback");
    auto manager = f.open();
    ASSERT(manager->add_document("A", "0,0"), "add A failed");
    InternalId next_before = manager->stats().next_id;

    f.store.fail_keys.insert("A");
    f.store.fail_keys.insert("B");

    ASSERT(!manager->add_document("A", "5,5"), "replace with failing notification should fail");
    auto hits = manager->find_similar_by_vector({0.0f, 0.0f}, 1);
    ASSERT(hits.size() == 1 && hits[0].key == "A" && near(hits[0].distance, 0.0f), "old vector for A should be restored");

    ASSERT(!manager->add_document("B", "1,0"), "new key with failing notification should fail");
    ASSERT(!manager->contains("B"), "B should not be indexed");

    ASSERT(!manager->remove_document("A"), "remove with failing notification should fail");
    ASSERT(manager->contains("A") && manager->size() == 1, "A should still be indexed");
    ASSERT(manager->is_consistent(), "index and id map should agree after rollbacks");
    ASSERT(manager->stats().next_id >= next_before, "ids are never reused");
}

TEST(find_similar_by_key_excludes_self) {
    Fixture f("im_by_key");
    f.store.put("A", "0,0");
    f.store.put("B", "1,0");
    f.store.put("C", "5,5");
    f.store.put("D", "  ");
    auto manager = f.open();

    auto result = manager->update_index(50);
    ASSERT(result.added == 3 && result.skipped == 1, "three added, one without text skipped");

    auto hits = manager->find_similar_by_key("A", 10);
    ASSERT(keys_of(hits) == std::vector<std::string>({"B", "C"}), "self should be excluded even for k >= count");

    hits = manager->find_similar_by_key("A", std::numeric_limits<size_t>::max());
    ASSERT(keys_of(hits) == std::vector<std::string>({"B", "C"}), "the largest k should return every other document");

    hits = manager->find_similar_by_key("A", 1);
    ASSERT(keys_of(hits) == std::vector<std::string>({"B"}), "k should be honored after exclusion");

    ASSERT_THROWS(manager->find_similar_by_key("Z", 3), DocumentNotFoundError, "unknown key should throw");
    ASSERT_THROWS(manager->find_similar_by_key("D", 3), NoTextError, "document without text should throw");
}

TEST(find_similar_by_text) {
    Fixture f("im_by_text");
    auto manager = f.open();
    manager->add_document("A", "0,0");
    manager->add_document("B", "1,0");

    auto hits = manager->find_similar_by_text("0.9,0", 1);
    ASSERT(keys_of(hits) == std::vector<std::string>({"B"}), "nearest to (0.9, 0) should be B");
    ASSERT_THROWS(manager->find_similar_by_text("", 3), EmptyQueryError, "empty query should throw");
    ASSERT_THROWS(manager->find_similar_by_text(" \n", 3), EmptyQueryError, "blank query should throw");
    ASSERT_THROWS(manager->find_similar_by_text("fail", 3), ModelFailure, "backend failure should propagate");
}

TEST(clustered_undersized_sample_degrades) {
    Fixture f("im_degraded", IndexVariant::Clustered);
    auto manager = f.open();

    auto pending = line_of_points(5);
    auto result = manager->update_index(pending, 50);
    ASSERT(result.trained && result.degraded_training, "5 docs for 100 clusters should degrade");
    ASSERT(result.added == 5 && result.failed == 0, "all docs should be added");

    auto stats = manager->stats();
    ASSERT(stats.trained && stats.degraded && stats.clusters == 5, "stats should report degraded training");

    // Training vectors are reused for insertion: one probe plus five encodes.
    ASSERT(f.embedder->calls == 6, "documents should be encoded once");

    auto hits = manager->find_similar_by_vector({0.0f, 0.0f}, 2);
    ASSERT(keys_of(hits) == std::vector<std::string>({"doc-0", "doc-1"}), "search should work after degraded training");
}

TEST(clustered_strict_policy_throws) {
    Fixture f("im_strict", IndexVariant::Clustered);
    f.config.training_policy = Config::TrainingPolicy::STRICT;
    auto manager = f.open();

    ASSERT_THROWS(manager->update_index(line_of_points(5), 50), InsufficientTrainingDataError,
                  "strict policy should refuse to train on 5 docs");
    ASSERT(manager->size() == 0 && !manager->stats().trained, "nothing should be inserted");
    ASSERT(f.store.mark_calls == 0, "store should not be notified");
}

TEST(clustered_add_before_training) {
    Fixture f("im_untrained", IndexVariant::Clustered);
    auto manager = f.open();
    ASSERT_THROWS(manager->add_document("A", "0,0"), IndexNotTrainedError, "add before training should throw");
    ASSERT(manager->find_similar_by_vector({0.0f, 0.0f}, 3).empty(), "untrained index should return nothing");
}

TEST(batch_failures_are_isolated) {
    Fixture f("im_batch_fail");
    auto manager = f.open();

    std::vector<DocumentRef> pending = {{"A", "0,0"}, {"B", "fail"}, {"C", ""}, {"D", "1,1"}};
    auto result = manager->update_index(pending, 50);
    ASSERT(result.added == 2 && result.failed == 2, "two added, two failed");
    ASSERT(manager->contains("A") && manager->contains("D"), "good documents should be indexed");
}

TEST(batch_size_limits_work) {
    Fixture f("im_batch_size");
    auto manager = f.open();
    auto result = manager->update_index(line_of_points(25), 10);
    ASSERT(result.added == 10 && manager->size() == 10, "only batch_size documents should be processed");
}

TEST(checkpoint_cadence) {
    Fixture f("im_checkpoint");
    auto manager = f.open();

    auto result = manager->update_index(line_of_points(25), 50);
    ASSERT(result.added == 25, "all documents should be added");
    ASSERT(result.checkpoints == 3, "expected saves after 10, 20 and at the end");
    ASSERT(result.persist_error.empty(), "no save should fail");
    ASSERT(std::filesystem::exists(f.config.index_file()), "vector snapshot should exist");
    ASSERT(std::filesystem::exists(f.config.id_map_file()), "id-map snapshot should exist");
}

TEST(store_driven_update) {
    Fixture f("im_store_update");
    for (int i = 0; i < 4; ++i) f.store.put("P" + std::to_string(i), std::to_string(i) + "," + std::to_string(i));
    auto manager = f.open();

    auto first = manager->update_index(50);
    ASSERT(first.added == 4, "all pending documents should be added");
    for (int i = 0; i < 4; ++i) {
        ASSERT(f.store.is_indexed("P" + std::to_string(i)), "store should mark documents indexed");
    }

    auto second = manager->update_index(50);
    ASSERT(second.added == 0 && second.checkpoints == 0, "nothing left to do");
}

TEST(round_trip_through_fresh_instance) {
    Fixture f("im_round_trip", IndexVariant::Clustered);
    std::vector<SearchHit> before;
    std::vector<std::string> keys_before;
    {
        auto manager = f.open();
        manager->update_index(line_of_points(12), 50);
        manager->remove_document("doc-3");
        before = manager->find_similar_by_vector({2.5f, 0.0f}, 4);
        keys_before = manager->keys();
        manager->shutdown();
        ASSERT(!manager->is_initialized(), "shutdown should release the index");
    }

    auto reopened = f.open();
    ASSERT(reopened->keys() == keys_before, "key set should survive");
    auto after = reopened->find_similar_by_vector({2.5f, 0.0f}, 4);
    ASSERT(after.size() == before.size(), "result size should survive");
    for (size_t i = 0; i < before.size(); ++i) {
        ASSERT(after[i].key == before[i].key && after[i].distance == before[i].distance, "results should survive");
    }
    ASSERT(reopened->stats().next_id == 13, "id counter should survive");
    ASSERT(reopened->stats().degraded, "degraded flag should survive");

    ASSERT(reopened->add_document("new", "20,0"), "adding after reload failed");
    ASSERT(reopened->stats().next_id == 14, "new ids continue after the stored counter");
}

TEST(orphans_and_dangling_entries_pruned) {
    Fixture f("im_orphans");
    std::filesystem::create_directories(f.config.index_dir);

    // Vector snapshot is one step ahead: id 2 has no key. Id 3 has a key but no vector.
    FlatIndex index(2);
    index.add({0.0f, 0.0f}, 1);
    index.add({1.0f, 0.0f}, 2);
    PersistenceCodec::write_index(index, f.config.index_file());

    IdMap map;
    map.insert(1, "A");
    map.insert(3, "C");
    PersistenceCodec::write_id_map(map, 2, 2, IndexVariant::Exact, f.config.id_map_file());

    auto manager = f.open();
    ASSERT(manager->size() == 1 && manager->contains("A"), "only A should survive");
    ASSERT(!manager->contains("C"), "dangling id-map entry should be dropped");
    ASSERT(manager->is_consistent(), "pruned state should be consistent");
    ASSERT(manager->stats().next_id == 4, "next id should clear every id seen on disk");
}

TEST(id_map_without_vectors_resets) {
    Fixture f("im_map_only");
    std::filesystem::create_directories(f.config.index_dir);
    IdMap map;
    map.insert(1, "A");
    PersistenceCodec::write_id_map(map, 2, 2, IndexVariant::Exact, f.config.id_map_file());

    auto manager = f.open();
    ASSERT(manager->size() == 0, "missing vector snapshot should start empty under reset");
}

TEST(corrupt_snapshot_policies) {
    Fixture f("im_corrupt");
    {
        auto manager = f.open();
        manager->add_document("A", "0,0");
        manager->shutdown();
    }
    overwrite(f.config.index_file(), "garbage-garbage-garbage-garbage-garbage");

    f.config.load_failure_policy = Config::LoadFailurePolicy::FAIL;
    IndexManager strict(f.config, f.generator, f.store, f.text);
    ASSERT_THROWS(strict.initialize(), PersistenceError, "fail policy should propagate");
    ASSERT(!strict.is_initialized(), "failed initialize should leave the manager unusable");
    ASSERT(std::filesystem::exists(f.config.id_map_file()), "snapshot files should be left for recovery");

    f.config.load_failure_policy = Config::LoadFailurePolicy::RESET;
    auto manager = f.open();
    ASSERT(manager->size() == 0, "reset policy should start empty");
    ASSERT(manager->add_document("B", "1,1"), "reset index should accept documents");
}

TEST(inaccessible_index_dir_policies) {
    Fixture f("im_unreachable");
    // A path component longer than NAME_MAX makes every stat fail.
    f.config.index_dir = f.dir.path() / std::string(300, 'x') / "index";

    auto manager = f.open();
    ASSERT(manager->is_initialized() && manager->size() == 0, "reset policy should start empty");
    ASSERT(manager->add_document("A", "0,0"), "reset index should accept documents");

    f.config.load_failure_policy = Config::LoadFailurePolicy::FAIL;
    IndexManager strict(f.config, f.generator, f.store, f.text);
    ASSERT_THROWS(strict.initialize(), PersistenceError, "fail policy should report the unreadable directory");
    ASSERT(!strict.is_initialized(), "failed initialize should leave the manager unusable");
}

TEST(snapshot_dimension_mismatch) {
    Fixture f("im_dim");
    {
        auto manager = f.open();
        manager->add_document("A", "0,0");
        manager->shutdown();
    }

    VectorTextEmbedder* wide = nullptr;
    auto backend = std::make_unique<VectorTextEmbedder>(3);
    wide = backend.get();
    EmbeddingGenerator generator3(std::move(backend));
    ASSERT(wide != nullptr && generator3.dimension() == 3, "three-dimensional generator");

    Config config = f.config;
    config.load_failure_policy = Config::LoadFailurePolicy::FAIL;
    IndexManager strict(config, generator3, f.store, f.text);
    ASSERT_THROWS(strict.initialize(), PersistenceError, "dimension mismatch should fail under fail policy");

    config.load_failure_policy = Config::LoadFailurePolicy::RESET;
    IndexManager lenient(config, generator3, f.store, f.text);
    lenient.initialize();
    ASSERT(lenient.size() == 0 && lenient.stats().dimension == 3, "reset should rebuild at the model dimension");
}

TEST(save_failure_is_reported) {
    Fixture f("im_save_fail");
    overwrite(f.dir.path() / "blocker", "not a directory");
    f.config.index_dir = f.dir.path() / "blocker" / "index";

    auto manager = f.open();
    auto result = manager->update_index(line_of_points(3), 50);
    ASSERT(result.added == 3, "documents should still be added in memory");
    ASSERT(!result.persist_error.empty() && result.checkpoints == 0, "save failure should be reported");
    ASSERT_THROWS(manager->save(), PersistenceError, "explicit save should throw");
    ASSERT(manager->size() == 3, "in-memory state should be intact");
}

TEST(lifecycle_guards) {
    Fixture f("im_lifecycle");
    IndexManager manager(f.config, f.generator, f.store, f.text);
    ASSERT(!manager.is_initialized(), "not initialized yet");
    ASSERT_THROWS(manager.size(), std::logic_error, "use before initialize should throw");
    ASSERT_THROWS(manager.add_document("A", "0,0"), std::logic_error, "add before initialize should throw");

    manager.initialize();
    ASSERT(manager.stats().variant == IndexVariant::Exact && manager.stats().next_id == 1, "fresh stats");
    manager.shutdown();
    ASSERT_THROWS(manager.keys(), std::logic_error, "use after shutdown should throw");
}

TEST(concurrent_searches_during_updates) {
    Fixture f("im_concurrent");
    auto manager = f.open();
    manager->add_document("seed", "0,0");

    std::atomic<bool> done{false};
    std::atomic<bool> bad{false};
    auto reader = [&]() {
        while (!done) {
            auto hits = manager->find_similar_by_vector({0.0f, 0.0f}, 5);
            if (hits.empty() || hits[0].key != "seed") bad = true;
        }
    };
    std::thread r1(reader);
    std::thread r2(reader);

    auto result = manager->update_index(line_of_points(40), 50);
    done = true;
    r1.join();
    r2.join();

    ASSERT(!bad, "readers should always see the seed document first");
    ASSERT(result.added == 40 && manager->is_consistent(), "all updates should land consistently");
}

int main() {
    RUN_TEST(nearest_and_after_removal);
    RUN_TEST(search_bounds);
    RUN_TEST(replace_keeps_one_entry);
    RUN_TEST(add_remove_inverse);
    RUN_TEST(encode_failure_changes_nothing);
    RUN_TEST(notification_failure_rolls_back);
    RUN_TEST(find_similar_by_key_excludes_self);
    RUN_TEST(find_similar_by_text);
    RUN_TEST(clustered_undersized_sample_degrades);
    RUN_TEST(clustered_strict_policy_throws);
    RUN_TEST(clustered_add_before_training);
    RUN_TEST(batch_failures_are_isolated);
    RUN_TEST(batch_size_limits_work);
    RUN_TEST(checkpoint_cadence);
    RUN_TEST(store_driven_update);
    RUN_TEST(round_trip_through_fresh_instance);
    RUN_TEST(orphans_and_dangling_entries_pruned);
    RUN_TEST(id_map_without_vectors_resets);
    RUN_TEST(corrupt_snapshot_policies);
    RUN_TEST(inaccessible_index_dir_policies);
    RUN_TEST(snapshot_dimension_mismatch);
    RUN_TEST(save_failure_is_reported);
    RUN_TEST(lifecycle_guards);
    RUN_TEST(concurrent_searches_during_updates);
    return vellum::test::summary("index_manager");
}
