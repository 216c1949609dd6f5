#include <gtest/gtest.h>
#include "../src/graph/DiffWorkerPool.h"
#include "../src/graph/GraphSerializer.h"
#include <filesystem>
#include <new>

namespace fs = std::filesystem;

namespace bacnet_scan {

class DiffWorkerPoolTest : public ::testing::Test {
protected:
    fs::path dir;
    void SetUp() override {
        dir = fs::temp_directory_path() / (std::string("bacnet_pool_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    void TearDown() override { fs::remove_all(dir); }

    std::string snapshot(const std::string& name, std::vector<DeviceInstance> instances){
        TopologyGraph g;
        for(auto i : instances) g.ensure_node(node_key::device(i), NodeType::Device).set_device_instance(i);
        fs::path p = dir / name;
        ntriples::save_file(p.string(), g.to_triples());
        return p.string();
    }
};

TEST(DiffWorkerPoolNameTest, MergedNameUsesStems) {
    EXPECT_EQ(DiffWorkerPool::merged_name("/a/bacnet_graph_1.nt", "b/bacnet_graph_2.nt"), "bacnet_graph_1_vs_bacnet_graph_2.nt");
}

TEST_F(DiffWorkerPoolTest, ResultsArriveThroughFutures) {
    std::string a = snapshot("a.nt", {1, 2});
    std::string b = snapshot("b.nt", {2, 3});
    std::string c = snapshot("c.nt", {1, 2});
    DiffWorkerPool pool(2);
    auto f1 = pool.submit({a, b, (dir / "out").string()});
    auto f2 = pool.submit({a, c, ""});

    DiffOutcome o1 = f1.get();
    ASSERT_TRUE(o1.ok) << o1.error;
    EXPECT_FALSE(o1.result.identical());
    EXPECT_FALSE(o1.result.only_in_a.empty());
    EXPECT_FALSE(o1.result.only_in_b.empty());
    EXPECT_EQ(fs::path(o1.output_path).filename().string(), "a_vs_b.nt");
    EXPECT_TRUE(fs::exists(o1.output_path));

    DiffOutcome o2 = f2.get();
    ASSERT_TRUE(o2.ok);
    EXPECT_TRUE(o2.result.identical());
    EXPECT_TRUE(o2.output_path.empty());
}

TEST_F(DiffWorkerPoolTest, BadInputFailsOnlyThatJob) {
    std::string a = snapshot("a.nt", {1});
    DiffWorkerPool pool(1);
    auto bad = pool.submit({a, (dir / "missing.nt").string(), ""});
    auto good = pool.submit({a, a, ""});
    DiffOutcome o = bad.get();
    EXPECT_FALSE(o.ok);
    EXPECT_FALSE(o.error.empty());
    EXPECT_TRUE(good.get().ok);
}

TEST_F(DiffWorkerPoolTest, ThrowingDiffFailsFutureAndWorkerSurvives) {
    std::string a = snapshot("a.nt", {1});
    DiffWorkerPool pool(1, [](const std::string& path_a, const std::string& path_b, const std::string& out){
        if(path_b == "boom") throw std::bad_alloc();
        return diff_snapshot_files(path_a, path_b, out);
    });
    auto bad = pool.submit({a, "boom", ""});
    EXPECT_THROW(bad.get(), std::bad_alloc);
    auto good = pool.submit({a, a, ""});
    EXPECT_TRUE(good.get().ok);
    EXPECT_EQ(pool.in_progress(), 0u);
}

TEST_F(DiffWorkerPoolTest, ShutdownDrainsQueueThenRejects) {
    std::string a = snapshot("a.nt", {1});
    DiffWorkerPool pool(1);
    std::vector<std::future<DiffOutcome>> futures;
    for(int i = 0; i < 5; ++i) futures.push_back(pool.submit({a, a, ""}));
    pool.shutdown();
    for(auto& f : futures) EXPECT_TRUE(f.get().ok);
    EXPECT_EQ(pool.pending(), 0u);
    EXPECT_EQ(pool.in_progress(), 0u);
    EXPECT_THROW(pool.submit({a, a, ""}), std::runtime_error);
    EXPECT_NO_THROW(pool.shutdown());
}

}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
