#include <filesystem>
#include <gtest/gtest.h>
#include "../../src/state/state_file.hpp"
#include "../../src/storage/disk_storage.hpp"

using namespace Burrow::State;
using namespace Burrow::Engine;
using Burrow::Core::Config;
using Burrow::Storage::DiskStorage;
namespace fs = std::filesystem;

class StateTest : public ::testing::Test {
protected:
    std::shared_ptr<RunConfig> config = std::make_shared<RunConfig>();

    void SetUp() override {
        if (fs::exists("test_state_out"))
            fs::remove_all("test_state_out");
        config->targets  = {"http://host/"};
        config->wordlist = "words.txt";
        config->threads  = 12;
    }

    void TearDown() override {
        if (fs::exists("test_state_out"))
            fs::remove_all("test_state_out");
    }

    static Response result(const std::string& url) {
        Response r;
        r.url         = url;
        r.status_code = 200;
        r.body        = "<html>secret body</html>";
        return r;
    }
};

TEST_F(StateTest, CheckpointWritesCompleteFile) {
    ScanRegistry   registry(config);
    ResponseBuffer responses;

    auto a = registry.register_scan("http://host/", ScanType::Initial, std::nullopt, 0);
    auto b = registry.register_scan("http://host/admin/", ScanType::Directory, a, 1);
    registry.transition(*a, ScanStatus::Running);
    registry.transition(*a, ScanStatus::Complete);
    registry.transition(*b, ScanStatus::Running);
    responses.append(result("http://host/admin"));

    StatePersistence persistence(
        config, registry, responses, std::make_unique<DiskStorage>("test_state_out"), "run.state");
    ASSERT_TRUE(persistence.checkpoint());

    EXPECT_TRUE(fs::exists("test_state_out/run.state"));
    EXPECT_FALSE(fs::exists("test_state_out/run.state.tmp"));

    DiskStorage storage("test_state_out");
    std::string text = storage.load("run.state");
    EXPECT_EQ(text.find("secret body"), std::string::npos);

    auto state = StatePersistence::load(storage, "run.state");
    ASSERT_EQ(state.scans.size(), 2u);
    EXPECT_EQ(state.scans[0].status, ScanStatus::Complete);
    EXPECT_EQ(state.scans[1].status, ScanStatus::Running);
    EXPECT_EQ(state.config.threads, 12);
    ASSERT_EQ(state.responses.size(), 1u);
    EXPECT_EQ(state.responses[0].url, "http://host/admin");
}

TEST_F(StateTest, ReseedRequeuesUnfinishedScans) {
    Scan done;
    done.id     = 1;
    done.status = ScanStatus::Complete;

    Scan running;
    running.id     = 2;
    running.status = ScanStatus::Running;

    Scan cancelled;
    cancelled.id            = 3;
    cancelled.status        = ScanStatus::Cancelled;
    cancelled.cancel_reason = "time limit";

    auto scans = StatePersistence::reseed({done, running, cancelled});
    EXPECT_EQ(scans[0].status, ScanStatus::Complete);
    EXPECT_EQ(scans[1].status, ScanStatus::Queued);
    EXPECT_EQ(scans[2].status, ScanStatus::Queued);
    EXPECT_TRUE(scans[2].cancel_reason.empty());
}

TEST_F(StateTest, RestoreSeedsRegistryAndBuffer) {
    StateFile state;
    state.config = *config;

    Scan root;
    root.id       = 1;
    root.base_url = "http://host/";
    root.status   = ScanStatus::Complete;

    Scan child;
    child.id        = 4;
    child.base_url  = "http://host/api/";
    child.scan_type = ScanType::Directory;
    child.parent_id = 1;
    child.depth     = 1;
    child.status    = ScanStatus::Running;

    state.scans     = {root, child};
    state.responses = {result("http://host/api")};

    ScanRegistry   registry(config);
    ResponseBuffer responses;
    StatePersistence::restore(state, registry, responses);

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.find(4)->status, ScanStatus::Queued);
    EXPECT_EQ(registry.count(ScanStatus::Complete), 1u);
    EXPECT_TRUE(responses.contains("http://host/api"));

    auto next = registry.register_scan("http://host/api/v1/", ScanType::Directory, ScanId{4}, 2);
    ASSERT_TRUE(next);
    EXPECT_EQ(*next, 5u);
}

TEST_F(StateTest, CollectedExtensionsSurviveResume) {
    ScanRegistry   registry(config);
    ResponseBuffer responses;
    registry.register_scan("http://host/", ScanType::Initial, std::nullopt, 0);
    registry.add_extension("php");
    registry.add_extension("asp");

    StatePersistence persistence(
        config, registry, responses, std::make_unique<DiskStorage>("test_state_out"), "run.state");
    ASSERT_TRUE(persistence.checkpoint());

    DiskStorage storage("test_state_out");
    auto        state = StatePersistence::load(storage, "run.state");
    std::vector<std::string> expected = {"php", "asp"};
    EXPECT_EQ(state.collected_extensions, expected);

    ScanRegistry   resumed(config);
    ResponseBuffer buffer;
    StatePersistence::restore(state, resumed, buffer);
    EXPECT_EQ(resumed.extensions(), expected);
    EXPECT_FALSE(resumed.add_extension("php"));
}

TEST_F(StateTest, IncompatibleInvocation) {
    Config same;
    same.urls     = {"http://host"};
    same.wordlist = "words.txt";
    EXPECT_NO_THROW(StatePersistence::check_compatible(*config, same));

    Config unnamed;
    EXPECT_NO_THROW(StatePersistence::check_compatible(*config, unnamed));

    Config other_target;
    other_target.urls = {"http://elsewhere/"};
    EXPECT_THROW(StatePersistence::check_compatible(*config, other_target), StateError);

    Config other_words;
    other_words.wordlist = "big.txt";
    EXPECT_THROW(StatePersistence::check_compatible(*config, other_words), StateError);
}

TEST_F(StateTest, MalformedFiles) {
    EXPECT_THROW(StateFile::deserialize("not json"), StateError);
    EXPECT_THROW(StateFile::deserialize(R"({"scans": []})"), StateError);

    DiskStorage storage("test_state_out");
    EXPECT_THROW(StatePersistence::load(storage, "missing.state"), StateError);

    StateFile invalid;
    invalid.config = *config;
    invalid.config.targets.clear();
    EXPECT_THROW(StateFile::deserialize(invalid.serialize()), StateError);
}

TEST_F(StateTest, DefaultPathNamesHost) {
    config->targets = {"http://host:8080/"};
    std::string path = StatePersistence::default_path(*config);
    EXPECT_EQ(path.rfind("burrow-host_8080-", 0), 0u);
    EXPECT_EQ(path.substr(path.size() - 6), ".state");
}
