#include <gtest/gtest.h>

#include <fstream>

#include "Store/FileTaskStore.hpp"
#include "TestDoubles.hpp"

using namespace tsched;
using tsched::test::TempDir;
using tsched::test::makeRecord;

namespace {

void writeFile(const std::filesystem::path& p, const std::string& text) {
    std::ofstream out(p, std::ios::trunc);
    out << text;
}

} // namespace

TEST(FileTaskStore, MissingFileLoadsEmpty) {
    TempDir dir;
    FileTaskStore store(dir.file("absent.json").string());
    EXPECT_TRUE(store.load(1000.0).empty());
}

TEST(FileTaskStore, SaveThenLoadKeepsFieldsAndPayload) {
    TempDir dir;
    FileTaskStore store(dir.file("tasks.json").string());

    TaskRecord once = makeRecord("once", 2000.5, 3);
    once.payload = json::Value::parse(R"({"agent":"MessagingAgent","action":"send","params":{"to":["ops"],"n":7}})");

    TaskRecord rec = makeRecord("series", 3000, 1);
    rec.recurring = true;
    rec.interval  = std::chrono::seconds(60);

    store.save({once, rec});
    auto loaded = store.load(1000.0);

    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].id, "once");
    EXPECT_DOUBLE_EQ(loaded[0].dueTime, 2000.5);
    EXPECT_EQ(loaded[0].priority, 3);
    EXPECT_EQ(loaded[0].payload, once.payload);
    EXPECT_FALSE(loaded[0].recurring);
    EXPECT_FALSE(loaded[0].interval.has_value());

    EXPECT_EQ(loaded[1].id, "series");
    EXPECT_TRUE(loaded[1].recurring);
    ASSERT_TRUE(loaded[1].interval.has_value());
    EXPECT_EQ(loaded[1].interval->count(), 60);
}

TEST(FileTaskStore, SnapshotUsesDocumentedFieldNames) {
    TempDir dir;
    FileTaskStore store(dir.file("tasks.json").string());
    store.save({makeRecord("a", 2000, 2)});

    std::ifstream in(dir.file("tasks.json"));
    std::stringstream ss;
    ss << in.rdbuf();
    json::Value doc = json::Value::parse(ss.str());

    ASSERT_TRUE(doc.isArray());
    ASSERT_EQ(doc.size(), 1u);
    const json::Value& item = doc.asArray()[0];
    EXPECT_EQ(item.getString("task_id"), "a");
    EXPECT_DOUBLE_EQ(item.find("timestamp")->asDouble(), 2000.0);
    EXPECT_EQ(item.find("priority")->asInt(), 2);
    EXPECT_TRUE(item.find("task_data")->isObject());
    EXPECT_FALSE(item.find("recurring")->asBool());
    EXPECT_TRUE(item.find("recurrence_interval")->isNull());
}

TEST(FileTaskStore, ExpiredRecordsAreDroppedOnLoad) {
    TempDir dir;
    FileTaskStore store(dir.file("tasks.json").string());
    store.save({makeRecord("past", 900), makeRecord("edge", 1000), makeRecord("future", 1100)});

    auto loaded = store.load(1000.0);
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].id, "future");
}

TEST(FileTaskStore, CorruptSnapshotThrowsPersistenceError) {
    TempDir dir;
    writeFile(dir.file("bad.json"), "[{\"task_id\": ");
    FileTaskStore store(dir.file("bad.json").string());
    EXPECT_THROW(store.load(0.0), PersistenceError);

    writeFile(dir.file("obj.json"), "{\"task_id\":\"x\"}");
    FileTaskStore notArray(dir.file("obj.json").string());
    EXPECT_THROW(notArray.load(0.0), PersistenceError);

    writeFile(dir.file("partial.json"), "[{\"task_id\":\"x\",\"priority\":1}]");
    FileTaskStore partial(dir.file("partial.json").string());
    EXPECT_THROW(partial.load(0.0), PersistenceError);
}

TEST(FileTaskStore, OutOfRangeNumbersAreCorruption) {
    TempDir dir;
    writeFile(dir.file("prio.json"),
              R"([{"timestamp":5000,"priority":4294967297,"task_id":"x","task_data":{},"recurring":false,"recurrence_interval":null}])");
    EXPECT_THROW(FileTaskStore(dir.file("prio.json").string()).load(0.0), PersistenceError);

    writeFile(dir.file("interval.json"),
              R"([{"timestamp":5000,"priority":1,"task_id":"x","task_data":{},"recurring":true,"recurrence_interval":1e30}])");
    EXPECT_THROW(FileTaskStore(dir.file("interval.json").string()).load(0.0), PersistenceError);
}

TEST(FileTaskStore, SaveCreatesParentDirectories) {
    TempDir dir;
    auto nested = dir.path() / "data" / "deep" / "tasks.json";
    FileTaskStore store(nested.string());

    store.save({makeRecord("a", 5000)});
    EXPECT_TRUE(std::filesystem::exists(nested));
    EXPECT_EQ(store.load(0.0).size(), 1u);
}

TEST(FileTaskStore, SaveOverwritesPreviousSnapshot) {
    TempDir dir;
    FileTaskStore store(dir.file("tasks.json").string());
    store.save({makeRecord("a", 5000), makeRecord("b", 6000)});
    store.save({makeRecord("c", 7000)});

    auto loaded = store.load(0.0);
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].id, "c");
}
