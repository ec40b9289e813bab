#include <gtest/gtest.h>

#include "history/recordstorage.h"
#include "testfiles.h"

#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>

namespace {

class RecordStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.isValid());
        m_path = m_dir.filePath("data/WeightCalorie.txt");
    }

    QTemporaryDir m_dir;
    QString m_path;
};

TEST_F(RecordStorageTest, LoadMissingFileReturnsEmpty) {
    RecordStorage storage(m_path);
    EXPECT_FALSE(storage.exists());
    EXPECT_TRUE(storage.load().isEmpty());
}

TEST_F(RecordStorageTest, AppendAddsRecordAtEndAndKeepsOthers) {
    RecordStorage storage(m_path);
    ASSERT_TRUE(storage.append({"1/1/2024", "180.2", "2100"}));
    ASSERT_TRUE(storage.append({"1/2/2024", "179.8", "1950"}));

    WeightRecordList before = storage.load();
    WeightRecord added{"1/3/2024", "179.1", "2000"};
    ASSERT_TRUE(storage.append(added));

    WeightRecordList after = storage.load();
    ASSERT_EQ(after.size(), before.size() + 1);
    EXPECT_EQ(after.last(), added);
    for (qsizetype i = 0; i < before.size(); ++i) {
        EXPECT_EQ(after[i], before[i]);
    }
    EXPECT_EQ(readBytes(m_path), QByteArray("1/1/2024,180.2,2100\n1/2/2024,179.8,1950\n1/3/2024,179.1,2000\n"));
}

TEST_F(RecordStorageTest, LoadDropsMalformedLines) {
    RecordStorage storage(m_path);
    ASSERT_TRUE(storage.append({"1/1/2024", "180", "2000"}));
    ASSERT_TRUE(appendBytes(m_path, "garbage\n1/2/2024,179\n\n1/3/2024,178,1900,extra\n1/4/2024,177,1800\n"));

    WeightRecordList records = storage.load();
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].date, "1/1/2024");
    EXPECT_EQ(records[1].date, "1/4/2024");
}

TEST_F(RecordStorageTest, LoadAcceptsWindowsLineEndings) {
    ASSERT_TRUE(QDir().mkpath(QFileInfo(m_path).absolutePath()));
    ASSERT_TRUE(writeBytes(m_path, "1/1/2024,180,2000\r\n1/2/2024,179,1900\r\n"));

    RecordStorage storage(m_path);
    WeightRecordList records = storage.load();
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[1].calorie, "1900");
}

TEST_F(RecordStorageTest, UpdateRewritesFirstMatchOnly) {
    RecordStorage storage(m_path);
    ASSERT_TRUE(storage.append({"1/1/2024", "180", "2000"}));
    ASSERT_TRUE(storage.append({"1/2/2024", "179", "1900"}));
    ASSERT_TRUE(storage.append({"1/2/2024", "178", "1800"}));

    ASSERT_TRUE(storage.update("1/2/2024", "175.5", "1700"));

    WeightRecordList records = storage.load();
    ASSERT_EQ(records.size(), 3);
    EXPECT_EQ(records[0], (WeightRecord{"1/1/2024", "180", "2000"}));
    EXPECT_EQ(records[1], (WeightRecord{"1/2/2024", "175.5", "1700"}));
    EXPECT_EQ(records[2], (WeightRecord{"1/2/2024", "178", "1800"}));
}

TEST_F(RecordStorageTest, UpdateUnknownDateLeavesFileByteIdentical) {
    RecordStorage storage(m_path);
    ASSERT_TRUE(storage.append({"1/1/2024", "180", "2000"}));
    ASSERT_TRUE(appendBytes(m_path, "not a record\n"));
    QByteArray before = readBytes(m_path);

    int changed = 0;
    QObject::connect(&storage, &RecordStorage::recordsChanged, [&changed]() { changed++; });
    EXPECT_TRUE(storage.update("2/2/2024", "170", "1500"));

    EXPECT_EQ(readBytes(m_path), before);
    EXPECT_EQ(changed, 0);
}

TEST_F(RecordStorageTest, UpdateMatchesWholeDateField) {
    RecordStorage storage(m_path);
    ASSERT_TRUE(storage.append({"2024-01-10", "180", "2000"}));

    EXPECT_TRUE(storage.update("2024-01-1", "170", "1500"));
    EXPECT_EQ(storage.load().first().weight, "180");
}

TEST_F(RecordStorageTest, RemoveDeletesAllAndOnlyMatchingDates) {
    RecordStorage storage(m_path);
    ASSERT_TRUE(storage.append({"2024-01-1", "181", "2100"}));
    ASSERT_TRUE(storage.append({"2024-01-10", "180", "2000"}));
    ASSERT_TRUE(storage.append({"2024-01-1", "179", "1900"}));
    ASSERT_TRUE(storage.append({"2024-01-2", "178", "1800"}));

    ASSERT_TRUE(storage.remove("2024-01-1"));

    WeightRecordList records = storage.load();
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[0].date, "2024-01-10");
    EXPECT_EQ(records[1].date, "2024-01-2");
}

TEST_F(RecordStorageTest, RemoveUnknownDateLeavesFileUnchanged) {
    RecordStorage storage(m_path);
    ASSERT_TRUE(storage.append({"1/1/2024", "180", "2000"}));
    QByteArray before = readBytes(m_path);

    EXPECT_TRUE(storage.remove("3/3/2024"));
    EXPECT_EQ(readBytes(m_path), before);
}

TEST_F(RecordStorageTest, MutationsOnMissingFileAreNoOps) {
    RecordStorage storage(m_path);
    EXPECT_TRUE(storage.update("1/1/2024", "180", "2000"));
    EXPECT_TRUE(storage.remove("1/1/2024"));
    EXPECT_FALSE(storage.exists());
}

TEST_F(RecordStorageTest, AppendFailureIsReported) {
    // The store path is a directory, so it cannot be opened for append
    QString dirPath = m_dir.filePath("occupied");
    ASSERT_TRUE(QDir().mkpath(dirPath));

    RecordStorage storage(dirPath);
    QStringList errors;
    QObject::connect(&storage, &RecordStorage::errorOccurred,
                     [&errors](const QString& error) { errors.append(error); });

    EXPECT_FALSE(storage.append({"1/1/2024", "180", "2000"}));
    EXPECT_FALSE(storage.lastError().isEmpty());
    EXPECT_EQ(errors.size(), 1);
}

}  // namespace
