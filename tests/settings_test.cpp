#include <gtest/gtest.h>

#include "core/settings.h"
#include "sync/stabilitywaiter.h"

#include <QTemporaryDir>

namespace {

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.isValid());
        m_iniPath = m_dir.filePath("weighin.ini");
    }

    QTemporaryDir m_dir;
    QString m_iniPath;
};

TEST_F(SettingsTest, DefaultsWhenNothingStored) {
    Settings settings(m_iniPath);
    EXPECT_TRUE(settings.syncEnabled());
    EXPECT_EQ(settings.syncFolder(), Settings::defaultSyncFolder());
    EXPECT_TRUE(settings.exportFolder().endsWith("/Export"));
    EXPECT_TRUE(settings.backupFolder().endsWith("/Backups"));
    EXPECT_EQ(settings.stabilityAttempts(), StabilityWaiter::DEFAULT_ATTEMPTS);
}

TEST_F(SettingsTest, StoredValuesPersistAcrossInstances) {
    {
        Settings settings(m_iniPath);
        settings.setSyncFolder("/data/cloud");
        settings.setStabilityAttempts(4);
    }

    Settings reopened(m_iniPath);
    EXPECT_EQ(reopened.syncFolder(), QString("/data/cloud"));
    EXPECT_EQ(reopened.exportFolder(), QString("/data/cloud/Export"));
    EXPECT_EQ(reopened.stabilityAttempts(), 4);
}

TEST_F(SettingsTest, OverrideLastsOneSessionAndIsNotWritten) {
    {
        Settings settings(m_iniPath);
        settings.setSyncFolder("/data/cloud");
        settings.setOverride("sync/folder", "/tmp/elsewhere");
        settings.setOverride("sync/enabled", false);

        EXPECT_EQ(settings.syncFolder(), QString("/tmp/elsewhere"));
        EXPECT_EQ(settings.value("sync/folder").toString(), QString("/tmp/elsewhere"));
        EXPECT_FALSE(settings.syncEnabled());
    }

    Settings reopened(m_iniPath);
    EXPECT_EQ(reopened.syncFolder(), QString("/data/cloud"));
    EXPECT_TRUE(reopened.syncEnabled());
}

TEST_F(SettingsTest, SetterUnderOverridePersistsWithoutSignalling) {
    {
        Settings settings(m_iniPath);
        settings.setOverride("sync/folder", "/tmp/elsewhere");

        int changes = 0;
        QObject::connect(&settings, &Settings::syncFolderChanged, [&changes]() { changes++; });

        settings.setSyncFolder("/data/cloud");
        EXPECT_EQ(changes, 0);
        EXPECT_EQ(settings.syncFolder(), QString("/tmp/elsewhere"));
    }

    Settings reopened(m_iniPath);
    EXPECT_EQ(reopened.syncFolder(), QString("/data/cloud"));
}

TEST_F(SettingsTest, SetterSignalsOnlyOnChange) {
    Settings settings(m_iniPath);
    int changes = 0;
    QObject::connect(&settings, &Settings::syncEnabledChanged, [&changes]() { changes++; });

    settings.setSyncEnabled(true);
    EXPECT_EQ(changes, 0);
    settings.setSyncEnabled(false);
    EXPECT_EQ(changes, 1);
    EXPECT_FALSE(settings.syncEnabled());
}

}  // namespace
