#include <QtTest>
#include <QTemporaryDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QFile>
#include "settingsstore.h"

class SettingsStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void test_missing_file_yields_defaults();
    void test_known_keys_override_defaults();
    void test_malformed_file_yields_defaults();
    void test_invalid_values_keep_defaults();
    void test_oversized_values_keep_defaults();
    void test_largest_values_are_accepted();
    void test_save_then_load_round_trip();
    void test_save_writes_flat_keys();
    void test_save_overwrites_previous_file();
    void test_save_rejects_invalid_settings();
    void test_save_reports_unwritable_path();

private:
    static void writeFile(const QString &path, const QByteArray &contents);
};

void SettingsStoreTest::writeFile(const QString &path, const QByteArray &contents)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(contents);
    file.close();
}

void SettingsStoreTest::test_missing_file_yields_defaults()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    SettingsStore store(tempDir.filePath("pomodoro_settings.json"));

    TimerSettings settings = store.load();
    QCOMPARE(settings.workMinutes, 25);
    QCOMPARE(settings.breakMinutes, 5);
    QCOMPARE(settings.longBreakMinutes, 15);
    QCOMPARE(settings.sessionsBeforeLongBreak, 4);
    QCOMPARE(settings.soundEnabled, true);
    QCOMPARE(settings.autoAdvance, false);
    QVERIFY(settings == SettingsStore::defaults());
}

void SettingsStoreTest::test_known_keys_override_defaults()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QString path = tempDir.filePath("pomodoro_settings.json");
    writeFile(path, R"({"work_time": 50, "auto_start_breaks": true, "theme": "dark"})");

    TimerSettings settings = SettingsStore(path).load();
    QCOMPARE(settings.workMinutes, 50);
    QCOMPARE(settings.autoAdvance, true);
    // Absent keys keep their defaults
    QCOMPARE(settings.breakMinutes, 5);
    QCOMPARE(settings.longBreakMinutes, 15);
    QCOMPARE(settings.sessionsBeforeLongBreak, 4);
    QCOMPARE(settings.soundEnabled, true);
}

void SettingsStoreTest::test_malformed_file_yields_defaults()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QString path = tempDir.filePath("pomodoro_settings.json");

    writeFile(path, "{\"work_time\": 40,");
    QVERIFY(SettingsStore(path).load() == SettingsStore::defaults());

    writeFile(path, "[1, 2, 3]");
    QVERIFY(SettingsStore(path).load() == SettingsStore::defaults());
}

void SettingsStoreTest::test_invalid_values_keep_defaults()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QString path = tempDir.filePath("pomodoro_settings.json");
    writeFile(path, R"({"work_time": 0, "break_time": -3, "long_break_time": "ten",
                        "sessions_before_long_break": 2.5, "sound_enabled": 1,
                        "auto_start_breaks": "yes"})");

    QVERIFY(SettingsStore(path).load() == SettingsStore::defaults());
}

void SettingsStoreTest::test_oversized_values_keep_defaults()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QString path = tempDir.filePath("pomodoro_settings.json");
    writeFile(path, R"({"work_time": 40000000, "break_time": 1441, "long_break_time": 1e12,
                        "sessions_before_long_break": 100})");

    QVERIFY(SettingsStore(path).load() == SettingsStore::defaults());

    TimerSettings settings;
    settings.workMinutes = 40000000;
    QVERIFY(!settings.isValid());
    QString error;
    QVERIFY(!SettingsStore(path).save(settings, &error));
    QVERIFY(!error.isEmpty());
}

void SettingsStoreTest::test_largest_values_are_accepted()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QString path = tempDir.filePath("pomodoro_settings.json");
    writeFile(path, R"({"work_time": 1440, "break_time": 240, "sessions_before_long_break": 99})");

    TimerSettings settings = SettingsStore(path).load();
    QCOMPARE(settings.workMinutes, TimerSettings::MaxMinutes);
    QCOMPARE(settings.breakMinutes, 240);
    QCOMPARE(settings.sessionsBeforeLongBreak, TimerSettings::MaxSessionsBeforeLongBreak);
    QVERIFY(settings.isValid());

    QVERIFY(SettingsStore(path).save(settings));
    QVERIFY(SettingsStore(path).load() == settings);
}

void SettingsStoreTest::test_save_then_load_round_trip()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    SettingsStore store(tempDir.filePath("pomodoro_settings.json"));

    TimerSettings settings;
    settings.workMinutes = 45;
    settings.breakMinutes = 10;
    settings.longBreakMinutes = 30;
    settings.sessionsBeforeLongBreak = 3;
    settings.soundEnabled = false;
    settings.autoAdvance = true;

    QString error;
    QVERIFY(store.save(settings, &error));
    QVERIFY(error.isEmpty());
    QVERIFY(store.load() == settings);
}

void SettingsStoreTest::test_save_writes_flat_keys()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QString path = tempDir.filePath("pomodoro_settings.json");
    QVERIFY(SettingsStore(path).save(SettingsStore::defaults()));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QJsonObject obj = QJsonDocument::fromJson(file.readAll()).object();
    QCOMPARE(obj.size(), 6);
    QCOMPARE(obj.value("work_time").toInt(), 25);
    QCOMPARE(obj.value("break_time").toInt(), 5);
    QCOMPARE(obj.value("long_break_time").toInt(), 15);
    QCOMPARE(obj.value("sessions_before_long_break").toInt(), 4);
    QVERIFY(obj.value("sound_enabled").isBool());
    QCOMPARE(obj.value("sound_enabled").toBool(), true);
    QVERIFY(obj.value("auto_start_breaks").isBool());
    QCOMPARE(obj.value("auto_start_breaks").toBool(), false);
}

void SettingsStoreTest::test_save_overwrites_previous_file()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QString path = tempDir.filePath("pomodoro_settings.json");
    writeFile(path, R"({"work_time": 60, "legacy_key": 1})");

    SettingsStore store(path);
    TimerSettings settings;
    settings.breakMinutes = 7;
    QVERIFY(store.save(settings));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QJsonObject obj = QJsonDocument::fromJson(file.readAll()).object();
    QVERIFY(!obj.contains("legacy_key"));
    QCOMPARE(obj.value("work_time").toInt(), 25);
    QCOMPARE(store.load().breakMinutes, 7);
}

void SettingsStoreTest::test_save_rejects_invalid_settings()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    QString path = tempDir.filePath("pomodoro_settings.json");
    SettingsStore store(path);

    TimerSettings settings;
    settings.longBreakMinutes = 0;
    QVERIFY(!settings.isValid());

    QString error;
    QVERIFY(!store.save(settings, &error));
    QVERIFY(!error.isEmpty());
    QVERIFY(!QFile::exists(path));
}

void SettingsStoreTest::test_save_reports_unwritable_path()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    SettingsStore store(tempDir.filePath("missing/dir/pomodoro_settings.json"));

    QString error;
    QVERIFY(!store.save(SettingsStore::defaults(), &error));
    QVERIFY(!error.isEmpty());
    // Loading from the same place still degrades to defaults
    QVERIFY(store.load() == SettingsStore::defaults());
}

QTEST_GUILESS_MAIN(SettingsStoreTest)
#include "tst_settingsstore.moc"
