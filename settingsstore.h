#ifndef SETTINGSSTORE_H
#define SETTINGSSTORE_H

#include <QString>
#include <QJsonObject>

struct TimerSettings
{
    // Upper bounds keep every duration in seconds well inside an int
    static constexpr int MaxMinutes = 24 * 60;
    static constexpr int MaxSessionsBeforeLongBreak = 99;

    int workMinutes = 25;
    int breakMinutes = 5;
    int longBreakMinutes = 15;
    int sessionsBeforeLongBreak = 4;
    bool soundEnabled = true;
    bool autoAdvance = false;

    bool isValid() const;
    QJsonObject toJson() const;

    bool operator==(const TimerSettings &other) const;
    bool operator!=(const TimerSettings &other) const { return !(*this == other); }
};

class SettingsStore
{
public:
    explicit SettingsStore(const QString &filePath = defaultFilePath());

    static QString defaultFilePath();
    static TimerSettings defaults();

    // Never fails: a missing or broken file yields the defaults
    TimerSettings load() const;
    bool save(const TimerSettings &settings, QString *errorMessage = nullptr) const;

    QString filePath() const;

private:
    QString path;

    static void applyCount(const QJsonObject &obj, const char *key, int maximum, int &target);
    static void applyFlag(const QJsonObject &obj, const char *key, bool &target);
};

#endif // SETTINGSSTORE_H
