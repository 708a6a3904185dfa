#include "settingsstore.h"
#include <QDebug>
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

namespace {
const char *const kWorkTime = "work_time";
const char *const kBreakTime = "break_time";
const char *const kLongBreakTime = "long_break_time";
const char *const kSessionsBeforeLongBreak = "sessions_before_long_break";
const char *const kSoundEnabled = "sound_enabled";
const char *const kAutoStartBreaks = "auto_start_breaks";
}

bool TimerSettings::isValid() const
{
    return workMinutes > 0 && workMinutes <= MaxMinutes
        && breakMinutes > 0 && breakMinutes <= MaxMinutes
        && longBreakMinutes > 0 && longBreakMinutes <= MaxMinutes
        && sessionsBeforeLongBreak > 0 && sessionsBeforeLongBreak <= MaxSessionsBeforeLongBreak;
}

QJsonObject TimerSettings::toJson() const
{
    QJsonObject obj;
    obj[kWorkTime] = workMinutes;
    obj[kBreakTime] = breakMinutes;
    obj[kLongBreakTime] = longBreakMinutes;
    obj[kSessionsBeforeLongBreak] = sessionsBeforeLongBreak;
    obj[kSoundEnabled] = soundEnabled;
    obj[kAutoStartBreaks] = autoAdvance;
    return obj;
}

bool TimerSettings::operator==(const TimerSettings &other) const
{
    return workMinutes == other.workMinutes
        && breakMinutes == other.breakMinutes
        && longBreakMinutes == other.longBreakMinutes
        && sessionsBeforeLongBreak == other.sessionsBeforeLongBreak
        && soundEnabled == other.soundEnabled
        && autoAdvance == other.autoAdvance;
}

SettingsStore::SettingsStore(const QString &filePath)
    : path(filePath)
{
}

QString SettingsStore::defaultFilePath()
{
    return QStringLiteral("pomodoro_settings.json");
}

TimerSettings SettingsStore::defaults()
{
    return TimerSettings();
}

QString SettingsStore::filePath() const
{
    return path;
}

TimerSettings SettingsStore::load() const
{
    TimerSettings settings = defaults();

    QFile file(path);
    if (!file.exists()) {
        qDebug() << "No settings file at" << path << "- using defaults";
        return settings;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Could not read settings file" << path << ":" << file.errorString();
        return settings;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "Ignoring malformed settings file" << path << ":" << parseError.errorString();
        return settings;
    }
    if (!doc.isObject()) {
        qWarning() << "Ignoring settings file" << path << ": top level is not an object";
        return settings;
    }

    QJsonObject obj = doc.object();
    applyCount(obj, kWorkTime, TimerSettings::MaxMinutes, settings.workMinutes);
    applyCount(obj, kBreakTime, TimerSettings::MaxMinutes, settings.breakMinutes);
    applyCount(obj, kLongBreakTime, TimerSettings::MaxMinutes, settings.longBreakMinutes);
    applyCount(obj, kSessionsBeforeLongBreak, TimerSettings::MaxSessionsBeforeLongBreak,
               settings.sessionsBeforeLongBreak);
    applyFlag(obj, kSoundEnabled, settings.soundEnabled);
    applyFlag(obj, kAutoStartBreaks, settings.autoAdvance);
    return settings;
}

bool SettingsStore::save(const TimerSettings &settings, QString *errorMessage) const
{
    if (!settings.isValid()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Durations must be between 1 and %1 minutes and the session count between 1 and %2.")
                                .arg(TimerSettings::MaxMinutes)
                                .arg(TimerSettings::MaxSessionsBeforeLongBreak);
        qWarning() << "Refusing to save invalid settings";
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage)
            *errorMessage = file.errorString();
        qWarning() << "Failed to open settings file for writing:" << path << file.errorString();
        return false;
    }

    file.write(QJsonDocument(settings.toJson()).toJson());
    if (!file.commit()) {
        if (errorMessage)
            *errorMessage = file.errorString();
        qWarning() << "Failed to write settings file:" << path << file.errorString();
        return false;
    }

    qDebug() << "Settings saved to" << path;
    return true;
}

void SettingsStore::applyCount(const QJsonObject &obj, const char *key, int maximum, int &target)
{
    if (!obj.contains(QLatin1String(key)))
        return;

    QJsonValue value = obj.value(QLatin1String(key));
    if (!value.isDouble()) {
        qWarning() << "Settings key" << key << "is not a number, keeping" << target;
        return;
    }
    // JSON numbers are doubles; whole values in [1, maximum] only
    double number = value.toDouble();
    if (number < 1 || number > maximum || number != static_cast<int>(number)) {
        qWarning() << "Settings key" << key << "has invalid value" << number << ", keeping" << target;
        return;
    }
    target = static_cast<int>(number);
}

void SettingsStore::applyFlag(const QJsonObject &obj, const char *key, bool &target)
{
    if (!obj.contains(QLatin1String(key)))
        return;

    QJsonValue value = obj.value(QLatin1String(key));
    if (!value.isBool()) {
        qWarning() << "Settings key" << key << "is not a boolean, keeping" << target;
        return;
    }
    target = value.toBool();
}
