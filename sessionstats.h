#ifndef SESSIONSTATS_H
#define SESSIONSTATS_H

#include <QObject>
#include <QDateTime>
#include <QString>

class SessionStats : public QObject
{
    Q_OBJECT

public:
    struct Snapshot {
        int completedPomodoros;
        qint64 totalFocusMinutes;
    };

    explicit SessionStats(QObject *parent = nullptr);

    void startSession(const QDateTime &now);
    void endSession(const QDateTime &now);
    void discardSession();

    bool hasActiveSession() const;
    QDateTime activeSessionStart() const;
    int completedPomodoros() const;
    qint64 totalFocusSeconds() const;
    Snapshot snapshot() const;

    static QString summary(const Snapshot &snapshot);

signals:
    void statsChanged();

private:
    int completed;
    qint64 focusSeconds;
    QDateTime sessionStart;
};

#endif // SESSIONSTATS_H
