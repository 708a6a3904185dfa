#include "sessionstats.h"
#include <QDebug>

SessionStats::SessionStats(QObject *parent)
    : QObject(parent)
    , completed(0)
    , focusSeconds(0)
{
}

void SessionStats::startSession(const QDateTime &now)
{
    if (sessionStart.isValid()) {
        qDebug() << "Focus session already active since" << sessionStart.toString(Qt::ISODate)
                 << "- ignoring start";
        return;
    }
    sessionStart = now;
}

void SessionStats::endSession(const QDateTime &now)
{
    if (!sessionStart.isValid())
        return;

    qint64 duration = qMax<qint64>(0, sessionStart.secsTo(now));
    focusSeconds += duration;
    completed++;
    sessionStart = QDateTime();

    qDebug() << "Focus session ended after" << duration << "s, completed:" << completed;
    emit statsChanged();
}

void SessionStats::discardSession()
{
    if (!sessionStart.isValid())
        return;

    qDebug() << "Discarding interrupted focus session started at"
             << sessionStart.toString(Qt::ISODate);
    sessionStart = QDateTime();
}

bool SessionStats::hasActiveSession() const
{
    return sessionStart.isValid();
}

QDateTime SessionStats::activeSessionStart() const
{
    return sessionStart;
}

int SessionStats::completedPomodoros() const
{
    return completed;
}

qint64 SessionStats::totalFocusSeconds() const
{
    return focusSeconds;
}

SessionStats::Snapshot SessionStats::snapshot() const
{
    return { completed, focusSeconds / 60 };
}

QString SessionStats::summary(const Snapshot &snapshot)
{
    if (snapshot.completedPomodoros == 0) {
        return QStringLiteral("Come on, start your Pomodoro!\nToday focus: 0 tomato\nTotal focus: 0 min");
    }
    return QString("today focus: %1 tomatoes\ntotal focus: %2 mins")
        .arg(snapshot.completedPomodoros)
        .arg(snapshot.totalFocusMinutes);
}
