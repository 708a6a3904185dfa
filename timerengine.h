#ifndef TIMERENGINE_H
#define TIMERENGINE_H

#include <QObject>
#include <QTimer>
#include <QDateTime>
#include <QString>
#include <functional>
#include "settingsstore.h"

class SessionStats;

class TimerEngine : public QObject
{
    Q_OBJECT

public:
    enum class Phase {
        Idle,
        Work,
        Break,
        LongBreak
    };
    Q_ENUM(Phase)

    using Clock = std::function<QDateTime()>;

    TimerEngine(const TimerSettings &settings, SessionStats &stats, QObject *parent = nullptr);
    ~TimerEngine();

    // Configuration
    bool setSettings(const TimerSettings &settings);
    TimerSettings settings() const;
    void setClock(Clock clock);

    // Control
    void startWork();
    void startBreak();
    void reset();

    // Advances the countdown to `now` and returns the progress ratio
    double tick(const QDateTime &now);

    // Status
    Phase phase() const;
    bool isRunning() const;
    int remainingSeconds() const;
    int phaseTotalSeconds() const;
    int completedWorkSessionsSinceLongBreak() const;
    double progress() const;
    int progressPercent() const;
    QString timeRemaining() const;

    static QString formatTime(int seconds);
    static QString phaseName(Phase phase);

signals:
    void phaseChanged(TimerEngine::Phase phase);
    void runningChanged(bool running);
    void timeUpdated(const QString &time);
    void progressChanged(int percent);
    void phaseCompleted(TimerEngine::Phase finished);

private slots:
    void onTimerTick();

private:
    QTimer *timer;
    SessionStats &stats;
    TimerSettings config;
    Clock clock;

    Phase currentPhase;
    bool running;
    int remaining;
    int phaseTotal;
    int workSessionsSinceLongBreak;
    QDateTime lastTick;

    void interruptCurrentPhase();
    void beginWork(const QDateTime &start);
    void beginBreak(const QDateTime &start);
    void beginPhase(Phase phase, int seconds, const QDateTime &start);
    void completePhase(const QDateTime &now);
    void enterIdle();
    void updateDisplay();
};

#endif // TIMERENGINE_H
