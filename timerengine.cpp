#include "timerengine.h"
#include "sessionstats.h"
#include <QDebug>

TimerEngine::TimerEngine(const TimerSettings &settings, SessionStats &stats, QObject *parent)
    : QObject(parent)
    , timer(new QTimer(this))
    , stats(stats)
    , config(settings.isValid() ? settings : SettingsStore::defaults())
    , clock([]() { return QDateTime::currentDateTimeUtc(); })
    , currentPhase(Phase::Idle)
    , running(false)
    , remaining(0)
    , phaseTotal(0)
    , workSessionsSinceLongBreak(0)
{
    if (!settings.isValid()) {
        qWarning() << "TimerEngine: invalid settings supplied, falling back to defaults";
    }
    timer->setTimerType(Qt::PreciseTimer);
    timer->setInterval(1000);
    connect(timer, &QTimer::timeout, this, &TimerEngine::onTimerTick);
    remaining = phaseTotal = config.workMinutes * 60;
}

TimerEngine::~TimerEngine()
{
    if (timer->isActive()) {
        timer->stop();
    }
}

bool TimerEngine::setSettings(const TimerSettings &settings)
{
    if (!settings.isValid()) {
        qWarning() << "TimerEngine: rejecting settings with out-of-range durations";
        return false;
    }
    config = settings;

    // A running phase keeps its length; the new values apply from the next start
    if (!running) {
        remaining = phaseTotal = config.workMinutes * 60;
        updateDisplay();
    }
    return true;
}

TimerSettings TimerEngine::settings() const
{
    return config;
}

void TimerEngine::setClock(Clock source)
{
    clock = std::move(source);
}

void TimerEngine::startWork()
{
    interruptCurrentPhase();
    beginWork(clock());
}

void TimerEngine::startBreak()
{
    interruptCurrentPhase();
    beginBreak(clock());
}

void TimerEngine::reset()
{
    interruptCurrentPhase();
    enterIdle();
}

double TimerEngine::tick(const QDateTime &now)
{
    if (!running) {
        return progress();
    }

    // Whole seconds only; the sub-second remainder carries into the next tick
    qint64 deltaMs = lastTick.msecsTo(now);
    qint64 elapsed = 0;
    if (deltaMs < 0) {
        // Clock went backwards: count no time and restart from here
        lastTick = now;
    } else {
        elapsed = deltaMs / 1000;
        lastTick = lastTick.addSecs(elapsed);
    }
    remaining = static_cast<int>(qMax<qint64>(0, remaining - elapsed));

    double ratio = progress();
    if (remaining == 0) {
        completePhase(now);
        return ratio;
    }

    updateDisplay();
    return ratio;
}

TimerEngine::Phase TimerEngine::phase() const
{
    return currentPhase;
}

bool TimerEngine::isRunning() const
{
    return running;
}

int TimerEngine::remainingSeconds() const
{
    return remaining;
}

int TimerEngine::phaseTotalSeconds() const
{
    return phaseTotal;
}

int TimerEngine::completedWorkSessionsSinceLongBreak() const
{
    return workSessionsSinceLongBreak;
}

double TimerEngine::progress() const
{
    if (phaseTotal <= 0) {
        return 0.0;
    }
    return static_cast<double>(phaseTotal - remaining) / phaseTotal;
}

int TimerEngine::progressPercent() const
{
    return static_cast<int>(progress() * 100.0);
}

QString TimerEngine::timeRemaining() const
{
    return formatTime(remaining);
}

QString TimerEngine::formatTime(int seconds)
{
    seconds = qMax(0, seconds);
    return QString("%1:%2")
        .arg(seconds / 60, 2, 10, QChar('0'))
        .arg(seconds % 60, 2, 10, QChar('0'));
}

QString TimerEngine::phaseName(Phase phase)
{
    switch (phase) {
    case Phase::Idle:
        return QStringLiteral("Idle");
    case Phase::Work:
        return QStringLiteral("Focus");
    case Phase::Break:
        return QStringLiteral("Break");
    case Phase::LongBreak:
        return QStringLiteral("Long Break");
    }
    return QString();
}

void TimerEngine::onTimerTick()
{
    tick(clock());
}

void TimerEngine::interruptCurrentPhase()
{
    if (!running) {
        return;
    }
    qDebug() << "Interrupting" << currentPhase << "with" << remaining << "s left";
    if (currentPhase == Phase::Work) {
        stats.discardSession();
    }
    timer->stop();
    running = false;
}

void TimerEngine::beginWork(const QDateTime &start)
{
    beginPhase(Phase::Work, config.workMinutes * 60, start);
    stats.startSession(start);
}

void TimerEngine::beginBreak(const QDateTime &start)
{
    if (workSessionsSinceLongBreak >= config.sessionsBeforeLongBreak) {
        workSessionsSinceLongBreak = 0;
        beginPhase(Phase::LongBreak, config.longBreakMinutes * 60, start);
    } else {
        beginPhase(Phase::Break, config.breakMinutes * 60, start);
    }
}

void TimerEngine::beginPhase(Phase phase, int seconds, const QDateTime &start)
{
    currentPhase = phase;
    remaining = phaseTotal = seconds;
    lastTick = start;
    running = true;
    timer->start();

    qDebug() << "Started" << phase << "for" << seconds << "s";
    emit phaseChanged(currentPhase);
    emit runningChanged(true);
    updateDisplay();
}

void TimerEngine::completePhase(const QDateTime &now)
{
    // Redundant completions from a late tick are ignored
    if (!running || remaining > 0) {
        return;
    }

    Phase finished = currentPhase;
    timer->stop();
    running = false;

    if (finished == Phase::Work) {
        workSessionsSinceLongBreak++;
        stats.endSession(now);
    }
    qDebug() << finished << "completed, work sessions since long break:" << workSessionsSinceLongBreak;

    if (config.autoAdvance) {
        if (finished == Phase::Work) {
            beginBreak(now);
        } else {
            beginWork(now);
        }
    } else {
        enterIdle();
    }

    emit phaseCompleted(finished);
}

void TimerEngine::enterIdle()
{
    timer->stop();
    running = false;
    currentPhase = Phase::Idle;
    remaining = phaseTotal = config.workMinutes * 60;
    lastTick = QDateTime();

    emit phaseChanged(currentPhase);
    emit runningChanged(false);
    updateDisplay();
}

void TimerEngine::updateDisplay()
{
    emit timeUpdated(timeRemaining());
    emit progressChanged(progressPercent());
}
