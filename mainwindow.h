#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QPushButton>
#include <QLabel>
#include <QProgressBar>
#include <QVBoxLayout>
#include <QString>
#include "settingsstore.h"
#include "sessionstats.h"
#include "timerengine.h"
#include "phasenotifier.h"

// Platform look for the control buttons
enum class ButtonStyle {
    Flat,   // colored background, white text
    MacOS   // native white button, colored text
};

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(ButtonStyle buttonStyle, QWidget *parent = nullptr);
    ~MainWindow();

private slots:
    // Pomodoro Slots
    void updateTimeDisplay(const QString &time);
    void updateProgress(int percent);
    void handlePhaseChanged(TimerEngine::Phase phase);
    void updateStatsDisplay();
    void showSettings();

private:
    ButtonStyle buttonStyle;
    SettingsStore settingsStore;
    SessionStats *sessionStats;
    TimerEngine *timerEngine;
    PhaseNotifier *notifier;

    // UI Elements
    QLabel *titleLabel;
    QLabel *phaseLabel;
    QLabel *timeLabel;
    QProgressBar *progressBar;
    QPushButton *startButton;
    QPushButton *breakButton;
    QPushButton *resetButton;
    QPushButton *settingsButton;
    QLabel *statsLabel;

    void setupUI();
    void createTimerSection(QVBoxLayout *layout);
    void createControls(QVBoxLayout *layout);
    void createStatsSection(QVBoxLayout *layout);
    QPushButton *createButton(const QString &text, const QString &color);
    void applySettings(const TimerSettings &settings);
};

#endif // MAINWINDOW_H
