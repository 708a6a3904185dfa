#include "mainwindow.h"
#include "settingsdialog.h"
#include <QHBoxLayout>
#include <QWidget>
#include <QFont>
#include <QDebug>

namespace {
const char *const kBackground = "#FFF5E1";
const char *const kStartColor = "#45B7D1";
const char *const kBreakColor = "#4CAF50";
const char *const kResetColor = "#FF6B6B";
const char *const kSettingsColor = "#8E8E93";
}

MainWindow::MainWindow(ButtonStyle buttonStyle, QWidget *parent)
    : QMainWindow(parent)
    , buttonStyle(buttonStyle)
    , sessionStats(nullptr)
    , timerEngine(nullptr)
    , notifier(nullptr)
{
    TimerSettings settings = settingsStore.load();

    sessionStats = new SessionStats(this);
    timerEngine = new TimerEngine(settings, *sessionStats, this);
    notifier = new PhaseNotifier(this, this);
    notifier->setSoundEnabled(settings.soundEnabled);

    setupUI();

    // Connect engine signals to slots
    connect(timerEngine, &TimerEngine::timeUpdated, this, &MainWindow::updateTimeDisplay);
    connect(timerEngine, &TimerEngine::progressChanged, this, &MainWindow::updateProgress);
    connect(timerEngine, &TimerEngine::phaseChanged, this, &MainWindow::handlePhaseChanged);
    connect(timerEngine, &TimerEngine::phaseCompleted, notifier, &PhaseNotifier::notifyCompleted);
    connect(sessionStats, &SessionStats::statsChanged, this, &MainWindow::updateStatsDisplay);

    connect(startButton, &QPushButton::clicked, timerEngine, &TimerEngine::startWork);
    connect(breakButton, &QPushButton::clicked, timerEngine, &TimerEngine::startBreak);
    connect(resetButton, &QPushButton::clicked, timerEngine, &TimerEngine::reset);
    connect(settingsButton, &QPushButton::clicked, this, &MainWindow::showSettings);

    updateTimeDisplay(timerEngine->timeRemaining());
    handlePhaseChanged(timerEngine->phase());
}

MainWindow::~MainWindow()
{
}

void MainWindow::setupUI()
{
    setWindowTitle("Focus Timer - For your paper");
    resize(500, 500);
    setWindowFlag(Qt::WindowStaysOnTopHint, true);

    QWidget *central = new QWidget(this);
    central->setObjectName("centralWidget");
    central->setStyleSheet(QString("#centralWidget { background-color: %1; }").arg(QLatin1String(kBackground)));
    QVBoxLayout *layout = new QVBoxLayout(central);
    layout->setContentsMargins(20, 20, 20, 20);

    titleLabel = new QLabel("Paper!!! Your paper!!!");
    titleLabel->setAlignment(Qt::AlignCenter);
    QFont titleFont = titleLabel->font();
    titleFont.setPointSize(20);
    titleFont.setBold(true);
    titleLabel->setFont(titleFont);
    titleLabel->setStyleSheet("color: #FF6B6B;");
    layout->addWidget(titleLabel);

    createTimerSection(layout);
    createControls(layout);
    createStatsSection(layout);
    layout->addStretch();

    setCentralWidget(central);
}

void MainWindow::createTimerSection(QVBoxLayout *layout)
{
    phaseLabel = new QLabel();
    phaseLabel->setAlignment(Qt::AlignCenter);
    phaseLabel->setStyleSheet("color: #4A4A4A;");
    layout->addWidget(phaseLabel);

    timeLabel = new QLabel();
    timeLabel->setAlignment(Qt::AlignCenter);
    QFont font = timeLabel->font();
    font.setPointSize(72);
    font.setBold(true);
    timeLabel->setFont(font);
    timeLabel->setStyleSheet("color: #4ECDC4;");
    layout->addWidget(timeLabel);

    progressBar = new QProgressBar();
    progressBar->setRange(0, 100);
    progressBar->setValue(0);
    progressBar->setTextVisible(false);
    progressBar->setFixedWidth(300);
    layout->addWidget(progressBar, 0, Qt::AlignHCenter);
}

void MainWindow::createControls(QVBoxLayout *layout)
{
    QHBoxLayout *controlsLayout = new QHBoxLayout();
    startButton = createButton("START", kStartColor);
    breakButton = createButton("BREAK", kBreakColor);
    resetButton = createButton("RESET", kResetColor);
    settingsButton = createButton("SETTINGS", kSettingsColor);

    controlsLayout->addStretch();
    controlsLayout->addWidget(startButton);
    controlsLayout->addWidget(breakButton);
    controlsLayout->addWidget(resetButton);
    controlsLayout->addWidget(settingsButton);
    controlsLayout->addStretch();
    layout->addLayout(controlsLayout);
}

void MainWindow::createStatsSection(QVBoxLayout *layout)
{
    statsLabel = new QLabel(SessionStats::summary(sessionStats->snapshot()));
    statsLabel->setAlignment(Qt::AlignLeft);
    QFont font = statsLabel->font();
    font.setPointSize(13);
    statsLabel->setFont(font);
    statsLabel->setStyleSheet("color: #4A4A4A;");
    layout->addWidget(statsLabel);
}

QPushButton *MainWindow::createButton(const QString &text, const QString &color)
{
    QPushButton *button = new QPushButton(text);
    QFont font = button->font();
    font.setPointSize(14);
    font.setBold(true);
    button->setFont(font);
    button->setMinimumWidth(90);

    if (buttonStyle == ButtonStyle::MacOS) {
        button->setStyleSheet(QString(
            "QPushButton { background-color: #FFFFFF; color: %1; border: 2px outset #D0D0D0; padding: 6px; }"
            "QPushButton:pressed { background-color: #F0F0F0; }").arg(color));
    } else {
        button->setStyleSheet(QString(
            "QPushButton { background-color: %1; color: white; border: 1px solid %1; padding: 6px; }"
            "QPushButton:pressed { background-color: %1; border-style: inset; }").arg(color));
    }
    return button;
}

void MainWindow::updateTimeDisplay(const QString &time)
{
    if (timeLabel) {
        timeLabel->setText(time);
    }
}

void MainWindow::updateProgress(int percent)
{
    if (progressBar) {
        progressBar->setValue(percent);
    }
}

void MainWindow::handlePhaseChanged(TimerEngine::Phase phase)
{
    if (phaseLabel) {
        phaseLabel->setText(QString("Mode: %1").arg(TimerEngine::phaseName(phase)));
    }
}

void MainWindow::updateStatsDisplay()
{
    statsLabel->setText(SessionStats::summary(sessionStats->snapshot()));
}

void MainWindow::showSettings()
{
    SettingsDialog dialog(timerEngine->settings(), settingsStore, this);
    if (dialog.exec() == QDialog::Accepted) {
        applySettings(dialog.settings());
    }
}

void MainWindow::applySettings(const TimerSettings &settings)
{
    if (!timerEngine->setSettings(settings)) {
        qWarning() << "Saved settings were rejected by the timer";
        return;
    }
    notifier->setSoundEnabled(settings.soundEnabled);
}
