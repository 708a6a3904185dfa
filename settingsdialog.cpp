#include "settingsdialog.h"
#include <QVBoxLayout>
#include <QFormLayout>
#include <QGroupBox>
#include <QDialogButtonBox>
#include <QMessageBox>
#include <QDebug>

SettingsDialog::SettingsDialog(const TimerSettings &current, const SettingsStore &store, QWidget *parent)
    : QDialog(parent)
    , store(store)
{
    setWindowTitle(tr("Timer Settings"));
    QVBoxLayout *layout = new QVBoxLayout(this);

    QGroupBox *durationGroup = new QGroupBox(tr("Pomodoro Timer Settings"));
    QFormLayout *durationLayout = new QFormLayout(durationGroup);
    workSpin = new QSpinBox();
    workSpin->setRange(1, TimerSettings::MaxMinutes);
    breakSpin = new QSpinBox();
    breakSpin->setRange(1, TimerSettings::MaxMinutes);
    longBreakSpin = new QSpinBox();
    longBreakSpin->setRange(1, TimerSettings::MaxMinutes);
    sessionsSpin = new QSpinBox();
    sessionsSpin->setRange(1, TimerSettings::MaxSessionsBeforeLongBreak);
    durationLayout->addRow(tr("Focus Duration (min):"), workSpin);
    durationLayout->addRow(tr("Short Break (min):"), breakSpin);
    durationLayout->addRow(tr("Long Break (min):"), longBreakSpin);
    durationLayout->addRow(tr("Sessions Before Long Break:"), sessionsSpin);
    layout->addWidget(durationGroup);

    QGroupBox *notifGroup = new QGroupBox(tr("Behaviour"));
    QVBoxLayout *notifLayout = new QVBoxLayout(notifGroup);
    soundCheck = new QCheckBox(tr("Play a sound when a phase ends"));
    autoAdvanceCheck = new QCheckBox(tr("Start the next phase automatically"));
    notifLayout->addWidget(soundCheck);
    notifLayout->addWidget(autoAdvanceCheck);
    layout->addWidget(notifGroup);

    QDialogButtonBox *buttons = new QDialogButtonBox(QDialogButtonBox::Save | QDialogButtonBox::Cancel);
    layout->addWidget(buttons);
    connect(buttons, &QDialogButtonBox::accepted, this, &SettingsDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &SettingsDialog::reject);

    workSpin->setValue(current.workMinutes);
    breakSpin->setValue(current.breakMinutes);
    longBreakSpin->setValue(current.longBreakMinutes);
    sessionsSpin->setValue(current.sessionsBeforeLongBreak);
    soundCheck->setChecked(current.soundEnabled);
    autoAdvanceCheck->setChecked(current.autoAdvance);
}

TimerSettings SettingsDialog::settings() const
{
    TimerSettings result;
    result.workMinutes = workSpin->value();
    result.breakMinutes = breakSpin->value();
    result.longBreakMinutes = longBreakSpin->value();
    result.sessionsBeforeLongBreak = sessionsSpin->value();
    result.soundEnabled = soundCheck->isChecked();
    result.autoAdvance = autoAdvanceCheck->isChecked();
    return result;
}

void SettingsDialog::accept()
{
    QString error;
    if (!store.save(settings(), &error)) {
        QMessageBox::warning(this, tr("Settings"),
                             tr("Could not save settings to %1:\n%2").arg(store.filePath(), error));
        return;
    }
    QDialog::accept();
}
