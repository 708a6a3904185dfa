#ifndef SETTINGSDIALOG_H
#define SETTINGSDIALOG_H

#include <QDialog>
#include <QSpinBox>
#include <QCheckBox>
#include "settingsstore.h"

class SettingsDialog : public QDialog
{
    Q_OBJECT

public:
    SettingsDialog(const TimerSettings &current, const SettingsStore &store, QWidget *parent = nullptr);

    TimerSettings settings() const;

public slots:
    void accept() override;

private:
    const SettingsStore &store;
    QSpinBox *workSpin;
    QSpinBox *breakSpin;
    QSpinBox *longBreakSpin;
    QSpinBox *sessionsSpin;
    QCheckBox *soundCheck;
    QCheckBox *autoAdvanceCheck;
};

#endif // SETTINGSDIALOG_H
