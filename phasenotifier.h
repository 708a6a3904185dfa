#ifndef PHASENOTIFIER_H
#define PHASENOTIFIER_H

#include <QObject>
#include <QPointer>
#include <QMessageBox>
#include <QtMultimedia/QSoundEffect>
#include "timerengine.h"

class PhaseNotifier : public QObject
{
    Q_OBJECT

public:
    explicit PhaseNotifier(QWidget *window, QObject *parent = nullptr);

    void setSoundEnabled(bool enabled);
    bool isSoundEnabled() const;

    static QString completionMessage(TimerEngine::Phase finished);

public slots:
    void notifyCompleted(TimerEngine::Phase finished);

private:
    QWidget *window;
    QSoundEffect *sound;
    bool soundEnabled;
    QPointer<QMessageBox> messageBox;

    void playSound();
    void showMessage(const QString &text);
};

#endif // PHASENOTIFIER_H
