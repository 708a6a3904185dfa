#include "phasenotifier.h"
#include <QDebug>
#include <QUrl>

PhaseNotifier::PhaseNotifier(QWidget *window, QObject *parent)
    : QObject(parent)
    , window(window)
    , sound(new QSoundEffect(this))
    , soundEnabled(true)
{
    sound->setSource(QUrl("qrc:/sounds/notify.wav"));
    sound->setVolume(0.75f);
}

void PhaseNotifier::setSoundEnabled(bool enabled)
{
    soundEnabled = enabled;
}

bool PhaseNotifier::isSoundEnabled() const
{
    return soundEnabled;
}

QString PhaseNotifier::completionMessage(TimerEngine::Phase finished)
{
    if (finished == TimerEngine::Phase::Work) {
        return tr("It's time to take a break!");
    }
    return tr("It's time to focus!");
}

void PhaseNotifier::notifyCompleted(TimerEngine::Phase finished)
{
    playSound();
    showMessage(completionMessage(finished));
}

void PhaseNotifier::playSound()
{
    if (!soundEnabled) {
        return;
    }
    // Best effort: a sound that has not finished loading is skipped
    if (sound->status() != QSoundEffect::Ready) {
        qWarning() << "Notification sound not ready, status:" << sound->status();
        return;
    }
    sound->play();
}

void PhaseNotifier::showMessage(const QString &text)
{
    if (window) {
        window->raise();
        window->activateWindow();
    }

    // Reuse the box if the previous completion has not been dismissed yet
    if (messageBox) {
        messageBox->setText(text);
        return;
    }

    messageBox = new QMessageBox(QMessageBox::Information, tr("Pomodoro Timer"), text,
                                 QMessageBox::Ok, window);
    messageBox->setAttribute(Qt::WA_DeleteOnClose);
    messageBox->setWindowFlag(Qt::WindowStaysOnTopHint, true);
    // open() is window-modal and returns immediately; the countdown keeps ticking
    messageBox->open();
}
