#ifndef LAUNCHWIRING_H
#define LAUNCHWIRING_H

#include "instancechannel.h"
#include "launchrelay.h"

#include <QObject>

/**
 * @brief Routes forwarded launches into the relay and the relay's
 *        activation requests to @p window.
 *
 * Window needs a bringToFront() member; MainWindow in the app.
 */
template <typename Window>
void connectLaunchRelay(InstanceChannel *instance, LaunchRelay *relay, Window *window) {
    QObject::connect(instance, &InstanceChannel::secondLaunch,
                     relay, &LaunchRelay::handleSecondLaunch);
    QObject::connect(relay, &LaunchRelay::activationRequested,
                     window, &Window::bringToFront);
}

#endif // LAUNCHWIRING_H
