/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 *
 * Copyright 2024, Consolinno Energy GmbH
 * Contact: info@consolinno.de
 *
 * GNU Lesser General Public License Usage
 * Alternatively, this project may be redistributed and/or modified under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation; version 3. This project is distributed in the hope that
 * it will be useful, but WITHOUT ANY WARRANTY; without even the implied
 * warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this project. If not, see <https://www.gnu.org/licenses/>.
 *
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

#ifndef HANCHUUPDATECOORDINATOR_H
#define HANCHUUPDATECOORDINATOR_H

#include <QObject>
#include <QTimer>
#include <QPointer>
#include <QVariant>
#include <QDateTime>

#include "hanchu.h"
#include "hanchupoller.h"

/**
 * @brief Drives one HanchuPoller on a fixed interval and tracks its availability.
 *
 * The coordinator starts in StateIdle. start() polls right away and then every
 * interval milliseconds until stop() gets called. There is never more than one
 * poll pending, a tick firing while the previous poll is still running is
 * skipped and not queued.
 *
 * A successful poll replaces the last reading and makes the coordinator
 * available. Failed polls increase consecutiveFailures(). Once the number of
 * counted failures reaches the threshold the coordinator becomes unavailable,
 * the last reading is kept. The first authentication failure of a streak is not
 * counted since the session logs in again with the next poll.
 */
class HanchuUpdateCoordinator : public QObject
{
    Q_OBJECT
public:
    enum State {
        StateIdle,
        StatePolling,
        StateSuccess,
        StateFailure
    };
    Q_ENUM(State)

    explicit HanchuUpdateCoordinator(HanchuPoller *poller, int interval, int threshold = Hanchu::UnavailableThreshold, QObject *parent = nullptr);
    ~HanchuUpdateCoordinator();

    HanchuPoller *poller() const;
    int interval() const;
    int threshold() const;

    State state() const;
    bool running() const;
    bool pollPending() const;

    bool available() const;
    int consecutiveFailures() const;
    int skippedTicks() const;

    bool hasReading() const;
    QVariant lastReading() const;

    template <typename T>
    T reading() const { return m_lastReading.value<T>(); }

    // Time of the last successful poll
    QDateTime lastUpdated() const;
    QDateTime nextPollAt() const;

    Hanchu::Error lastError() const;
    QString lastErrorString() const;

public slots:
    void start();
    void stop();
    void refresh();

signals:
    void stateChanged(HanchuUpdateCoordinator::State state);
    void readingChanged(const QVariant &reading);
    void availableChanged(bool available);
    void pollFinished(Hanchu::Error error);

private:
    HanchuPoller *m_poller = nullptr;
    int m_threshold = Hanchu::UnavailableThreshold;
    QTimer *m_timer = nullptr;
    QPointer<HanchuReply> m_pendingReply;

    State m_state = StateIdle;
    bool m_available = false;
    int m_consecutiveFailures = 0;
    int m_countedFailures = 0;
    bool m_authErrorForgiven = false;
    int m_skippedTicks = 0;

    QVariant m_lastReading;
    QDateTime m_lastUpdated;
    Hanchu::Error m_lastError = Hanchu::ErrorNoError;
    QString m_lastErrorString;

    void poll();
    void processReply(HanchuReply *reply);
    void setState(State state);
    void setAvailable(bool available);
};

QDebug operator<<(QDebug debug, HanchuUpdateCoordinator *coordinator);

#endif // HANCHUUPDATECOORDINATOR_H
