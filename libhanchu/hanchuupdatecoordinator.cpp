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

#include "hanchuupdatecoordinator.h"
#include "loggingcategories.h"

#include <QDebug>

NYMEA_LOGGING_CATEGORY(dcHanchuCoordinator, "HanchuCoordinator")

HanchuUpdateCoordinator::HanchuUpdateCoordinator(HanchuPoller *poller, int interval, int threshold, QObject *parent) :
    QObject(parent),
    m_poller(poller),
    m_threshold(qMax(1, threshold))
{
    m_timer = new QTimer(this);
    m_timer->setInterval(interval);
    m_timer->setSingleShot(false);
    connect(m_timer, &QTimer::timeout, this, [this](){
        if (pollPending()) {
            m_skippedTicks++;
            qCDebug(dcHanchuCoordinator()) << "Skipping tick for" << m_poller->name() << "since the previous poll is still pending";
            return;
        }

        poll();
    });
}

HanchuUpdateCoordinator::~HanchuUpdateCoordinator()
{
    stop();
}

HanchuPoller *HanchuUpdateCoordinator::poller() const
{
    return m_poller;
}

int HanchuUpdateCoordinator::interval() const
{
    return m_timer->interval();
}

int HanchuUpdateCoordinator::threshold() const
{
    return m_threshold;
}

HanchuUpdateCoordinator::State HanchuUpdateCoordinator::state() const
{
    return m_state;
}

bool HanchuUpdateCoordinator::running() const
{
    return m_timer->isActive();
}

bool HanchuUpdateCoordinator::pollPending() const
{
    return !m_pendingReply.isNull();
}

bool HanchuUpdateCoordinator::available() const
{
    return m_available;
}

int HanchuUpdateCoordinator::consecutiveFailures() const
{
    return m_consecutiveFailures;
}

int HanchuUpdateCoordinator::skippedTicks() const
{
    return m_skippedTicks;
}

bool HanchuUpdateCoordinator::hasReading() const
{
    return m_lastReading.isValid();
}

QVariant HanchuUpdateCoordinator::lastReading() const
{
    return m_lastReading;
}

QDateTime HanchuUpdateCoordinator::lastUpdated() const
{
    return m_lastUpdated;
}

QDateTime HanchuUpdateCoordinator::nextPollAt() const
{
    if (!m_timer->isActive())
        return QDateTime();

    return QDateTime::currentDateTime().addMSecs(m_timer->remainingTime());
}

Hanchu::Error HanchuUpdateCoordinator::lastError() const
{
    return m_lastError;
}

QString HanchuUpdateCoordinator::lastErrorString() const
{
    return m_lastErrorString;
}

void HanchuUpdateCoordinator::start()
{
    if (m_timer->isActive())
        return;

    qCDebug(dcHanchuCoordinator()) << "Starting updates for" << m_poller->name() << "every" << m_timer->interval() << "ms";
    m_timer->start();
    if (!pollPending())
        poll();
}

void HanchuUpdateCoordinator::stop()
{
    m_timer->stop();

    if (m_pendingReply) {
        qCDebug(dcHanchuCoordinator()) << "Abandoning pending poll of" << m_poller->name();
        HanchuReply *reply = m_pendingReply;
        m_pendingReply = nullptr;
        disconnect(reply, nullptr, this, nullptr);
        reply->abort();
        reply->deleteLater();
    }

    setState(StateIdle);
}

void HanchuUpdateCoordinator::refresh()
{
    if (pollPending()) {
        qCDebug(dcHanchuCoordinator()) << "Refresh of" << m_poller->name() << "requested while a poll is pending. Skipping.";
        return;
    }

    poll();
}

void HanchuUpdateCoordinator::poll()
{
    HanchuReply *reply = m_poller->poll();
    m_pendingReply = reply;
    setState(StatePolling);

    connect(reply, &HanchuReply::finished, reply, &HanchuReply::deleteLater);
    connect(reply, &HanchuReply::finished, this, [this, reply](){
        if (m_pendingReply != reply)
            return;

        m_pendingReply = nullptr;
        processReply(reply);
    });
}

void HanchuUpdateCoordinator::processReply(HanchuReply *reply)
{
    Hanchu::Error error = reply->error();
    if (error == Hanchu::ErrorAborted) {
        qCDebug(dcHanchuCoordinator()) << "Poll of" << m_poller->name() << "has been aborted";
        setState(running() ? StateFailure : StateIdle);
        return;
    }

    m_lastError = error;
    m_lastErrorString = reply->errorString();

    if (error == Hanchu::ErrorNoError) {
        m_lastReading = reply->result();
        m_lastUpdated = QDateTime::currentDateTime();
        m_consecutiveFailures = 0;
        m_countedFailures = 0;
        m_authErrorForgiven = false;

        setState(StateSuccess);
        emit readingChanged(m_lastReading);
        setAvailable(true);
        emit pollFinished(error);
        return;
    }

    m_consecutiveFailures++;
    if (error == Hanchu::ErrorAuthentication && !m_authErrorForgiven) {
        // The session logs in again with the next poll
        m_authErrorForgiven = true;
        qCDebug(dcHanchuCoordinator()) << "Poll of" << m_poller->name() << "failed to authenticate. Retrying with the next tick.";
    } else {
        m_countedFailures++;
        qCWarning(dcHanchuCoordinator()) << "Poll of" << m_poller->name() << "failed" << m_countedFailures << "/" << m_threshold << ":" << m_lastErrorString;
    }

    setState(StateFailure);
    if (m_countedFailures >= m_threshold)
        setAvailable(false);

    emit pollFinished(error);
}

void HanchuUpdateCoordinator::setState(State state)
{
    if (m_state == state)
        return;

    m_state = state;
    emit stateChanged(m_state);
}

void HanchuUpdateCoordinator::setAvailable(bool available)
{
    if (m_available == available)
        return;

    qCDebug(dcHanchuCoordinator()) << m_poller->name() << (available ? "is available" : "is not available any more");
    m_available = available;
    emit availableChanged(m_available);
}

QDebug operator<<(QDebug debug, HanchuUpdateCoordinator *coordinator)
{
    debug.nospace() << "HanchuUpdateCoordinator(" << coordinator->poller()->name() << ", " << coordinator->state();
    debug.nospace() << ", available: " << coordinator->available();
    debug.nospace() << ", failures: " << coordinator->consecutiveFailures() << ")";
    return debug.space();
}
