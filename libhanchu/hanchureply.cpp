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

#include "hanchureply.h"

#include <QTimer>

HanchuReply::HanchuReply(QObject *parent) :
    QObject(parent)
{

}

bool HanchuReply::isFinished() const
{
    return m_finished;
}

Hanchu::Error HanchuReply::error() const
{
    return m_error;
}

QString HanchuReply::errorString() const
{
    return m_errorString;
}

QVariant HanchuReply::result() const
{
    return m_result;
}

void HanchuReply::setResult(const QVariant &result)
{
    m_result = result;
}

void HanchuReply::finish(Hanchu::Error error, const QString &errorString)
{
    if (m_finished)
        return;

    m_finished = true;
    m_error = error;
    m_errorString = errorString.isEmpty() && error != Hanchu::ErrorNoError ? Hanchu::errorToString(error) : errorString;

    // Deliver through the event loop, the caller may not have connected yet
    QTimer::singleShot(0, this, &HanchuReply::finished);
}

void HanchuReply::abort()
{
    if (m_finished)
        return;

    finish(Hanchu::ErrorAborted, "The request has been aborted.");

    // Give the owner of the underlying request the chance to cancel it right away
    emit aborted();
}
