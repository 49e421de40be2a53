#include "tv_wol.h"

#include <QHostAddress>
#include <QUdpSocket>

namespace phicore::samsungtv::ipc {

QString normalizeMacAddress(const QString &macAddress)
{
    QString hex;
    hex.reserve(12);
    for (const QChar ch : macAddress.trimmed()) {
        if (ch == QLatin1Char(':') || ch == QLatin1Char('-') || ch == QLatin1Char('.'))
            continue;
        if (!ch.isDigit() && !(ch.toLower() >= QLatin1Char('a') && ch.toLower() <= QLatin1Char('f')))
            return {};
        hex.append(ch.toUpper());
    }
    return hex.size() == 12 ? hex : QString();
}

QByteArray buildMagicPacket(const QString &macAddress)
{
    const QString hex = normalizeMacAddress(macAddress);
    if (hex.isEmpty())
        return {};

    const QByteArray mac = QByteArray::fromHex(hex.toLatin1());
    QByteArray packet(6, char(0xFF));
    packet.reserve(6 + 16 * mac.size());
    for (int i = 0; i < 16; ++i)
        packet.append(mac);
    return packet;
}

bool UdpWakeOnLanSender::sendMagicPacket(const QString &macAddress, QString *error)
{
    const QByteArray packet = buildMagicPacket(macAddress);
    if (packet.isEmpty()) {
        if (error)
            *error = QStringLiteral("Invalid MAC address '%1'").arg(macAddress);
        return false;
    }

    QUdpSocket socket;
    const qint64 written = socket.writeDatagram(packet, QHostAddress::Broadcast, kWakeOnLanPort);
    if (written != packet.size()) {
        if (error)
            *error = socket.errorString();
        return false;
    }
    return true;
}

} // namespace phicore::samsungtv::ipc
