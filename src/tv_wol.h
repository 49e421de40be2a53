#pragma once

#include <QByteArray>
#include <QString>

namespace phicore::samsungtv::ipc {

inline constexpr quint16 kWakeOnLanPort = 9;

// Returns "AABBCCDDEEFF" or an empty string when the input is not a MAC.
QString normalizeMacAddress(const QString &macAddress);
// 6 x 0xFF followed by 16 repetitions of the MAC, empty for an invalid MAC.
QByteArray buildMagicPacket(const QString &macAddress);

class WakeOnLanSender
{
public:
    virtual ~WakeOnLanSender() = default;
    virtual bool sendMagicPacket(const QString &macAddress, QString *error = nullptr) = 0;
};

class UdpWakeOnLanSender final : public WakeOnLanSender
{
public:
    bool sendMagicPacket(const QString &macAddress, QString *error = nullptr) override;
};

} // namespace phicore::samsungtv::ipc
