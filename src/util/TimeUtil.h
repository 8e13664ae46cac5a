#pragma once

#include <QString>
#include <QStringList>
#include <QChar>

namespace TimeUtil {

// Parse an encoder time marker "HH:MM:SS.frac" into seconds; -1 when malformed
inline double parseTimemark(const QString& timemark) {
    const QStringList parts = timemark.trimmed().split(':');
    if (parts.size() != 3) return -1.0;

    bool okH = false, okM = false, okS = false;
    double hours = parts[0].toDouble(&okH);
    double minutes = parts[1].toDouble(&okM);
    double seconds = parts[2].toDouble(&okS);
    if (!okH || !okM || !okS) return -1.0;
    if (hours < 0 || minutes < 0 || seconds < 0) return -1.0;

    return hours * 3600.0 + minutes * 60.0 + seconds;
}

inline QString secondsToHMSms(double totalSeconds) {
    int hours = static_cast<int>(totalSeconds) / 3600;
    int minutes = (static_cast<int>(totalSeconds) % 3600) / 60;
    int seconds = static_cast<int>(totalSeconds) % 60;
    int millis = static_cast<int>((totalSeconds - static_cast<int>(totalSeconds)) * 1000);

    return QString("%1:%2:%3.%4")
        .arg(hours, 2, 10, QChar('0'))
        .arg(minutes, 2, 10, QChar('0'))
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

} // namespace TimeUtil
