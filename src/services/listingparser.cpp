#include "listingparser.h"

#include <QRegularExpression>
#include <QStringList>
#include <QTime>

namespace {

int monthFromAbbreviation(const QString &name)
{
    static const QStringList months = {
        "jan", "feb", "mar", "apr", "may", "jun",
        "jul", "aug", "sep", "oct", "nov", "dec"
    };
    return static_cast<int>(months.indexOf(name.left(3).toLower())) + 1;
}

QDateTime parseListingTimestamp(const QString &month, const QString &day,
                                const QString &yearOrTime, const QDate &today)
{
    const int m = monthFromAbbreviation(month);
    const int d = day.toInt();
    if (m <= 0 || d <= 0) {
        return QDateTime();
    }

    if (yearOrTime.contains(QLatin1Char(':'))) {
        // "Jan 1 12:00" means within the last six months
        const QTime time = QTime::fromString(yearOrTime, "H:mm");
        int year = today.year();
        QDate date(year, m, d);
        if (date.isValid() && date > today.addDays(1)) {
            date = QDate(year - 1, m, d);
        }
        return QDateTime(date, time.isValid() ? time : QTime(0, 0), Qt::UTC);
    }

    const QDate date(yearOrTime.toInt(), m, d);
    return date.isValid() ? QDateTime(date, QTime(0, 0), Qt::UTC) : QDateTime();
}

} // namespace

QList<RemoteEntry> parseUnixListing(const QByteArray &data, const QDate &today)
{
    QList<RemoteEntry> entries;
    const QString listing = QString::fromUtf8(data);
    const QStringList lines = listing.split(QRegularExpression("\r?\n"), Qt::SkipEmptyParts);

    static const QRegularExpression unixRx(
        "^([dl\\-])[rwxsStT\\-]{9}[@+.]?\\s+\\d+\\s+\\S+\\s+\\S+\\s+(\\d+)\\s+"
        "(\\w{3})\\s+(\\d{1,2})\\s+([\\d:]+)\\s+(.+)$");

    for (const QString &rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith("total ")) {
            continue;
        }

        RemoteEntry entry;
        const auto match = unixRx.match(line);
        if (match.hasMatch()) {
            entry.isDirectory = (match.captured(1) == "d");
            entry.size = entry.isDirectory ? 0 : match.captured(2).toLongLong();
            entry.modified = parseListingTimestamp(match.captured(3), match.captured(4),
                                                   match.captured(5), today);
            entry.name = match.captured(6);
            if (match.captured(1) == "l") {
                const int arrow = entry.name.indexOf(" -> ");
                if (arrow > 0) {
                    entry.name = entry.name.left(arrow);
                }
            }
        } else {
            entry.name = line;
        }

        if (!entry.name.isEmpty() && entry.name != "." && entry.name != "..") {
            entries.append(entry);
        }
    }

    return entries;
}
