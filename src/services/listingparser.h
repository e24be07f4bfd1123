#ifndef LISTINGPARSER_H
#define LISTINGPARSER_H

#include <QByteArray>
#include <QDate>
#include <QList>

#include "remoteentry.h"

/**
 * @brief Parses a Unix-style directory listing into remote entries.
 *
 * Understands the "ls -l" format produced by FTP LIST and SFTP directory
 * reads:
 * @code
 * drwxr-xr-x 2 user group 4096 Jan  1 12:00 dirname
 * -rw-r--r-- 1 user group  812 Mar 14  2023 notes.txt
 * @endcode
 * Lines that do not match are treated as bare file names. "." and ".." are
 * skipped, symbolic links are reported under their link name.
 *
 * @param data Raw listing bytes (LF or CRLF line endings).
 * @param today Reference date used for entries that carry a time instead
 *              of a year.
 */
[[nodiscard]] QList<RemoteEntry> parseUnixListing(const QByteArray &data,
                                                  const QDate &today = QDate::currentDate());

#endif // LISTINGPARSER_H
