#ifndef BACKUPPATH_H
#define BACKUPPATH_H

#include <QString>

/**
 * @brief File addressing inside an iTunes-style device backup
 *
 * Files in a backup are stored under the hex SHA1 of
 * "<domain>-<relative path>", in a subdirectory named after the first
 * two characters of the hash:
 *
 *   <backup>/31/31bb7ba8914766d4ba40d6dfb6113c8b614be442
 */
class BackupPath
{
public:
    /// SHA1("HomeDomain-Library/AddressBook/AddressBook.sqlitedb")
    static constexpr const char *ADDRESSBOOK_DB_HASH = "31bb7ba8914766d4ba40d6dfb6113c8b614be442";

    /// SHA1("HomeDomain-Library/SMS/sms.db")
    static constexpr const char *SMS_DB_HASH = "3d0d7e5fb2ce288813306e4d4636395e047a3d28";

    /// Backup manifest, stored unhashed at the backup root
    static constexpr const char *MANIFEST_DB = "Manifest.db";

    /**
     * @brief Hex SHA1 of "<domain>-<relativePath>"
     */
    static QString fileHash(const QString &domain, const QString &relativePath);

    /**
     * @brief Location of a hashed file inside a backup directory
     */
    static QString filePath(const QString &backupPath, const QString &hash);

    /**
     * @brief Shorthand for filePath(backupPath, fileHash(domain, relativePath))
     */
    static QString domainFilePath(const QString &backupPath,
                                  const QString &domain,
                                  const QString &relativePath);
};

#endif // BACKUPPATH_H
