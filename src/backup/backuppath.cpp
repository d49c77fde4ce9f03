#include "backuppath.h"

#include <QCryptographicHash>
#include <QDir>

QString BackupPath::fileHash(const QString &domain, const QString &relativePath)
{
    const QByteArray key = (domain + QLatin1Char('-') + relativePath).toUtf8();
    return QString::fromLatin1(QCryptographicHash::hash(key, QCryptographicHash::Sha1).toHex());
}

QString BackupPath::filePath(const QString &backupPath, const QString &hash)
{
    return QDir(backupPath).filePath(hash.left(2) + QLatin1Char('/') + hash);
}

QString BackupPath::domainFilePath(const QString &backupPath,
                                   const QString &domain,
                                   const QString &relativePath)
{
    return filePath(backupPath, fileHash(domain, relativePath));
}
