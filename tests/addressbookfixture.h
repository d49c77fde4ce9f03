#ifndef ADDRESSBOOKFIXTURE_H
#define ADDRESSBOOKFIXTURE_H

#include <QString>
#include <QStringList>
#include <QDir>
#include <QFileInfo>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QDebug>

#include "backup/backuppath.h"

/**
 * @brief Builds a minimal AddressBook database inside a fake backup
 *
 * Contents:
 *   1  John Doe              (555) 123-4567 mobile, john.doe@example.com home
 *   2  Jane Smith, Acme Corp +1 555 987 6543 work, 555-111-2222 mobile,
 *                            Jane@Acme.com work
 *   3  Test Company (org)    5553334444 (no label), info@testcompany.com (no label)
 *   4  (no name fields)
 *
 * John also has a street address (property 5), which must be ignored.
 */
namespace AddressBookFixture {

inline QString databasePath(const QString &backupPath)
{
    return BackupPath::filePath(backupPath, QString::fromLatin1(BackupPath::ADDRESSBOOK_DB_HASH));
}

/**
 * @brief Run statements against the AddressBook of @p backupPath
 */
inline bool execute(const QString &backupPath, const QStringList &statements)
{
    static int connectionCounter = 0;
    const QString connectionName = QString("addressbook_fixture_%1").arg(++connectionCounter);
    const QString dbPath = databasePath(backupPath);

    QDir().mkpath(QFileInfo(dbPath).absolutePath());

    bool ok = true;
    {
        QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", connectionName);
        db.setDatabaseName(dbPath);
        if (!db.open()) {
            qWarning() << "AddressBookFixture: cannot open" << dbPath << db.lastError().text();
            ok = false;
        } else {
            QSqlQuery query(db);
            for (const QString &statement : statements) {
                if (!query.exec(statement)) {
                    qWarning() << "AddressBookFixture:" << statement << query.lastError().text();
                    ok = false;
                    break;
                }
            }
            db.close();
        }
    }
    QSqlDatabase::removeDatabase(connectionName);
    return ok;
}

inline bool createSchema(const QString &backupPath)
{
    return execute(backupPath, {
        "CREATE TABLE ABPerson (ROWID INTEGER PRIMARY KEY AUTOINCREMENT, "
        "First TEXT, Last TEXT, Organization TEXT)",
        "CREATE TABLE ABMultiValueLabel (ROWID INTEGER PRIMARY KEY AUTOINCREMENT, value TEXT)",
        "CREATE TABLE ABMultiValue (UID INTEGER PRIMARY KEY AUTOINCREMENT, record_id INTEGER, "
        "property INTEGER, identifier INTEGER, label INTEGER, value TEXT)"
    });
}

inline bool create(const QString &backupPath)
{
    if (!createSchema(backupPath)) {
        return false;
    }

    return execute(backupPath, {
        "INSERT INTO ABPerson (ROWID, First, Last, Organization) VALUES (1, 'John', 'Doe', NULL)",
        "INSERT INTO ABPerson (ROWID, First, Last, Organization) VALUES (2, 'Jane', 'Smith', 'Acme Corp')",
        "INSERT INTO ABPerson (ROWID, First, Last, Organization) VALUES (3, NULL, NULL, 'Test Company')",
        "INSERT INTO ABPerson (ROWID, First, Last, Organization) VALUES (4, NULL, NULL, NULL)",

        "INSERT INTO ABMultiValueLabel (ROWID, value) VALUES (1, '_$!<Mobile>!$_')",
        "INSERT INTO ABMultiValueLabel (ROWID, value) VALUES (2, '_$!<Home>!$_')",
        "INSERT INTO ABMultiValueLabel (ROWID, value) VALUES (3, '_$!<Work>!$_')",

        "INSERT INTO ABMultiValue (record_id, property, identifier, label, value) "
        "VALUES (1, 3, 0, 1, '(555) 123-4567')",
        "INSERT INTO ABMultiValue (record_id, property, identifier, label, value) "
        "VALUES (1, 4, 0, 2, 'john.doe@example.com')",
        "INSERT INTO ABMultiValue (record_id, property, identifier, label, value) "
        "VALUES (1, 5, 0, 2, '123 Main St')",
        "INSERT INTO ABMultiValue (record_id, property, identifier, label, value) "
        "VALUES (2, 3, 0, 3, '+1 555 987 6543')",
        "INSERT INTO ABMultiValue (record_id, property, identifier, label, value) "
        "VALUES (2, 3, 1, 1, '555-111-2222')",
        "INSERT INTO ABMultiValue (record_id, property, identifier, label, value) "
        "VALUES (2, 4, 0, 3, 'Jane@Acme.com')",
        "INSERT INTO ABMultiValue (record_id, property, identifier, label, value) "
        "VALUES (3, 3, 0, NULL, '5553334444')",
        "INSERT INTO ABMultiValue (record_id, property, identifier, label, value) "
        "VALUES (3, 4, 0, NULL, 'info@testcompany.com')"
    });
}

} // namespace AddressBookFixture

#endif // ADDRESSBOOKFIXTURE_H
