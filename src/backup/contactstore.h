#ifndef CONTACTSTORE_H
#define CONTACTSTORE_H

#include <QString>
#include <QList>
#include <QMap>
#include <QHash>

#include "contacttypes.h"

class QSqlQuery;

/**
 * @brief Read-only view of the AddressBook database inside a device backup
 *
 * The address book is a SQLite file stored in the backup under the
 * hash of HomeDomain-Library/AddressBook/AddressBook.sqlitedb. People
 * live in ABPerson; phone numbers and email addresses are rows of
 * ABMultiValue (property 3 and 4) whose label points into
 * ABMultiValueLabel.
 *
 * open() loads every contact and builds two lookup indexes:
 * - phone: last 10 digits of the normalized number -> contact id
 *   (numbers with fewer than 7 digits are not indexed)
 * - email: lowercased address -> contact id
 *
 * When two contacts share a phone key the one loaded last wins.
 *
 * The database is never written to. A store must be opened, used and
 * closed on one thread (QtSql connections are thread-bound).
 */
class ContactStore
{
public:
    ContactStore();
    ~ContactStore();

    ContactStore(const ContactStore &) = delete;
    ContactStore &operator=(const ContactStore &) = delete;

    // ========== Lifecycle ==========

    /**
     * @brief Open the AddressBook of a backup and build the indexes
     * @param backupPath Backup directory (the one containing Manifest.db)
     * @return false if the database is missing or unreadable; see errorString()
     *
     * A previously opened database is closed first.
     */
    bool open(const QString &backupPath);

    /**
     * @brief Close the database and drop all cached data; idempotent
     */
    void close();

    bool isOpen() const { return m_open; }

    QString errorString() const { return m_errorString; }

    /**
     * @brief Location of the AddressBook database inside a backup
     */
    static QString databasePath(const QString &backupPath);

    // ========== Queries ==========

    /**
     * @brief All loaded contacts, ordered by id
     */
    QList<Contact> allContacts() const;

    /**
     * @brief Fetch a contact by ABPerson ROWID
     *
     * Served from the cache; on a miss the open database is queried
     * and the result cached.
     */
    bool contactById(qint64 id, Contact &contact);

    ContactLookupResult lookupByPhone(const QString &phoneNumber);
    ContactLookupResult lookupByEmail(const QString &email);

    /**
     * @brief Look up a message handle (phone number or email address)
     *
     * Handles without '@' and with at least 7 digits go to the phone
     * index, everything else to the email index.
     */
    ContactLookupResult lookupByHandle(const QString &handle);

    int contactCount() const { return m_contacts.size(); }
    ContactStoreStats stats() const;

    // ========== Decoding ==========

    /**
     * @brief Normalize a multi-value label
     *
     * "_$!<Mobile>!$_" -> "mobile", "Custom" -> "custom", empty -> "other"
     */
    static QString cleanLabel(const QString &label);

    /**
     * @brief "First Last", else Organization, else "Unknown"
     */
    static QString computeDisplayName(const QString &firstName,
                                      const QString &lastName,
                                      const QString &organization);

private:
    struct MultiValueRow {
        qint64 recordId = 0;
        int property = 0;
        QString label;
        QString value;
    };

    bool loadContacts();
    Contact buildContact(qint64 id,
                         const QString &first,
                         const QString &last,
                         const QString &organization,
                         const QList<MultiValueRow> &multiValues) const;
    static MultiValueRow readMultiValue(const QSqlQuery &query);
    ContactLookupResult lookup(const QHash<QString, qint64> &index,
                               const QString &key,
                               ContactMatch kind);
    void setError(const QString &message);

    QString m_connectionName;
    bool m_open = false;
    QString m_errorString;

    QMap<qint64, Contact> m_contacts;
    QHash<QString, qint64> m_phoneIndex;
    QHash<QString, qint64> m_emailIndex;
};

#endif // CONTACTSTORE_H
