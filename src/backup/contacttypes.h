#ifndef CONTACTTYPES_H
#define CONTACTTYPES_H

#include <QString>
#include <QList>
#include <QMetaType>

struct ContactPhone
{
    QString label;              ///< Cleaned label, e.g. "mobile"
    QString number;             ///< As stored in the address book
    QString normalizedNumber;   ///< PhoneUtils::normalizeToE164(number)
};

struct ContactEmail
{
    QString label;
    QString email;
};

/**
 * @brief One ABPerson row with its phone numbers and email addresses
 *
 * Name fields are null QStrings when the database column is NULL.
 */
struct Contact
{
    qint64 id = 0;              ///< ABPerson ROWID
    QString firstName;
    QString lastName;
    QString organization;
    QList<ContactPhone> phoneNumbers;
    QList<ContactEmail> emails;
    QString displayName;
};

/**
 * @brief Which index produced a lookup hit
 */
enum class ContactMatch {
    None,
    Phone,
    Email
};

struct ContactLookupResult
{
    bool found = false;
    Contact contact;
    ContactMatch matchedOn = ContactMatch::None;

    /// "phone", "email", or an empty string when nothing matched
    QString matchedOnName() const
    {
        switch (matchedOn) {
            case ContactMatch::Phone: return QStringLiteral("phone");
            case ContactMatch::Email: return QStringLiteral("email");
            case ContactMatch::None: break;
        }
        return QString();
    }
};

struct ContactStoreStats
{
    int contactCount = 0;
    int phoneIndexSize = 0;
    int emailIndexSize = 0;
};

Q_DECLARE_METATYPE(Contact)

#endif // CONTACTTYPES_H
