#include "contactstore.h"
#include "backuppath.h"
#include "phoneutils.h"

#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QFileInfo>
#include <QRegularExpression>
#include <QStringList>
#include <QElapsedTimer>
#include <QDebug>

namespace {

// ABMultiValue.property
const int PROPERTY_PHONE = 3;
const int PROPERTY_EMAIL = 4;

const char *SELECT_PERSONS =
    "SELECT ROWID, First, Last, Organization FROM ABPerson ORDER BY ROWID";

const char *SELECT_PERSON_BY_ID =
    "SELECT ROWID, First, Last, Organization FROM ABPerson WHERE ROWID = :id";

const char *SELECT_MULTI_VALUES =
    "SELECT mv.record_id, mv.property, mvl.value, mv.value "
    "FROM ABMultiValue mv "
    "LEFT JOIN ABMultiValueLabel mvl ON mv.label = mvl.ROWID "
    "WHERE mv.property IN (:phone, :email) "
    "ORDER BY mv.record_id";

const char *SELECT_MULTI_VALUES_BY_ID =
    "SELECT mv.record_id, mv.property, mvl.value, mv.value "
    "FROM ABMultiValue mv "
    "LEFT JOIN ABMultiValueLabel mvl ON mv.label = mvl.ROWID "
    "WHERE mv.record_id = :id AND mv.property IN (:phone, :email)";

} // namespace

ContactStore::ContactStore()
    : m_connectionName(QStringLiteral("qphonesync_contacts_%1")
                           .arg(reinterpret_cast<quintptr>(this), 0, 16))
{
}

ContactStore::~ContactStore()
{
    close();
}

QString ContactStore::databasePath(const QString &backupPath)
{
    return BackupPath::filePath(backupPath, QString::fromLatin1(BackupPath::ADDRESSBOOK_DB_HASH));
}

// ========== Lifecycle ==========

bool ContactStore::open(const QString &backupPath)
{
    close();
    m_errorString.clear();

    const QString dbPath = databasePath(backupPath);
    if (!QFileInfo::exists(dbPath)) {
        setError(QStringLiteral("AddressBook database not found: %1").arg(dbPath));
        return false;
    }

    {
        QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
        db.setDatabaseName(dbPath);
        db.setConnectOptions(QStringLiteral("QSQLITE_OPEN_READONLY"));

        if (!db.open()) {
            const QString reason = db.lastError().text();
            db = QSqlDatabase();
            QSqlDatabase::removeDatabase(m_connectionName);
            setError(QStringLiteral("Failed to open AddressBook database: %1").arg(reason));
            return false;
        }
    }

    m_open = true;
    qInfo() << "[ContactStore] Opened AddressBook database";

    if (!loadContacts()) {
        const QString error = m_errorString;
        close();
        m_errorString = error;
        return false;
    }

    return true;
}

void ContactStore::close()
{
    if (m_open) {
        {
            QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);
            db.close();
        }
        QSqlDatabase::removeDatabase(m_connectionName);
        m_open = false;
        qInfo() << "[ContactStore] Closed AddressBook database";
    }

    m_contacts.clear();
    m_phoneIndex.clear();
    m_emailIndex.clear();
}

void ContactStore::setError(const QString &message)
{
    m_errorString = message;
    qWarning() << "[ContactStore]" << message;
}

// ========== Loading ==========

ContactStore::MultiValueRow ContactStore::readMultiValue(const QSqlQuery &query)
{
    MultiValueRow row;
    row.recordId = query.value(0).toLongLong();
    row.property = query.value(1).toInt();
    row.label = query.value(2).toString();
    row.value = query.value(3).toString();
    return row;
}

bool ContactStore::loadContacts()
{
    QElapsedTimer timer;
    timer.start();

    QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);

    QSqlQuery mvQuery(db);
    mvQuery.setForwardOnly(true);
    mvQuery.prepare(QString::fromLatin1(SELECT_MULTI_VALUES));
    mvQuery.bindValue(QStringLiteral(":phone"), PROPERTY_PHONE);
    mvQuery.bindValue(QStringLiteral(":email"), PROPERTY_EMAIL);
    if (!mvQuery.exec()) {
        setError(QStringLiteral("Failed to read ABMultiValue: %1").arg(mvQuery.lastError().text()));
        return false;
    }

    QHash<qint64, QList<MultiValueRow>> multiValuesByContact;
    while (mvQuery.next()) {
        const MultiValueRow row = readMultiValue(mvQuery);
        multiValuesByContact[row.recordId].append(row);
    }

    QSqlQuery personQuery(db);
    personQuery.setForwardOnly(true);
    if (!personQuery.exec(QString::fromLatin1(SELECT_PERSONS))) {
        setError(QStringLiteral("Failed to read ABPerson: %1").arg(personQuery.lastError().text()));
        return false;
    }

    while (personQuery.next()) {
        const qint64 id = personQuery.value(0).toLongLong();
        const Contact contact = buildContact(id,
                                             personQuery.value(1).toString(),
                                             personQuery.value(2).toString(),
                                             personQuery.value(3).toString(),
                                             multiValuesByContact.value(id));
        m_contacts.insert(contact.id, contact);

        for (const ContactPhone &phone : contact.phoneNumbers) {
            const QString key = PhoneUtils::trailingDigits(phone.normalizedNumber);
            if (key.size() >= PhoneUtils::MIN_INDEXED_DIGITS) {
                m_phoneIndex.insert(key, contact.id);
            }
        }

        for (const ContactEmail &email : contact.emails) {
            m_emailIndex.insert(email.email.toLower(), contact.id);
        }
    }

    qInfo() << "[ContactStore] Built lookup indexes:"
            << m_contacts.size() << "contacts,"
            << m_phoneIndex.size() << "phone keys,"
            << m_emailIndex.size() << "email keys in"
            << timer.elapsed() << "ms";
    return true;
}

Contact ContactStore::buildContact(qint64 id,
                                   const QString &first,
                                   const QString &last,
                                   const QString &organization,
                                   const QList<MultiValueRow> &multiValues) const
{
    Contact contact;
    contact.id = id;
    contact.firstName = first;
    contact.lastName = last;
    contact.organization = organization;
    contact.displayName = computeDisplayName(first, last, organization);

    for (const MultiValueRow &mv : multiValues) {
        if (mv.property == PROPERTY_PHONE) {
            ContactPhone phone;
            phone.label = cleanLabel(mv.label);
            phone.number = mv.value;
            phone.normalizedNumber = PhoneUtils::normalizeToE164(mv.value);
            contact.phoneNumbers.append(phone);
        } else if (mv.property == PROPERTY_EMAIL) {
            ContactEmail email;
            email.label = cleanLabel(mv.label);
            email.email = mv.value;
            contact.emails.append(email);
        }
    }

    return contact;
}

// ========== Decoding ==========

QString ContactStore::cleanLabel(const QString &label)
{
    if (label.isEmpty()) {
        return QStringLiteral("other");
    }

    // Built-in labels are stored as "_$!<Mobile>!$_"
    static const QRegularExpression builtIn(QStringLiteral("_\\$!<(.+)>!\\$_"));
    const QRegularExpressionMatch match = builtIn.match(label);
    if (match.hasMatch()) {
        return match.captured(1).toLower();
    }

    return label.toLower();
}

QString ContactStore::computeDisplayName(const QString &firstName,
                                         const QString &lastName,
                                         const QString &organization)
{
    QStringList parts;
    if (!firstName.trimmed().isEmpty()) {
        parts << firstName.trimmed();
    }
    if (!lastName.trimmed().isEmpty()) {
        parts << lastName.trimmed();
    }
    if (!parts.isEmpty()) {
        return parts.join(QLatin1Char(' '));
    }

    if (!organization.trimmed().isEmpty()) {
        return organization.trimmed();
    }

    return QStringLiteral("Unknown");
}

// ========== Queries ==========

QList<Contact> ContactStore::allContacts() const
{
    return m_contacts.values();
}

bool ContactStore::contactById(qint64 id, Contact &contact)
{
    auto it = m_contacts.constFind(id);
    if (it != m_contacts.constEnd()) {
        contact = it.value();
        return true;
    }

    if (!m_open) {
        return false;
    }

    QSqlDatabase db = QSqlDatabase::database(m_connectionName, false);

    QSqlQuery personQuery(db);
    personQuery.prepare(QString::fromLatin1(SELECT_PERSON_BY_ID));
    personQuery.bindValue(QStringLiteral(":id"), id);
    if (!personQuery.exec()) {
        qWarning() << "[ContactStore] Contact query failed:" << personQuery.lastError().text();
        return false;
    }
    if (!personQuery.next()) {
        return false;
    }

    QSqlQuery mvQuery(db);
    mvQuery.prepare(QString::fromLatin1(SELECT_MULTI_VALUES_BY_ID));
    mvQuery.bindValue(QStringLiteral(":id"), id);
    mvQuery.bindValue(QStringLiteral(":phone"), PROPERTY_PHONE);
    mvQuery.bindValue(QStringLiteral(":email"), PROPERTY_EMAIL);
    if (!mvQuery.exec()) {
        qWarning() << "[ContactStore] Multi-value query failed:" << mvQuery.lastError().text();
        return false;
    }

    QList<MultiValueRow> multiValues;
    while (mvQuery.next()) {
        multiValues.append(readMultiValue(mvQuery));
    }

    contact = buildContact(id,
                           personQuery.value(1).toString(),
                           personQuery.value(2).toString(),
                           personQuery.value(3).toString(),
                           multiValues);
    m_contacts.insert(id, contact);
    return true;
}

ContactLookupResult ContactStore::lookup(const QHash<QString, qint64> &index,
                                         const QString &key,
                                         ContactMatch kind)
{
    ContactLookupResult result;

    auto it = index.constFind(key);
    if (it == index.constEnd()) {
        return result;
    }

    if (contactById(it.value(), result.contact)) {
        result.found = true;
        result.matchedOn = kind;
    }
    return result;
}

ContactLookupResult ContactStore::lookupByPhone(const QString &phoneNumber)
{
    return lookup(m_phoneIndex, PhoneUtils::trailingDigits(phoneNumber), ContactMatch::Phone);
}

ContactLookupResult ContactStore::lookupByEmail(const QString &email)
{
    return lookup(m_emailIndex, email.toLower(), ContactMatch::Email);
}

ContactLookupResult ContactStore::lookupByHandle(const QString &handle)
{
    const QString trimmed = handle.trimmed();
    if (trimmed.isEmpty()) {
        return ContactLookupResult();
    }

    if (PhoneUtils::isPhoneNumber(trimmed)) {
        return lookupByPhone(trimmed);
    }
    return lookupByEmail(trimmed);
}

ContactStoreStats ContactStore::stats() const
{
    ContactStoreStats s;
    s.contactCount = m_contacts.size();
    s.phoneIndexSize = m_phoneIndex.size();
    s.emailIndexSize = m_emailIndex.size();
    return s;
}
