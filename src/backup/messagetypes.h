#ifndef MESSAGETYPES_H
#define MESSAGETYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QMetaType>

/**
 * @brief One message from the device message database
 */
struct Message
{
    qint64 id = 0;
    QString guid;
    QString text;
    QString handle;         ///< Sender phone number or email; empty for own messages
    QString senderName;     ///< Resolved display name, filled in during sync
    bool isFromMe = false;
    QDateTime date;
    QString service;        ///< "iMessage", "SMS", ...
};

/**
 * @brief A chat thread and, once loaded, its messages
 */
struct Conversation
{
    qint64 chatId = 0;
    QString chatIdentifier;
    QStringList participants;   ///< Handles, replaced by display names when resolved
    QList<Message> messages;
    QDateTime lastMessage;
    bool isGroupChat = false;
};

Q_DECLARE_METATYPE(Message)
Q_DECLARE_METATYPE(Conversation)

#endif // MESSAGETYPES_H
