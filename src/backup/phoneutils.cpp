#include "phoneutils.h"

namespace PhoneUtils {

QString extractDigits(const QString &text)
{
    QString digits;
    digits.reserve(text.size());
    for (const QChar &c : text) {
        if (c >= QLatin1Char('0') && c <= QLatin1Char('9')) {
            digits.append(c);
        }
    }
    return digits;
}

QString trailingDigits(const QString &number, int count)
{
    return extractDigits(number).right(count);
}

bool isPhoneNumber(const QString &handle)
{
    if (handle.isEmpty() || handle.contains(QLatin1Char('@'))) {
        return false;
    }
    return extractDigits(handle).size() >= MIN_INDEXED_DIGITS;
}

QString normalizeToE164(const QString &number)
{
    const QString digits = extractDigits(number);

    if (digits.size() == 10) {
        return QStringLiteral("+1") + digits;
    }
    // 11 digits with a leading 1 already carry the country code
    return QLatin1Char('+') + digits;
}

} // namespace PhoneUtils
