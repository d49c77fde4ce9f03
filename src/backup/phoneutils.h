#ifndef PHONEUTILS_H
#define PHONEUTILS_H

#include <QString>

/**
 * @file phoneutils.h
 * @brief Phone number helpers used for contact matching
 *
 * Message handles and address book entries format numbers differently
 * ("(555) 123-4567", "+1 555 123 4567", "15551234567"). Matching is done
 * on the trailing digits so that all of these compare equal.
 */
namespace PhoneUtils {

/// Default number of trailing digits used as a lookup key
const int TRAILING_DIGIT_COUNT = 10;

/// Keys shorter than this are too ambiguous to index
const int MIN_INDEXED_DIGITS = 7;

/**
 * @brief Strip everything except 0-9
 */
QString extractDigits(const QString &text);

/**
 * @brief The last @p count digits of @p number (all digits if fewer)
 */
QString trailingDigits(const QString &number, int count = TRAILING_DIGIT_COUNT);

/**
 * @brief Heuristic: no '@' and at least MIN_INDEXED_DIGITS digits
 */
bool isPhoneNumber(const QString &handle);

/**
 * @brief Normalize to an E.164-like form
 *
 * 10 digits get a +1 prefix, 11 digits starting with 1 get a +,
 * anything else becomes + followed by its digits.
 */
QString normalizeToE164(const QString &number);

} // namespace PhoneUtils

#endif // PHONEUTILS_H
