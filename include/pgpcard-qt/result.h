#pragma once

#include <QString>
#include <utility>

namespace PgpCard {

/**
 * @brief Kinds of failure reported by the library
 */
enum class ErrorCode {
    None,
    KeyNotPresent,     ///< Record not constructed, or key slot not present on the card
    NoSuchTag,         ///< Tag path missing from the parsed response
    NoSuchAlgorithm,   ///< Algorithm identifier outside the recognized range
    UnknownKeyOrigin,  ///< Key origin byte outside the recognized range
    NotFound,          ///< 1-based byte/range access out of bounds
    TooShort,          ///< Field present but shorter than required
    MalformedTlv,      ///< Truncated or unsupported BER-TLV encoding
    TransportError,    ///< Channel failed to exchange an APDU
    CardError,         ///< Card answered with a non-9000 status word
    CryptoError        ///< OpenSSL rejected a key operation
};

/**
 * @brief Human-readable name of an error code (e.g. "NoSuchTag")
 */
QString errorCodeName(ErrorCode code);

/**
 * @brief Error value: a code plus a message annotated by each caller
 */
class Error {
public:
    Error() = default;
    Error(ErrorCode code, QString message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    ErrorCode code() const { return m_code; }
    QString message() const { return m_message; }

    /**
     * @brief Prefix the message with the failing field or operation
     *
     * The code is preserved so callers can still match on it:
     * @code
     * return Result<QString>::error(tag.errorInfo().wrap("fingerprint(Sig)"));
     * @endcode
     */
    Error wrap(const QString& context) const {
        return Error(m_code, context + QStringLiteral(": ") + m_message);
    }

    /**
     * @brief "message [Code]"
     */
    QString toString() const;

private:
    ErrorCode m_code = ErrorCode::None;
    QString m_message;
};

/**
 * @brief Result type for unified error handling
 *
 * Holds either a value or an Error. Every decode step returns one of these;
 * nothing in the library throws.
 *
 * Usage:
 * @code
 * Result<QByteArray> tag = data.tag(Tags::Fingerprints, 60);
 * if (!tag) {
 *     qCWarning(lcPgpCard) << tag.error();
 *     return Result<QString>::error(tag.errorInfo());
 * }
 * use(tag.value());
 * @endcode
 *
 * @tparam T The type of the successful result value (default constructible)
 */
template<typename T>
class Result {
public:
    static Result success(T value) {
        return Result(std::move(value), Error());
    }

    static Result error(const Error& error) {
        return Result(T(), error);
    }

    static Result error(ErrorCode code, const QString& message) {
        return Result(T(), Error(code, message));
    }

    bool isSuccess() const { return m_error.code() == ErrorCode::None; }
    bool isError() const { return !isSuccess(); }

    /**
     * @brief Gets the success value
     * @warning Only meaningful if isSuccess(); returns a default value otherwise
     */
    const T& value() const { return m_value; }

    T valueOr(const T& defaultValue) const {
        return isSuccess() ? m_value : defaultValue;
    }

    ErrorCode errorCode() const { return m_error.code(); }

    /**
     * @brief Error message, or empty string if successful
     */
    QString error() const { return m_error.message(); }

    const Error& errorInfo() const { return m_error; }

    explicit operator bool() const { return isSuccess(); }

private:
    Result(T value, Error error)
        : m_value(std::move(value))
        , m_error(std::move(error))
    {
    }

    T m_value;
    Error m_error;
};

/**
 * @brief Specialization of Result for operations without a value
 */
template<>
class Result<void> {
public:
    static Result success() {
        return Result(Error());
    }

    static Result error(const Error& error) {
        return Result(error);
    }

    static Result error(ErrorCode code, const QString& message) {
        return Result(Error(code, message));
    }

    bool isSuccess() const { return m_error.code() == ErrorCode::None; }
    bool isError() const { return !isSuccess(); }
    ErrorCode errorCode() const { return m_error.code(); }
    QString error() const { return m_error.message(); }
    const Error& errorInfo() const { return m_error; }

    explicit operator bool() const { return isSuccess(); }

private:
    explicit Result(Error error)
        : m_error(std::move(error))
    {
    }

    Error m_error;
};

} // namespace PgpCard
