#pragma once

#include <string>

namespace wallet::domain {

/**
 * @brief Типизированный результат бизнес-операции
 *
 * Ожидаемые исходы (нехватка средств, неверное состояние, права)
 * возвращаются кодом, а не исключением. STORE_UNAVAILABLE появляется
 * только в ответах command handler'а: внутри ядра это исключение.
 */
enum class ErrorCode {
    NONE,
    INSUFFICIENT_FUNDS,
    MONTHLY_LIMIT_EXCEEDED,
    ACCOUNT_FROZEN,
    ACCOUNT_NOT_FOUND,
    INVALID_STATE_TRANSITION,
    UNAUTHORIZED,
    LOCK_TIMEOUT,
    DUPLICATE_OPERATION,
    LISTING_UNAVAILABLE,
    INVALID_REQUEST,
    NOT_FOUND,
    STORE_UNAVAILABLE
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "OK";
        case ErrorCode::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case ErrorCode::MONTHLY_LIMIT_EXCEEDED: return "MONTHLY_LIMIT_EXCEEDED";
        case ErrorCode::ACCOUNT_FROZEN: return "ACCOUNT_FROZEN";
        case ErrorCode::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case ErrorCode::INVALID_STATE_TRANSITION: return "INVALID_STATE_TRANSITION";
        case ErrorCode::UNAUTHORIZED: return "UNAUTHORIZED";
        case ErrorCode::LOCK_TIMEOUT: return "LOCK_TIMEOUT";
        case ErrorCode::DUPLICATE_OPERATION: return "DUPLICATE_OPERATION";
        case ErrorCode::LISTING_UNAVAILABLE: return "LISTING_UNAVAILABLE";
        case ErrorCode::INVALID_REQUEST: return "INVALID_REQUEST";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::STORE_UNAVAILABLE: return "STORE_UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Можно ли повторить операцию без изменений
 */
inline bool isRetryable(ErrorCode code) {
    return code == ErrorCode::LOCK_TIMEOUT;
}

} // namespace wallet::domain
