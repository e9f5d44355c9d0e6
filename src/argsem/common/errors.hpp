/**
 * @file errors.hpp
 */
#pragma once
#include "argsem/common/common.hpp"

namespace argsem
{

/**
 * @brief Error codes for argsem operations.
 *
 * @details
 * The first four codes form the "malformed graph" family and are raised while
 * a graph is being constructed or parsed, never at query time.
 *
 * @note An empty extension family (for example no stable extension on an odd
 * cycle) is a valid result and has no error code.
 */
enum class AfErrorCode
{
    DuplicateArgument,
    UnknownArgumentInAttack,
    UnknownArgument,
    InvalidArgumentId,
    InvalidSemanticsKind,
    InvalidRequest,
    ParseError,
    SearchExhausted
};

/**
 * @brief Get a short name for an error code.
 */
inline const char* to_string(AfErrorCode code) noexcept
{
    switch (code)
    {
        case AfErrorCode::DuplicateArgument: return "DuplicateArgument";
        case AfErrorCode::UnknownArgumentInAttack: return "UnknownArgumentInAttack";
        case AfErrorCode::UnknownArgument: return "UnknownArgument";
        case AfErrorCode::InvalidArgumentId: return "InvalidArgumentId";
        case AfErrorCode::InvalidSemanticsKind: return "InvalidSemanticsKind";
        case AfErrorCode::InvalidRequest: return "InvalidRequest";
        case AfErrorCode::ParseError: return "ParseError";
        case AfErrorCode::SearchExhausted: return "SearchExhausted";
    }
    return "Unknown";
}

/**
 * @brief Exception class for argsem errors.
 *
 * @details
 * `AfError` is thrown when input is malformed, a request is invalid, or an
 * enumeration cap is hit. Each exception carries an error code and a
 * descriptive message. No partial result is ever returned together with an
 * `AfError`.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class AfError : public std::exception
{
public:
    /**
     * @brief Construct an AfError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    AfError(AfErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    AfErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    AfErrorCode m_code;
    std::string m_message;
};

} // namespace argsem
