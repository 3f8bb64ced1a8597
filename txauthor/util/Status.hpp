/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#ifndef TXAUTHOR_UTIL_STATUS_HPP
#define TXAUTHOR_UTIL_STATUS_HPP

#include <stddef.h>
#include <ostream>
#include <string>

namespace txauthor {

/**
 * Result codes for core functions.
 */
typedef enum eTXA_CC
{
    /** The function completed without an error */
    TXA_CC_Ok = 0,
    /** An error occured */
    TXA_CC_Error = 1,
    /** Unexpected NULL pointer */
    TXA_CC_NULLPtr = 2,
    /** Operating system failure */
    TXA_CC_SysError = 3,
    /** JSON parsing or validation error */
    TXA_CC_JSONError = 4,
    /** Could not read a file */
    TXA_CC_FileReadError = 5,
    /** Malformed input data */
    TXA_CC_ParseError = 6,
    /** An amount is zero, negative, or above the network ceiling */
    TXA_CC_InvalidAmount = 7,
    /** An address does not decode */
    TXA_CC_InvalidAddress = 8,
    /** An address decodes, but has no known output script */
    TXA_CC_UnsupportedAddressType = 9,
    /** More than one destination wants the maximum amount */
    TXA_CC_MultipleMaxAmountRecipients = 10,
    /** A send-max destination appears alongside explicit change */
    TXA_CC_ConflictingChangeSpecification = 11,
    /** The change address provider failed */
    TXA_CC_ChangeAddressGenerationFailed = 12,
    /** The inputs cannot cover the outputs and fee */
    TXA_CC_InsufficientFunds = 13,
    /** A change script is too big to push onto the stack */
    TXA_CC_ScriptTooLarge = 14,
    /** The explicit change amounts add up to more than the leftover */
    TXA_CC_ChangeAllocationExceedsAvailable = 15
} tTXA_CC;

/**
 * Returns a short, human-readable name for an error code.
 */
const char *
codeName(tTXA_CC value);

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tTXA_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tTXA_CC value()             const { return value_; }
    const std::string &message() const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == TXA_CC_Ok; }

    /**
     * Write this status to the debug log if it isn't success.
     */
    const Status &log() const;

private:
    // Error information:
    tTXA_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define TXA_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define TXA_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

/**
 * Checks a status code, and if it represents an error,
 * returns a new error with the given code that wraps the inner message.
 */
#define TXA_CHECK_WRAP(f, value, prefix) \
    do { \
        Status s = (f); \
        if (!s) return TXA_ERROR(value, std::string(prefix) + ": " + s.message()); \
    } while (false)

} // namespace txauthor

#endif
