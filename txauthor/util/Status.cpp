/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#include "Status.hpp"
#include "Debug.hpp"
#include <sstream>

namespace txauthor {

const char *
codeName(tTXA_CC value)
{
    switch (value)
    {
    case TXA_CC_Ok: return "Ok";
    case TXA_CC_Error: return "Error";
    case TXA_CC_NULLPtr: return "NULLPtr";
    case TXA_CC_SysError: return "SysError";
    case TXA_CC_JSONError: return "JSONError";
    case TXA_CC_FileReadError: return "FileReadError";
    case TXA_CC_ParseError: return "ParseError";
    case TXA_CC_InvalidAmount: return "InvalidAmount";
    case TXA_CC_InvalidAddress: return "InvalidAddress";
    case TXA_CC_UnsupportedAddressType: return "UnsupportedAddressType";
    case TXA_CC_MultipleMaxAmountRecipients: return "MultipleMaxAmountRecipients";
    case TXA_CC_ConflictingChangeSpecification: return "ConflictingChangeSpecification";
    case TXA_CC_ChangeAddressGenerationFailed: return "ChangeAddressGenerationFailed";
    case TXA_CC_InsufficientFunds: return "InsufficientFunds";
    case TXA_CC_ScriptTooLarge: return "ScriptTooLarge";
    case TXA_CC_ChangeAllocationExceedsAvailable: return "ChangeAllocationExceedsAvailable";
    }
    return "Unknown";
}

Status::Status() :
    value_(TXA_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tTXA_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(message),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
    {
        std::stringstream s;
        s << *this;
        logInfo(s.str());
    }
    return *this;
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
        s.file() << ":" << s.line() << ": " << s.function() <<
        " returned error " << s.value() << " " << codeName(s.value()) <<
        " (" << s.message() << ")";
    return output;
}

} // namespace txauthor
