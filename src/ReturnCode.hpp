#ifndef HEADER_ReturnCode_hpp_ALREADY_INCLUDED
#define HEADER_ReturnCode_hpp_ALREADY_INCLUDED

#include <ostream>

enum class ReturnCode
{
    Ok = 0,
    Error,
    InvalidCharacter,
    FileNotFound,
    IncludeTooDeep,
    UnknownArgument,
};

inline std::ostream &operator<<(std::ostream &os, ReturnCode rc)
{
    switch (rc)
    {
        case ReturnCode::Ok: os << "Ok"; break;
        case ReturnCode::Error: os << "Error"; break;
        case ReturnCode::InvalidCharacter: os << "InvalidCharacter"; break;
        case ReturnCode::FileNotFound: os << "FileNotFound"; break;
        case ReturnCode::IncludeTooDeep: os << "IncludeTooDeep"; break;
        case ReturnCode::UnknownArgument: os << "UnknownArgument"; break;
    }
    return os;
}

#endif
