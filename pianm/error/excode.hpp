//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// An Exception that carries an Error::Type code and a fatal flag.

#ifndef PIANM_ERROR_EXCODE_H
#define PIANM_ERROR_EXCODE_H

#include <string>

#include <pianm/common/exception.hpp>
#include <pianm/error/error.hpp>

namespace pianm {

class ExceptionCode : public Exception
{
    enum
    {
        FATAL_FLAG = 0x80000000
    };

  public:
    ExceptionCode(const std::string &err)
        : Exception(err),
          code_(0)
    {
    }

    ExceptionCode(const Error::Type code, const std::string &err)
        : Exception(err),
          code_(code)
    {
    }

    ExceptionCode(const Error::Type code, const bool fatal, const std::string &err)
        : Exception(err),
          code_(mkcode(code, fatal))
    {
    }

    Error::Type code() const
    {
        return Error::Type(code_ & ~FATAL_FLAG);
    }

    bool fatal() const
    {
        return (code_ & FATAL_FLAG) != 0;
    }

    bool code_defined() const
    {
        return code_ != 0;
    }

  private:
    static unsigned int mkcode(const Error::Type code, const bool fatal)
    {
        unsigned int ret = code;
        if (fatal)
            ret |= FATAL_FLAG;
        return ret;
    }

    unsigned int code_;
};

} // namespace pianm

#endif
