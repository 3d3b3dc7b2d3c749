//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Basic exception handling.  Exception classes for specific errors
// are declared with one macro, and thrown with a concise syntax that
// allows stringstream concatenation using <<

#ifndef PIANM_COMMON_EXCEPTION_H
#define PIANM_COMMON_EXCEPTION_H

#include <string>
#include <sstream>
#include <exception>
#include <utility>

namespace pianm {

// string exception class, where the exception is described by a std::string
class Exception : public std::exception
{
  public:
    Exception(std::string err) noexcept
        : err_(std::move(err))
    {
    }

    const char *what() const noexcept override
    {
        return err_.c_str();
    }

    const std::string &err() const noexcept
    {
        return err_;
    }

  private:
    std::string err_;
};

// define a simple custom exception class with no extra info
#define PIANM_SIMPLE_EXCEPTION(C)                  \
    class C : public std::exception                \
    {                                              \
      public:                                      \
        const char *what() const noexcept override \
        {                                          \
            return #C;                             \
        }                                          \
    }

// define a custom exception class that allows extra info
#define PIANM_EXCEPTION(C)                              \
    class C : public pianm::Exception                   \
    {                                                   \
      public:                                           \
        C()                                             \
            : pianm::Exception(#C)                      \
        {                                               \
        }                                               \
        C(const std::string &err)                       \
            : pianm::Exception(#C ": " + err)           \
        {                                               \
        }                                               \
    }

// throw a PIANM_EXCEPTION class with stringstream concatenation allowed
#define PIANM_THROW(exc, stuff)              \
    do                                       \
    {                                        \
        std::ostringstream _pianm_exc;       \
        _pianm_exc << stuff;                 \
        throw exc(_pianm_exc.str());         \
    } while (0)

} // namespace pianm

#endif // PIANM_COMMON_EXCEPTION_H
