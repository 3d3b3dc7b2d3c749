//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Exceptions raised by the connection core.  Each one carries its
// Error::Type, and whether retrying the same operation is pointless.

#ifndef PIANM_NM_NMERR_H
#define PIANM_NM_NMERR_H

#include <string>
#include <utility>

#include <pianm/error/excode.hpp>

namespace pianm {

#define PIANM_NM_EXCEPTION(C, CODE, FATAL)                            \
    class C : public pianm::ExceptionCode                             \
    {                                                                 \
      public:                                                         \
        C(const std::string &err)                                     \
            : pianm::ExceptionCode(pianm::Error::CODE, FATAL, #C ": " + err) \
        {                                                             \
        }                                                             \
    }

PIANM_NM_EXCEPTION(startup_failed, STARTUP_FAILED, true);
PIANM_NM_EXCEPTION(operation_timeout, OPERATION_TIMEOUT, false);
PIANM_NM_EXCEPTION(missing_config_section, MISSING_CONFIG_SECTION, true);
PIANM_NM_EXCEPTION(profile_invalid, PROFILE_INVALID, true);
PIANM_NM_EXCEPTION(config_error, CONFIG_ERROR, true);

// A service-level error, the counterpart of a GError: an error domain,
// a code within that domain, and a message.
class operation_failed : public ExceptionCode
{
  public:
    operation_failed(std::string domain, const int code, std::string message)
        : ExceptionCode(Error::OPERATION_FAILED,
                        false,
                        "operation_failed: " + domain + ":" + std::to_string(code) + ": " + message),
          domain_(std::move(domain)),
          service_code_(code),
          message_(std::move(message))
    {
    }

    const std::string &domain() const
    {
        return domain_;
    }

    int service_code() const
    {
        return service_code_;
    }

    const std::string &message() const
    {
        return message_;
    }

    // The saved profile is owned by another user, or by the system,
    // and the caller is not in its permission list.
    bool is_insufficient_privileges() const
    {
        return (domain_ == "nm-settings-error-quark" && service_code_ == 1)
               || message_.find("Insufficient privileges") != std::string::npos;
    }

  private:
    std::string domain_;
    int service_code_;
    std::string message_;
};

// Outcome of one failed refresh attempt.
class refresh_error : public ExceptionCode
{
  public:
    refresh_error(const Error::Type code, const bool fatal, const std::string &err)
        : ExceptionCode(code, fatal, err)
    {
    }
};

} // namespace pianm

#endif
