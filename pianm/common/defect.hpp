//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Reporting of program defects: conditions that can only arise from a
// threading or reentrancy bug in this code base, never from a failed
// service call.  Development builds stop at the first one; release
// builds (NDEBUG) log it and carry on.

#ifndef PIANM_COMMON_DEFECT_H
#define PIANM_COMMON_DEFECT_H

#include <cstdlib>
#include <iostream>
#include <string>

#include <pianm/log/logbase.hpp>

namespace pianm {

inline void program_defect(const std::string &what)
{
#ifdef NDEBUG
    PIANM_LOG("PROGRAM DEFECT: " << what);
#else
    std::cerr << "PROGRAM DEFECT: " << what << std::endl;
    std::abort();
#endif
}

} // namespace pianm

#endif
