//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Code refers to the asio library as pianm_io.

#ifndef PIANM_IO_IO_H
#define PIANM_IO_IO_H

#include <boost/asio.hpp>

#define pianm_io boost::asio

#endif
