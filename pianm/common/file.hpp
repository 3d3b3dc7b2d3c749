//    pia-nm -- WireGuard profile management and zero-downtime
//              credential rotation for NetworkManager
//
//    Copyright (C) 2024- pia-nm contributors
//
//    SPDX-License-Identifier: GPL-3.0-or-later
//

// Basic file-handling methods.

#ifndef PIANM_COMMON_FILE_H
#define PIANM_COMMON_FILE_H

#include <string>
#include <fstream>
#include <iterator>

#include <pianm/common/exception.hpp>

namespace pianm {

PIANM_EXCEPTION(open_file_error);

// Read text from file via stream approach that doesn't require that we
// establish the length of the file in advance.
inline std::string read_text_simple(const std::string &filename)
{
    std::ifstream ifs(filename.c_str());
    if (!ifs)
        PIANM_THROW(open_file_error, "cannot open: " << filename);
    const std::string str((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad())
        PIANM_THROW(open_file_error, "cannot read: " << filename);
    return str;
}

} // namespace pianm

#endif
