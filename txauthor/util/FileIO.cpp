/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "FileIO.hpp"
#include <unistd.h>

namespace txauthor {

bool
fileExists(const std::string &path)
{
    return 0 == access(path.c_str(), F_OK);
}

} // namespace txauthor
