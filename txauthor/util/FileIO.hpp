/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Filesystem access functions
 */

#ifndef TXAUTHOR_UTIL_FILE_IO_HPP
#define TXAUTHOR_UTIL_FILE_IO_HPP

#include <string>

namespace txauthor {

/**
 * Returns true if the path exists.
 */
bool
fileExists(const std::string &path);

} // namespace txauthor

#endif
