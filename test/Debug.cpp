/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../txauthor/util/Debug.hpp"
#include "../txauthor/util/FileIO.hpp"
#include <catch.hpp>
#include <fstream>
#include <sstream>
#include <stdio.h>

TEST_CASE("Debug log file", "[util]")
{
    const std::string path = "txauthor-test.log";
    remove(path.c_str());
    remove((path + ".prev").c_str());

    REQUIRE(txauthor::debugInitialize(path));
    txauthor::logInfo("first message");
    txauthor::TXA_DebugLog("formatted %d", 42);
    txauthor::debugTerminate();

    std::ifstream file(path);
    std::stringstream text;
    text << file.rdbuf();
    REQUIRE(std::string::npos != text.str().find("TXA_Log: first message\n"));
    REQUIRE(std::string::npos != text.str().find("TXA_Log: formatted 42\n"));

    // Starting again keeps the old log around:
    REQUIRE(txauthor::debugInitialize(path));
    txauthor::debugTerminate();
    REQUIRE(txauthor::fileExists(path + ".prev"));

    remove(path.c_str());
    remove((path + ".prev").c_str());
}
