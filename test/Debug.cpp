/*
 * Copyright (c) 2016, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../txcoord/util/Debug.hpp"
#include "../txcoord/util/FileIO.hpp"
#include <catch.hpp>

TEST_CASE("Debug log file", "[util][debug]")
{
    const std::string dir = "debug-test/";
    REQUIRE(txcoord::debugInitialize(dir));
    txcoord::TXC_DebugLog("Tick %d done", 42);
    txcoord::debugTerminate();

    const auto log = txcoord::toString(txcoord::debugLogLoad());
#ifdef DEBUG
    REQUIRE(std::string::npos != log.find("TXC_Log: Tick 42 done\n"));
#else
    REQUIRE(log.empty());
#endif

    // Logging carries on to stdout once the file is closed:
    txcoord::TXC_DebugLog("After terminate");
    REQUIRE(txcoord::fileDelete(dir));
}
