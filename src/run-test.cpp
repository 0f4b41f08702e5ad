/* This file is part of Praos Crypto project.
 * Copyright (c) 2025 Praos Crypto contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <iostream>
#include <pc/common/test.hpp>
#include <pc/logger.hpp>

int main(const int argc, const char **argv)
{
    using namespace praos_crypto;
    if (argc >= 2) {
        std::cerr << "using test-filter mask: " << argv[1] << '\n';
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    logger::info("{} finished with {}", argv[0], res ? "failures" : "success");
    return res ? 1 : 0;
}
