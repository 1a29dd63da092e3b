/** \brief Unit test macros.
 *  \author Dr. Johannes Ruscheinski (johannes.ruscheinski@uni-tuebingen.de)
 *
 *  \copyright 2018,2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <iostream>
#include <string>
#include <utility>
#include <vector>
#include <cstdlib>
#include "util.h"


static std::vector<std::pair<void (*)(), std::string>> tests;
static unsigned success_count, failure_count;


// If a test name has been given on the command-line, only that test will be run.
#define TEST_MAIN(name)                                                          \
    int main(int argc, char *argv[]) {                                           \
        ::progname = argv[0];                                                    \
        std::cerr << "*** " << #name << " ***\n";                                \
        unsigned run_count(0);                                                   \
        for (const auto &func_and_name : tests) {                                \
            if (argc > 1 and func_and_name.second != argv[1])                    \
                continue;                                                        \
            std::cerr << "Calling test \"" << func_and_name.second << "\".\n";   \
            func_and_name.first();                                               \
            ++run_count;                                                         \
        }                                                                        \
        if (argc > 1 and run_count == 0) {                                       \
            std::cerr << "*** unknown test \"" << argv[1] << "\"! ***\n";        \
            return EXIT_FAILURE;                                                 \
        }                                                                        \
                                                                                 \
        std::cerr << "*** " << success_count << " checks succeeded. ***\n";      \
        std::cerr << "*** " << failure_count << " checks failed. ***\n";         \
        return (failure_count > 0) ? EXIT_FAILURE : EXIT_SUCCESS;                \
    }

#define TEST(test_name)                             \
    static void test_name();                        \
    static int register_##test_name() {             \
        tests.emplace_back(test_name, #test_name);  \
        return 0;                                   \
    }                                               \
    int dummy_##test_name = register_##test_name(); \
    void test_name()

#define REPORT_FAILURE(message)                                                       \
    do {                                                                              \
        ++failure_count;                                                              \
        std::cerr << "\tTest failed in line " << __LINE__ << ": " << message << '\n'; \
    } while (0)

#define CHECK_TRUE(a)                             \
    do {                                          \
        if ((a))                                  \
            ++success_count;                      \
        else                                      \
            REPORT_FAILURE(#a << " is not true!"); \
    } while (0)

#define CHECK_FALSE(a)                             \
    do {                                           \
        if (not(a))                                \
            ++success_count;                       \
        else                                       \
            REPORT_FAILURE(#a << " is not false!"); \
    } while (0)

// The following comparison macros evaluate each argument exactly once and print both values on failure.
#define CHECK_BINARY_OP(a, op, b)                                                                              \
    do {                                                                                                       \
        const auto &lhs_value(a);                                                                              \
        const auto &rhs_value(b);                                                                              \
        if (lhs_value op rhs_value)                                                                            \
            ++success_count;                                                                                   \
        else                                                                                                   \
            REPORT_FAILURE(#a " " #op " " #b << " (\"" << lhs_value << "\" vs. \"" << rhs_value << "\")"); \
    } while (0)

#define CHECK_LT(a, b) CHECK_BINARY_OP(a, <, b)
#define CHECK_GT(a, b) CHECK_BINARY_OP(a, >, b)
#define CHECK_LE(a, b) CHECK_BINARY_OP(a, <=, b)
#define CHECK_GE(a, b) CHECK_BINARY_OP(a, >=, b)
#define CHECK_EQ(a, b) CHECK_BINARY_OP(a, ==, b)
#define CHECK_NE(a, b) CHECK_BINARY_OP(a, !=, b)

// Succeeds if evaluating "expression" throws an exception of type "exception_type" or a type derived from it.
#define CHECK_THROWS(expression, exception_type)                                        \
    do {                                                                                \
        bool caught(false);                                                             \
        try {                                                                           \
            (void)(expression);                                                         \
        } catch (const exception_type &) {                                              \
            caught = true;                                                              \
        }                                                                               \
        if (caught)                                                                     \
            ++success_count;                                                            \
        else                                                                            \
            REPORT_FAILURE(#expression << " did not throw a " << #exception_type << "!"); \
    } while (0)
