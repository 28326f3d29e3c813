/* This file is part of ValueCore.
 * Copyright (C) 2008-2022 Volt Active Data Inc.
 *
 * This file contains original code and/or modifications of original code.
 * Any modifications made by Volt Active Data Inc. are licensed under the following
 * terms and conditions:
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
 * IN NO EVENT SHALL THE AUTHORS BE LIABLE FOR ANY CLAIM, DAMAGES OR
 * OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE,
 * ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
 * OTHER DEALINGS IN THE SOFTWARE.
 */
/* Copyright (C) 2008 by H-Store Project
 * Brown University
 * Massachusetts Institute of Technology
 * Yale University
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT
 * IN NO EVENT SHALL THE AUTHORS BE LIABLE FOR ANY CLAIM, DAMAGES OR
 * OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE,
 * ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
 * OTHER DEALINGS IN THE SOFTWARE.
 */

// A stupid and simple unit test framework for C++ code.
// Evan Jones <ej@evanjones.ca>

#include <cstdlib> // for getenv
#include <cstring> // for strcmp
#include <cstdio>
#include <cassert>
#include <sstream>
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>

#include "json/json.h"

#include "harness.h"

using std::string;

// A custom assert macro that avoids "unused variable" warnings when compiled
// away.
#ifdef NDEBUG
#undef assert
#define assert(x) ((void)(x))
#endif


// Contains and runs a collection of tests.
void TestSuite::registerTest(Test* (*test_factory)()) {
    assert(test_factory != NULL);
    test_factories_.push_back(test_factory);
}

// One JSON record per test: {"class_name": ..., "name": ..., "failure": ...}
static string testRecord(const Test& test) {
    Json::Value record(Json::objectValue);
    record["class_name"] = test.suiteName();
    record["name"] = test.testName();
    if (!test.testSuccess()) {
        string failure;
        for (size_t j = 0; j < test.stupidunitNumErrors(); ++j) {
            failure += test.stupidunitError((int)j);
            failure += "\n";
        }
        record["failure"] = failure;
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, record);
}

int TestSuite::runAll() {
    // Change to the root directory to avoid tests that depend on files, etc.
    int status = chdir("/");
    assert(status == 0);

    // Look to see if we should produce machine readable output
    const char* machine_readable = getenv(stupidunit::OUT_FILE_ENVIRONMENT_VARIABLE);
    int json_output = -1;
    if (machine_readable != NULL && machine_readable[0] != '\0') {
        json_output = open(machine_readable, O_WRONLY | O_CREAT | O_EXCL, 0666);
        if (json_output == -1 && errno == EEXIST) {
            fprintf(stderr,
                    "ERROR: %s file (%s) already exists: remove this file to run the tests",
                    stupidunit::OUT_FILE_ENVIRONMENT_VARIABLE, machine_readable);
            abort();
        }
        assert(json_output >= 0);

        size_t bytes = write(json_output, "[", 1);
        assert(bytes == 1);
    }

    int failed_tests = 0;
    const char* last_suite = NULL;
    for (size_t i = 0; i < test_factories_.size(); ++i) {
        // Create the test
        Test* test = test_factories_[i]();
        assert(test != NULL);

        // Print the suite name if it is new
        if (last_suite == NULL || strcmp(test->suiteName(), last_suite) != 0) {
            if (last_suite != NULL) printf("\n");
            last_suite = test->suiteName();
            printf("%s:\n", last_suite);
        }

        // Print the test name
        printf("\t%s: ", test->testName());
        fflush(stdout);

        // run the test and check the result; an escaping exception fails it
        try {
            test->run();
        } catch (const std::exception& e) {
            string message = "uncaught exception: ";
            message += e.what();
            test->fail(__FILE__, __LINE__, message.c_str());
        }
        if (test->testSuccess()) {
            printf("PASSED.\n");
        } else {
            printf("FAILED.\n");
            test->printErrors();
            printf("\n");
            failed_tests++;
        }

        if (json_output != -1) {
            string json = testRecord(*test);
            if (i != test_factories_.size() - 1) {
                json += ",\n";
            } else {
                json += "]\n";
            }

            size_t bytes = write(json_output, json.data(), json.size());
            assert(bytes == json.size());
        }

        // Clean up the test
        delete test;
    }

    if (json_output != -1) {
        int error = close(json_output);
        assert(error == 0);
    }

    if (failed_tests == 0) {
        printf("PASSED\n");
    } else {
        printf("%d FAILED\n", failed_tests);
    }
    return failed_tests;
}

TestSuite* TestSuite::globalInstance() {
    // Avoids static initialization order problems, although it could have destructor order
    // problems if the TestSuite destructor did anything.
    static TestSuite global_suite;
    return &global_suite;
}

void Test::fail(const char* file, int line, const char* message) {
    std::ostringstream output;
    output << file << ":" << line << ": Test failed: " << message;
    errors_.push_back(output.str());
}

void Test::printErrors() const {
    for (size_t i = 0; i < errors_.size(); ++i) {
        printf("%s\n", errors_[i].c_str());
    }
}

const string& Test::stupidunitError(int i) const {
    assert(0 <= i && i < static_cast<int>(errors_.size()));
    return errors_[i];
}

namespace stupidunit {

ChTempDir::ChTempDir() : name_(P_tmpdir) {
    name_ += "/test_XXXXXX";
    // Abuse the type system to modify the string in place
    char* result = mkdtemp(const_cast<char*>(name_.c_str()));
    assert(result != NULL);
    assert(result == name_.c_str());

    int status = chdir(name_.c_str());
    assert(status == 0);
}

std::string ChTempDir::tempFile(const std::string &prefix) const {
    std::string file_template = this->name_ + "/" + prefix + "XXXXXX";
    int fd = mkstemp(const_cast<char*>(file_template.c_str()));
    assert(fd != -1);
    close(fd);
    return (file_template);
}

// Recursively deletes the file named path. If path is a file, it will be
// removed. If it is a directory, everything in it will also be deleted.
// Returns 0 on success, -1 on error, and sets errno appropriately.
static int rmtree(const char* path) {
    DIR* dir = opendir(path);
    if (dir == NULL) {
        if (errno == ENOTDIR) {
            // Not a directory: unlink it instead
            return unlink(path);
        }

        return -1;
    }

    for (struct dirent* entry = readdir(dir); entry != NULL; entry = readdir(dir)) {
        // Skip special directories
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
            continue;
        }

        // Recursively delete the directory entry. This handles regular files
        // and directories.
        string fullpath(path);
        fullpath += "/";
        fullpath += entry->d_name;
        rmtree(fullpath.c_str());
    }

    int error = closedir(dir);
    assert(error == 0);

    return rmdir(path);
}

ChTempDir::~ChTempDir() {
    int status = chdir("/");
    assert(status == 0);

    // Recursively delete everything in the temporary directory.
    status = rmtree(name_.c_str());
    assert(status == 0);
}

const char OUT_FILE_ENVIRONMENT_VARIABLE[] = "STUPIDUNIT_OUTPUT";

}  // namespace stupidunit
