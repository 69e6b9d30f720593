/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file io_test.cpp
 * @brief Tests for the sequential line source.
 *
 * @details
 * Every scenario writes its own file into a scratch directory that is
 * removed again when the test finishes.
 */

#include "logview/io/line_reader.hpp"
#include "framework.hpp"
#include "test_files.hpp"

#include <string>
#include <vector>

using logview::io::IoError;
using logview::io::LineReader;
using logview::test::TestDirManager;

namespace {

std::vector<std::string> read_all(LineReader& reader)
{
    std::vector<std::string> lines;
    std::string line;
    while (reader.next(line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

/**
 * @brief Lines come back in file order without terminators.
 */
void test_reader_splits_lines()
{
    TestDirManager dir("./logview_test_io");
    LineReader reader(dir.write("plain.log", "first\nsecond\n\nfourth\n"));

    auto lines = read_all(reader);
    ASSERT_EQ(lines.size(), static_cast<size_t>(4));
    ASSERT_EQ(lines[0], std::string("first"));
    ASSERT_EQ(lines[1], std::string("second"));
    ASSERT_EQ(lines[2], std::string(""));
    ASSERT_EQ(lines[3], std::string("fourth"));
}

/**
 * @brief A last line without '\n' is still produced; CR is stripped only before LF.
 */
void test_reader_terminators()
{
    TestDirManager dir("./logview_test_io");
    LineReader reader(dir.write("crlf.log", "dos\r\nunix\nlast\r"));

    auto lines = read_all(reader);
    ASSERT_EQ(lines.size(), static_cast<size_t>(3));
    ASSERT_EQ(lines[0], std::string("dos"));
    ASSERT_EQ(lines[1], std::string("unix"));
    ASSERT_EQ(lines[2], std::string("last\r"));
}

/**
 * @brief An empty file yields nothing and the sequence stays exhausted.
 */
void test_reader_empty_file()
{
    TestDirManager dir("./logview_test_io");
    LineReader reader(dir.write("empty.log", ""));

    std::string line = "untouched";
    ASSERT_FALSE(reader.next(line));
    ASSERT_FALSE(reader.next(line));
    ASSERT_EQ(line, std::string("untouched"));
}

/**
 * @brief Invalid UTF-8 lines are skipped without stopping the read.
 */
void test_reader_drops_invalid_utf8()
{
    TestDirManager dir("./logview_test_io");
    LineReader reader(dir.write("mixed.log", "good one\nbad \xFF byte\ngood two\n"));

    auto lines = read_all(reader);
    ASSERT_EQ(lines.size(), static_cast<size_t>(2));
    ASSERT_EQ(lines[0], std::string("good one"));
    ASSERT_EQ(lines[1], std::string("good two"));
    ASSERT_EQ(reader.dropped(), static_cast<size_t>(1));
}

/**
 * @brief Missing files and directories raise `IoError`.
 */
void test_reader_open_failures()
{
    TestDirManager dir("./logview_test_io");

    bool missing_threw = false;
    try {
        LineReader reader(dir.path() + "/does_not_exist.log");
    } catch (const IoError&) {
        missing_threw = true;
    }
    ASSERT_TRUE(missing_threw);

    bool directory_threw = false;
    try {
        LineReader reader(dir.path());
    } catch (const IoError&) {
        directory_threw = true;
    }
    ASSERT_TRUE(directory_threw);
}
