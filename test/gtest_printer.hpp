//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_GTEST_PRINTER_HPP_INCLUDED
#define DPXFER_GTEST_PRINTER_HPP_INCLUDED

#include <spdlog/cfg/argv.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <gtest/gtest.h>

#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>

namespace dpxfer
{

class GtestPrinter final : public testing::EmptyTestEventListener
{
public:
    /// Sets up the logging system.
    ///
    /// File sink is used for all loggers (with Trace default level).
    /// Subsystem loggers are registered up front so that `SPDLOG_LEVEL=mount=info` style arguments apply to them.
    ///
    static void setupLogging(const int argc, char** const argv, const std::string& log_prefix)
    {
        try
        {
            // Drop all existing loggers, including the default one, so that we can reconfigure them.
            spdlog::drop_all();

            const std::string log_file_nm = log_prefix + ".log";
            const auto        file_sink   = std::make_shared<spdlog::sinks::basic_file_sink_st>(log_file_nm);

            const auto default_logger = std::make_shared<spdlog::logger>("", file_sink);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");
            register_logger(default_logger);
            set_default_logger(default_logger);

            for (const auto* const name : {"io", "mount", "http", "upload", "cloud", "dp"})
            {
                register_logger(std::make_shared<spdlog::logger>(name, file_sink));
            }

            // Accept `SPDLOG_LEVEL` argument (like `SPDLOG_LEVEL=debug`).
            //
            spdlog::set_level(spdlog::level::trace);
            spdlog::cfg::load_argv_levels(argc, argv);

        } catch (const std::exception& ex)
        {
            std::cerr << "Failed to setup logging: " << ex.what() << '\n';
            std::exit(EXIT_FAILURE);
        }
    }

private:
    void OnTestSuiteStart(const testing::TestSuite& test_suite) override
    {
        spdlog::info("====================> TEST_SUITE {} ({} tests)",
                     test_suite.name(),
                     test_suite.test_to_run_count());
    }

    void OnTestStart(const testing::TestInfo& test_info) override
    {
        spdlog::info("--------------------------> TEST {}.{}", test_info.test_suite_name(), test_info.name());
    }

    // Failed assertions go to the log right where they happen, between the logs of the code under test.
    void OnTestPartResult(const testing::TestPartResult& test_part_result) override
    {
        if (test_part_result.failed())
        {
            spdlog::error("TEST Failure in {}:{}\n{}",
                          test_part_result.file_name(),
                          test_part_result.line_number(),
                          test_part_result.summary());
        }
    }

    void OnTestEnd(const testing::TestInfo& test_info) override
    {
        const auto* const result = test_info.result();
        spdlog::info("<-------------------------- TEST {}.{} {} ({} ms).",
                     test_info.test_suite_name(),
                     test_info.name(),
                     (result != nullptr) && result->Failed() ? "FAILED" : "passed",
                     (result != nullptr) ? result->elapsed_time() : 0);
    }

    void OnTestSuiteEnd(const testing::TestSuite& test_suite) override
    {
        spdlog::info("<==================== TEST_SUITE {} (failed={})",
                     test_suite.name(),
                     test_suite.failed_test_count());
        spdlog::info("");
    }

    void OnTestProgramEnd(const testing::UnitTest& unit_test) override
    {
        spdlog::info("Done (passed={}, failed={}, skipped={}).\n",
                     unit_test.successful_test_count(),
                     unit_test.failed_test_count(),
                     unit_test.skipped_test_count());
        spdlog::default_logger()->flush();
    }

};  // GtestPrinter

}  // namespace dpxfer

#endif  // DPXFER_GTEST_PRINTER_HPP_INCLUDED
