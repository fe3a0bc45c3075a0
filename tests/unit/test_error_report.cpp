#include <gtest/gtest.h>

#include <rayshell/error.hpp>
#include <stdexcept>

using namespace rayshell;

static ErrorReport sample_report()
{
    ErrorReport report("permission denied");
    report.wrap("could not open config file");
    report.wrap("could not start app");
    report.note("path: /etc/rayshell.json");
    report.suggestion("check the file permissions");
    return report;
}

TEST(ErrorReport, WrapPushesOuterContext)
{
    auto report = sample_report();
    ASSERT_EQ(report.chain().size(), 3u);
    EXPECT_EQ(report.message(), "could not start app");
    EXPECT_EQ(report.chain().back(), "permission denied");
}

TEST(ErrorReport, EmptyReportHasPlaceholderMessage)
{
    ErrorReport report;
    EXPECT_TRUE(report.empty());
    EXPECT_EQ(report.message(), "(empty error report)");
}

TEST(ErrorReport, ShortStyleIsOutermostOnly)
{
    EXPECT_EQ(format_report(sample_report(), ErrorLogStyle::Short), "could not start app");
}

TEST(ErrorReport, ShortWithCauseJoinsChain)
{
    EXPECT_EQ(format_report(sample_report(), ErrorLogStyle::ShortWithCause),
              "could not start app: could not open config file: permission denied");
}

TEST(ErrorReport, DebugStyleListsCausesNotesAndSuggestions)
{
    auto text = format_report(sample_report(), ErrorLogStyle::Debug);
    EXPECT_EQ(text.find("could not start app"), 0u);
    EXPECT_NE(text.find("Caused by:\n   0: could not open config file\n   1: permission denied"),
              std::string::npos);
    EXPECT_NE(text.find("Note: path: /etc/rayshell.json"), std::string::npos);
    EXPECT_NE(text.find("Suggestion: check the file permissions"), std::string::npos);
}

TEST(ErrorReport, DebugStyleWithoutCausesHasNoCauseSection)
{
    auto text = format_report(ErrorReport("plain"), ErrorLogStyle::Debug);
    EXPECT_EQ(text, "plain");
}

TEST(ErrorReport, StyleNamesRoundTrip)
{
    for (auto style : {ErrorLogStyle::Short, ErrorLogStyle::ShortWithCause, ErrorLogStyle::Debug})
    {
        ErrorLogStyle parsed = ErrorLogStyle::Short;
        ASSERT_TRUE(error_log_style_from_string(to_string(style), parsed));
        EXPECT_EQ(parsed, style);
    }
    ErrorLogStyle untouched = ErrorLogStyle::Debug;
    EXPECT_FALSE(error_log_style_from_string("Verbose", untouched));
    EXPECT_EQ(untouched, ErrorLogStyle::Debug);
}

TEST(Error, WhatIsShortWithCause)
{
    Error e(sample_report());
    EXPECT_STREQ(e.what(), "could not start app: could not open config file: permission denied");
    EXPECT_EQ(e.report().notes().size(), 1u);
}

TEST(Error, SharedReportIsNotCopied)
{
    auto  shared = share(sample_report());
    Error e(shared);
    EXPECT_EQ(e.shared_report().get(), shared.get());
}

TEST(Error, ReportFromExceptionKeepsErrorChain)
{
    Error e(sample_report());
    auto  report = report_from_exception(e);
    EXPECT_EQ(report.chain().size(), 3u);
    EXPECT_EQ(report.suggestions().size(), 1u);
}

TEST(Error, ReportFromStandardException)
{
    std::runtime_error e("disk on fire");
    auto               report = report_from_exception(e);
    ASSERT_EQ(report.chain().size(), 1u);
    EXPECT_EQ(report.message(), "disk on fire");
}
