/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "cashdesk/desk/CashDeskConfig.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace cashdesk;
using namespace cashdesk::desk;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

CashDeskConfig parse(const char* xml)
{
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_string(xml);
    EXPECT_TRUE(result) << result.description();
    return makeCashDeskConfig(doc.child("CashDesk"));
}

}  // namespace

//-------------------------------------------------------------------------

TEST(CashDeskConfig, DefaultsWhenAttributesAbsent)
{
    const auto config = parse("<CashDesk/>");

    EXPECT_EQ(config.amountDecimals, 2u);
    EXPECT_EQ(config.tenant, "default");
    EXPECT_TRUE(config.reportDestination.empty());
    EXPECT_TRUE(config.journalPath.empty());
    EXPECT_EQ(config.fallbackShift, store::FallbackPolicy::LOWEST_ID);
    EXPECT_EQ(config.logLevel, spdlog::level::info);
}

//-------------------------------------------------------------------------

TEST(CashDeskConfig, ReadsEveryAttribute)
{
    const auto config = parse(R"(
        <CashDesk amountDecimals="3" tenant="pizzeria-7" reportDestination="/tmp/z"
                  fallbackShift="most-recent" logLevel="debug">
            <Journal path="/tmp/journal.csv"/>
        </CashDesk>)");

    EXPECT_EQ(config.amountDecimals, 3u);
    EXPECT_EQ(config.tenant, "pizzeria-7");
    EXPECT_EQ(config.reportDestination, fs::path{"/tmp/z"});
    EXPECT_EQ(config.fallbackShift, store::FallbackPolicy::MOST_RECENT);
    EXPECT_EQ(config.logLevel, spdlog::level::debug);
    EXPECT_EQ(config.journalPath, fs::path{"/tmp/journal.csv"});
}

//-------------------------------------------------------------------------

struct InvalidConfigTest : TestWithParam<const char*> {};

TEST_P(InvalidConfigTest, Throws)
{
    EXPECT_THROW(parse(GetParam()), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    CashDeskConfig,
    InvalidConfigTest,
    Values(
        R"(<CashDesk amountDecimals="9"/>)",
        R"(<CashDesk tenant=""/>)",
        R"(<CashDesk fallbackShift="random"/>)",
        R"(<CashDesk logLevel="loud"/>)",
        R"(<CashDesk><Journal/></CashDesk>)",
        R"(<Other/>)"));

//-------------------------------------------------------------------------

TEST(CashDeskConfig, MissingFileThrows)
{
    EXPECT_THROW(loadCashDeskConfig("/nonexistent/cashdesk.xml"), std::invalid_argument);
}

//-------------------------------------------------------------------------
