/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "AnomalyLogger.hpp"
#include "test-common/quotes.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace firmquote;
using namespace firmquote::validator;
using namespace firmquote::test;

using namespace testing;

//-------------------------------------------------------------------------

class AnomalyLoggerTest : public Test
{
protected:
    void SetUp() override
    {
        const auto* info = UnitTest::GetInstance()->current_test_info();
        m_logPath = fs::temp_directory_path()
            / fmt::format("firmquote-{}-{}.csv", info->name(), ::getpid());
        std::error_code ec;
        fs::remove(m_logPath, ec);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove(m_logPath, ec);
    }

    std::vector<std::string> readLines() const
    {
        std::ifstream ifs{m_logPath};
        std::vector<std::string> lines;
        for (std::string line; std::getline(ifs, line);) {
            lines.push_back(line);
        }
        return lines;
    }

    fs::path m_logPath;
    ValidatorSignals m_signals;
};

//-------------------------------------------------------------------------

TEST_F(AnomalyLoggerTest, WritesHeaderAndEvents)
{
    {
        AnomalyLogger logger{m_logPath, m_signals};
        EXPECT_EQ(logger.filepath().string(), m_logPath.string());

        m_signals.anomaly(AnomalyEvent{
            .timestamp = 42,
            .kind = AnomalyKind::SAMPLER_STUCK,
            .tokenAddress = kTokenX,
            .makerAddress = kMakerA,
            .message = "sampler stuck, \"again\""
        });
        m_signals.backfill(BackfillEvent{
            .timestamp = 43,
            .tokenAddress = kTokenX,
            .makerAddresses = {kMakerA, kMakerB},
            .inserted = 1
        });
    }

    EXPECT_THAT(
        readLines(),
        ElementsAre(
            AnomalyLogger::s_header,
            fmt::format("42,SAMPLER_STUCK,{},{},\"sampler stuck, \"\"again\"\"\"", kTokenX, kMakerA),
            fmt::format(
                "43,BACKFILL,{},{};{},registered 1 of 2 maker addresses",
                kTokenX, kMakerA, kMakerB)));
}

//-------------------------------------------------------------------------

TEST_F(AnomalyLoggerTest, StopsLoggingWhenDestroyed)
{
    {
        AnomalyLogger logger{m_logPath, m_signals};
    }
    m_signals.anomaly(AnomalyEvent{.timestamp = 1, .kind = AnomalyKind::CACHE_ANOMALY});

    EXPECT_THAT(readLines(), ElementsAre(AnomalyLogger::s_header));
}

//-------------------------------------------------------------------------

TEST_F(AnomalyLoggerTest, AppendsWithoutRepeatingHeader)
{
    {
        AnomalyLogger logger{m_logPath, m_signals};
        m_signals.anomaly(AnomalyEvent{
            .timestamp = 1, .kind = AnomalyKind::BATCH_HETEROGENEITY, .message = "first"});
    }
    {
        AnomalyLogger logger{m_logPath, m_signals};
        m_signals.anomaly(AnomalyEvent{
            .timestamp = 2, .kind = AnomalyKind::BACKFILL_FAILURE, .message = "second"});
    }

    EXPECT_THAT(
        readLines(),
        ElementsAre(
            AnomalyLogger::s_header,
            "1,BATCH_HETEROGENEITY,,,first",
            "2,BACKFILL_FAILURE,,,second"));
}

//-------------------------------------------------------------------------
