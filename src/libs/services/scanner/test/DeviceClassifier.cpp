/*
 * Copyright (C) 2024 Emeric Poupon
 *
 * This file is part of Gamus.
 *
 * Gamus is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Gamus is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Gamus.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <gtest/gtest.h>

#include "Common.hpp"
#include "DeviceClassifier.hpp"

namespace gamus::scanner::tests
{
    TEST(DeviceClassifier, computeWorkerCount)
    {
        EXPECT_EQ(DeviceClassifier::computeWorkerCount(std::nullopt, 50, 8), 1);
        EXPECT_EQ(DeviceClassifier::computeWorkerCount(0, 50, 8), 1);
        EXPECT_EQ(DeviceClassifier::computeWorkerCount(20, 50, 8), 1);
        EXPECT_EQ(DeviceClassifier::computeWorkerCount(100, 50, 8), 2);
        EXPECT_EQ(DeviceClassifier::computeWorkerCount(130, 50, 8), 3);
        EXPECT_EQ(DeviceClassifier::computeWorkerCount(3'000, 50, 8), 8);
        EXPECT_EQ(DeviceClassifier::computeWorkerCount(3'000, 50, 0), 1);
        EXPECT_EQ(DeviceClassifier::computeWorkerCount(3'000, 0, 8), 1);
    }

    TEST(DeviceClassifier, getDeviceId)
    {
        TmpDirectory dir;

        std::error_code ec;
        const std::optional<std::string> deviceId{ getDeviceId(dir.getPath(), ec) };
        EXPECT_FALSE(ec);
        ASSERT_TRUE(deviceId);
        EXPECT_NE(deviceId->find(':'), std::string::npos);

        EXPECT_FALSE(getDeviceId(dir.getPath() / "missing", ec));
        EXPECT_TRUE(ec);
    }

    TEST(DeviceClassifier, measureReadThroughput)
    {
        TmpDirectory dir;
        const std::filesystem::path file{ dir.createFile("sample.mp3", std::string(256 * 1024, 'x')) };

        const std::optional<double> throughput{ measureReadThroughput(file, 1024 * 1024) };
        ASSERT_TRUE(throughput);
        EXPECT_GT(*throughput, 0);

        EXPECT_FALSE(measureReadThroughput(dir.getPath() / "missing.mp3", 1024));
        EXPECT_FALSE(measureReadThroughput(dir.createFile("empty.mp3", ""), 1024));
    }

    TEST(DeviceClassifier, sameDeviceRoots)
    {
        TmpDirectory dir;
        const std::filesystem::path root1{ dir.createDirectory("root1") };
        const std::filesystem::path root2{ dir.createDirectory("root2") };

        const std::vector<RootCandidates> roots{
            RootCandidates{ root1, { dir.createFile("root1/a.mp3"), dir.createFile("root1/b.mp3") } },
            RootCandidates{ root2, { dir.createFile("root2/c.mp3") } },
        };

        DeviceClassifier classifier{ DeviceClassifier::Settings{ .maxWorkerCount = 4 } };
        const std::vector<DeviceGroup> groups{ classifier.classify(roots) };
        ASSERT_EQ(groups.size(), 1);
        EXPECT_EQ(groups[0].roots, (std::vector<std::filesystem::path>{ root1, root2 }));
        EXPECT_EQ(groups[0].files.size(), 3);
        EXPECT_GE(groups[0].workerCount, 1);
        EXPECT_LE(groups[0].workerCount, 4);
    }

    TEST(DeviceClassifier, unresolvableRoot)
    {
        TmpDirectory dir;
        const std::filesystem::path missingRoot{ dir.getPath() / "missing" };

        const std::vector<RootCandidates> roots{
            RootCandidates{ dir.getPath(), { dir.createFile("a.mp3") } },
            RootCandidates{ missingRoot, {} },
        };

        DeviceClassifier classifier{ DeviceClassifier::Settings{ .maxWorkerCount = 4 } };
        const std::vector<DeviceGroup> groups{ classifier.classify(roots) };
        ASSERT_EQ(groups.size(), 2);
        EXPECT_EQ(groups[1].deviceId, "unknown:" + missingRoot.string());
        EXPECT_EQ(groups[1].roots, std::vector<std::filesystem::path>{ missingRoot });
        EXPECT_EQ(groups[1].workerCount, 1);
        EXPECT_FALSE(groups[1].bandwidthMBps);
    }
} // namespace gamus::scanner::tests
