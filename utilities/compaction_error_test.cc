/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *     Copyright 2025-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */

#include <folly/portability/GTest.h>
#include <relay/compaction_error.h>

#include <sstream>

using relay::compaction_errc;
using relay::compaction_error;

TEST(CompactionErrorTest, Category) {
    EXPECT_STREQ("compaction error codes",
                 relay::compaction_error_category().name());
}

TEST(CompactionErrorTest, Messages) {
    EXPECT_EQ("success", relay::to_string(compaction_errc::success));
    EXPECT_EQ("no repos to compact",
              relay::to_string(compaction_errc::no_work_available));
    EXPECT_EQ("account not found",
              relay::to_string(compaction_errc::account_not_found));
    EXPECT_EQ("temporary failure",
              relay::to_string(compaction_errc::temporary_failure));
    EXPECT_EQ("account lookup failed",
              relay::to_string(compaction_errc::account_lookup_failed));
    EXPECT_EQ("compaction failed",
              relay::to_string(compaction_errc::compaction_failed));
    EXPECT_EQ("failed to list compaction candidates",
              relay::to_string(compaction_errc::candidate_listing_failed));
}

TEST(CompactionErrorTest, InvalidCode) {
    EXPECT_THROW(relay::to_string(compaction_errc(1000)),
                 std::invalid_argument);
}

TEST(CompactionErrorTest, Exception) {
    try {
        throw compaction_error(compaction_errc::compaction_failed, "uid:5");
    } catch (const std::system_error& e) {
        EXPECT_EQ(&relay::compaction_error_category(), &e.code().category());
        EXPECT_EQ(int(compaction_errc::compaction_failed), e.code().value());
        EXPECT_TRUE(e.code() == compaction_errc::compaction_failed);
        EXPECT_FALSE(e.code() == compaction_errc::account_lookup_failed);
        const std::string what = e.what();
        EXPECT_NE(std::string::npos, what.find("uid:5")) << what;
        EXPECT_NE(std::string::npos, what.find("compaction failed")) << what;
    }

    const compaction_error error(compaction_errc::no_work_available,
                                 std::string{"empty"});
    EXPECT_EQ(compaction_errc::no_work_available, error.compaction_code());
}

TEST(CompactionErrorTest, Ostream) {
    std::stringstream ss;
    ss << compaction_errc::account_not_found;
    EXPECT_EQ("account not found", ss.str());
}
