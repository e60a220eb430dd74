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
#include <relay/compaction_error.h>

#include <iostream>
#include <stdexcept>
#include <string>

/**
 * compaction_error_category provides the mapping from the compaction error
 * codes to a textual mapping and is used together with the std::system_error.
 */
class compaction_category : public std::error_category {
public:
    const char* name() const noexcept override {
        return "compaction error codes";
    }

    std::string message(int code) const override {
        return to_string(relay::compaction_errc(code));
    }

    std::error_condition default_error_condition(
            int code) const noexcept override {
        return std::error_condition(code, *this);
    }
};

const std::error_category& relay::compaction_error_category() noexcept {
    static compaction_category category_instance;
    return category_instance;
}

std::string relay::to_string(relay::compaction_errc code) {
    switch (code) {
    case compaction_errc::success:
        return "success";
    case compaction_errc::no_work_available:
        return "no repos to compact";
    case compaction_errc::account_not_found:
        return "account not found";
    case compaction_errc::temporary_failure:
        return "temporary failure";
    case compaction_errc::account_lookup_failed:
        return "account lookup failed";
    case compaction_errc::compaction_failed:
        return "compaction failed";
    case compaction_errc::candidate_listing_failed:
        return "failed to list compaction candidates";
    };
    throw std::invalid_argument(
            "compaction_error_category::message: code does not represent a "
            "legal error code: " +
            std::to_string(int(code)));
}

void relay::PrintTo(relay::compaction_errc ev, ::std::ostream* os) {
    *os << relay::to_string(ev);
}

namespace relay {
std::ostream& operator<<(std::ostream& os, relay::compaction_errc ec) {
    os << to_string(ec);
    return os;
}
} // namespace relay
