/*
 *     Copyright 2025-Present Couchbase, Inc.
 *
 *   Use of this software is governed by the Business Source License included
 *   in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
 *   in that file, in accordance with the Business Source License, use of this
 *   software will be governed by the Apache License, Version 2.0, included in
 *   the file licenses/APL2.txt.
 */
#pragma once

#include <iosfwd>
#include <string>
#include <system_error>

namespace relay {

/**
 * The compaction_errc enum contains the error codes reported by the
 * compaction scheduler and its collaborators. They are used together with
 * relay::compaction_error_category() in std::system_error exceptions (where
 * you can fetch the code, and the textual description for the given error).
 */
enum class compaction_errc {
    /// The operation completed successfully
    success,
    /// The compaction queue is empty
    no_work_available,
    /// The account does not exist in the directory
    account_not_found,
    /// Temporary failure in a collaborator, please try again later
    temporary_failure,
    /// The account could not be resolved before compacting it
    account_lookup_failed,
    /// The shard store failed to compact the shards of an account
    compaction_failed,
    /// The shard store failed to list the compaction candidates
    candidate_listing_failed
};

/**
 * Get the error category object used to map from numeric values to
 * a textual representation of the error code.
 *
 * @return The one and only instance of the error object
 */
const std::error_category& compaction_error_category() noexcept;

class compaction_error : public std::system_error {
public:
    compaction_error(compaction_errc ev, const std::string& what_arg)
        : system_error(static_cast<int>(ev),
                       compaction_error_category(),
                       what_arg) {
    }

    compaction_error(compaction_errc ev, const char* what_arg)
        : system_error(static_cast<int>(ev),
                       compaction_error_category(),
                       what_arg) {
    }

    compaction_errc compaction_code() const {
        return static_cast<compaction_errc>(code().value());
    }
};

static inline std::error_condition make_error_condition(compaction_errc e) {
    return {static_cast<int>(e), compaction_error_category()};
}

std::string to_string(compaction_errc ev);

// GoogleTest printing function.
void PrintTo(compaction_errc ev, ::std::ostream* os);

std::ostream& operator<<(std::ostream& os, compaction_errc ec);

} // namespace relay

namespace std {

template <>
struct is_error_condition_enum<relay::compaction_errc> : public true_type {};

} // namespace std
