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

#include <relay/account_id.h>

#include <nlohmann/json.hpp>
#include <ostream>

namespace relay {

std::ostream& operator<<(std::ostream& os, const AccountId& id) {
    return os << id.to_string();
}

std::string to_string(const AccountId& id) {
    return id.to_string();
}

void to_json(nlohmann::json& json, const AccountId& id) {
    json = id.get();
}

void from_json(const nlohmann::json& json, AccountId& id) {
    id = AccountId(json.get<AccountId::id_type>());
}

} // namespace relay
