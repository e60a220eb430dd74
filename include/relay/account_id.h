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

#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace relay {

/**
 * AccountId - a custom type class to control the use of account (repository
 * owner) ids and their output formatting, wrapping it with "uid:"
 */
class AccountId {
public:
    using id_type = uint64_t;

    AccountId() = default;

    explicit AccountId(id_type id) : uid(id){};

    // Retrieve the account ID in the form of uint64_t
    id_type get() const {
        return uid;
    }

    // Retrieve the account ID in a printable/loggable form
    std::string to_string() const {
        return "uid:" + std::to_string(uid);
    }

    bool operator<(const AccountId& other) const {
        return uid < other.get();
    }

    bool operator==(const AccountId& other) const {
        return uid == other.get();
    }

    bool operator!=(const AccountId& other) const {
        return uid != other.get();
    }

protected:
    id_type uid = 0;
};

std::ostream& operator<<(std::ostream& os, const AccountId& id);
std::string to_string(const AccountId& id);

/// The JSON representation is the raw numeric id
void to_json(nlohmann::json& json, const AccountId& id);
void from_json(const nlohmann::json& json, AccountId& id);

/**
 * An account as returned from the directory: the numeric id and the
 * human readable identifier (the DID) of the account.
 */
struct Account {
    AccountId id;
    std::string did;
};

} // namespace relay

namespace std {
template <>
struct hash<relay::AccountId> {
public:
    size_t operator()(const relay::AccountId& d) const {
        return std::hash<relay::AccountId::id_type>{}(d.get());
    }
};
} // namespace std
