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

#include "dedup_queue.h"

#include <algorithm>
#include <ostream>

namespace relay::compaction {

std::ostream& operator<<(std::ostream& os, const WorkItem& item) {
    return os << "{" << item.account << " fast:" << std::boolalpha
              << item.fast << "}";
}

bool DedupQueue::append(AccountId account, bool fast) {
    return state.withLock([account, fast](auto& st) {
        if (!st.members.insert(account).second) {
            return false;
        }
        st.items.push_back({account, fast});
        return true;
    });
}

bool DedupQueue::prepend(AccountId account, bool fast) {
    return state.withLock([account, fast](auto& st) {
        if (!st.members.insert(account).second) {
            return false;
        }
        st.items.push_front({account, fast});
        return true;
    });
}

bool DedupQueue::contains(AccountId account) const {
    return state.lock()->members.count(account) != 0;
}

void DedupQueue::remove(AccountId account) {
    state.withLock([account](auto& st) {
        if (st.members.erase(account) == 0) {
            return;
        }
        auto iter = std::find_if(
                st.items.begin(), st.items.end(), [account](const auto& item) {
                    return item.account == account;
                });
        if (iter != st.items.end()) {
            st.items.erase(iter);
        }
    });
}

std::optional<WorkItem> DedupQueue::pop() {
    return state.withLock([](auto& st) -> std::optional<WorkItem> {
        if (st.items.empty()) {
            return {};
        }
        auto item = st.items.front();
        st.items.pop_front();
        st.members.erase(item.account);
        return item;
    });
}

size_t DedupQueue::size() const {
    return state.lock()->items.size();
}

} // namespace relay::compaction
