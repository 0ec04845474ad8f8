// PRICEFEED - Source Authorization
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/oracle/authorization.h"

#include <algorithm>

namespace pricefeed {
namespace oracle {

bool AuthorizationRegistry::IsAuthorized(const Principal& source) const {
    auto it = records_.find(source);
    return it != records_.end() && it->second.authorized;
}

std::optional<SourceRecord> AuthorizationRegistry::Find(const Principal& source) const {
    auto it = records_.find(source);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result<std::optional<SourceRecord>> AuthorizationRegistry::PrepareAuthorize(
    const Principal& caller, const Principal& source) const {
    if (!owner_.IsOwner(caller)) {
        return Fail(OracleError::NotAuthorized, "authorize: caller is not the owner");
    }
    if (IsAuthorized(source)) {
        return std::optional<SourceRecord>();
    }
    SourceRecord record;
    record.authorized = true;
    record.sequence = nextSequence_;
    return std::optional<SourceRecord>(record);
}

Result<std::optional<SourceRecord>> AuthorizationRegistry::PrepareDeauthorize(
    const Principal& caller, const Principal& source) const {
    if (!owner_.IsOwner(caller)) {
        return Fail(OracleError::NotAuthorized, "deauthorize: caller is not the owner");
    }
    auto it = records_.find(source);
    if (it == records_.end() || !it->second.authorized) {
        return std::optional<SourceRecord>();
    }
    SourceRecord record = it->second;
    record.authorized = false;
    return std::optional<SourceRecord>(record);
}

void AuthorizationRegistry::Apply(const Principal& source, const SourceRecord& record) {
    records_[source] = record;
    if (record.sequence >= nextSequence_) {
        nextSequence_ = record.sequence + 1;
    }
}

std::vector<Principal> AuthorizationRegistry::AuthorizedSources() const {
    std::vector<std::pair<uint64_t, Principal>> ordered;
    for (const auto& [source, record] : records_) {
        if (record.authorized) {
            ordered.emplace_back(record.sequence, source);
        }
    }
    std::sort(ordered.begin(), ordered.end());

    std::vector<Principal> result;
    result.reserve(ordered.size());
    for (const auto& entry : ordered) {
        result.push_back(entry.second);
    }
    return result;
}

void AuthorizationRegistry::Clear() {
    records_.clear();
    nextSequence_ = 1;
}

} // namespace oracle
} // namespace pricefeed
