// PRICEFEED - Source Authorization
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Owner capability and the registry of reporters allowed to submit quotes.

#ifndef PRICEFEED_ORACLE_AUTHORIZATION_H
#define PRICEFEED_ORACLE_AUTHORIZATION_H

#include "pricefeed/core/types.h"
#include "pricefeed/oracle/errors.h"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace pricefeed {
namespace oracle {

// ============================================================================
// Owner Capability
// ============================================================================

/// Decides whether a caller may perform owner-only operations
class OwnerCapability {
public:
    virtual ~OwnerCapability() = default;
    virtual bool IsOwner(const Principal& caller) const = 0;
};

/// A single fixed owner
class SingleOwner : public OwnerCapability {
public:
    explicit SingleOwner(const Principal& owner) : owner_(owner) {}

    bool IsOwner(const Principal& caller) const override { return caller == owner_; }

    const Principal& GetOwner() const { return owner_; }

private:
    Principal owner_;
};

// ============================================================================
// Authorization Registry
// ============================================================================

/// Persisted authorization state of one source
struct SourceRecord {
    bool authorized{false};

    /// Position in authorization order; assigned when a source becomes authorized
    uint64_t sequence{0};

    bool operator==(const SourceRecord& other) const {
        return authorized == other.authorized && sequence == other.sequence;
    }
};

/**
 * Source identity -> authorized flag. No entry means not authorized.
 *
 * Mutations are split into Prepare (validate, compute the new record) and
 * Apply (commit it) so the caller can persist the record in between.
 */
class AuthorizationRegistry {
public:
    explicit AuthorizationRegistry(const OwnerCapability& owner) : owner_(owner) {}

    bool IsAuthorized(const Principal& source) const;

    std::optional<SourceRecord> Find(const Principal& source) const;

    /**
     * Record that authorizing source would produce.
     * @return nullopt when the source is already authorized,
     *         NotAuthorized failure when caller is not the owner
     */
    Result<std::optional<SourceRecord>> PrepareAuthorize(const Principal& caller,
                                                         const Principal& source) const;

    /// As PrepareAuthorize; nullopt when the source is not authorized
    Result<std::optional<SourceRecord>> PrepareDeauthorize(const Principal& caller,
                                                           const Principal& source) const;

    void Apply(const Principal& source, const SourceRecord& record);

    /// Authorized sources in authorization order
    std::vector<Principal> AuthorizedSources() const;

    const std::map<Principal, SourceRecord>& Records() const { return records_; }

    void Clear();

private:
    const OwnerCapability& owner_;
    std::map<Principal, SourceRecord> records_;
    uint64_t nextSequence_{1};
};

} // namespace oracle
} // namespace pricefeed

#endif // PRICEFEED_ORACLE_AUTHORIZATION_H
