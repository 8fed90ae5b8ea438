#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "adapters/object_store.hpp"
#include "core/state/backup_state.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/retry.hpp"

namespace coldsend::extensions {

/// What the object store holds for one pair, compared with the state file
struct PairAudit {
    core::SnapshotPair pair;
    bool in_flight = false;
    std::uint64_t expected_chunks = 0;
    std::uint64_t expected_bytes = 0;
    std::uint64_t stored_bytes = 0;               // sum over expected indices present
    std::vector<std::uint64_t> missing;           // expected, absent
    std::vector<std::uint64_t> unexpected;        // present, not recorded
    std::optional<std::uint64_t> uncommitted;     // in-flight k+1: acknowledged, not committed
    std::vector<std::string> foreign_keys;        // under the prefix but not a chunk key

    [[nodiscard]] auto ok() const -> bool {
        return missing.empty() && unexpected.empty() && foreign_keys.empty() &&
               stored_bytes == expected_bytes;
    }
};

struct AuditReport {
    std::vector<PairAudit> pairs;

    [[nodiscard]] auto ok() const -> bool;
};

/// Compares one pair's listing with `expected_chunks` recorded chunks.
[[nodiscard]] auto audit_pair(std::string_view object_prefix,
                              const core::SnapshotPair& pair,
                              std::uint64_t expected_chunks,
                              std::uint64_t expected_bytes,
                              bool in_flight,
                              const std::vector<adapters::ObjectInfo>& listing) -> PairAudit;

/// Lists every completed pair and the in-flight pair, in chain order.
[[nodiscard]] auto verify_chain(const core::BackupChainState& state,
                                adapters::ObjectStore& store,
                                const infra::RetryPolicy& retry = {}) -> infra::Result<AuditReport>;

} // namespace coldsend::extensions
