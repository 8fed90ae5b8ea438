#include "verifier.hpp"
#include <algorithm>
#include <set>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace coldsend::extensions {

auto AuditReport::ok() const -> bool {
    return std::all_of(pairs.begin(), pairs.end(), [](const PairAudit& p) { return p.ok(); });
}

auto audit_pair(std::string_view object_prefix,
                const core::SnapshotPair& pair,
                std::uint64_t expected_chunks,
                std::uint64_t expected_bytes,
                bool in_flight,
                const std::vector<adapters::ObjectInfo>& listing) -> PairAudit
{
    PairAudit audit{
        .pair = pair,
        .in_flight = in_flight,
        .expected_chunks = expected_chunks,
        .expected_bytes = expected_bytes,
    };

    const auto prefix = core::pair_key_prefix(object_prefix, pair);
    std::set<std::uint64_t> present;
    for (const auto& object : listing) {
        auto index = core::parse_chunk_index(prefix, object.key);
        if (!index) {
            audit.foreign_keys.push_back(object.key);
            continue;
        }
        present.insert(*index);
        if (*index < expected_chunks) {
            audit.stored_bytes += object.size;
        }
    }

    for (std::uint64_t i = 0; i < expected_chunks; ++i) {
        if (!present.contains(i)) {
            audit.missing.push_back(i);
        }
    }
    for (auto index : present) {
        if (index < expected_chunks) {
            continue;
        }
        // Crash between the store's ack and the state commit
        if (in_flight && index == expected_chunks && !audit.uncommitted) {
            audit.uncommitted = index;
            continue;
        }
        audit.unexpected.push_back(index);
    }
    return audit;
}

auto verify_chain(const core::BackupChainState& state,
                  adapters::ObjectStore& store,
                  const infra::RetryPolicy& retry) -> infra::Result<AuditReport>
{
    AuditReport report;

    auto list = [&](const core::SnapshotPair& pair) {
        const auto prefix = core::pair_key_prefix(state.config.object_prefix, pair);
        return infra::with_retry([&] { return store.list_objects(prefix); },
                                 retry, fmt::format("listing of {}", prefix));
    };

    for (const auto& completed : state.chain) {
        auto listing = list(completed.pair);
        if (!listing) {
            return std::unexpected(std::move(listing.error()));
        }
        report.pairs.push_back(audit_pair(state.config.object_prefix, completed.pair,
                                          completed.chunk_count, completed.total_bytes,
                                          false, *listing));
        spdlog::debug("Audited {}: {} objects listed", completed.pair.name(), listing->size());
    }

    if (state.in_flight) {
        const auto& run = *state.in_flight;
        auto listing = list(run.pair);
        if (!listing) {
            return std::unexpected(std::move(listing.error()));
        }
        report.pairs.push_back(audit_pair(state.config.object_prefix, run.pair,
                                          run.durable_chunks(), run.bytes_streamed,
                                          true, *listing));
    }
    return report;
}

} // namespace coldsend::extensions
