#pragma once

#include "combatlog/ownership_index.hpp"
#include "combatlog/types.hpp"
#include <expected>
#include <filesystem>
#include <istream>

namespace combatlog {

// Scan -> build -> (open-session synthesis) -> score -> (disambiguate).
// The stream is read from the beginning regardless of its position.
std::expected<Resolution, ResolveError> resolve_interval(
    std::istream& log, const MetadataRecord& record, const ResolverConfig& config,
    const TraceCallback& trace = nullptr);

// Resolves the interval, then runs the attributed extraction pass over it.
std::expected<MatchFeatures, ResolveError> resolve_and_extract(
    std::istream& log, const MetadataRecord& record, const OwnershipIndex& index,
    const ResolverConfig& config, const TraceCallback& trace = nullptr);

// Opens the log for the duration of both passes.
std::expected<MatchFeatures, ResolveError> resolve_log_file(
    const std::filesystem::path& log_path, const MetadataRecord& record,
    const OwnershipIndex& index, const ResolverConfig& config,
    const TraceCallback& trace = nullptr);

} // namespace combatlog
