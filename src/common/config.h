#pragma once

#include <cstddef>
#include <cstdint>

namespace Chronicle {

/// Array defaults
/// Slots per partition. Also the branching factor of the index tree.
inline constexpr int64_t kDefaultArraySize = 10000;

/// Notification log defaults
inline constexpr int64_t kDefaultSectionSize = 20;
/// Archived sections never change; one year is the advertised max-age.
inline constexpr int64_t kDefaultArchivedMaxAgeSeconds = 365LL * 24 * 60 * 60;
/// Sections a remote reader keeps in each of its caches.
inline constexpr size_t kDefaultRemoteCacheSections = 256;

/// Retry defaults for ConcurrencyError
inline constexpr int kDefaultRetryMaxAttempts = 50;
inline constexpr int kDefaultRetryWaitMs = 10;

/// Network defaults
inline constexpr int kDefaultServerPort = 50070;
inline constexpr int kDefaultCounterPort = 50071;
inline constexpr int kDefaultRpcDeadlineMs = 5000;

/// Reserved topics for index-tree records stored alongside items.
inline constexpr char kArrayNodeTopic[] = "chronicle.array.node";
inline constexpr char kArrayApexTopic[] = "chronicle.array.apex";

/// Section id naming the section that holds the next unassigned position.
inline constexpr char kCurrentSectionId[] = "current";

} // namespace Chronicle
