#pragma once
#include <memory>
#include <unordered_map>
#include "native/subsystem.hpp"

namespace kstatpp::stats {

class KStat;

// Maps a native kstat identity to the one KStat wrapper handed out for it.
// Scoped to a single token; not locked itself (the token's session lock
// covers every access).
class KStatCache {
public:
    // The cached wrapper for id, or nullptr.
    std::shared_ptr<KStat> find(native::RecordId id) const;

    // Caches kstat for id unless an entry exists; returns the entry that wins.
    std::shared_ptr<KStat> insert(native::RecordId id, std::shared_ptr<KStat> kstat);

    void clear();
    size_t size() const { return entries_.size(); }

private:
    std::unordered_map<native::RecordId, std::shared_ptr<KStat>, native::RecordIdHash> entries_;
};

} // namespace kstatpp::stats
