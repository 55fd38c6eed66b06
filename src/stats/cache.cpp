#include "stats/cache.hpp"
#include "stats/kstat.hpp"
#include <utility>

namespace kstatpp::stats {

std::shared_ptr<KStat> KStatCache::find(native::RecordId id) const {
    auto it = entries_.find(id);
    return (it != entries_.end()) ? it->second : nullptr;
}

std::shared_ptr<KStat> KStatCache::insert(native::RecordId id, std::shared_ptr<KStat> kstat) {
    auto result = entries_.emplace(id, std::move(kstat));
    return result.first->second;
}

void KStatCache::clear() {
    entries_.clear();
}

} // namespace kstatpp::stats
