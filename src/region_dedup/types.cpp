#include "region_dedup/types.hpp"

#include <functional>
#include <string_view>

namespace region_dedup {

namespace {
void hash_combine(std::size_t& seed, std::size_t value) noexcept {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}
}  // namespace

std::size_t LocationRecordHash::operator()(const LocationRecord& record) const noexcept {
    const std::hash<std::string_view> string_hash{};
    const std::hash<double> double_hash{};

    std::size_t seed = string_hash(record.record_id);
    hash_combine(seed, string_hash(record.user_id));
    hash_combine(seed, string_hash(record.emotion));
    hash_combine(seed, string_hash(record.audio_url));
    hash_combine(seed, string_hash(record.location_name));
    hash_combine(seed, double_hash(record.location.latitude_deg));
    hash_combine(seed, double_hash(record.location.longitude_deg));
    return seed;
}

}  // namespace region_dedup
