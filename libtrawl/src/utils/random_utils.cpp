//
// Created by Giuseppe Francione on 03/03/26.
//

#include "../../include/random_utils.hpp"
#include <algorithm>
#include <random>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;
}

namespace trawl {

unsigned long long RandomUtils::next_u64() {
    return dist(rng);
}

std::string RandomUtils::random_suffix(const std::size_t length) {
    static constexpr char kHex[] = "0123456789abcdef";
    unsigned long long value = next_u64();
    std::string out(std::min<std::size_t>(length, 16), '0');
    for (auto& c : out) {
        c = kHex[value & 0xF];
        value >>= 4;
    }
    return out;
}

} // namespace trawl
