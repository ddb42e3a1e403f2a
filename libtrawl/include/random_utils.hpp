//
// Created by Giuseppe Francione on 03/03/26.
//

#ifndef TRAWL_RANDOM_UTILS_HPP
#define TRAWL_RANDOM_UTILS_HPP

#include <cstddef>
#include <string>

/**
 * @brief Thread-local random helpers for unique temporary names.
 *
 * The generator (std::mt19937_64) is thread-local, so concurrent workers
 * never contend on it.
 */
namespace trawl::RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a lowercase hexadecimal suffix.
     * @param length Number of hex digits (at most 16).
     */
    std::string random_suffix(std::size_t length = 12);

} // namespace trawl::RandomUtils

#endif // TRAWL_RANDOM_UTILS_HPP
