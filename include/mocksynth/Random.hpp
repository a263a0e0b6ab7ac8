/**
 * @file Random.hpp
 * @brief Deterministic random leaf values
 *
 * A RandomSource owns a seeded std::mt19937_64. Raw engine output is
 * reduced with a modulo rather than a std:: distribution, so the same
 * seed produces the same values with every standard library.
 *
 * Generation strategy per type:
 * - string: 8 characters from [a-z0-9]
 * - number: 0
 * - bool:   false
 * - list / set / map: empty collection of the element type
 * - object: every attribute generated recursively
 * - dynamic: null (no strategy)
 */

#ifndef MOCKSYNTH_RANDOM_HPP
#define MOCKSYNTH_RANDOM_HPP

#include "mocksynth/Type.hpp"
#include "mocksynth/Value.hpp"

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace mocksynth {

class RandomSource {
public:
    static constexpr size_t kStringLength = 8;

    explicit RandomSource(std::uint64_t seed) : engine_(seed) {}

    RandomSource(const RandomSource&) = delete;
    RandomSource& operator=(const RandomSource&) = delete;

    /**
     * @brief Process-wide generator, seeded from std::random_device
     *
     * Used when a caller does not supply its own RandomSource.
     */
    static RandomSource& process_default();

    /**
     * @brief Random string of `length` characters from [a-z0-9]
     */
    std::string next_string(size_t length = kStringLength);

    /**
     * @brief Generate a value of the given type
     *
     * Never returns null except for dynamic.
     */
    Value generate(const Type& type);

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

} // namespace mocksynth

#endif // MOCKSYNTH_RANDOM_HPP
