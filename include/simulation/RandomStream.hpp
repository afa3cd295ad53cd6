#ifndef RANDOM_STREAM_HPP
#define RANDOM_STREAM_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <gsl/gsl_rng.h>

namespace dissim {

/**
 * @brief Owns one GSL Mersenne Twister generator for a single trial.
 *
 * Each trial gets its own stream whose seed is derived from the top-level
 * seed, the identity of the trial's seed set and the trial index, so a
 * trial's draws never depend on which other trials ran before it, on which
 * thread runs it, or on where its seed set falls in the enumeration.
 *
 * gsl_rng_mt19937 takes a 32-bit seed, so distinct trials share a stream
 * with probability about m^2 / 2^33 over m trials.
 */
class RandomStream {
public:
    /**
     * @brief Allocates and seeds the generator.
     * @param seed [in] Seed passed to gsl_rng_set.
     * @throws SimulationException If the GSL generator cannot be allocated.
     */
    explicit RandomStream(std::uint64_t seed);

    /**
     * @brief Frees the GSL generator.
     */
    ~RandomStream();

    RandomStream(const RandomStream&) = delete;
    RandomStream& operator=(const RandomStream&) = delete;
    RandomStream(RandomStream&& other) noexcept;
    RandomStream& operator=(RandomStream&& other) noexcept;

    /**
     * @brief One Bernoulli draw.
     * @param p [in] Success probability in [0, 1].
     * @return true with probability p.
     */
    bool bernoulli(double p);

    /** @brief Uniform double in [0, 1). */
    double uniform();

    std::uint64_t seed() const { return seed_; }

    /**
     * @brief Seed of the stream for one trial.
     *
     * Mixes the three inputs with SplitMix64 steps and folds the result to
     * the 32 bits gsl_rng_mt19937 uses.
     *
     * @param top_seed    [in] Run-level seed.
     * @param stream_key  [in] Identity of the seed set, see seedSetKey().
     * @param trial_index [in] Trial number within the seed set.
     */
    static std::uint64_t deriveSeed(std::uint64_t top_seed, std::uint64_t stream_key, std::uint64_t trial_index);

    /**
     * @brief Stable 64-bit key of a set of vertex identifiers.
     *
     * FNV-1a over the sorted, de-duplicated identifiers; independent of the
     * order or repetition of @p labels.
     */
    static std::uint64_t seedSetKey(std::vector<std::string> labels);

private:
    static std::uint64_t mix(std::uint64_t z);

    gsl_rng* rng_;
    std::uint64_t seed_;
};

} // namespace dissim

#endif // RANDOM_STREAM_HPP
