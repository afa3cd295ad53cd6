#include "simulation/RandomStream.hpp"
#include "exceptions/Exceptions.hpp"
#include <gsl/gsl_randist.h>
#include <algorithm>
#include <utility>

namespace dissim {

RandomStream::RandomStream(std::uint64_t seed)
    : rng_(gsl_rng_alloc(gsl_rng_mt19937)), seed_(seed)
{
    if (!rng_) {
        throw SimulationException("RandomStream::RandomStream", "Failed to allocate GSL RNG.");
    }
    gsl_rng_set(rng_, static_cast<unsigned long>(seed));
}

RandomStream::~RandomStream() {
    if (rng_) gsl_rng_free(rng_);
}

RandomStream::RandomStream(RandomStream&& other) noexcept
    : rng_(other.rng_), seed_(other.seed_)
{
    other.rng_ = nullptr;
}

RandomStream& RandomStream::operator=(RandomStream&& other) noexcept {
    if (this != &other) {
        if (rng_) gsl_rng_free(rng_);
        rng_ = std::exchange(other.rng_, nullptr);
        seed_ = other.seed_;
    }
    return *this;
}

bool RandomStream::bernoulli(double p) {
    return gsl_ran_bernoulli(rng_, p) == 1;
}

double RandomStream::uniform() {
    return gsl_rng_uniform(rng_);
}

std::uint64_t RandomStream::mix(std::uint64_t z) {
    z += 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

std::uint64_t RandomStream::deriveSeed(std::uint64_t top_seed, std::uint64_t stream_key, std::uint64_t trial_index) {
    std::uint64_t h = mix(top_seed);
    h = mix(h ^ stream_key);
    h = mix(h ^ trial_index);
    // gsl_rng_mt19937 only uses the low 32 bits of the seed; fold the high half in.
    return (h ^ (h >> 32)) & 0xFFFFFFFFULL;
}

std::uint64_t RandomStream::seedSetKey(std::vector<std::string> labels) {
    std::sort(labels.begin(), labels.end());
    labels.erase(std::unique(labels.begin(), labels.end()), labels.end());

    std::uint64_t h = 0xCBF29CE484222325ULL;
    for (const auto& label : labels) {
        for (unsigned char c : label) {
            h ^= c;
            h *= 0x100000001B3ULL;
        }
        // Separator keeps {"ab"} and {"a", "b"} apart
        h ^= 0xFFULL;
        h *= 0x100000001B3ULL;
    }
    return h;
}

} // namespace dissim
