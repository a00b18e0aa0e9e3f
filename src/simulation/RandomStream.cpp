#include "simulation/RandomStream.hpp"
#include "exceptions/Exceptions.hpp"
#include <gsl/gsl_randist.h>
#include <cmath>
#include <ctime>
#include <unistd.h>

namespace crn {

    RandomStream::RandomStream(unsigned long seed)
        : rng_(gsl_rng_alloc(gsl_rng_mt19937)), seed_(seed)
    {
        if (!rng_) {
            THROW_SIMULATION_ERROR("RandomStream::RandomStream", "Failed to allocate GSL RNG.");
        }
        gsl_rng_set(rng_, seed_);
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
            rng_ = other.rng_;
            seed_ = other.seed_;
            other.rng_ = nullptr;
        }
        return *this;
    }

    double RandomStream::uniform() {
        return gsl_rng_uniform(rng_);
    }

    double RandomStream::uniformPositive() {
        return gsl_rng_uniform_pos(rng_);
    }

    double RandomStream::exponential(double rate) {
        if (!(rate > 0.0)) {
            THROW_INVALID_PARAM("RandomStream::exponential", "Rate must be positive. Got: " + std::to_string(rate));
        }
        return -std::log(uniformPositive()) / rate;
    }

    unsigned int RandomStream::poisson(double mean) {
        if (!std::isfinite(mean) || mean < 0.0) {
            THROW_INVALID_PARAM("RandomStream::poisson", "Mean must be finite and non-negative. Got: " + std::to_string(mean));
        }
        if (mean == 0.0) {
            return 0;
        }
        return gsl_ran_poisson(rng_, mean);
    }

    unsigned long RandomStream::getSeed() const {
        return seed_;
    }

    unsigned long RandomStream::makeSeed() {
        return static_cast<unsigned long>(time(NULL)) ^ (static_cast<unsigned long>(getpid()) << 16);
    }

} // namespace crn
