#ifndef RANDOM_STREAM_HPP
#define RANDOM_STREAM_HPP

#include <gsl/gsl_rng.h>

namespace crn {

    /**
     * @class RandomStream
     * @brief Owns one GSL Mersenne Twister generator.
     *
     * Every stochastic run draws from exactly one stream and no stream is
     * shared between runs, so runs with the same seed reproduce exactly and
     * concurrent runs never contend. Movable, not copyable.
     */
    class RandomStream {
    public:
        /**
         * @brief Allocates a mt19937 generator and seeds it.
         * @throws SimulationException If GSL cannot allocate the generator.
         */
        explicit RandomStream(unsigned long seed);

        ~RandomStream();

        RandomStream(const RandomStream&) = delete;
        RandomStream& operator=(const RandomStream&) = delete;

        RandomStream(RandomStream&& other) noexcept;
        RandomStream& operator=(RandomStream&& other) noexcept;

        /** @brief Uniform draw in [0, 1). */
        double uniform();

        /** @brief Uniform draw in (0, 1). */
        double uniformPositive();

        /**
         * @brief Exponential waiting time with the given rate.
         *
         * Computed as -ln(u)/rate with u from uniformPositive(), so the result
         * is finite and strictly positive.
         *
         * @throws InvalidParameterException If `rate` is not positive.
         */
        double exponential(double rate);

        /**
         * @brief Poisson draw with the given mean; zero when the mean is zero.
         * @throws InvalidParameterException If `mean` is negative or non-finite.
         */
        unsigned int poisson(double mean);

        unsigned long getSeed() const;

        /**
         * @brief Seed derived from wall-clock time and process id.
         */
        static unsigned long makeSeed();

    private:
        gsl_rng* rng_;
        unsigned long seed_;
    };

} // namespace crn

#endif // RANDOM_STREAM_HPP
