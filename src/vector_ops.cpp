//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "vector_ops.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include "cppassert.h"
#include "errors.hpp"

namespace
{
void validateProbability(double probability, const std::string &name)
{
    if (probability < 0.0 || probability > 1.0)
        throw std::invalid_argument(name + " expects a probability within [0, 1], got " + std::to_string(probability));
}

const FitnessVector &fitnessOf(const Population &population)
{
    t_assert(population.hasFitness(), "Fitness should be computed.");
    return std::any_cast<const FitnessVector &>(population.fitness);
}

template <typename T> GenomeMatrix<T> crossover(const GenomeMatrix<T> &genomes, double probability, Rng &rng)
{
    GenomeMatrix<T> offspring = genomes;
    std::bernoulli_distribution swap(probability);
    for (size_t idx = 0; idx + 1 < offspring.size(); idx += 2)
    {
        auto &a = offspring[idx];
        auto &b = offspring[idx + 1];
        t_assert(a.size() == b.size(), "Parents should have equal length.");
        for (size_t gene = 0; gene < a.size(); ++gene)
        {
            if (swap(rng.rng))
                std::swap(a[gene], b[gene]);
        }
    }
    return offspring;
}
} // namespace

OperationPtr initRealRandomUniform(size_t n, size_t length, double min, double max)
{
    if (min > max)
        throw std::invalid_argument("initRealRandomUniform expects min <= max");

    Operation op;
    op.name = "Initialization: real random uniform";
    op.out_representation = realRepresentation();
    op.impl = [n, length, min, max](Population population, OperationContext &ctx) {
        std::uniform_real_distribution<double> gene(min, max);
        GenomeMatrix<double> genomes(n, std::vector<double>(length));
        for (auto &genome : genomes)
            std::generate(genome.begin(), genome.end(), [&]() { return gene(ctx.rng.rng); });
        population.genomes = std::move(genomes);
        population.invalidateFitness();
        return population;
    };
    return makeOperation(std::move(op));
}

OperationPtr initBinaryRandomUniform(size_t n, size_t length)
{
    Operation op;
    op.name = "Initialization: binary random uniform";
    op.out_representation = binaryRepresentation();
    op.impl = [n, length](Population population, OperationContext &ctx) {
        std::bernoulli_distribution gene(0.5);
        GenomeMatrix<uint8_t> genomes(n, std::vector<uint8_t>(length));
        for (auto &genome : genomes)
            std::generate(genome.begin(), genome.end(), [&]() { return static_cast<uint8_t>(gene(ctx.rng.rng)); });
        population.genomes = std::move(genomes);
        population.invalidateFitness();
        return population;
    };
    return makeOperation(std::move(op));
}

OperationPtr initPermutationRandom(size_t n, size_t length)
{
    Operation op;
    op.name = "Initialization: random permutation";
    op.out_representation = permutationRepresentation();
    op.impl = [n, length](Population population, OperationContext &ctx) {
        GenomeMatrix<int64_t> genomes(n, std::vector<int64_t>(length));
        for (auto &genome : genomes)
        {
            std::iota(genome.begin(), genome.end(), 0);
            std::shuffle(genome.begin(), genome.end(), ctx.rng.rng);
        }
        population.genomes = std::move(genomes);
        population.invalidateFitness();
        return population;
    };
    return makeOperation(std::move(op));
}

Population takeIndividuals(const Population &population, const std::vector<size_t> &indices)
{
    if (indices.empty())
        return slice(population, 0, 0);

    std::vector<Population> individuals;
    individuals.reserve(indices.size());
    for (size_t idx : indices)
        individuals.push_back(slice(population, idx, idx + 1));
    return concatenate(individuals);
}

OperationPtr selectionNatural(size_t n)
{
    Operation op;
    op.name = "Selection: natural";
    op.requires_fitness = true;
    op.impl = [n](Population population, OperationContext &) {
        const FitnessVector &fitness = fitnessOf(population);
        std::vector<size_t> order(fitness.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&fitness](size_t a, size_t b) { return fitness[a] > fitness[b]; });
        order.resize(std::min(n, order.size()));
        return takeIndividuals(population, order);
    };
    return makeOperation(std::move(op));
}

OperationPtr selectionTournament(size_t n, size_t tournament_size)
{
    if (tournament_size == 0)
        throw std::invalid_argument("selectionTournament expects a tournament size of at least 1");

    Operation op;
    op.name = "Selection: tournament";
    op.requires_fitness = true;
    op.impl = [n, tournament_size](Population population, OperationContext &ctx) {
        const FitnessVector &fitness = fitnessOf(population);
        if (fitness.empty())
            return takeIndividuals(population, {});

        std::uniform_int_distribution<size_t> pick(0, fitness.size() - 1);
        std::vector<size_t> winners;
        winners.reserve(n);
        for (size_t t = 0; t < n; ++t)
        {
            size_t best = pick(ctx.rng.rng);
            for (size_t contestant = 1; contestant < tournament_size; ++contestant)
            {
                size_t other = pick(ctx.rng.rng);
                if (fitness[other] > fitness[best])
                    best = other;
            }
            winners.push_back(best);
        }
        return takeIndividuals(population, winners);
    };
    return makeOperation(std::move(op));
}

OperationPtr crossoverUniform(double probability)
{
    validateProbability(probability, "crossoverUniform");

    Operation op;
    op.name = "Crossover: uniform";
    op.invalidates_fitness = true;
    op.in_representations = std::set<std::string>{realRepresentation()->tag(), binaryRepresentation()->tag()};
    op.impl = [probability](Population population, OperationContext &ctx) {
        if (population.tag() == realRepresentation()->tag())
            population.genomes = crossover(RealRepresentation::genomes(population.genomes), probability, ctx.rng);
        else
            population.genomes = crossover(BinaryRepresentation::genomes(population.genomes), probability, ctx.rng);
        return population;
    };
    return makeOperation(std::move(op));
}

OperationPtr mutationBitFlip(double probability)
{
    validateProbability(probability, "mutationBitFlip");

    Operation op;
    op.name = "Mutation: bit flip";
    op.invalidates_fitness = true;
    op.in_representations = std::set<std::string>{binaryRepresentation()->tag()};
    op.impl = [probability](Population population, OperationContext &ctx) {
        GenomeMatrix<uint8_t> genomes = BinaryRepresentation::genomes(population.genomes);
        std::bernoulli_distribution flip(probability);
        for (auto &genome : genomes)
        {
            for (auto &gene : genome)
            {
                if (flip(ctx.rng.rng))
                    gene = static_cast<uint8_t>(1 - gene);
            }
        }
        population.genomes = std::move(genomes);
        return population;
    };
    return makeOperation(std::move(op));
}

OperationPtr mutationShiftGaussian(double probability, double sigma)
{
    validateProbability(probability, "mutationShiftGaussian");
    if (sigma <= 0.0)
        throw std::invalid_argument("mutationShiftGaussian expects a positive sigma");

    Operation op;
    op.name = "Mutation: shift gaussian";
    op.invalidates_fitness = true;
    op.in_representations = std::set<std::string>{realRepresentation()->tag()};
    op.impl = [probability, sigma](Population population, OperationContext &ctx) {
        GenomeMatrix<double> genomes = RealRepresentation::genomes(population.genomes);
        std::bernoulli_distribution mutate(probability);
        std::normal_distribution<double> shift(0.0, sigma);
        for (auto &genome : genomes)
        {
            for (auto &gene : genome)
            {
                if (mutate(ctx.rng.rng))
                    gene += shift(ctx.rng.rng);
            }
        }
        population.genomes = std::move(genomes);
        return population;
    };
    return makeOperation(std::move(op));
}

OperationPtr logBestIndividual()
{
    Operation op;
    op.name = "Log: best individual";
    op.requires_fitness = true;
    op.impl = [](Population population, OperationContext &) {
        const FitnessVector &fitness = fitnessOf(population);
        if (fitness.empty())
            return population;

        auto best = std::max_element(fitness.begin(), fitness.end());
        auto it = population.log.find("best_fitness");
        if (it == population.log.end() || *best > it->second)
        {
            population.log["best_fitness"] = *best;
            population.log["best_generation"] = static_cast<double>(population.generation);
            population.notes["best_genome"] = population.representation->formatGenome(
                population.genomes, static_cast<size_t>(best - fitness.begin()));
        }
        return population;
    };
    return makeOperation(std::move(op));
}
