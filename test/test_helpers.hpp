#pragma once

#include <atomic>
#include <memory>
#include <numeric>

#include "operation.hpp"
#include "pipeline.hpp"
#include "vector_representation.hpp"

// Integer genomes, only used by tests.
using ListRepresentation = VectorRepresentation<int>;

inline std::shared_ptr<const ListRepresentation> listRepresentation()
{
    static std::shared_ptr<const ListRepresentation> representation = std::make_shared<ListRepresentation>("list");
    return representation;
}

// A population of `n` single-gene genomes 0, 1, ..., n-1 in the given representation.
inline Population countingPopulation(size_t n, size_t generation = 1)
{
    GenomeMatrix<int> genomes(n);
    for (size_t idx = 0; idx < n; ++idx)
        genomes[idx] = {static_cast<int>(idx)};

    Population population;
    population.genomes = genomes;
    population.representation = listRepresentation();
    population.generation = generation;
    return population;
}

inline const GenomeMatrix<int> &listGenomes(const Population &population)
{
    return ListRepresentation::genomes(population.genomes);
}

// Fitness of a genome is the sum of its genes.
template <typename T> Fitness sumObjective(const Genomes &genomes)
{
    FitnessVector fitness;
    for (auto &genome : VectorRepresentation<T>::genomes(genomes))
        fitness.push_back(std::accumulate(genome.begin(), genome.end(), 0.0));
    return fitness;
}

// Objective counting the number of times it was called.
inline ObjectiveFunction countingObjective(std::shared_ptr<std::atomic<size_t>> calls)
{
    return [calls](const Genomes &genomes) {
        (*calls)++;
        return sumObjective<int>(genomes);
    };
}

inline OperationPtr initCounting(size_t n)
{
    Operation op;
    op.name = "Initialization: counting";
    op.out_representation = listRepresentation();
    op.impl = [n](Population population, OperationContext &) {
        population.genomes = countingPopulation(n).genomes;
        population.invalidateFitness();
        return population;
    };
    return makeOperation(std::move(op));
}

// Operation doing nothing but declaring the given metadata.
inline OperationPtr identityOperation(std::string name,
                                      bool requires_fitness = false,
                                      bool invalidates_fitness = false,
                                      std::optional<std::set<std::string>> in_representations = std::nullopt)
{
    Operation op;
    op.name = std::move(name);
    op.requires_fitness = requires_fitness;
    op.invalidates_fitness = invalidates_fitness;
    op.in_representations = std::move(in_representations);
    op.impl = [](Population population, OperationContext &) { return population; };
    return makeOperation(std::move(op));
}

inline OperationContext singlePopulationContext(ObjectiveFunction objective)
{
    OperationContext ctx;
    ctx.objective = std::move(objective);
    ctx.roster = {PopulationAddress{"local", 0}};
    ctx.self_index = 0;
    ctx.inbox = std::make_shared<Mailbox>();
    ctx.rng = Rng(42);
    return ctx;
}
