//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "population.hpp"

#include <algorithm>

#include "cppassert.h"
#include "errors.hpp"

std::string Population::tag() const
{
    if (representation == nullptr)
        return "none";
    return representation->tag();
}

size_t populationSize(const Population &population)
{
    t_assert(population.representation != nullptr, "Population should be initialized before measuring its size.");
    return population.representation->populationSize(population.genomes);
}

std::vector<Population> duplicate(const Population &population, size_t k)
{
    return std::vector<Population>(k, population);
}

Population joinWith(const std::vector<Population> &populations, GenomesJoin genomes_join, FitnessJoin fitness_join)
{
    t_assert(!populations.empty(), "Cannot join an empty list of populations.");

    const Population &first = populations.front();
    for (auto &population : populations)
    {
        if (population.tag() != first.tag())
        {
            throw IncompatibleRepresentationError("cannot join populations with representations " + first.tag() +
                                                  " and " + population.tag());
        }
    }

    Population result;
    result.representation = first.representation;
    result.generation = 0;

    std::vector<Genomes> genomes;
    std::vector<Fitness> fitness;
    bool all_fitness = true;
    for (auto &population : populations)
    {
        genomes.push_back(population.genomes);
        if (population.hasFitness())
            fitness.push_back(population.fitness);
        else
            all_fitness = false;

        result.generation = std::max(result.generation, population.generation);
        result.terminated = result.terminated || population.terminated;
        for (auto &[key, value] : population.log)
            result.log[key] = value;
        for (auto &[key, value] : population.notes)
            result.notes[key] = value;
    }

    result.genomes = genomes_join(genomes);
    // Partially known fitness is never trusted.
    if (all_fitness)
        result.fitness = fitness_join(fitness);

    return result;
}

Population concatenate(const std::vector<Population> &populations)
{
    t_assert(!populations.empty(), "Cannot concatenate an empty list of populations.");
    RepresentationPtr representation = populations.front().representation;
    t_assert(representation != nullptr, "Population should be initialized before concatenating.");

    return joinWith(
        populations,
        [representation](const std::vector<Genomes> &genomes) { return representation->concatenateGenomes(genomes); },
        [representation](const std::vector<Fitness> &fitness) { return representation->concatenateFitness(fitness); });
}

Population slice(const Population &population, size_t begin, size_t end)
{
    t_assert(population.representation != nullptr, "Population should be initialized before slicing.");
    t_assert(begin <= end && end <= populationSize(population), "Slice should lie within the population.");

    Population result = population;
    result.genomes = population.representation->sliceGenomes(population.genomes, begin, end);
    if (population.hasFitness())
        result.fitness = population.representation->sliceFitness(population.fitness, begin, end);
    return result;
}
