//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// A population is the snapshot of one evolving group of individuals at a particular generation.

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "representation.hpp"

// Numeric entries recorded by logging operations, e.g. "best_fitness".
using PopulationLog = std::map<std::string, double>;
// Text entries recorded by logging operations, e.g. "best_genome".
using PopulationNotes = std::map<std::string, std::string>;

struct Population
{
    Genomes genomes;
    // Empty when not computed, or no longer consistent with the genomes.
    Fitness fitness;
    RepresentationPtr representation;
    size_t generation = 1;
    bool terminated = false;
    PopulationLog log;
    PopulationNotes notes;

    bool hasFitness() const
    {
        return fitness.has_value();
    }
    void invalidateFitness()
    {
        fitness.reset();
    }
    // Tag of the representation, or "none" before initialization.
    std::string tag() const;
};

size_t populationSize(const Population &population);

// k copies of the same snapshot.
std::vector<Population> duplicate(const Population &population, size_t k);

using GenomesJoin = std::function<Genomes(const std::vector<Genomes> &)>;
using FitnessJoin = std::function<Fitness(const std::vector<Fitness> &)>;

/**
 * @brief Joins multiple populations into a single one.
 *
 * All populations must share a representation. The generation of the result is the maximum of
 * all generations, the result is terminated if any input is, and fitness is only kept if every
 * input has fitness.
 */
Population joinWith(const std::vector<Population> &populations, GenomesJoin genomes_join, FitnessJoin fitness_join);

// Joins using the shared representation's concatenation.
Population concatenate(const std::vector<Population> &populations);

// Individuals [begin, end) of the population, preserving fitness when present.
Population slice(const Population &population, size_t begin, size_t end);
