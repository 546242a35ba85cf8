//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Operations are the building blocks of a pipeline: each one transforms a population.

#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>

#include "mailbox.hpp"
#include "population.hpp"

// Batched objective: one fitness value per individual, higher is better.
using ObjectiveFunction = std::function<Fitness(const Genomes &)>;

class IMigrationTransport;

struct Rng
{
    std::mt19937_64 rng;

    Rng();
    Rng(size_t seed);
};

/**
 * @brief Ambient data of the worker applying an operation.
 *
 * Each population worker owns its own context, none of it is shared between workers except the
 * (read-only) roster and the transport.
 */
struct OperationContext
{
    ObjectiveFunction objective;
    // Addresses of all populations of the run, ordered by population index.
    Roster roster;
    size_t self_index = 0;
    std::shared_ptr<IMigrationTransport> transport;
    std::shared_ptr<Mailbox> inbox;
    Rng rng;

    size_t numPopulations() const
    {
        return roster.size();
    }
};

struct Operation
{
    std::string name;
    bool requires_fitness = false;
    bool invalidates_fitness = false;
    // std::nullopt accepts any representation.
    std::optional<std::set<std::string>> in_representations;
    // nullptr keeps the representation of the input population.
    RepresentationPtr out_representation;
    std::function<Population(Population, OperationContext &)> impl;

    bool accepts(const std::string &tag) const;
    bool isInitializer() const
    {
        return out_representation != nullptr;
    }
};

using OperationPtr = std::shared_ptr<const Operation>;

OperationPtr makeOperation(Operation operation);

/**
 * @brief Applies a single operation to the population.
 *
 * Does not compute fitness: a fitness-requiring operation applied to a population without fitness
 * raises MissingFitnessError. Use Pipeline::apply for lazy fitness evaluation.
 */
Population applyOperation(Population population, const Operation &operation, OperationContext &ctx);
