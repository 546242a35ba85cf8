//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "operation.hpp"

#include "errors.hpp"

Rng::Rng() : rng(std::random_device()())
{
}
Rng::Rng(size_t seed) : rng(seed)
{
}

bool Operation::accepts(const std::string &tag) const
{
    if (!in_representations.has_value())
        return true;
    return in_representations->count(tag) > 0;
}

OperationPtr makeOperation(Operation operation)
{
    return std::make_shared<Operation>(std::move(operation));
}

Population applyOperation(Population population, const Operation &operation, OperationContext &ctx)
{
    if (operation.requires_fitness && !population.hasFitness())
        throw MissingFitnessError(operation.name);

    population = operation.impl(std::move(population), ctx);

    if (operation.out_representation != nullptr)
        population.representation = operation.out_representation;

    return population;
}
