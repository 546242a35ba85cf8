//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once

#include <vector>

#include "operation.hpp"

/**
 * @brief An ordered sequence of operations a population passes through every generation.
 *
 * Fitness is computed lazily: only right before an operation that requires it, and only if the
 * population has none. Operations that invalidate fitness drop it afterwards.
 */
class Pipeline
{
    std::vector<OperationPtr> ops;

  public:
    Pipeline() = default;
    Pipeline(std::vector<OperationPtr> ops);

    const std::vector<OperationPtr> &operations() const
    {
        return ops;
    }
    bool empty() const
    {
        return ops.empty();
    }

    // A terminated population is returned as-is.
    Population apply(Population population, OperationContext &ctx) const;

    /**
     * @brief Checks that every operation accepts the representation produced before it.
     *
     * The first operation is checked once more against the output of the last one, as the
     * pipeline is applied repeatedly.
     *
     * @param input The representation tag entering the pipeline.
     * @return The representation tag leaving the pipeline, std::nullopt if it is unchanged.
     */
    std::optional<RepresentationPtr> validate(const std::string &input) const;
};

// Runs a single operation through a one-operation pipeline, computing fitness if needed.
Population pipeThroughOperation(Population population, const OperationPtr &operation, OperationContext &ctx);
