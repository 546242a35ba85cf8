//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Definition of an evolutionary algorithm: an objective and the lineages of populations optimizing it.

#include <string>
#include <vector>

#include "pipeline.hpp"
#include "representation.hpp"

struct Lineage
{
    OperationPtr initializer;
    Pipeline pipeline;
};

class Algorithm
{
    ObjectiveFunction objective;
    // One entry per population, duplicates already expanded.
    std::vector<Lineage> lineages;
    RepresentationRegistry registry;

  public:
    // Higher objective values are better, populations are maximized.
    Algorithm(ObjectiveFunction objective);

    /**
     * @brief Adds a lineage: populations created by `initializer` that evolve through `pipeline`.
     *
     * The lineage is validated before it is added: `initializer` must declare its output
     * representation, and every operation must accept the representation produced before it.
     *
     * @param duplicate The number of independent populations following this lineage.
     */
    Algorithm &addPipeline(OperationPtr initializer, Pipeline pipeline, size_t duplicate = 1);

    const ObjectiveFunction &getObjective() const
    {
        return objective;
    }
    size_t numPopulations() const
    {
        return lineages.size();
    }
    const Lineage &lineage(size_t population_index) const;
    const RepresentationRegistry &representations() const
    {
        return registry;
    }

    // Summary of the lineage structure, processes running the same algorithm produce the same value.
    std::string fingerprint() const;
};
