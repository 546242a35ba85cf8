//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "algorithm.hpp"

#include <sstream>

#include "cppassert.h"
#include "errors.hpp"

namespace
{
void registerRepresentations(RepresentationRegistry &registry, const Pipeline &pipeline)
{
    for (auto &op : pipeline.operations())
        registry.add(op->out_representation);
}
} // namespace

Algorithm::Algorithm(ObjectiveFunction objective) : objective(std::move(objective))
{
}

Algorithm &Algorithm::addPipeline(OperationPtr initializer, Pipeline pipeline, size_t duplicate)
{
    t_assert(initializer != nullptr, "An initializer operation should be provided.");
    // Without an explicit output representation there is nothing to initialize.
    if (!initializer->isInitializer())
        throw InvalidInitializerError(initializer->name);

    pipeline.validate(initializer->out_representation->tag());

    registry.add(initializer->out_representation);
    registerRepresentations(registry, pipeline);

    for (size_t idx = 0; idx < duplicate; ++idx)
        lineages.push_back(Lineage{initializer, pipeline});
    return *this;
}

const Lineage &Algorithm::lineage(size_t population_index) const
{
    t_assert(population_index < lineages.size(), "Population index should be within range.");
    return lineages[population_index];
}

std::string Algorithm::fingerprint() const
{
    std::ostringstream oss;
    oss << lineages.size();
    for (auto &lineage : lineages)
    {
        oss << "|" << lineage.initializer->name;
        for (auto &op : lineage.pipeline.operations())
            oss << ";" << op->name;
    }
    return oss.str();
}
