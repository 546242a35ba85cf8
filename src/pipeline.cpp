//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "pipeline.hpp"

#include "errors.hpp"

Pipeline::Pipeline(std::vector<OperationPtr> ops) : ops(std::move(ops))
{
}

Population Pipeline::apply(Population population, OperationContext &ctx) const
{
    for (auto &op : ops)
    {
        if (population.terminated)
            return population;

        if (op->requires_fitness && !population.hasFitness())
            population.fitness = ctx.objective(population.genomes);

        population = applyOperation(std::move(population), *op, ctx);

        if (op->invalidates_fitness)
            population.invalidateFitness();
    }
    return population;
}

std::optional<RepresentationPtr> Pipeline::validate(const std::string &input) const
{
    if (ops.empty())
        return std::nullopt;

    std::string current = input;
    std::optional<RepresentationPtr> out;

    std::vector<OperationPtr> chain = ops;
    chain.push_back(ops.front());
    for (size_t idx = 0; idx < chain.size(); ++idx)
    {
        auto &op = chain[idx];
        if (!op->accepts(current))
            throw RepresentationMismatchError(op->name, current);
        if (op->out_representation != nullptr)
        {
            current = op->out_representation->tag();
            // The trailing re-check of the first operation does not contribute to the output.
            if (idx + 1 < chain.size())
                out = op->out_representation;
        }
    }
    return out;
}

Population pipeThroughOperation(Population population, const OperationPtr &operation, OperationContext &ctx)
{
    Pipeline pipeline({operation});
    return pipeline.apply(std::move(population), ctx);
}
