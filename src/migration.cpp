//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "migration.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "cppassert.h"
#include "errors.hpp"
#include "pipeline.hpp"
#include "spdlog/spdlog.h"

namespace
{
bool isMigrationGeneration(const Population &population, const OperationContext &ctx, size_t interval)
{
    return ctx.numPopulations() > 1 && population.generation % interval == 0;
}

std::vector<PopulationAddress> neighbourAddresses(const OperationContext &ctx, const TopologyFunction &topology)
{
    std::vector<PopulationAddress> addresses;
    for (size_t idx : topology(ctx.numPopulations(), ctx.self_index))
    {
        t_assert(idx < ctx.roster.size(), "Topology should only produce valid population indices.");
        addresses.push_back(ctx.roster[idx]);
    }
    return addresses;
}
} // namespace

OperationPtr emigrate(OperationPtr selection, TopologyFunction topology, EmigrateOptions options)
{
    t_assert(selection != nullptr, "A selection operation should be provided.");
    if (options.interval == 0)
        throw std::invalid_argument("emigrate expects an interval of at least 1");
    if (options.number_of_targets.min > options.number_of_targets.max)
        throw std::invalid_argument("emigrate expects number_of_targets min <= max");

    Operation op;
    op.name = "Multi-population: emigration";
    op.impl = [selection, topology, options](Population population, OperationContext &ctx) {
        if (!isMigrationGeneration(population, ctx, options.interval))
            return population;

        std::vector<PopulationAddress> neighbours = neighbourAddresses(ctx, topology);
        std::uniform_int_distribution<size_t> draw(options.number_of_targets.min, options.number_of_targets.max);
        size_t number_of_targets = draw(ctx.rng.rng);
        if (number_of_targets == 0 || neighbours.size() < number_of_targets)
            return population;

        std::vector<PopulationAddress> targets;
        std::sample(neighbours.begin(), neighbours.end(), std::back_inserter(targets), number_of_targets, ctx.rng.rng);

        Population emigrants = pipeThroughOperation(population, selection, ctx);
        for (auto &target : targets)
        {
            spdlog::debug("population {} (generation {}) sends {} emigrants to {}",
                          ctx.self_index,
                          population.generation,
                          populationSize(emigrants),
                          to_string(target));
            ctx.transport->send(target,
                                MigrantBatch{ctx.self_index, population.generation, emigrants.tag(), emigrants.genomes});
        }
        return population;
    };
    return makeOperation(std::move(op));
}

OperationPtr immigrate(SizeToSelection size_to_selection, ImmigrateOptions options)
{
    if (options.interval == 0)
        throw std::invalid_argument("immigrate expects an interval of at least 1");

    Operation op;
    op.name = "Multi-population: immigration";
    // Shrinking and splicing in immigrants leaves no fitness to trust.
    op.invalidates_fitness = true;
    op.impl = [size_to_selection, options](Population population, OperationContext &ctx) {
        if (!isMigrationGeneration(population, ctx, options.interval))
            return population;

        std::optional<MigrantBatch> batch;
        if (options.blocking)
        {
            batch = ctx.inbox->popFor(options.timeout);
            if (!batch.has_value())
                throw MigrationTimeoutError(options.timeout.count());
        }
        else
        {
            batch = ctx.inbox->tryPop();
            if (!batch.has_value())
                return population;
        }

        if (batch->representation != population.tag())
        {
            throw IncompatibleRepresentationError("population " + std::to_string(ctx.self_index) + " with representation " +
                                                  population.tag() + " received immigrants with representation " +
                                                  batch->representation);
        }

        Population immigrants;
        immigrants.genomes = std::move(batch->genomes);
        immigrants.representation = population.representation;
        immigrants.generation = population.generation;

        size_t size = populationSize(population);
        size_t num_immigrants = populationSize(immigrants);
        size_t shrink_size = size > num_immigrants ? size - num_immigrants : 0;
        spdlog::debug("population {} (generation {}) receives {} immigrants from population {} (generation {})",
                      ctx.self_index,
                      population.generation,
                      num_immigrants,
                      batch->source_index,
                      batch->source_generation);

        Population shrunk = pipeThroughOperation(std::move(population), size_to_selection(shrink_size), ctx);
        return concatenate({shrunk, immigrants});
    };
    return makeOperation(std::move(op));
}
