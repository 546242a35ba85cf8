#include <chrono>

#include <catch2/catch.hpp>
#include <catch2/trompeloeil.hpp>

#include "errors.hpp"
#include "migration.hpp"
#include "mocks_migration.hpp"
#include "test_helpers.hpp"
#include "vector_ops.hpp"

namespace
{
OperationContext islandContext(size_t self_index, size_t num_populations, std::shared_ptr<IMigrationTransport> transport)
{
    OperationContext ctx = singlePopulationContext(sumObjective<int>);
    ctx.roster.clear();
    for (size_t idx = 0; idx < num_populations; ++idx)
        ctx.roster.push_back(PopulationAddress{"node", idx});
    ctx.self_index = self_index;
    ctx.transport = std::move(transport);
    return ctx;
}

MigrantBatch batchOf(const Population &population, size_t source_index = 1)
{
    return MigrantBatch{source_index, population.generation, population.tag(), population.genomes};
}
} // namespace

TEST_CASE("Emigration", "[Migration]")
{
    using trompeloeil::_;
    auto transport = std::make_shared<MockMigrationTransport>();
    OperationContext ctx = islandContext(2, 4, transport);
    Population p = countingPopulation(6);

    SECTION("The selected emigrants are sent to the neighbour")
    {
        MigrantBatch sent;
        REQUIRE_CALL(*transport, send(_, _))
            .WITH(_1 == PopulationAddress{"node", 3})
            .LR_SIDE_EFFECT(sent = _2);

        Population result = Pipeline({emigrate(selectionNatural(2), topology::ring)}).apply(p, ctx);

        REQUIRE(sent.source_index == 2);
        REQUIRE(sent.representation == "list");
        REQUIRE(ListRepresentation::genomes(sent.genomes) == GenomeMatrix<int>{{5}, {4}});
        // The population itself is left as is.
        REQUIRE(listGenomes(result) == listGenomes(p));
    }

    SECTION("Emigration only happens on generations divisible by the interval")
    {
        FORBID_CALL(*transport, send(_, _));
        EmigrateOptions options;
        options.interval = 3;
        Pipeline({emigrate(selectionNatural(2), topology::ring, options)}).apply(countingPopulation(6, 4), ctx);
    }

    SECTION("A single population has nobody to send to")
    {
        FORBID_CALL(*transport, send(_, _));
        OperationContext alone = islandContext(0, 1, transport);
        Pipeline({emigrate(selectionNatural(2), topology::ring)}).apply(p, alone);
    }

    SECTION("Several targets each receive a batch")
    {
        REQUIRE_CALL(*transport, send(_, _)).TIMES(3);
        EmigrateOptions options;
        options.number_of_targets = NumberOfTargets(3);
        Pipeline({emigrate(selectionNatural(2), topology::fullyConnected, options)}).apply(p, ctx);
    }

    SECTION("Asking for more targets than neighbours sends nothing")
    {
        FORBID_CALL(*transport, send(_, _));
        EmigrateOptions options;
        options.number_of_targets = NumberOfTargets(2);
        Pipeline({emigrate(selectionNatural(2), topology::ring, options)}).apply(p, ctx);
    }

    SECTION("Invalid options are refused while building")
    {
        EmigrateOptions options;
        options.number_of_targets = NumberOfTargets(3, 1);
        REQUIRE_THROWS_AS(emigrate(selectionNatural(2), topology::ring, options), std::invalid_argument);
        options = EmigrateOptions();
        options.interval = 0;
        REQUIRE_THROWS_AS(emigrate(selectionNatural(2), topology::ring, options), std::invalid_argument);
    }
}

TEST_CASE("Immigration", "[Migration]")
{
    auto transport = std::make_shared<MockMigrationTransport>();
    OperationContext ctx = islandContext(0, 2, transport);
    auto shrink = [](size_t n) { return selectionNatural(n); };
    Population p = countingPopulation(6);

    SECTION("Immigrants replace the least fit individuals, preserving the size")
    {
        Population migrants = countingPopulation(2);
        migrants.genomes = GenomeMatrix<int>{{100}, {200}};
        ctx.inbox->push(batchOf(migrants));

        Population result = Pipeline({immigrate(shrink)}).apply(p, ctx);
        REQUIRE(populationSize(result) == 6);
        REQUIRE(listGenomes(result) == GenomeMatrix<int>{{5}, {4}, {3}, {2}, {100}, {200}});
        REQUIRE(!result.hasFitness());
        REQUIRE(ctx.inbox->size() == 0);
    }

    SECTION("A batch larger than the population replaces it entirely")
    {
        ctx.inbox->push(batchOf(countingPopulation(8)));
        Population result = Pipeline({immigrate(shrink)}).apply(p, ctx);
        REQUIRE(populationSize(result) == 8);
    }

    SECTION("Blocking immigration times out without migrants")
    {
        ImmigrateOptions options;
        options.timeout = std::chrono::milliseconds(20);
        REQUIRE_THROWS_AS(Pipeline({immigrate(shrink, options)}).apply(p, ctx), MigrationTimeoutError);
    }

    SECTION("Non-blocking immigration without migrants leaves the population as is")
    {
        ImmigrateOptions options;
        options.blocking = false;
        Population result = Pipeline({immigrate(shrink, options)}).apply(p, ctx);
        REQUIRE(listGenomes(result) == listGenomes(p));
    }

    SECTION("Migrants of another representation are refused")
    {
        MigrantBatch batch;
        batch.source_index = 1;
        batch.representation = "real";
        batch.genomes = GenomeMatrix<double>{{1.0}};
        ctx.inbox->push(batch);
        REQUIRE_THROWS_AS(Pipeline({immigrate(shrink)}).apply(p, ctx), IncompatibleRepresentationError);
    }

    SECTION("Off-interval generations do not wait for migrants")
    {
        ImmigrateOptions options;
        options.interval = 2;
        options.timeout = std::chrono::milliseconds(20);
        Population result = Pipeline({immigrate(shrink, options)}).apply(countingPopulation(6, 3), ctx);
        REQUIRE(populationSize(result) == 6);
    }
}
