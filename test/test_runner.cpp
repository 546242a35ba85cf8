#include <atomic>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "migration.hpp"
#include "ops.hpp"
#include "runner.hpp"
#include "test_helpers.hpp"
#include "vector_ops.hpp"

TEST_CASE("Running a single population", "[Runner]")
{
    Algorithm algorithm(sumObjective<double>);
    algorithm.addPipeline(initRealRandomUniform(10, 3, -1.0, 1.0),
                          Pipeline({selectionTournament(10), mutationShiftGaussian(0.5, 0.1), maxGenerations(5)}));

    RunOptions options;
    options.seed = 7;
    Report report = run(algorithm, options);

    REQUIRE(report.population_reports.size() == 1);
    auto &population = report.population_reports[0].population;
    REQUIRE(population.generation == 5);
    REQUIRE(population.terminated);
    REQUIRE(populationSize(population) == 10);
    REQUIRE(report.population_reports[0].node == "local");

    SECTION("The same seed reproduces the same final population")
    {
        Report again = run(algorithm, options);
        REQUIRE(RealRepresentation::genomes(again.population_reports[0].population.genomes) ==
                RealRepresentation::genomes(population.genomes));
    }

    SECTION("The summary lists the populations")
    {
        std::string summary = formatSummary(report);
        REQUIRE(summary.find("Summary") != std::string::npos);
    }
}

TEST_CASE("The summary shows the best individual", "[Runner]")
{
    Algorithm algorithm(sumObjective<int>);
    algorithm.addPipeline(initCounting(4), Pipeline({logBestIndividual(), maxGenerations(2)}), 2);

    std::string summary = formatSummary(run(algorithm));
    REQUIRE(summary.find("Best individual") != std::string::npos);
    REQUIRE(summary.find("Fitness: 3") != std::string::npos);
    REQUIRE(summary.find("Genome: [3]") != std::string::npos);
}

TEST_CASE("Running islands in a ring", "[Runner]")
{
    const size_t size = 10;
    const size_t emigrants = 3;
    const size_t generations = 8;

    // Immigration shrinks the population to make room for exactly the received migrants.
    auto rounds = std::make_shared<std::atomic<size_t>>(0);
    auto mismatches = std::make_shared<std::atomic<size_t>>(0);
    SizeToSelection shrink = [rounds, mismatches](size_t n) {
        (*rounds)++;
        if (n != size - emigrants)
            (*mismatches)++;
        return selectionNatural(n);
    };

    Algorithm algorithm(sumObjective<int>);
    algorithm.addPipeline(initCounting(size),
                          Pipeline({emigrate(selectionNatural(emigrants), topology::ring),
                                    immigrate(shrink),
                                    logBestIndividual(),
                                    maxGenerations(generations)}),
                          2);

    Report report = run(algorithm);

    REQUIRE(report.population_reports.size() == 2);
    for (size_t idx = 0; idx < 2; ++idx)
    {
        auto &population_report = report.population_reports[idx];
        REQUIRE(population_report.index == idx);
        REQUIRE(population_report.population.generation == generations);
        REQUIRE(populationSize(population_report.population) == size);
    }
    REQUIRE(*rounds == 2 * generations);
    REQUIRE(*mismatches == 0);
}

TEST_CASE("Failures while running", "[Runner]")
{
    Algorithm algorithm(sumObjective<int>);

    SECTION("A failing population fails the run")
    {
        Operation failing;
        failing.name = "failing";
        failing.impl = [](Population population, OperationContext &) -> Population {
            if (population.generation == 3)
                throw std::runtime_error("population broke down");
            return population;
        };
        algorithm.addPipeline(initCounting(4), Pipeline({makeOperation(failing), maxGenerations(5)}));
        algorithm.addPipeline(initCounting(4), Pipeline({maxGenerations(5)}));

        REQUIRE_THROWS_WITH(run(algorithm), "population broke down");
    }

    SECTION("An operation throwing a non-standard exception fails the run")
    {
        Operation failing;
        failing.name = "failing";
        failing.impl = [](Population population, OperationContext &) -> Population {
            if (population.generation == 2)
                throw 42;
            return population;
        };
        algorithm.addPipeline(initCounting(4), Pipeline({makeOperation(failing), maxGenerations(5)}), 2);

        REQUIRE_THROWS_AS(run(algorithm), std::runtime_error);
    }

    SECTION("Blocking immigration without a sender times out")
    {
        ImmigrateOptions options;
        options.timeout = std::chrono::milliseconds(50);
        algorithm.addPipeline(initCounting(4),
                              Pipeline({immigrate([](size_t n) { return selectionNatural(n); }, options),
                                        maxGenerations(5)}),
                              2);

        REQUIRE_THROWS_AS(run(algorithm), MigrationTimeoutError);
    }
}

TEST_CASE("Population groups", "[Runner]")
{
    SECTION("Even groups give the remainder to the first groups")
    {
        REQUIRE(splitEvenly(5, 2) == std::vector<std::vector<size_t>>{{0, 1, 2}, {3, 4}});
        REQUIRE(splitEvenly(1, 2) == std::vector<std::vector<size_t>>{{0}, {}});
        REQUIRE_THROWS_AS(splitEvenly(3, 0), std::invalid_argument);
    }

    SECTION("Every population must be in exactly one group")
    {
        REQUIRE_NOTHROW(validatePopulationGroups({{0, 2}, {1}}, 3, 2));
        REQUIRE_THROWS_AS(validatePopulationGroups({{0, 1, 2}}, 3, 2), std::invalid_argument);
        REQUIRE_THROWS_AS(validatePopulationGroups({{0, 1}, {1, 2}}, 3, 2), std::invalid_argument);
        REQUIRE_THROWS_AS(validatePopulationGroups({{0}, {1}}, 3, 2), std::invalid_argument);
        REQUIRE_THROWS_AS(validatePopulationGroups({{0, 1}, {3}}, 3, 2), std::invalid_argument);
    }

    SECTION("Invalid groups are refused before anything runs")
    {
        Algorithm algorithm(sumObjective<int>);
        algorithm.addPipeline(initCounting(4), Pipeline({maxGenerations(2)}), 2);

        RunOptions options;
        options.population_groups = {{0}, {1}};
        REQUIRE_THROWS_AS(run(algorithm, options), std::invalid_argument);
    }

    SECTION("A local-only run cannot reach other nodes")
    {
        Algorithm algorithm(sumObjective<int>);
        algorithm.addPipeline(initCounting(4), Pipeline({maxGenerations(2)}), 2);

        RunOptions options;
        options.nodes = {"local", "elsewhere:1234"};
        REQUIRE_THROWS_AS(run(algorithm, options), std::invalid_argument);
    }
}
