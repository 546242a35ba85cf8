// OneMax on four islands connected in a ring.
//
// Without arguments all islands run in this process. To distribute them, start workers with
//   ARCHIPELAGO_NODE=127.0.0.1:50052 ./islands worker
// and the leader with
//   ARCHIPELAGO_NODE=127.0.0.1:50051 ./islands leader 127.0.0.1:50052

#include <iostream>
#include <numeric>

#include "distribution.hpp"
#include "migration.hpp"
#include "ops.hpp"
#include "runner.hpp"
#include "vector_ops.hpp"

#include "spdlog/spdlog.h"

namespace
{
const size_t string_length = 100;
const size_t population_size = 100;

Fitness oneMax(const Genomes &genomes)
{
    auto &genes = BinaryRepresentation::genomes(genomes);
    FitnessVector fitness;
    fitness.reserve(genes.size());
    for (auto &genome : genes)
        fitness.push_back(static_cast<double>(std::accumulate(genome.begin(), genome.end(), 0)));
    return fitness;
}

Algorithm buildAlgorithm()
{
    Algorithm algorithm(oneMax);
    algorithm.addPipeline(initBinaryRandomUniform(population_size, string_length),
                          Pipeline({selectionTournament(population_size),
                                    crossoverUniform(0.5),
                                    mutationBitFlip(0.01),
                                    emigrate(selectionTournament(5), topology::ring, EmigrateOptions{10}),
                                    immigrate([](size_t n) { return selectionNatural(n); }, ImmigrateOptions{10}),
                                    logBestIndividual(),
                                    maxGenerations(200)}),
                          4);
    return algorithm;
}
} // namespace

int main(int argc, char **argv)
{
    spdlog::set_level(spdlog::level::info);
    Algorithm algorithm = buildAlgorithm();

    if (argc <= 1)
    {
        Report report = run(algorithm);
        std::cout << formatSummary(report) << std::endl;
        return 0;
    }

    try
    {
        initFromCliArgs(argc, argv, algorithm, [](NodeRuntime &runtime, const std::vector<std::string> &nodes) {
            RunOptions options;
            options.nodes = nodes;
            Report report = runtime.run(options);
            std::cout << formatSummary(report) << std::endl;
        });
    }
    catch (std::exception &e)
    {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
