#include <catch2/catch.hpp>

#include <algorithm>

#include "pipeline.hpp"
#include "test_helpers.hpp"
#include "vector_ops.hpp"

TEST_CASE("Initializers", "[VectorOps]")
{
    OperationContext ctx = singlePopulationContext(sumObjective<double>);

    SECTION("Real genomes lie within bounds")
    {
        Population p = applyOperation(Population(), *initRealRandomUniform(20, 5, -2.0, 3.0), ctx);
        REQUIRE(p.tag() == "real");
        REQUIRE(populationSize(p) == 20);
        for (auto &genome : RealRepresentation::genomes(p.genomes))
        {
            REQUIRE(genome.size() == 5);
            for (double gene : genome)
                REQUIRE((gene >= -2.0 && gene <= 3.0));
        }
    }
    SECTION("Binary genomes only contain zeros and ones")
    {
        Population p = applyOperation(Population(), *initBinaryRandomUniform(10, 8), ctx);
        REQUIRE(p.tag() == "binary");
        for (auto &genome : BinaryRepresentation::genomes(p.genomes))
            for (auto gene : genome)
                REQUIRE(gene <= 1);
    }
    SECTION("Permutation genomes are permutations")
    {
        Population p = applyOperation(Population(), *initPermutationRandom(10, 6), ctx);
        REQUIRE(p.tag() == "permutation");
        for (auto genome : PermutationRepresentation::genomes(p.genomes))
        {
            std::sort(genome.begin(), genome.end());
            REQUIRE(genome == std::vector<int64_t>{0, 1, 2, 3, 4, 5});
        }
    }
    SECTION("Invalid bounds are refused")
    {
        REQUIRE_THROWS_AS(initRealRandomUniform(1, 1, 1.0, 0.0), std::invalid_argument);
    }
}

TEST_CASE("Selection", "[VectorOps]")
{
    OperationContext ctx = singlePopulationContext(sumObjective<int>);
    Population p = countingPopulation(6);

    SECTION("Natural selection keeps the fittest, fittest first")
    {
        Population selected = pipeThroughOperation(p, selectionNatural(3), ctx);
        REQUIRE(listGenomes(selected) == GenomeMatrix<int>{{5}, {4}, {3}});
        REQUIRE(ListRepresentation::fitness(selected.fitness) == FitnessVector{5.0, 4.0, 3.0});
    }
    SECTION("Natural selection of more individuals than available keeps everyone")
    {
        REQUIRE(populationSize(pipeThroughOperation(p, selectionNatural(10), ctx)) == 6);
    }
    SECTION("Tournament selection picks the requested number of individuals")
    {
        Population selected = pipeThroughOperation(p, selectionTournament(10, 3), ctx);
        REQUIRE(populationSize(selected) == 10);
    }
    SECTION("A tournament over the whole population always picks the best")
    {
        Population single = countingPopulation(1);
        Population selected = pipeThroughOperation(single, selectionTournament(4, 2), ctx);
        REQUIRE(listGenomes(selected) == GenomeMatrix<int>{{0}, {0}, {0}, {0}});
    }
}

TEST_CASE("Variation", "[VectorOps]")
{
    OperationContext ctx = singlePopulationContext(sumObjective<uint8_t>);
    Population p;
    p.representation = binaryRepresentation();
    p.genomes = GenomeMatrix<uint8_t>{{0, 0, 0, 0}, {1, 1, 1, 1}, {0, 1, 0, 1}};

    SECTION("Flipping every bit inverts the genomes")
    {
        Population flipped = Pipeline({mutationBitFlip(1.0)}).apply(p, ctx);
        REQUIRE(BinaryRepresentation::genomes(flipped.genomes) ==
                GenomeMatrix<uint8_t>{{1, 1, 1, 1}, {0, 0, 0, 0}, {1, 0, 1, 0}});
    }
    SECTION("A zero probability leaves genomes untouched")
    {
        Population same = Pipeline({mutationBitFlip(0.0)}).apply(p, ctx);
        REQUIRE(BinaryRepresentation::genomes(same.genomes) == BinaryRepresentation::genomes(p.genomes));
    }
    SECTION("Uniform crossover swaps genes between paired parents only")
    {
        Population offspring = Pipeline({crossoverUniform(0.5)}).apply(p, ctx);
        auto &genomes = BinaryRepresentation::genomes(offspring.genomes);
        for (size_t gene = 0; gene < 4; ++gene)
            REQUIRE(genomes[0][gene] + genomes[1][gene] == 1);
        // The unpaired last individual is kept as is.
        REQUIRE(genomes[2] == std::vector<uint8_t>{0, 1, 0, 1});
    }
    SECTION("Variation invalidates fitness")
    {
        p.fitness = sumObjective<uint8_t>(p.genomes);
        REQUIRE(!Pipeline({crossoverUniform()}).apply(p, ctx).hasFitness());
    }
    SECTION("Probabilities outside [0, 1] are refused")
    {
        REQUIRE_THROWS_AS(mutationBitFlip(1.5), std::invalid_argument);
        REQUIRE_THROWS_AS(crossoverUniform(-0.1), std::invalid_argument);
        REQUIRE_THROWS_AS(mutationShiftGaussian(0.5, 0.0), std::invalid_argument);
    }
}

TEST_CASE("Logging the best individual", "[VectorOps]")
{
    OperationContext ctx = singlePopulationContext(sumObjective<int>);
    Pipeline pipeline({logBestIndividual()});

    Population p = pipeline.apply(countingPopulation(4, 2), ctx);
    REQUIRE(p.log.at("best_fitness") == 3.0);
    REQUIRE(p.log.at("best_generation") == 2.0);
    REQUIRE(p.notes.at("best_genome") == "[3]");

    SECTION("A worse generation does not replace the record")
    {
        Population worse = slice(p, 0, 2);
        worse.generation = 3;
        worse = pipeline.apply(worse, ctx);
        REQUIRE(worse.log.at("best_fitness") == 3.0);
        REQUIRE(worse.log.at("best_generation") == 2.0);
        REQUIRE(worse.notes.at("best_genome") == "[3]");
    }
}

TEST_CASE("Genomes are formatted for reports", "[VectorOps]")
{
    REQUIRE(realRepresentation()->formatGenome(GenomeMatrix<double>{{0.5, -1.25}}, 0) == "[0.5, -1.25]");
    REQUIRE(binaryRepresentation()->formatGenome(GenomeMatrix<uint8_t>{{0, 1}, {1, 1, 0}}, 1) == "[1, 1, 0]");
}

TEST_CASE("Real genomes survive encoding", "[VectorOps]")
{
    GenomeMatrix<double> genomes = {{0.5, -1.25}, {3.0, 1e-9}};
    auto representation = realRepresentation();
    Genomes decoded = representation->decodeGenomes(representation->encodeGenomes(genomes));
    REQUIRE(RealRepresentation::genomes(decoded) == genomes);
}
