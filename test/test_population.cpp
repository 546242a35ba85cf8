#include <catch2/catch.hpp>

#include "errors.hpp"
#include "population.hpp"
#include "test_helpers.hpp"

TEST_CASE("Duplicating and concatenating populations", "[Population]")
{
    Population p = countingPopulation(4);

    SECTION("Concatenating k duplicates gives k times the individuals with the same representation")
    {
        Population joined = concatenate(duplicate(p, 3));
        REQUIRE(populationSize(joined) == 12);
        REQUIRE(joined.tag() == "list");
        REQUIRE(listGenomes(joined)[4] == std::vector<int>{0});
    }

    SECTION("Fitness is kept only when every part has fitness")
    {
        Population with_fitness = p;
        with_fitness.fitness = sumObjective<int>(p.genomes);

        Population both = concatenate({with_fitness, with_fitness});
        REQUIRE(both.hasFitness());
        REQUIRE(ListRepresentation::fitness(both.fitness).size() == 8);

        Population partial = concatenate({with_fitness, p});
        REQUIRE(!partial.hasFitness());
    }

    SECTION("The joined population takes the latest generation and any termination")
    {
        Population older = countingPopulation(2, 3);
        Population newer = countingPopulation(2, 7);
        newer.terminated = true;
        newer.log["best_fitness"] = 1.0;

        Population joined = concatenate({older, newer});
        REQUIRE(joined.generation == 7);
        REQUIRE(joined.terminated);
        REQUIRE(joined.log.at("best_fitness") == 1.0);
    }

    SECTION("Populations of different representations cannot be joined")
    {
        Population other = p;
        other.representation = realRepresentation();
        REQUIRE_THROWS_AS(concatenate({p, other}), IncompatibleRepresentationError);
    }
}

TEST_CASE("Slicing populations", "[Population]")
{
    Population p = countingPopulation(5);
    p.fitness = sumObjective<int>(p.genomes);

    Population part = slice(p, 1, 3);
    REQUIRE(populationSize(part) == 2);
    REQUIRE(listGenomes(part) == GenomeMatrix<int>{{1}, {2}});
    REQUIRE(ListRepresentation::fitness(part.fitness) == FitnessVector{1.0, 2.0});

    REQUIRE(populationSize(slice(p, 2, 2)) == 0);
}

TEST_CASE("Representation registry", "[Population]")
{
    RepresentationRegistry registry;
    registry.add(listRepresentation());

    SECTION("Registering the same representation twice is fine")
    {
        registry.add(listRepresentation());
        REQUIRE(registry.tags() == std::vector<std::string>{"list"});
        REQUIRE(registry.get("list") == listRepresentation());
    }
    SECTION("A different representation under an existing tag is refused")
    {
        REQUIRE_THROWS_AS(registry.add(std::make_shared<ListRepresentation>("list")), IncompatibleRepresentationError);
    }
    SECTION("Unknown tags cannot be looked up")
    {
        REQUIRE(!registry.contains("real"));
        REQUIRE_THROWS_AS(registry.get("real"), IncompatibleRepresentationError);
    }
}
