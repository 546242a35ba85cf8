#include <catch2/catch.hpp>

#include "algorithm.hpp"
#include "errors.hpp"
#include "ops.hpp"
#include "test_helpers.hpp"
#include "vector_ops.hpp"

TEST_CASE("Building an algorithm", "[Algorithm]")
{
    Algorithm algorithm(sumObjective<double>);

    SECTION("Lineages are expanded into one entry per population")
    {
        algorithm.addPipeline(initRealRandomUniform(10, 3, -1.0, 1.0), Pipeline({maxGenerations(5)}), 3);
        algorithm.addPipeline(initCounting(4), Pipeline({maxGenerations(2)}));
        REQUIRE(algorithm.numPopulations() == 4);
        REQUIRE(algorithm.lineage(2).initializer->name == "Initialization: real random uniform");
        REQUIRE(algorithm.lineage(3).initializer->name == "Initialization: counting");
        REQUIRE(algorithm.representations().contains("real"));
        REQUIRE(algorithm.representations().contains("list"));
    }

    SECTION("The pipeline has to start with an initializer")
    {
        REQUIRE_THROWS_AS(algorithm.addPipeline(maxGenerations(5), Pipeline({maxGenerations(5)})),
                          InvalidInitializerError);
        REQUIRE(algorithm.numPopulations() == 0);
    }

    SECTION("A representation mismatch is reported while building")
    {
        try
        {
            algorithm.addPipeline(initRealRandomUniform(10, 3, -1.0, 1.0),
                                  Pipeline({mutationBitFlip(0.1), maxGenerations(5)}));
            FAIL("Expected a RepresentationMismatchError");
        }
        catch (RepresentationMismatchError &e)
        {
            REQUIRE(e.operation_name == "Mutation: bit flip");
            REQUIRE(e.representation == "real");
            REQUIRE(std::string(e.what()).find("Mutation: bit flip") != std::string::npos);
        }
        REQUIRE(algorithm.numPopulations() == 0);
    }

    SECTION("Identically built algorithms share a fingerprint")
    {
        Algorithm other(sumObjective<double>);
        algorithm.addPipeline(initRealRandomUniform(10, 3, -1.0, 1.0), Pipeline({maxGenerations(5)}), 2);
        other.addPipeline(initRealRandomUniform(10, 3, -1.0, 1.0), Pipeline({maxGenerations(5)}), 2);
        REQUIRE(algorithm.fingerprint() == other.fingerprint());

        other.addPipeline(initCounting(4), Pipeline({maxGenerations(5)}));
        REQUIRE(algorithm.fingerprint() != other.fingerprint());
    }
}
