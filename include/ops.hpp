//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Core operations, independent of any genome representation.

#include <functional>
#include <vector>

#include "pipeline.hpp"

// Terminates the population once its generation reaches `generations`.
OperationPtr maxGenerations(size_t generations);

using SplitFunction = std::function<std::vector<Population>(const Population &)>;
using JoinFunction = std::function<Population(const std::vector<Population> &)>;
using PopulationPredicate = std::function<bool(const Population &)>;

/**
 * @brief Introduces branching into the pipeline.
 *
 * The population is split into as many populations as there are pipelines, each part passes through
 * its own pipeline, after which the results are joined back into a single population.
 *
 * If any branch starts with an operation that requires fitness, so does this operation.
 */
OperationPtr splitJoin(SplitFunction split, std::vector<Pipeline> pipelines, JoinFunction join);

// Passes the population through one of two pipelines, depending on the predicate.
OperationPtr ifElse(PopulationPredicate predicate, Pipeline on_true, Pipeline on_false);

// Splits into k contiguous parts of (almost) equal size, earlier parts take the remainder.
SplitFunction splitEven(size_t k);
JoinFunction joinConcatenate();
