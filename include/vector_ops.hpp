//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Operations for the reference vector encoding.
//
// Selection and logging only rely on fitness being a FitnessVector, and therefore accept any
// representation whose fitness is. Variation operators work on specific gene types.

#include <vector>

#include "operation.hpp"
#include "vector_representation.hpp"

// Initializers
OperationPtr initRealRandomUniform(size_t n, size_t length, double min, double max);
OperationPtr initBinaryRandomUniform(size_t n, size_t length);
OperationPtr initPermutationRandom(size_t n, size_t length);

// Selection

// Keeps the n fittest individuals, fittest first.
OperationPtr selectionNatural(size_t n);
// Picks n individuals, each being the fitter of `tournament_size` uniformly drawn ones.
OperationPtr selectionTournament(size_t n, size_t tournament_size = 2);

// Variation

// Consecutive individuals are paired, and each pair swaps every gene with the given probability.
OperationPtr crossoverUniform(double probability = 0.5);
OperationPtr mutationBitFlip(double probability);
OperationPtr mutationShiftGaussian(double probability, double sigma = 1.0);

// Logging

// Records "best_fitness" and "best_generation" of the best individual seen so far.
OperationPtr logBestIndividual();

// Individuals at the given indices, in order; fitness is preserved when present.
Population takeIndividuals(const Population &population, const std::vector<size_t> &indices);
