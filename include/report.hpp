//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Final results of a run.

#include <cstdint>
#include <string>
#include <vector>

#include "population.hpp"

struct PopulationReport
{
    std::string node;
    size_t index = 0;
    // Wall time of this population's worker, from receiving the roster to termination.
    uint64_t time_us = 0;
    Population population;
};

struct Report
{
    uint64_t total_time_us = 0;
    // Ordered by population index.
    std::vector<PopulationReport> population_reports;
};

/**
 * @brief Summary of a report as human readable text.
 *
 * Includes run times and mean generations, and if any population logged "best_fitness", the best one
 * along with its genome.
 */
std::string formatSummary(const Report &report);
