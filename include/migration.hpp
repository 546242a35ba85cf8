//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Multi-population operations: the sending (emigration) and receiving (immigration) sides of migration.

#include <chrono>
#include <functional>

#include "operation.hpp"
#include "topology.hpp"

/**
 * @brief Delivers migrant batches to population workers.
 *
 * Sending must not block on the receiving worker: the batch is queued in the target's mailbox.
 */
class IMigrationTransport
{
  public:
    virtual ~IMigrationTransport() = default;

    virtual void send(const PopulationAddress &target, MigrantBatch batch) = 0;
};

// Number of emigration targets, drawn uniformly from [min, max] every time.
struct NumberOfTargets
{
    size_t min = 1;
    size_t max = 1;

    NumberOfTargets() = default;
    NumberOfTargets(size_t n) : min(n), max(n)
    {
    }
    NumberOfTargets(size_t min, size_t max) : min(min), max(max)
    {
    }
};

struct EmigrateOptions
{
    // Emigration happens on generations divisible by the interval.
    size_t interval = 1;
    NumberOfTargets number_of_targets;
};

struct ImmigrateOptions
{
    size_t interval = 1;
    // Wait for immigrants if none are queued yet. Not blocking is faster but less deterministic.
    bool blocking = true;
    // Waiting longer than this most likely means populations are waiting on each other.
    std::chrono::milliseconds timeout = std::chrono::milliseconds(20000);
};

/**
 * @brief Builds an emigration operation.
 *
 * Selects emigrants with `selection` and sends them to randomly drawn neighbours according to
 * `topology`. Does not alter the population itself.
 */
OperationPtr emigrate(OperationPtr selection, TopologyFunction topology, EmigrateOptions options = {});

// Given the size to shrink the population to, returns the selection operation doing so.
using SizeToSelection = std::function<OperationPtr(size_t)>;

/**
 * @brief Builds an immigration operation.
 *
 * Receives a batch of migrants and replaces part of the population with them: the population is
 * first shrunk by the selection returned by `size_to_selection`, then the immigrants are appended.
 * The population size is preserved as long as the batch is not larger than the population.
 */
OperationPtr immigrate(SizeToSelection size_to_selection, ImmigrateOptions options = {});
