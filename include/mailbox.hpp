//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Addressing of population workers and the inbox through which they receive migrants.

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "representation.hpp"

struct PopulationAddress
{
    // Node hosting the population worker.
    std::string node;
    // Global population index, equal to the position in the roster.
    size_t index = 0;

    bool operator==(const PopulationAddress &o) const
    {
        return node == o.node && index == o.index;
    }
    bool operator!=(const PopulationAddress &o) const
    {
        return !(*this == o);
    }
};

using Roster = std::vector<PopulationAddress>;

std::string to_string(const PopulationAddress &address);

struct MigrantBatch
{
    size_t source_index = 0;
    size_t source_generation = 0;
    std::string representation;
    Genomes genomes;
};

/**
 * @brief Unbounded multi-producer, single-consumer queue of migrant batches.
 *
 * Written to by peers (emigration), read only by the owning worker (immigration).
 * Pushing never blocks.
 */
class Mailbox
{
    std::mutex mtx;
    std::condition_variable cv;
    std::deque<MigrantBatch> batches;

  public:
    void push(MigrantBatch batch);

    // Returns immediately, std::nullopt if nothing is queued.
    std::optional<MigrantBatch> tryPop();
    // Waits up to timeout for a batch, std::nullopt if none arrived.
    std::optional<MigrantBatch> popFor(std::chrono::milliseconds timeout);

    size_t size();
};
