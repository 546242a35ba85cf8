//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Running an algorithm: spawning one worker per population across nodes and collecting the results.

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "algorithm.hpp"
#include "population_host.hpp"
#include "report.hpp"

struct RunOptions
{
    // Nodes to run populations on. Empty runs everything on the local node.
    std::vector<std::string> nodes;
    // One group of population indices per node. Empty splits populations evenly over the nodes.
    std::vector<std::vector<size_t>> population_groups;
    // Seeds the random generators of all populations, random if not set.
    std::optional<uint64_t> seed;
};

/**
 * @brief A node the runner can place populations on.
 */
class INodeHandle
{
  public:
    virtual ~INodeHandle() = default;

    virtual void startPopulations(const std::string &run_id,
                                  const std::vector<size_t> &indices,
                                  std::optional<uint64_t> seed) = 0;
    virtual void setRoster(const std::string &run_id, const Roster &roster) = 0;
    virtual std::vector<PopulationReport> awaitReports(const std::string &run_id) = 0;
    virtual void abandon(const std::string &run_id) = 0;
};

class LocalNodeHandle : public INodeHandle
{
    std::shared_ptr<PopulationHost> host;

  public:
    LocalNodeHandle(std::shared_ptr<PopulationHost> host);

    void startPopulations(const std::string &run_id,
                          const std::vector<size_t> &indices,
                          std::optional<uint64_t> seed) override;
    void setRoster(const std::string &run_id, const Roster &roster) override;
    std::vector<PopulationReport> awaitReports(const std::string &run_id) override;
    void abandon(const std::string &run_id) override;
};

using NodeConnectFunction = std::function<std::shared_ptr<INodeHandle>(const std::string &node)>;

/**
 * @brief Coordinates runs of the algorithm hosted by `host`.
 *
 * Populations assigned to the host's own node run in this process, others are placed on remote
 * nodes obtained through `connect_remote`.
 */
class Runner
{
    std::shared_ptr<PopulationHost> host;
    NodeConnectFunction connect_remote;

  public:
    Runner(std::shared_ptr<PopulationHost> host, NodeConnectFunction connect_remote = nullptr);

    Report run(const RunOptions &options = {});
};

// Runs all populations of the algorithm in the current process.
Report run(const Algorithm &algorithm, const RunOptions &options = {});

// Contiguous groups of (almost) equal size, earlier groups take the remainder.
std::vector<std::vector<size_t>> splitEvenly(size_t num_populations, size_t num_groups);

// Throws std::invalid_argument unless every population is in exactly one of `num_nodes` groups.
void validatePopulationGroups(const std::vector<std::vector<size_t>> &groups, size_t num_populations, size_t num_nodes);
