//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Establishing the set of nodes taking part in a distributed run.
//
// A leader process connects to a list of worker nodes and initiates them. Worker processes wait to be
// initiated, host populations for the leader, and exit once the leader has gone away.

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "remote.hpp"

// Name under which worker processes register themselves.
extern const std::string WORKER_NAME;

/**
 * @brief Discovery and initiation of other nodes, as seen by a leader.
 */
class INodeConnector
{
  public:
    virtual ~INodeConnector() = default;

    // Whether the node could be reached.
    virtual bool connect(const std::string &node) = 0;
    // Whether a worker process is registered on the (connected) node.
    virtual bool lookupWorker(const std::string &node) = 0;
    virtual void initiate(const std::string &node, const std::string &leader) = 0;
};

class GrpcNodeConnector : public INodeConnector
{
    std::chrono::milliseconds connect_timeout;

    std::mutex mtx;
    std::map<std::string, std::shared_ptr<grpc::Channel>> channels;

    std::shared_ptr<grpc::Channel> getChannel(const std::string &node);

  public:
    GrpcNodeConnector(std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(1000));

    bool connect(const std::string &node) override;
    bool lookupWorker(const std::string &node) override;
    void initiate(const std::string &node, const std::string &leader) override;
};

struct LeaderOptions
{
    size_t max_attempts = 60;
    std::chrono::milliseconds attempt_gap{1000};
    // Address the workers will know the leader by.
    std::string leader_id;
};

/**
 * @brief Connects to and initiates all worker nodes.
 *
 * Nodes progress from disconnected, to connected but uninitiated, to initiated. Every attempt
 * advances all nodes as far as possible.
 *
 * @throws BootstrapTimeoutError when some nodes are not initiated after `max_attempts` attempts.
 */
void initLeader(const std::vector<std::string> &worker_nodes, INodeConnector &connector, const LeaderOptions &options);

struct WorkerOptions
{
    // Time to wait for a leader to initiate this node.
    std::chrono::milliseconds timeout{60000};
    std::chrono::milliseconds leader_poll_interval{1000};
    // Deadline of a single ping. A busy leader may take a while to answer.
    std::chrono::milliseconds ping_timeout{5000};
    // Consecutive unanswered pings after which the leader counts as gone.
    size_t max_missed_pings = 3;
};

/**
 * @brief Registers this node as a worker, and blocks until its leader is gone.
 *
 * @throws BootstrapTimeoutError when no leader initiates this node within `timeout`.
 */
void initWorker(NodeRuntime &runtime, const WorkerOptions &options);

// Calls `ping` every `leader_poll_interval`, returning once `max_missed_pings` calls in a row failed.
void watchLeader(const std::function<bool()> &ping, const WorkerOptions &options);

// Called on the leader once all workers are initiated, with all nodes (the leader first).
using LeaderFunction = std::function<void(NodeRuntime &runtime, const std::vector<std::string> &nodes)>;

struct CliOptions
{
    // Address to serve this node on, from ARCHIPELAGO_NODE if set.
    std::string node_address = defaultNodeAddress();
    LeaderOptions leader_options;
    WorkerOptions worker_options;

    static std::string defaultNodeAddress();
};

/**
 * @brief Starts this process as the leader or a worker, depending on the command line.
 *
 * Accepts either `leader <worker node>...` or `worker`.
 *
 * @throws UsageError for any other command line.
 */
void initFromCliArgs(int argc,
                     const char *const argv[],
                     const Algorithm &algorithm,
                     LeaderFunction leader_fun,
                     const CliOptions &options = {});
