//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Hosting populations on behalf of other processes, and reaching populations hosted elsewhere, over gRPC.

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "algorithm.hpp"
#include "population_host.hpp"
#include "rpc.h"
#include "runner.hpp"

// Conversions between populations and their wire format, using the representation's own encoding.
EncodedMigrants encodeMigrants(const MigrantBatch &batch, const RepresentationRegistry &registry);
MigrantBatch decodeMigrants(const EncodedMigrants &encoded, const RepresentationRegistry &registry);
void encodePopulation(const Population &population, EncodedPopulation *encoded);
Population decodePopulation(const EncodedPopulation &encoded, const RepresentationRegistry &registry);

// Throws RemoteError describing the failed call if the status is not OK.
void checkStatus(const grpc::Status &status, const std::string &call, const std::string &node);

/**
 * @brief Discovery endpoint of a process: registered names, the leader's initiate message, liveness.
 */
class BootstrapService final : public Bootstrap::Service
{
    std::mutex mtx;
    std::string node_id;
    std::set<std::string> names;
    std::promise<std::string> leader_promise;
    std::shared_future<std::string> leader;
    std::optional<std::string> initiated_by;

  public:
    BootstrapService();

    // The address this process is reachable at, known once the server has started.
    void setNode(const std::string &node);
    void registerName(const std::string &name);
    // Resolves to the address of the leader once it initiated this process.
    std::shared_future<std::string> getLeader()
    {
        return leader;
    }

    grpc::Status Lookup(grpc::ServerContext *context,
                        const BootstrapLookupRequest *req,
                        BootstrapLookupResponse *res) override;
    grpc::Status Initiate(grpc::ServerContext *context,
                          const BootstrapInitiateRequest *req,
                          BootstrapInitiateResponse *res) override;
    grpc::Status Ping(grpc::ServerContext *context, const BootstrapPingRequest *req, BootstrapPingResponse *res) override;
};

/**
 * @brief Runs the populations a coordinator on another process assigns to this node.
 *
 * The process must have built the same Algorithm as the coordinator: requests with a different
 * population count or lineage fingerprint are rejected.
 */
class EvolutionService final : public Evolution::Service
{
    std::mutex mtx;
    std::shared_ptr<PopulationHost> host;

    std::shared_ptr<PopulationHost> getHost();

  public:
    // Requests are refused as unavailable until a host is attached.
    void attach(std::shared_ptr<PopulationHost> host);

    grpc::Status StartPopulations(grpc::ServerContext *context,
                                  const EvolutionStartPopulationsRequest *req,
                                  EvolutionStartPopulationsResponse *res) override;
    grpc::Status SetRoster(grpc::ServerContext *context,
                           const EvolutionSetRosterRequest *req,
                           EvolutionSetRosterResponse *res) override;
    grpc::Status DeliverMigrants(grpc::ServerContext *context,
                                 const EvolutionDeliverMigrantsRequest *req,
                                 EvolutionDeliverMigrantsResponse *res) override;
    grpc::Status AwaitReports(grpc::ServerContext *context,
                              const EvolutionAwaitReportsRequest *req,
                              EvolutionAwaitReportsResponse *res) override;
    grpc::Status AbandonRun(grpc::ServerContext *context,
                            const EvolutionAbandonRunRequest *req,
                            EvolutionAbandonRunResponse *res) override;
};

/**
 * @brief Sends migrants to the Evolution service of the node hosting their target.
 */
class GrpcRemoteDelivery : public IRemoteDelivery
{
    std::shared_ptr<const Algorithm> algorithm;

    std::mutex mtx;
    std::map<std::string, std::shared_ptr<Evolution::Stub>> stubs;

    std::shared_ptr<Evolution::Stub> getStub(const std::string &node);

  public:
    GrpcRemoteDelivery(std::shared_ptr<const Algorithm> algorithm);

    void deliver(const std::string &run_id, const PopulationAddress &target, const MigrantBatch &batch) override;
};

/**
 * @brief Places populations on another process through its Evolution service.
 */
class RemoteNodeHandle : public INodeHandle
{
    const std::string node;
    std::shared_ptr<const Algorithm> algorithm;
    std::shared_ptr<grpc::Channel> channel;
    std::unique_ptr<Evolution::Stub> stub;

  public:
    RemoteNodeHandle(std::string node, std::shared_ptr<const Algorithm> algorithm);

    void startPopulations(const std::string &run_id,
                          const std::vector<size_t> &indices,
                          std::optional<uint64_t> seed) override;
    void setRoster(const std::string &run_id, const Roster &roster) override;
    std::vector<PopulationReport> awaitReports(const std::string &run_id) override;
    void abandon(const std::string &run_id) override;
};

/**
 * @brief A process participating in distributed runs.
 *
 * Serves the Bootstrap and Evolution services on `listen_address` and hosts populations for runs
 * coordinated by itself or by other nodes. The node is identified by the listen address, with the
 * port replaced by the port actually selected (relevant when listening on port 0).
 */
class NodeRuntime
{
    std::shared_ptr<const Algorithm> algorithm;
    std::shared_ptr<PopulationHost> host;
    std::unique_ptr<BootstrapService> bootstrap;
    std::unique_ptr<EvolutionService> evolution;
    std::unique_ptr<grpc::Server> server;
    std::string node_id;

  public:
    NodeRuntime(std::shared_ptr<const Algorithm> algorithm, const std::string &listen_address);
    ~NodeRuntime();

    NodeRuntime(const NodeRuntime &) = delete;
    NodeRuntime &operator=(const NodeRuntime &) = delete;

    const std::string &node() const
    {
        return node_id;
    }
    const Algorithm &getAlgorithm() const
    {
        return *algorithm;
    }
    BootstrapService &getBootstrap()
    {
        return *bootstrap;
    }

    // Coordinates a run from this node. Nodes other than this one must run a NodeRuntime as well.
    Report run(const RunOptions &options = {});

    void shutdown();
};
