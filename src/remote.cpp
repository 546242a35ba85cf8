//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "remote.hpp"

#include <chrono>

#include "cppassert.h"
#include "errors.hpp"
#include "spdlog/spdlog.h"

// Codec
EncodedMigrants encodeMigrants(const MigrantBatch &batch, const RepresentationRegistry &registry)
{
    auto representation = registry.get(batch.representation);
    EncodedMigrants encoded;
    encoded.set_source_index(batch.source_index);
    encoded.set_source_generation(batch.source_generation);
    encoded.set_representation(batch.representation);
    encoded.set_genomes(representation->encodeGenomes(batch.genomes));
    return encoded;
}
MigrantBatch decodeMigrants(const EncodedMigrants &encoded, const RepresentationRegistry &registry)
{
    auto representation = registry.get(encoded.representation());
    MigrantBatch batch;
    batch.source_index = static_cast<size_t>(encoded.source_index());
    batch.source_generation = static_cast<size_t>(encoded.source_generation());
    batch.representation = encoded.representation();
    batch.genomes = representation->decodeGenomes(encoded.genomes());
    return batch;
}
void encodePopulation(const Population &population, EncodedPopulation *encoded)
{
    t_assert(population.representation != nullptr, "Only initialized populations can be encoded.");
    encoded->set_representation(population.tag());
    encoded->set_genomes(population.representation->encodeGenomes(population.genomes));
    encoded->set_has_fitness(population.hasFitness());
    if (population.hasFitness())
        encoded->set_fitness(population.representation->encodeFitness(population.fitness));
    encoded->set_generation(population.generation);
    encoded->set_terminated(population.terminated);
    for (auto &[key, value] : population.log)
        (*encoded->mutable_log())[key] = value;
    for (auto &[key, value] : population.notes)
        (*encoded->mutable_notes())[key] = value;
}
Population decodePopulation(const EncodedPopulation &encoded, const RepresentationRegistry &registry)
{
    Population population;
    population.representation = registry.get(encoded.representation());
    population.genomes = population.representation->decodeGenomes(encoded.genomes());
    if (encoded.has_fitness())
        population.fitness = population.representation->decodeFitness(encoded.fitness());
    population.generation = static_cast<size_t>(encoded.generation());
    population.terminated = encoded.terminated();
    for (auto &entry : encoded.log())
        population.log[entry.first] = entry.second;
    for (auto &entry : encoded.notes())
        population.notes[entry.first] = entry.second;
    return population;
}

void checkStatus(const grpc::Status &status, const std::string &call, const std::string &node)
{
    if (status.ok())
        return;
    throw RemoteError(call + " on node " + node + " failed: " + status.error_message());
}

// BootstrapService
BootstrapService::BootstrapService() : leader(leader_promise.get_future().share())
{
}
void BootstrapService::setNode(const std::string &node)
{
    std::lock_guard<std::mutex> lock(mtx);
    node_id = node;
}
void BootstrapService::registerName(const std::string &name)
{
    std::lock_guard<std::mutex> lock(mtx);
    names.insert(name);
}
grpc::Status BootstrapService::Lookup(grpc::ServerContext * /* context */,
                                      const BootstrapLookupRequest *req,
                                      BootstrapLookupResponse *res)
{
    std::lock_guard<std::mutex> lock(mtx);
    res->set_found(names.count(req->name()) > 0);
    return grpc::Status::OK;
}
grpc::Status BootstrapService::Initiate(grpc::ServerContext * /* context */,
                                        const BootstrapInitiateRequest *req,
                                        BootstrapInitiateResponse * /* res */)
{
    std::lock_guard<std::mutex> lock(mtx);
    const std::string &leader_host = req->leader().host();
    if (initiated_by.has_value())
    {
        // Leaders retry, repeated messages from the same leader are harmless.
        if (*initiated_by == leader_host)
            return grpc::Status::OK;
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                            "already initiated by leader " + *initiated_by);
    }
    initiated_by = leader_host;
    leader_promise.set_value(leader_host);
    spdlog::info("initiated by leader {}", leader_host);
    return grpc::Status::OK;
}
grpc::Status BootstrapService::Ping(grpc::ServerContext * /* context */,
                                    const BootstrapPingRequest * /* req */,
                                    BootstrapPingResponse *res)
{
    std::lock_guard<std::mutex> lock(mtx);
    res->set_node(node_id);
    return grpc::Status::OK;
}

// EvolutionService
void EvolutionService::attach(std::shared_ptr<PopulationHost> host)
{
    std::lock_guard<std::mutex> lock(mtx);
    this->host = std::move(host);
}
std::shared_ptr<PopulationHost> EvolutionService::getHost()
{
    std::lock_guard<std::mutex> lock(mtx);
    return host;
}
grpc::Status EvolutionService::StartPopulations(grpc::ServerContext * /* context */,
                                                const EvolutionStartPopulationsRequest *req,
                                                EvolutionStartPopulationsResponse * /* res */)
{
    auto host = getHost();
    if (host == nullptr)
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "node is starting up");

    const Algorithm &algorithm = host->getAlgorithm();
    if (req->num_populations() != algorithm.numPopulations() || req->fingerprint() != algorithm.fingerprint())
    {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
                            "algorithm differs between nodes: coordinator has " +
                                std::to_string(req->num_populations()) + " populations (" + req->fingerprint() +
                                "), " + host->node() + " has " + std::to_string(algorithm.numPopulations()) +
                                " populations (" + algorithm.fingerprint() + ")");
    }

    std::vector<size_t> indices(req->indices().begin(), req->indices().end());
    std::optional<uint64_t> seed;
    if (req->has_seed())
        seed = req->seed();
    try
    {
        host->spawn(req->run_id(), indices, seed);
    }
    catch (std::exception &e)
    {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    }
    return grpc::Status::OK;
}
grpc::Status EvolutionService::SetRoster(grpc::ServerContext * /* context */,
                                         const EvolutionSetRosterRequest *req,
                                         EvolutionSetRosterResponse * /* res */)
{
    auto host = getHost();
    if (host == nullptr)
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "node is starting up");

    Roster roster;
    for (auto &entry : req->roster())
        roster.push_back(PopulationAddress{entry.node(), static_cast<size_t>(entry.index())});
    try
    {
        host->setRoster(req->run_id(), std::move(roster));
    }
    catch (std::exception &e)
    {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    }
    return grpc::Status::OK;
}
grpc::Status EvolutionService::DeliverMigrants(grpc::ServerContext * /* context */,
                                               const EvolutionDeliverMigrantsRequest *req,
                                               EvolutionDeliverMigrantsResponse * /* res */)
{
    auto host = getHost();
    if (host == nullptr)
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "node is starting up");

    try
    {
        auto batch = decodeMigrants(req->migrants(), host->getAlgorithm().representations());
        host->deliver(req->run_id(), static_cast<size_t>(req->target_index()), std::move(batch));
    }
    catch (std::exception &e)
    {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    }
    return grpc::Status::OK;
}
grpc::Status EvolutionService::AwaitReports(grpc::ServerContext * /* context */,
                                            const EvolutionAwaitReportsRequest *req,
                                            EvolutionAwaitReportsResponse *res)
{
    auto host = getHost();
    if (host == nullptr)
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "node is starting up");

    std::vector<PopulationReport> reports;
    try
    {
        reports = host->awaitReports(req->run_id());
    }
    catch (std::exception &e)
    {
        return grpc::Status(grpc::StatusCode::ABORTED, e.what());
    }

    for (auto &report : reports)
    {
        auto encoded = res->add_reports();
        encoded->set_node(report.node);
        encoded->set_index(report.index);
        encoded->set_time_us(report.time_us);
        encodePopulation(report.population, encoded->mutable_population());
    }
    return grpc::Status::OK;
}
grpc::Status EvolutionService::AbandonRun(grpc::ServerContext * /* context */,
                                          const EvolutionAbandonRunRequest *req,
                                          EvolutionAbandonRunResponse * /* res */)
{
    auto host = getHost();
    if (host == nullptr)
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "node is starting up");

    host->abandon(req->run_id());
    return grpc::Status::OK;
}

// GrpcRemoteDelivery
GrpcRemoteDelivery::GrpcRemoteDelivery(std::shared_ptr<const Algorithm> algorithm) : algorithm(std::move(algorithm))
{
}
std::shared_ptr<Evolution::Stub> GrpcRemoteDelivery::getStub(const std::string &node)
{
    std::lock_guard<std::mutex> lock(mtx);
    auto it = stubs.find(node);
    if (it != stubs.end())
        return it->second;

    auto channel = grpc::CreateChannel(node, grpc::InsecureChannelCredentials());
    std::shared_ptr<Evolution::Stub> stub = Evolution::NewStub(channel);
    stubs.emplace(node, stub);
    return stub;
}
void GrpcRemoteDelivery::deliver(const std::string &run_id, const PopulationAddress &target, const MigrantBatch &batch)
{
    auto stub = getStub(target.node);

    grpc::ClientContext context;
    EvolutionDeliverMigrantsRequest req;
    EvolutionDeliverMigrantsResponse res;
    req.set_run_id(run_id);
    req.set_target_index(target.index);
    *req.mutable_migrants() = encodeMigrants(batch, algorithm->representations());

    spdlog::debug("run {}: sending migrants from population {} to {}", run_id, batch.source_index, to_string(target));
    checkStatus(stub->DeliverMigrants(&context, req, &res), "DeliverMigrants", target.node);
}

// RemoteNodeHandle
RemoteNodeHandle::RemoteNodeHandle(std::string node, std::shared_ptr<const Algorithm> algorithm) :
    node(std::move(node)),
    algorithm(std::move(algorithm)),
    channel(grpc::CreateChannel(this->node, grpc::InsecureChannelCredentials())),
    stub(Evolution::NewStub(channel))
{
}
void RemoteNodeHandle::startPopulations(const std::string &run_id,
                                        const std::vector<size_t> &indices,
                                        std::optional<uint64_t> seed)
{
    grpc::ClientContext context;
    EvolutionStartPopulationsRequest req;
    EvolutionStartPopulationsResponse res;
    req.set_run_id(run_id);
    for (size_t index : indices)
        req.add_indices(index);
    req.set_num_populations(algorithm->numPopulations());
    req.set_fingerprint(algorithm->fingerprint());
    req.set_has_seed(seed.has_value());
    if (seed.has_value())
        req.set_seed(*seed);

    checkStatus(stub->StartPopulations(&context, req, &res), "StartPopulations", node);
}
void RemoteNodeHandle::setRoster(const std::string &run_id, const Roster &roster)
{
    grpc::ClientContext context;
    EvolutionSetRosterRequest req;
    EvolutionSetRosterResponse res;
    req.set_run_id(run_id);
    for (auto &address : roster)
    {
        auto entry = req.add_roster();
        entry->set_node(address.node);
        entry->set_index(address.index);
    }

    checkStatus(stub->SetRoster(&context, req, &res), "SetRoster", node);
}
std::vector<PopulationReport> RemoteNodeHandle::awaitReports(const std::string &run_id)
{
    grpc::ClientContext context;
    EvolutionAwaitReportsRequest req;
    EvolutionAwaitReportsResponse res;
    req.set_run_id(run_id);

    checkStatus(stub->AwaitReports(&context, req, &res), "AwaitReports", node);

    std::vector<PopulationReport> reports;
    for (auto &encoded : res.reports())
    {
        reports.push_back(PopulationReport{encoded.node(),
                                           static_cast<size_t>(encoded.index()),
                                           encoded.time_us(),
                                           decodePopulation(encoded.population(), algorithm->representations())});
    }
    return reports;
}
void RemoteNodeHandle::abandon(const std::string &run_id)
{
    grpc::ClientContext context;
    EvolutionAbandonRunRequest req;
    EvolutionAbandonRunResponse res;
    req.set_run_id(run_id);

    checkStatus(stub->AbandonRun(&context, req, &res), "AbandonRun", node);
}

// NodeRuntime
NodeRuntime::NodeRuntime(std::shared_ptr<const Algorithm> algorithm, const std::string &listen_address) :
    algorithm(std::move(algorithm)),
    bootstrap(std::make_unique<BootstrapService>()),
    evolution(std::make_unique<EvolutionService>())
{
    int selected_port = 0;
    grpc::ServerBuilder server_builder;
    server_builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials(), &selected_port);
    server_builder.RegisterService(bootstrap.get());
    server_builder.RegisterService(evolution.get());
    server = server_builder.BuildAndStart();
    if (server == nullptr || selected_port == 0)
        throw RemoteError("failed to listen on " + listen_address);

    node_id = listen_address.substr(0, listen_address.find_last_of(':') + 1) + std::to_string(selected_port);
    bootstrap->setNode(node_id);
    host = std::make_shared<PopulationHost>(
        node_id, this->algorithm, std::make_shared<GrpcRemoteDelivery>(this->algorithm));
    evolution->attach(host);
    spdlog::info("node {} is listening", node_id);
}
NodeRuntime::~NodeRuntime()
{
    shutdown();
}
Report NodeRuntime::run(const RunOptions &options)
{
    t_assert(server != nullptr, "A node that has shut down cannot run.");
    auto connect = [this](const std::string &node) -> std::shared_ptr<INodeHandle> {
        return std::make_shared<RemoteNodeHandle>(node, algorithm);
    };
    Runner runner(host, connect);
    return runner.run(options);
}
void NodeRuntime::shutdown()
{
    if (server == nullptr)
        return;

    // Workers still waiting for a roster would keep pending AwaitReports calls alive.
    for (auto &run_id : host->activeRuns())
        host->abandon(run_id);

    server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
    server.reset();
    spdlog::info("node {} has shut down", node_id);
}
