//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Exceptions raised by the engine.
//
// Configuration errors (representation mismatch, invalid initializer, invalid topology, invalid options)
// are raised while a model is being built. The remaining errors are raised while running.

#include <stdexcept>
#include <string>
#include <vector>

class RepresentationMismatchError : public std::runtime_error
{
  public:
    RepresentationMismatchError(const std::string &operation_name, const std::string &representation);

    const std::string operation_name;
    const std::string representation;
};

class InvalidInitializerError : public std::runtime_error
{
  public:
    InvalidInitializerError(const std::string &operation_name);
};

class IncompatibleRepresentationError : public std::runtime_error
{
  public:
    IncompatibleRepresentationError(const std::string &what) : std::runtime_error(what)
    {
    }
};

class InvalidTopologyError : public std::runtime_error
{
  public:
    InvalidTopologyError(const std::string &what) : std::runtime_error(what)
    {
    }
};

class MissingFitnessError : public std::runtime_error
{
  public:
    MissingFitnessError(const std::string &operation_name);
};

class MigrationTimeoutError : public std::runtime_error
{
  public:
    MigrationTimeoutError(long long timeout_ms);
};

class BootstrapTimeoutError : public std::runtime_error
{
  public:
    // Leader side: nodes that never connected and nodes without a worker process.
    BootstrapTimeoutError(std::vector<std::string> disconnected, std::vector<std::string> uninitiated);
    // Worker side: no initiate message within the timeout.
    BootstrapTimeoutError(long long timeout_ms);

    const std::vector<std::string> disconnected;
    const std::vector<std::string> uninitiated;
};

class UsageError : public std::runtime_error
{
  public:
    UsageError(const std::string &what) : std::runtime_error(what)
    {
    }
};

// A call to another node failed, or a population on another node failed.
class RemoteError : public std::runtime_error
{
  public:
    RemoteError(const std::string &what) : std::runtime_error(what)
    {
    }
};
