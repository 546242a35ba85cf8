//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Genome-encoding capabilities required by the engine.
//
// Genomes and fitness are opaque to the engine: they are stored type-erased, and only a
// RepresentationSpec knows how to measure, concatenate, slice and encode them.

#include <any>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using Genomes = std::any;
using Fitness = std::any;

class RepresentationSpec
{
  public:
    virtual ~RepresentationSpec() = default;

    // Unique name of this representation, e.g. "real" or "binary".
    virtual const std::string &tag() const = 0;

    virtual size_t populationSize(const Genomes &genomes) const = 0;

    virtual Genomes concatenateGenomes(const std::vector<Genomes> &genomes) const = 0;
    // Order of individuals matches concatenateGenomes.
    virtual Fitness concatenateFitness(const std::vector<Fitness> &fitness) const = 0;

    // Individuals [begin, end).
    virtual Genomes sliceGenomes(const Genomes &genomes, size_t begin, size_t end) const = 0;
    virtual Fitness sliceFitness(const Fitness &fitness, size_t begin, size_t end) const = 0;

    // Byte encodings used to move individuals between nodes.
    virtual std::string encodeGenomes(const Genomes &genomes) const = 0;
    virtual Genomes decodeGenomes(const std::string &data) const = 0;
    virtual std::string encodeFitness(const Fitness &fitness) const = 0;
    virtual Fitness decodeFitness(const std::string &data) const = 0;

    // Human readable form of a single genome, for reports.
    virtual std::string formatGenome(const Genomes &genomes, size_t idx) const = 0;
};

using RepresentationPtr = std::shared_ptr<const RepresentationSpec>;

/**
 * @brief Lookup of representations by tag.
 *
 * Used to decode populations and migrants arriving from other nodes, where only the tag is known.
 */
class RepresentationRegistry
{
    mutable std::mutex mtx;
    std::map<std::string, RepresentationPtr> representations;

  public:
    RepresentationRegistry() = default;
    RepresentationRegistry(const RepresentationRegistry &o);
    RepresentationRegistry &operator=(const RepresentationRegistry &o);

    // Registering a different representation under an existing tag is an error.
    void add(RepresentationPtr representation);

    RepresentationPtr get(const std::string &tag) const;
    bool contains(const std::string &tag) const;
    std::vector<std::string> tags() const;
};
