//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#pragma once
// Reference genome encoding: every genome is a vector of genes, fitness is one double per genome.

#include <cstdint>
#include <sstream>

#include "cereal/archives/binary.hpp"
#include "cereal/types/vector.hpp"

#include "cppassert.h"
#include "representation.hpp"

template <typename T> using GenomeMatrix = std::vector<std::vector<T>>;
using FitnessVector = std::vector<double>;

template <typename T> class VectorRepresentation : public RepresentationSpec
{
    const std::string name;

    template <typename V> static std::string encode(const V &value)
    {
        std::ostringstream oss;
        {
            cereal::BinaryOutputArchive boa(oss);
            boa(value);
        }
        return oss.str();
    }
    template <typename V> static V decode(const std::string &data)
    {
        std::istringstream iss(data);
        cereal::BinaryInputArchive bia(iss);
        V value;
        bia(value);
        return value;
    }

  public:
    using Gene = T;

    VectorRepresentation(std::string name) : name(std::move(name))
    {
    }

    static const GenomeMatrix<T> &genomes(const Genomes &genomes)
    {
        return std::any_cast<const GenomeMatrix<T> &>(genomes);
    }
    static const FitnessVector &fitness(const Fitness &fitness)
    {
        return std::any_cast<const FitnessVector &>(fitness);
    }

    const std::string &tag() const override
    {
        return name;
    }

    size_t populationSize(const Genomes &g) const override
    {
        return genomes(g).size();
    }

    Genomes concatenateGenomes(const std::vector<Genomes> &gs) const override
    {
        GenomeMatrix<T> result;
        for (auto &g : gs)
        {
            auto &m = genomes(g);
            result.insert(result.end(), m.begin(), m.end());
        }
        return result;
    }
    Fitness concatenateFitness(const std::vector<Fitness> &fs) const override
    {
        FitnessVector result;
        for (auto &f : fs)
        {
            auto &v = fitness(f);
            result.insert(result.end(), v.begin(), v.end());
        }
        return result;
    }

    Genomes sliceGenomes(const Genomes &g, size_t begin, size_t end) const override
    {
        auto &m = genomes(g);
        t_assert(begin <= end && end <= m.size(), "Slice should lie within the genomes.");
        return GenomeMatrix<T>(m.begin() + static_cast<std::ptrdiff_t>(begin),
                               m.begin() + static_cast<std::ptrdiff_t>(end));
    }
    Fitness sliceFitness(const Fitness &f, size_t begin, size_t end) const override
    {
        auto &v = fitness(f);
        t_assert(begin <= end && end <= v.size(), "Slice should lie within the fitness values.");
        return FitnessVector(v.begin() + static_cast<std::ptrdiff_t>(begin),
                             v.begin() + static_cast<std::ptrdiff_t>(end));
    }

    std::string encodeGenomes(const Genomes &g) const override
    {
        return encode(genomes(g));
    }
    Genomes decodeGenomes(const std::string &data) const override
    {
        return decode<GenomeMatrix<T>>(data);
    }
    std::string encodeFitness(const Fitness &f) const override
    {
        return encode(fitness(f));
    }
    Fitness decodeFitness(const std::string &data) const override
    {
        return decode<FitnessVector>(data);
    }

    std::string formatGenome(const Genomes &g, size_t idx) const override
    {
        auto &m = genomes(g);
        t_assert(idx < m.size(), "Genome index should lie within the genomes.");
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < m[idx].size(); ++i)
        {
            if (i > 0)
                oss << ", ";
            // Promotes single byte genes, so they print as numbers.
            oss << +m[idx][i];
        }
        oss << "]";
        return oss.str();
    }
};

using RealRepresentation = VectorRepresentation<double>;
using BinaryRepresentation = VectorRepresentation<uint8_t>;
using PermutationRepresentation = VectorRepresentation<int64_t>;

// Shared instances, tagged "real", "binary" and "permutation".
std::shared_ptr<const RealRepresentation> realRepresentation();
std::shared_ptr<const BinaryRepresentation> binaryRepresentation();
std::shared_ptr<const PermutationRepresentation> permutationRepresentation();
