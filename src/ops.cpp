//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "ops.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "cppassert.h"
#include "errors.hpp"

namespace
{
std::optional<std::set<std::string>> commonInRepresentations(const std::vector<Pipeline> &pipelines)
{
    std::optional<std::set<std::string>> common;
    for (auto &pipeline : pipelines)
    {
        if (pipeline.empty())
            continue;
        auto &in = pipeline.operations().front()->in_representations;
        if (!in.has_value())
            continue;
        if (!common.has_value())
        {
            common = in;
            continue;
        }
        std::set<std::string> intersection;
        std::set_intersection(common->begin(),
                              common->end(),
                              in->begin(),
                              in->end(),
                              std::inserter(intersection, intersection.begin()));
        common = std::move(intersection);
    }
    return common;
}

// A branch without a converting operation keeps the input representation, so either every branch
// converts to the same representation or none of them converts.
RepresentationPtr commonOutRepresentation(const std::string &name, const std::vector<Pipeline> &pipelines)
{
    auto describe = [](const RepresentationPtr &representation) {
        return representation == nullptr ? std::string("the input representation") : representation->tag();
    };

    RepresentationPtr common;
    for (size_t idx = 0; idx < pipelines.size(); ++idx)
    {
        RepresentationPtr out;
        for (auto &op : pipelines[idx].operations())
        {
            if (op->out_representation != nullptr)
                out = op->out_representation;
        }
        if (idx == 0)
        {
            common = out;
            continue;
        }
        bool same = (common == nullptr && out == nullptr) ||
                    (common != nullptr && out != nullptr && common->tag() == out->tag());
        if (!same)
        {
            throw IncompatibleRepresentationError("\"" + name +
                                                  "\" pipelines must have the same output representation, got " +
                                                  describe(common) + " and " + describe(out));
        }
    }
    return common;
}

bool anyRequiresFitness(const std::vector<Pipeline> &pipelines)
{
    return std::any_of(pipelines.begin(), pipelines.end(), [](const Pipeline &pipeline) {
        return !pipeline.empty() && pipeline.operations().front()->requires_fitness;
    });
}
} // namespace

OperationPtr maxGenerations(size_t generations)
{
    Operation op;
    op.name = "Termination: max generations";
    op.impl = [generations](Population population, OperationContext &) {
        if (population.generation >= generations)
            population.terminated = true;
        return population;
    };
    return makeOperation(std::move(op));
}

OperationPtr splitJoin(SplitFunction split, std::vector<Pipeline> pipelines, JoinFunction join)
{
    Operation op;
    op.name = "Flow: split join";
    // Fitness is requested eagerly on behalf of the branches.
    op.requires_fitness = anyRequiresFitness(pipelines);
    op.invalidates_fitness = false;
    op.in_representations = commonInRepresentations(pipelines);
    op.out_representation = commonOutRepresentation(op.name, pipelines);
    op.impl = [split, pipelines, join](Population population, OperationContext &ctx) {
        std::vector<Population> parts = split(population);
        t_assert(parts.size() == pipelines.size(), "Split should produce one population per pipeline.");
        for (size_t idx = 0; idx < parts.size(); ++idx)
            parts[idx] = pipelines[idx].apply(std::move(parts[idx]), ctx);
        return join(parts);
    };
    return makeOperation(std::move(op));
}

OperationPtr ifElse(PopulationPredicate predicate, Pipeline on_true, Pipeline on_false)
{
    std::vector<Pipeline> pipelines = {on_true, on_false};

    Operation op;
    op.name = "Flow: if";
    op.in_representations = commonInRepresentations(pipelines);
    op.out_representation = commonOutRepresentation(op.name, pipelines);
    op.impl = [predicate, on_true, on_false](Population population, OperationContext &ctx) {
        const Pipeline &pipeline = predicate(population) ? on_true : on_false;
        return pipeline.apply(std::move(population), ctx);
    };
    return makeOperation(std::move(op));
}

SplitFunction splitEven(size_t k)
{
    if (k == 0)
        throw std::invalid_argument("splitEven requires at least one part");

    return [k](const Population &population) {
        size_t size = populationSize(population);
        std::vector<Population> parts;
        size_t begin = 0;
        for (size_t idx = 0; idx < k; ++idx)
        {
            size_t part_size = size / k + (idx < size % k ? 1 : 0);
            parts.push_back(slice(population, begin, begin + part_size));
            begin += part_size;
        }
        return parts;
    };
}

JoinFunction joinConcatenate()
{
    return [](const std::vector<Population> &populations) { return concatenate(populations); };
}
