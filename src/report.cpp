//  DAEDALUS – Distributed and Automated Evolutionary Deep Architecture Learning with Unprecedented Scalability
// 
// This research code was developed as part of the research programme Open Technology Programme with project number 18373, which was financed by the Dutch Research Council (NWO), Elekta, and Ortec Logiqcare.
// 
// Project leaders: Peter A.N. Bosman, Tanja Alderliesten
// Researchers: Alex Chebykin, Arthur Guijt, Vangelis Kostoulas
// Main code developer: Arthur Guijt

#include "report.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace
{
std::string formatSeconds(double us)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << us / 1e6;
    return oss.str();
}
} // namespace

std::string formatSummary(const Report &report)
{
    double mean_time = 0.0;
    double mean_generations = 0.0;
    const PopulationReport *best = nullptr;
    for (auto &pr : report.population_reports)
    {
        mean_time += static_cast<double>(pr.time_us);
        mean_generations += static_cast<double>(pr.population.generation);

        auto it = pr.population.log.find("best_fitness");
        if (it == pr.population.log.end())
            continue;
        if (best == nullptr || it->second > best->population.log.at("best_fitness"))
            best = &pr;
    }
    if (!report.population_reports.empty())
    {
        mean_time /= static_cast<double>(report.population_reports.size());
        mean_generations /= static_cast<double>(report.population_reports.size());
    }

    std::ostringstream oss;
    oss << "──── Summary ────\n\n";
    oss << "Total time: " << formatSeconds(static_cast<double>(report.total_time_us)) << "s\n";
    oss << "Populations: " << report.population_reports.size() << "\n";
    oss << "Population time (mean): " << formatSeconds(std::round(mean_time)) << "s\n";
    oss << "Generations (mean): " << std::llround(mean_generations);

    if (best != nullptr)
    {
        const PopulationLog &log = best->population.log;
        oss << "\n\n──── Best individual ────\n\n";
        oss << "Fitness: " << log.at("best_fitness") << "\n";
        auto generation = log.find("best_generation");
        if (generation != log.end())
            oss << "Generation: " << std::llround(generation->second) << "\n";
        auto genome = best->population.notes.find("best_genome");
        if (genome != best->population.notes.end())
            oss << "Genome: " << genome->second << "\n";
        oss << "Population: " << best->index;
    }
    return oss.str();
}
