#include <montecarlo/potential.hpp>
#include <montecarlo/errors.hpp>
#include <montecarlo/debug_log.hpp>
#include <cmath>
#include <exception>

namespace montecarlo {

double log_potential(double score) {
    if (std::isnan(score) || !(score > 0.0)) {
        return NEG_INF;
    }
    return std::log(score);
}

PotentialSet::PotentialSet(std::initializer_list<std::shared_ptr<const Potential>> potentials) {
    for (const auto& p : potentials) {
        add(p);
    }
}

void PotentialSet::add(std::shared_ptr<const Potential> potential, FailurePolicy on_error) {
    if (!potential) {
        throw ConfigurationError("potential must not be null");
    }
    Entry entry{std::move(potential), on_error};
    if (entry.potential->is_efficient()) {
        // Keep efficient potentials ahead of expensive ones, insertion order within each group
        auto first_expensive = std::find_if(entries_.begin(), entries_.end(),
                                            [](const Entry& e) { return !e.potential->is_efficient(); });
        entries_.insert(first_expensive, std::move(entry));
    } else {
        entries_.push_back(std::move(entry));
    }
}

std::vector<std::string> PotentialSet::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& e : entries_) {
        result.push_back(e.potential->name());
    }
    return result;
}

IncrementalWeight PotentialSet::incremental_log_weight(const SequenceView& view) const {
    IncrementalWeight result;
    for (const auto& entry : entries_) {
        const Potential& potential = *entry.potential;
        double score = 0.0;
        try {
            if (!potential.is_satisfied(view)) {
                result.log_weight = NEG_INF;
                return result;
            }
            score = potential.score(view);
        } catch (const AbortedException&) {
            throw;
        } catch (const std::exception& e) {
            if (entry.on_error == FailurePolicy::AbortRun) {
                throw PotentialEvaluationError(potential.name(), e.what());
            }
            MONTECARLO_WARN_LOG("potential '%s' failed, particle scores -inf: %s", potential.name().c_str(), e.what());
            result.log_weight = NEG_INF;
            result.isolated_failures += 1;
            return result;
        }

        if (std::isnan(score)) {
            MONTECARLO_WARN_LOG("potential '%s' returned NaN, clipped to -inf", potential.name().c_str());
        }
        result.log_weight += log_potential(score);
        if (result.log_weight == NEG_INF) {
            return result;
        }
    }
    return result;
}

} // namespace montecarlo
