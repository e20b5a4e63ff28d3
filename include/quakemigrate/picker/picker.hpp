#pragma once

#include "quakemigrate/core/event.hpp"
#include "quakemigrate/onset/onset.hpp"
#include <memory>
#include <string>

namespace quakemigrate {

/**
 * PhasePicker - Abstract base class for onset-function phase pickers
 */
class PhasePicker {
public:
    virtual ~PhasePicker() = default;

    // Pick one phase arrival near the predicted time. Never throws on bad
    // data; failures come back as an invalid pick with a status.
    virtual Pick fit(const OnsetTrace& onset, TimePoint predicted,
                     double traveltime) const = 0;

    virtual std::string name() const = 0;

    // Configuration
    virtual void setParameter(const std::string& name, double value) = 0;
    virtual double getParameter(const std::string& name) const = 0;
};

using PhasePickerPtr = std::shared_ptr<PhasePicker>;

} // namespace quakemigrate
