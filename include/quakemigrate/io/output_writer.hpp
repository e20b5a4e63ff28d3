#pragma once

#include "quakemigrate/core/event.hpp"
#include "quakemigrate/core/settings.hpp"
#include "quakemigrate/lut/grid.hpp"
#include "quakemigrate/migration/coalescence.hpp"
#include "quakemigrate/trigger/trigger.hpp"
#include <string>
#include <vector>

namespace quakemigrate {

/**
 * OutputWriter - Run output tree below <directory>/<run_name>/
 *
 *   detect/scan/<run>_<YYYY>_<JJJ>.coa                 continuous coalescence
 *   trigger/<run>_<YYYY>_<JJJ>_TriggeredEvents.csv     candidates
 *   trigger/<run>_<YYYY>_<JJJ>_Summary.txt
 *   locate/events/<uid>.event
 *   locate/picks/<uid>.picks
 *   locate/amplitudes/<uid>.amps
 *   locate/volumes/<uid>.coavol                        retained volume
 *
 * Day partitions follow the UTC day of each sample or trigger peak. All
 * writers return false and report on std::cerr when a file cannot be
 * written.
 */
class OutputWriter {
public:
    explicit OutputWriter(const OutputSettings& settings);

    std::string runDirectory() const;
    std::string coalescencePath(TimePoint day) const;
    std::string triggerPath(TimePoint day) const;
    std::string triggerSummaryPath(TimePoint day) const;
    std::string eventPath(const std::string& uid) const;
    std::string pickPath(const std::string& uid) const;
    std::string amplitudePath(const std::string& uid) const;
    std::string volumePath(const std::string& uid) const;

    // Appends rows to the day files; a new file starts with the header
    bool appendCoalescence(const CoalescenceSeries& series) const;

    // Samples in [start, end) from the day files covering the span.
    // Missing day files are skipped; malformed rows fail the read.
    bool readCoalescence(TimePoint start, TimePoint end, CoalescenceSeries& series) const;

    // Rewrites the day files of every day holding a trigger peak
    bool writeTriggers(const std::vector<Trigger>& triggers,
                       const TriggerSettings& settings) const;

    // Triggers with peak in [start, end)
    bool readTriggers(TimePoint start, TimePoint end, std::vector<Trigger>& triggers) const;

    bool writeEvent(const Event& event) const;
    bool writePicks(const Event& event) const;
    bool writeAmplitudes(const Event& event) const;
    bool writeVolume(const std::string& uid, const Grid3D& grid,
                     const CoalescenceVolume& volume) const;

    const OutputSettings& settings() const { return settings_; }

private:
    OutputSettings settings_;

    bool ensureDirectory(const std::string& path) const;
    std::vector<TimePoint> daysCovering(TimePoint start, TimePoint end) const;
};

} // namespace quakemigrate
