#pragma once

#include "quakemigrate/core/archive.hpp"
#include "quakemigrate/core/event.hpp"
#include "quakemigrate/core/projection.hpp"
#include "quakemigrate/core/settings.hpp"
#include "quakemigrate/core/station.hpp"
#include "quakemigrate/database/catalog_database.hpp"
#include "quakemigrate/io/output_writer.hpp"
#include "quakemigrate/lut/lookup_table.hpp"
#include "quakemigrate/migration/migration_engine.hpp"
#include "quakemigrate/trigger/trigger.hpp"
#include <atomic>
#include <memory>
#include <vector>

namespace quakemigrate {

/**
 * QuakeScan - Runs the detect, trigger and locate stages of one configured
 * project
 *
 * Stations must already carry their grid positions. Every stage writes its
 * products below the output run directory and, when output.database is
 * set, into the event catalog.
 */
class QuakeScan {
public:
    QuakeScan(const RunSettings& settings, const StationInventory& inventory,
              WaveformSourcePtr source);

    // Travel-time tables for every station of the inventory
    LookupTablePtr buildLut() const;

    void setLut(LookupTablePtr lut) { lut_ = std::move(lut); }
    LookupTablePtr lut() const { return lut_; }

    // Loads lut.file; false if it cannot be read
    bool loadLut();

    void setProjection(ProjectionPtr projection) { projection_ = std::move(projection); }

    // Continuous coalescence over [start, end), migrated in chunks of
    // scan.timestep on the decimated grid. Ticks already in the day files
    // are not migrated again. Returns the samples computed by this call.
    CoalescenceSeries detect(TimePoint start, TimePoint end);

    // Candidates with peak in [start, end) from the stored coalescence
    std::vector<Trigger> trigger(TimePoint start, TimePoint end);

    // Locates the stored triggers with peak in [start, end)
    std::vector<Event> locate(TimePoint start, TimePoint end);
    std::vector<Event> locate(const std::vector<Trigger>& triggers);

    // Stops detect() before its next tick; safe to call from a signal handler
    void requestStop();
    bool stopRequested() const { return stop_.load(); }

    const OutputWriter& output() const { return output_; }

private:
    RunSettings settings_;
    StationInventory inventory_;
    WaveformSourcePtr source_;
    LookupTablePtr lut_;
    ProjectionPtr projection_;
    OutputWriter output_;
    std::unique_ptr<CatalogDatabase> catalog_;
    std::atomic<bool> stop_;
    std::atomic<MigrationEngine*> active_engine_;

    void requireLut() const;
    CatalogDatabase* catalog();
    std::vector<Pick> pick(const Event& event, const OnsetData& onsets) const;
};

} // namespace quakemigrate
