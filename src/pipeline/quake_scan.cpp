#include "quakemigrate/pipeline/quake_scan.hpp"
#include "quakemigrate/core/exception.hpp"
#include "quakemigrate/core/time_util.hpp"
#include "quakemigrate/locator/coalescence_locator.hpp"
#include "quakemigrate/magnitude/local_magnitude.hpp"
#include "quakemigrate/onset/stalta_onset.hpp"
#include "quakemigrate/picker/gaussian_picker.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace quakemigrate {

QuakeScan::QuakeScan(const RunSettings& settings, const StationInventory& inventory,
                     WaveformSourcePtr source)
    : settings_(settings)
    , inventory_(inventory)
    , source_(std::move(source))
    , output_(settings.output)
    , stop_(false)
    , active_engine_(nullptr)
{
    settings_.validate();
}

LookupTablePtr QuakeScan::buildLut() const {
    if (inventory_.empty()) {
        throw ConfigError("Cannot build a lookup table without stations");
    }

    Grid3D grid(settings_.grid.ll_corner, settings_.grid.ur_corner,
                settings_.grid.node_spacing);

    std::vector<LutStation> stations;
    for (const auto& [key, station] : inventory_.stations()) {
        stations.emplace_back(key, station->position());
    }

    LutBuildOptions options;
    options.graph_order = settings_.lut.graph_order;
    options.takeoff_angles = settings_.lut.takeoff_angles;
    options.fraction_tt = settings_.lut.fraction_tt;
    options.max_memory_mb = settings_.lut.max_memory_mb;

    // Precomputed grids bring their own geometry
    if (settings_.lut.velocity_model == "nonlinloc") {
        auto lut = std::make_shared<LookupTable>();
        lut->importNonLinLoc(settings_.lut.nlloc_root, stations, settings_.lut.phases, options);
        return lut;
    }

    std::unique_ptr<VelocityModel> model;
    if (settings_.lut.velocity_model == "layered") {
        auto layered = std::make_unique<VelocityModel1D>(settings_.lut.velocity_file);
        if (!layered->loadFromFile(settings_.lut.velocity_file)) {
            throw ConfigError("Cannot load velocity model " + settings_.lut.velocity_file);
        }
        model = std::move(layered);
    } else {
        model = std::make_unique<HomogeneousVelocityModel>(settings_.lut.vp, settings_.lut.vs);
    }

    if (settings_.output.verbose) {
        std::cout << "Building LUT: " << grid.nx() << " x " << grid.ny() << " x " << grid.nz()
                  << " nodes, " << stations.size() << " stations, "
                  << settings_.lut.phases.size() << " phases, model "
                  << model->name() << std::endl;
    }

    auto lut = std::make_shared<LookupTable>();
    lut->build(grid, stations, settings_.lut.phases, *model, options);
    return lut;
}

bool QuakeScan::loadLut() {
    auto lut = std::make_shared<LookupTable>();
    if (!lut->load(settings_.lut.file)) {
        std::cerr << "QuakeScan: cannot load LUT " << settings_.lut.file << std::endl;
        return false;
    }
    lut_ = lut;
    return true;
}

void QuakeScan::requireLut() const {
    if (!lut_ || lut_->empty()) {
        throw ConfigError("No lookup table loaded");
    }
}

void QuakeScan::requestStop() {
    stop_.store(true);
    MigrationEngine* engine = active_engine_.load();
    if (engine) engine->requestStop();
}

CatalogDatabase* QuakeScan::catalog() {
    if (settings_.output.database.empty()) return nullptr;
    if (!catalog_) {
        auto db = std::make_unique<CatalogDatabase>();
        if (!db->open(settings_.output.database)) {
            throw ResourceError("Cannot open catalog database " + settings_.output.database +
                                ": " + db->lastError());
        }
        catalog_ = std::move(db);
    }
    return catalog_.get();
}

CoalescenceSeries QuakeScan::detect(TimePoint start, TimePoint end) {
    requireLut();

    const ScanSettings& scan = settings_.scan;
    const bool decimated = scan.decimate[0] != 1 || scan.decimate[1] != 1 ||
                           scan.decimate[2] != 1;
    LookupTablePtr scan_lut = decimated
        ? std::make_shared<const LookupTable>(lut_->decimate(scan.decimate))
        : lut_;

    MigrationOptions options;
    options.sampling_rate = scan.sampling_rate;
    options.stack = scan.stack;
    options.normalise = scan.normalise;
    options.threads = static_cast<size_t>(scan.threads);
    options.block_size = scan.block_size;

    STALTAOnset onset(settings_.onset, OnsetPolicy::Classic);
    MigrationEngine engine(scan_lut, options);

    // Cleared before the engine goes out of scope
    struct EngineHandle {
        std::atomic<MigrationEngine*>& slot;
        ~EngineHandle() { slot.store(nullptr); }
    } handle{active_engine_};
    active_engine_.store(&engine);
    if (stop_.load()) engine.requestStop();

    // Resume after the last tick already on disk
    const double dt = 1.0 / scan.sampling_rate;
    CoalescenceSeries stored;
    if (settings_.output.write_coalescence && output_.readCoalescence(start, end, stored) &&
        !stored.empty()) {
        TimePoint resume = addSeconds(stored.back().time, dt);
        if (settings_.output.verbose) {
            std::cout << "Detect: resuming at " << formatTime(resume) << std::endl;
        }
        start = resume;
    }

    CoalescenceSeries result;
    const size_t total = MigrationEngine::tickCount(start, end, scan.sampling_rate);
    const size_t chunk_ticks = std::max<size_t>(
        1, static_cast<size_t>(std::llround(scan.timestep * scan.sampling_rate)));

    for (size_t first = 0; first < total && !engine.stopRequested(); first += chunk_ticks) {
        size_t last = std::min(total, first + chunk_ticks);
        TimePoint chunk_start = addSeconds(start, first * dt);
        TimePoint chunk_end = addSeconds(start, (last - 0.5) * dt);

        TimePoint data_start = addSeconds(chunk_start, -onset.prePadding() - 1.0);
        TimePoint data_end = addSeconds(chunk_end, scan_lut->maxTraveltime() +
                                                   onset.postPadding() + 1.0);
        WaveformMap waveforms = source_->read(data_start, data_end);
        OnsetData onsets = onset.compute(waveforms, *scan_lut);

        CoalescenceSeries chunk;
        size_t ticks = engine.run(onsets, chunk_start, chunk_end, chunk);

        if (settings_.output.write_coalescence && !output_.appendCoalescence(chunk)) {
            throw ResourceError("Cannot write coalescence below " + output_.runDirectory());
        }
        for (const auto& sample : chunk.samples()) {
            if (!result.append(sample)) {
                std::cerr << "Detect: out-of-order tick at " << formatTime(sample.time)
                          << std::endl;
            }
        }

        if (settings_.output.verbose) {
            std::cout << "Detect: " << formatTime(chunk_start) << "  " << ticks
                      << " ticks, " << onsets.presentCount() << "/" << onsets.pairCount()
                      << " onsets" << std::endl;
        }
    }

    if (engine.stopRequested()) {
        std::cout << "Detect: stopped after " << result.size() << " of " << total
                  << " ticks" << std::endl;
    }
    return result;
}

std::vector<Trigger> QuakeScan::trigger(TimePoint start, TimePoint end) {
    const TriggerSettings& ts = settings_.trigger;
    double before = ts.min_event_interval + ts.marginal_window;
    if (ts.method == ThresholdMethod::Dynamic) before += ts.window;
    double after = ts.min_event_interval + ts.marginal_window;

    CoalescenceSeries series;
    if (!output_.readCoalescence(addSeconds(start, -before), addSeconds(end, after), series)) {
        throw FormatError("Cannot read coalescence below " + output_.runDirectory());
    }
    if (series.empty()) {
        std::cerr << "Trigger: no coalescence between " << formatTime(start) << " and "
                  << formatTime(end) << std::endl;
        return {};
    }

    TriggerEngine engine(ts);
    std::vector<Trigger> triggers = engine.run(series, start, end);

    if (settings_.output.verbose) {
        std::cout << "Trigger: " << triggers.size() << " candidate events" << std::endl;
    }
    if (!output_.writeTriggers(triggers, ts)) {
        throw ResourceError("Cannot write triggers below " + output_.runDirectory());
    }
    if (CatalogDatabase* db = catalog()) {
        if (!db->storeTriggers(triggers)) {
            std::cerr << "Trigger: catalog storage failed: " << db->lastError() << std::endl;
        }
    }
    return triggers;
}

std::vector<Event> QuakeScan::locate(TimePoint start, TimePoint end) {
    std::vector<Trigger> triggers;
    if (!output_.readTriggers(start, end, triggers)) {
        throw FormatError("Cannot read triggers below " + output_.runDirectory());
    }
    return locate(triggers);
}

std::vector<Pick> QuakeScan::pick(const Event& event, const OnsetData& onsets) const {
    GaussianPicker picker(settings_.picker, lut_->fractionTT());
    const Point3 hypocentre = event.spline.valid
        ? event.spline.position
        : lut_->grid().nodePosition(event.peak_node);

    std::vector<Pick> picks;
    for (size_t s = 0; s < lut_->stationCount(); s++) {
        for (size_t p = 0; p < lut_->phaseCount(); p++) {
            double tt = lut_->traveltimeAt(s, p, hypocentre);
            TimePoint predicted = addSeconds(event.origin_time, tt);
            Pick pk = picker.fit(onsets.trace(s, p), predicted, tt);
            // Traces without data carry no station name
            pk.station = lut_->stations()[s].id;
            pk.phase = lut_->phases()[p];
            picks.push_back(pk);
        }
    }
    return picks;
}

std::vector<Event> QuakeScan::locate(const std::vector<Trigger>& triggers) {
    requireLut();

    CoalescenceLocator locator(lut_, settings_);
    if (projection_) locator.setProjection(projection_);

    std::unique_ptr<LocalMagnitude> magnitude;
    if (settings_.magnitude.enabled) {
        magnitude = std::make_unique<LocalMagnitude>(settings_.magnitude,
                                                     settings_.locate.marginal_window,
                                                     lut_->fractionTT());
    }

    std::vector<Event> events;
    for (const auto& trigger : triggers) {
        if (stop_.load()) break;

        WaveformMap waveforms = source_->read(locator.dataStart(trigger),
                                              locator.dataEnd(trigger));
        LocateResult result = locator.locate(trigger, waveforms);
        Event& event = result.event;

        event.picks = pick(event, result.onsets);
        if (magnitude) {
            event.magnitude = magnitude->calculate(event, waveforms, *lut_);
        }

        bool written = output_.writeEvent(event) && output_.writePicks(event) &&
                       output_.writeAmplitudes(event);
        if (settings_.locate.write_volume) {
            written = output_.writeVolume(event.uid, lut_->grid(), result.volume) && written;
        }
        if (!written) {
            std::cerr << "Locate: incomplete output for event " << event.uid << std::endl;
        }
        if (CatalogDatabase* db = catalog()) {
            if (!db->storeEvent(event)) {
                std::cerr << "Locate: catalog storage failed for " << event.uid << ": "
                          << db->lastError() << std::endl;
            }
        }

        if (settings_.output.verbose) {
            std::cout << event.summary() << std::endl;
        }
        events.push_back(std::move(event));
    }
    return events;
}

} // namespace quakemigrate
