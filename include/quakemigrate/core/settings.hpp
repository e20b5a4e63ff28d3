#pragma once

#include "types.hpp"
#include "config.hpp"
#include <array>
#include <map>
#include <string>
#include <vector>

namespace quakemigrate {

// STA/LTA evaluation policy
enum class OnsetPolicy {
    Classic,    // trailing windows, causal
    Centred     // windows centred on the sample
};

// How station/phase onsets are combined at a node
enum class StackMode {
    Sum,
    GeometricMean
};

enum class ThresholdMethod {
    Static,
    Dynamic
};

// How the retained volume is collapsed over time
enum class MarginalMode {
    Sum,
    Max
};

std::string onsetPolicyToString(OnsetPolicy p);
std::string stackModeToString(StackMode m);
std::string thresholdMethodToString(ThresholdMethod m);
std::string marginalModeToString(MarginalMode m);

struct GridSettings {
    Point3 ll_corner;
    Point3 ur_corner;
    Point3 node_spacing;
};

struct LutSettings {
    std::vector<PhaseType> phases;
    std::string velocity_model;     // "homogeneous", "layered" or "nonlinloc"
    double vp;
    double vs;
    std::string velocity_file;
    std::string nlloc_root;         // <root>.<PHASE>.<STA>.time.{hdr,buf}
    int graph_order;
    bool takeoff_angles;
    double fraction_tt;
    double max_memory_mb;
    std::string file;

    LutSettings()
        : phases{PhaseType::P, PhaseType::S}
        , velocity_model("homogeneous")
        , vp(5.0)
        , vs(3.0)
        , graph_order(3)
        , takeoff_angles(false)
        , fraction_tt(0.1)
        , max_memory_mb(4096.0) {}
};

struct PhaseOnsetSettings {
    double sta;                 // seconds
    double lta;                 // seconds
    bool filter;
    double low;                 // Hz
    double high;                // Hz
    int corners;
    std::vector<char> components;

    PhaseOnsetSettings()
        : sta(0.2), lta(1.0), filter(true), low(2.0), high(16.0), corners(2) {}
};

struct OnsetSettings {
    std::map<PhaseType, PhaseOnsetSettings> phases;
    bool log;
    double taper_fraction;

    OnsetSettings() : log(false), taper_fraction(0.05) {
        phases[PhaseType::P].components = {'Z'};
        phases[PhaseType::S].components = {'N', 'E'};
    }

    double maxLta() const;
};

struct ScanSettings {
    double sampling_rate;       // ticks per second
    int threads;
    StackMode stack;
    bool normalise;
    double timestep;            // seconds of data migrated per chunk
    std::array<int, 3> decimate;
    size_t block_size;

    ScanSettings()
        : sampling_rate(20.0)
        , threads(1)
        , stack(StackMode::Sum)
        , normalise(true)
        , timestep(120.0)
        , decimate{1, 1, 1}
        , block_size(4096) {}
};

struct TriggerSettings {
    ThresholdMethod method;
    double threshold;           // static threshold, floor of the dynamic one
    double window;              // trailing window of the dynamic threshold (s)
    double multiplier;          // k in mean + k * std
    double min_event_interval;  // cooldown (s)
    double marginal_window;     // s
    bool normalise_coalescence;

    TriggerSettings()
        : method(ThresholdMethod::Static)
        , threshold(1.5)
        , window(300.0)
        , multiplier(3.0)
        , min_event_interval(2.0)
        , marginal_window(2.0)
        , normalise_coalescence(false) {}
};

struct LocateSettings {
    double marginal_window;
    double sampling_rate;
    MarginalMode marginal;
    double uncertainty_fraction;
    double flat_tolerance;
    int gaussian_half_width;    // nodes either side of the peak
    double covariance_fraction;
    double max_volume_mb;
    bool write_volume;

    LocateSettings()
        : marginal_window(2.0)
        , sampling_rate(50.0)
        , marginal(MarginalMode::Sum)
        , uncertainty_fraction(0.5)
        , flat_tolerance(1e-6)
        , gaussian_half_width(2)
        , covariance_fraction(0.5)
        , max_volume_mb(2048.0)
        , write_volume(false) {}
};

struct PickerSettings {
    double half_width;          // s, added to fraction_tt * tt
    double noise_window;        // s before the pick window
    double threshold_multiplier;
    double uncertainty_scale;
    int max_iterations;

    PickerSettings()
        : half_width(0.5)
        , noise_window(2.0)
        , threshold_multiplier(3.0)
        , uncertainty_scale(1.0)
        , max_iterations(100) {}
};

struct MagnitudeSettings {
    bool enabled;
    std::string a0;
    double signal_window;
    double noise_window;
    std::string noise_measure;  // "RMS" or "STD"
    bool use_hyp_dist;
    double amp_multiplier;
    double noise_filter;
    double dist_filter;         // km, 0 disables
    bool pick_filter;
    bool weighted_mean;
    std::string filter;         // "none", "bandpass" or "highpass"
    double filter_low;
    double filter_high;
    int filter_corners;
    std::string amp_feature;    // "S_amp" or "P_amp"
    std::string loc_method;     // "spline", "gaussian" or "covariance"
    std::string trace_filter;   // regex on NET.STA.LOC.CHA, empty keeps all
    std::vector<std::string> station_filter;    // station codes left out of the mean
    std::map<std::string, double> station_corrections;

    MagnitudeSettings()
        : enabled(false)
        , a0("Hutton-Boore")
        , signal_window(0.0)
        , noise_window(10.0)
        , noise_measure("RMS")
        , use_hyp_dist(false)
        , amp_multiplier(1.0)
        , noise_filter(1.0)
        , dist_filter(0.0)
        , pick_filter(false)
        , weighted_mean(false)
        , filter("none")
        , filter_low(1.0)
        , filter_high(20.0)
        , filter_corners(4)
        , amp_feature("S_amp")
        , loc_method("spline") {}
};

struct OutputSettings {
    std::string directory;
    std::string run_name;
    bool write_coalescence;
    std::string database;
    bool verbose;

    OutputSettings()
        : directory(".")
        , run_name("quakemigrate")
        , write_coalescence(true)
        , verbose(true) {}
};

struct InputSettings {
    std::string stations;
    std::string archive;
    double reference_latitude;
    double reference_longitude;
    bool has_reference;

    InputSettings()
        : reference_latitude(0), reference_longitude(0), has_reference(false) {}
};

/**
 * RunSettings - Validated configuration of one run
 *
 * Built from a Config and passed explicitly to every stage; nothing is read
 * from global state.
 */
struct RunSettings {
    GridSettings grid;
    LutSettings lut;
    OnsetSettings onset;
    ScanSettings scan;
    TriggerSettings trigger;
    LocateSettings locate;
    PickerSettings picker;
    MagnitudeSettings magnitude;
    OutputSettings output;
    InputSettings input;

    // Throws ConfigError on any invalid or inconsistent value
    static RunSettings fromConfig(const Config& config);
    void validate() const;
};

} // namespace quakemigrate
