#include "quakemigrate/core/settings.hpp"
#include "quakemigrate/core/exception.hpp"
#include <algorithm>
#include <regex>
#include <sstream>

namespace quakemigrate {

std::string onsetPolicyToString(OnsetPolicy p) {
    return p == OnsetPolicy::Classic ? "classic" : "centred";
}

std::string stackModeToString(StackMode m) {
    return m == StackMode::Sum ? "sum" : "geometric";
}

std::string thresholdMethodToString(ThresholdMethod m) {
    return m == ThresholdMethod::Static ? "static" : "dynamic";
}

std::string marginalModeToString(MarginalMode m) {
    return m == MarginalMode::Sum ? "sum" : "max";
}

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), ::tolower);
    return s;
}

void readPhaseOnset(const Config& config, const std::string& prefix,
                    PhaseOnsetSettings& p) {
    p.sta = config.getDouble("onset." + prefix + "_sta", p.sta);
    p.lta = config.getDouble("onset." + prefix + "_lta", p.lta);
    p.filter = config.getBool("onset." + prefix + "_filter", p.filter);
    p.low = config.getDouble("onset." + prefix + "_low", p.low);
    p.high = config.getDouble("onset." + prefix + "_high", p.high);
    p.corners = config.getInt("onset." + prefix + "_corners", p.corners);
    if (config.has("onset." + prefix + "_components")) {
        p.components.clear();
        for (const auto& c : config.getStringList("onset." + prefix + "_components")) {
            if (c.size() != 1) {
                throw ConfigError("onset." + prefix + "_components entries must be "
                                  "single component letters, got '" + c + "'");
            }
            p.components.push_back(static_cast<char>(std::toupper(c[0])));
        }
    }
}

void requirePositive(double value, const std::string& name) {
    if (!(value > 0)) {
        std::ostringstream oss;
        oss << name << " must be positive, got " << value;
        throw ConfigError(oss.str());
    }
}

void requireFraction(double value, const std::string& name) {
    if (!(value > 0 && value < 1)) {
        std::ostringstream oss;
        oss << name << " must lie in (0, 1), got " << value;
        throw ConfigError(oss.str());
    }
}

} // namespace

double OnsetSettings::maxLta() const {
    double m = 0;
    for (const auto& [phase, p] : phases) m = std::max(m, p.lta);
    return m;
}

RunSettings RunSettings::fromConfig(const Config& config) {
    RunSettings s;

    // Grid
    s.grid.ll_corner = config.getPoint3("grid.ll_corner", s.grid.ll_corner);
    s.grid.ur_corner = config.getPoint3("grid.ur_corner", s.grid.ur_corner);
    s.grid.node_spacing = config.getPoint3("grid.node_spacing", s.grid.node_spacing);

    // Lookup table
    if (config.has("lut.phases")) {
        s.lut.phases.clear();
        for (const auto& name : config.getStringList("lut.phases")) {
            PhaseType p = stringToPhaseType(name);
            if (p == PhaseType::Unknown) {
                throw ConfigError("Unknown phase in lut.phases: " + name);
            }
            s.lut.phases.push_back(p);
        }
    }
    s.lut.velocity_model = lower(config.getString("lut.velocity_model", s.lut.velocity_model));
    s.lut.vp = config.getDouble("lut.vp", s.lut.vp);
    s.lut.vs = config.getDouble("lut.vs", s.lut.vs);
    s.lut.velocity_file = config.getString("lut.velocity_file", s.lut.velocity_file);
    s.lut.nlloc_root = config.getString("lut.nlloc_root", s.lut.nlloc_root);
    s.lut.graph_order = config.getInt("lut.graph_order", s.lut.graph_order);
    s.lut.takeoff_angles = config.getBool("lut.takeoff_angles", s.lut.takeoff_angles);
    s.lut.fraction_tt = config.getDouble("lut.fraction_tt", s.lut.fraction_tt);
    s.lut.max_memory_mb = config.getDouble("lut.max_memory_mb", s.lut.max_memory_mb);
    s.lut.file = config.getString("lut.file", s.lut.file);

    // Onset
    s.onset.log = config.getBool("onset.log", s.onset.log);
    s.onset.taper_fraction = config.getDouble("onset.taper_fraction", s.onset.taper_fraction);
    readPhaseOnset(config, "p", s.onset.phases[PhaseType::P]);
    readPhaseOnset(config, "s", s.onset.phases[PhaseType::S]);

    // Scan
    s.scan.sampling_rate = config.getDouble("scan.sampling_rate", s.scan.sampling_rate);
    s.scan.threads = config.getInt("scan.threads", s.scan.threads);
    std::string stack = lower(config.getString("scan.stack", stackModeToString(s.scan.stack)));
    if (stack == "sum") s.scan.stack = StackMode::Sum;
    else if (stack == "geometric") s.scan.stack = StackMode::GeometricMean;
    else throw ConfigError("Unknown scan.stack: " + stack);
    s.scan.normalise = config.getBool("scan.normalise", s.scan.normalise);
    s.scan.timestep = config.getDouble("scan.timestep", s.scan.timestep);
    if (config.has("scan.decimate")) {
        std::vector<double> d = config.getDoubleList("scan.decimate");
        if (d.size() != 3) throw ConfigError("scan.decimate needs three factors");
        for (int i = 0; i < 3; i++) {
            if (d[i] != static_cast<int>(d[i])) {
                throw ConfigError("scan.decimate factors must be integers");
            }
            s.scan.decimate[i] = static_cast<int>(d[i]);
        }
    }
    int block = config.getInt("scan.block_size", static_cast<int>(s.scan.block_size));
    if (block <= 0) throw ConfigError("scan.block_size must be positive");
    s.scan.block_size = static_cast<size_t>(block);

    // Trigger
    std::string method = lower(config.getString("trigger.method",
                                                thresholdMethodToString(s.trigger.method)));
    if (method == "static") s.trigger.method = ThresholdMethod::Static;
    else if (method == "dynamic") s.trigger.method = ThresholdMethod::Dynamic;
    else throw ConfigError("Unknown trigger.method: " + method);
    s.trigger.threshold = config.getDouble("trigger.threshold", s.trigger.threshold);
    s.trigger.window = config.getDouble("trigger.window", s.trigger.window);
    s.trigger.multiplier = config.getDouble("trigger.multiplier", s.trigger.multiplier);
    s.trigger.min_event_interval = config.getDouble("trigger.min_event_interval",
                                                    s.trigger.min_event_interval);
    s.trigger.marginal_window = config.getDouble("trigger.marginal_window",
                                                 s.trigger.marginal_window);
    s.trigger.normalise_coalescence = config.getBool("trigger.normalise_coalescence",
                                                     s.trigger.normalise_coalescence);

    // Locate
    s.locate.marginal_window = config.getDouble("locate.marginal_window",
                                                s.trigger.marginal_window);
    s.locate.sampling_rate = config.getDouble("locate.sampling_rate", s.locate.sampling_rate);
    std::string marginal = lower(config.getString("locate.marginal",
                                                  marginalModeToString(s.locate.marginal)));
    if (marginal == "sum") s.locate.marginal = MarginalMode::Sum;
    else if (marginal == "max") s.locate.marginal = MarginalMode::Max;
    else throw ConfigError("Unknown locate.marginal: " + marginal);
    s.locate.uncertainty_fraction = config.getDouble("locate.uncertainty_fraction",
                                                     s.locate.uncertainty_fraction);
    s.locate.flat_tolerance = config.getDouble("locate.flat_tolerance", s.locate.flat_tolerance);
    s.locate.gaussian_half_width = config.getInt("locate.gaussian_half_width",
                                                 s.locate.gaussian_half_width);
    s.locate.covariance_fraction = config.getDouble("locate.covariance_fraction",
                                                    s.locate.covariance_fraction);
    s.locate.max_volume_mb = config.getDouble("locate.max_volume_mb", s.locate.max_volume_mb);
    s.locate.write_volume = config.getBool("locate.write_volume", s.locate.write_volume);

    // Picker
    s.picker.half_width = config.getDouble("picker.half_width", s.picker.half_width);
    s.picker.noise_window = config.getDouble("picker.noise_window", s.picker.noise_window);
    s.picker.threshold_multiplier = config.getDouble("picker.threshold_multiplier",
                                                     s.picker.threshold_multiplier);
    s.picker.uncertainty_scale = config.getDouble("picker.uncertainty_scale",
                                                  s.picker.uncertainty_scale);
    s.picker.max_iterations = config.getInt("picker.max_iterations", s.picker.max_iterations);

    // Magnitude
    s.magnitude.enabled = config.getBool("magnitude.enabled", s.magnitude.enabled);
    s.magnitude.a0 = config.getString("magnitude.a0", s.magnitude.a0);
    s.magnitude.signal_window = config.getDouble("magnitude.signal_window",
                                                 s.magnitude.signal_window);
    s.magnitude.noise_window = config.getDouble("magnitude.noise_window",
                                                s.magnitude.noise_window);
    s.magnitude.noise_measure = config.getString("magnitude.noise_measure",
                                                 s.magnitude.noise_measure);
    std::transform(s.magnitude.noise_measure.begin(), s.magnitude.noise_measure.end(),
                   s.magnitude.noise_measure.begin(), ::toupper);
    s.magnitude.use_hyp_dist = config.getBool("magnitude.use_hyp_dist", s.magnitude.use_hyp_dist);
    s.magnitude.amp_multiplier = config.getDouble("magnitude.amp_multiplier",
                                                  s.magnitude.amp_multiplier);
    s.magnitude.noise_filter = config.getDouble("magnitude.noise_filter", s.magnitude.noise_filter);
    s.magnitude.dist_filter = config.getDouble("magnitude.dist_filter", s.magnitude.dist_filter);
    s.magnitude.pick_filter = config.getBool("magnitude.pick_filter", s.magnitude.pick_filter);
    s.magnitude.weighted_mean = config.getBool("magnitude.weighted_mean", s.magnitude.weighted_mean);
    s.magnitude.filter = lower(config.getString("magnitude.filter", s.magnitude.filter));
    s.magnitude.filter_low = config.getDouble("magnitude.filter_low", s.magnitude.filter_low);
    s.magnitude.filter_high = config.getDouble("magnitude.filter_high", s.magnitude.filter_high);
    s.magnitude.filter_corners = config.getInt("magnitude.filter_corners",
                                               s.magnitude.filter_corners);
    s.magnitude.amp_feature = config.getString("magnitude.amp_feature", s.magnitude.amp_feature);
    s.magnitude.loc_method = lower(config.getString("magnitude.loc_method", s.magnitude.loc_method));
    s.magnitude.trace_filter = config.getString("magnitude.trace_filter", s.magnitude.trace_filter);
    if (config.has("magnitude.station_filter")) {
        s.magnitude.station_filter = config.getStringList("magnitude.station_filter");
    }
    // station_corrections = NET.STA:0.12, NET.STB:-0.05
    for (const auto& entry : config.getStringList("magnitude.station_corrections")) {
        auto pos = entry.rfind(':');
        if (pos == std::string::npos || pos == 0) {
            throw ConfigError("Malformed magnitude.station_corrections entry: " + entry);
        }
        s.magnitude.station_corrections[entry.substr(0, pos)] =
            Config::parseDouble("magnitude.station_corrections", entry.substr(pos + 1));
    }

    // Output and input
    s.output.directory = config.getString("output.directory", s.output.directory);
    s.output.run_name = config.getString("output.run_name", s.output.run_name);
    s.output.write_coalescence = config.getBool("output.write_coalescence",
                                                s.output.write_coalescence);
    s.output.database = config.getString("output.database", s.output.database);
    s.output.verbose = config.getBool("output.verbose", s.output.verbose);

    s.input.stations = config.getString("input.stations", s.input.stations);
    s.input.archive = config.getString("input.archive", s.input.archive);
    s.input.has_reference = config.has("input.reference_latitude") &&
                            config.has("input.reference_longitude");
    s.input.reference_latitude = config.getDouble("input.reference_latitude", 0.0);
    s.input.reference_longitude = config.getDouble("input.reference_longitude", 0.0);

    s.validate();
    return s;
}

void RunSettings::validate() const {
    static const char* axes[3] = {"x", "y", "z"};

    for (int a = 0; a < 3; a++) {
        if (!(grid.ur_corner[a] > grid.ll_corner[a])) {
            std::ostringstream oss;
            oss << "grid: ur_corner must exceed ll_corner along " << axes[a]
                << " (" << grid.ur_corner[a] << " <= " << grid.ll_corner[a] << ")";
            throw ConfigError(oss.str());
        }
        if (!(grid.node_spacing[a] > 0)) {
            std::ostringstream oss;
            oss << "grid: node_spacing along " << axes[a] << " must be positive";
            throw ConfigError(oss.str());
        }
        if (scan.decimate[a] < 1) {
            throw ConfigError(std::string("scan.decimate along ") + axes[a] +
                              " must be at least 1");
        }
    }

    if (lut.phases.empty()) throw ConfigError("lut.phases is empty");
    for (size_t i = 0; i < lut.phases.size(); i++) {
        for (size_t j = i + 1; j < lut.phases.size(); j++) {
            if (lut.phases[i] == lut.phases[j]) {
                throw ConfigError("lut.phases lists " + phaseTypeToString(lut.phases[i]) +
                                  " twice");
            }
        }
    }
    if (lut.velocity_model != "homogeneous" && lut.velocity_model != "layered" &&
        lut.velocity_model != "nonlinloc") {
        throw ConfigError("Unknown lut.velocity_model: " + lut.velocity_model);
    }
    if (lut.velocity_model == "homogeneous") {
        requirePositive(lut.vp, "lut.vp");
        requirePositive(lut.vs, "lut.vs");
    } else if (lut.velocity_model == "nonlinloc") {
        if (lut.nlloc_root.empty()) {
            throw ConfigError("lut.velocity_model = nonlinloc requires lut.nlloc_root");
        }
    } else if (lut.velocity_file.empty()) {
        throw ConfigError("lut.velocity_model = layered requires lut.velocity_file");
    }
    if (lut.graph_order < 1) throw ConfigError("lut.graph_order must be at least 1");
    if (!(lut.fraction_tt >= 0 && lut.fraction_tt < 1)) {
        throw ConfigError("lut.fraction_tt must lie in [0, 1)");
    }
    requirePositive(lut.max_memory_mb, "lut.max_memory_mb");

    for (PhaseType phase : lut.phases) {
        auto it = onset.phases.find(phase);
        if (it == onset.phases.end()) {
            throw ConfigError("No onset settings for phase " + phaseTypeToString(phase));
        }
        const PhaseOnsetSettings& p = it->second;
        std::string name = "onset." + phaseTypeToString(phase);
        requirePositive(p.sta, name + " sta");
        requirePositive(p.lta, name + " lta");
        if (p.lta <= p.sta) {
            throw ConfigError(name + ": lta must be longer than sta");
        }
        if (p.filter) {
            requirePositive(p.low, name + " low");
            if (p.high <= p.low) {
                throw ConfigError(name + ": band-pass high corner must exceed low corner");
            }
            if (p.corners < 1 || p.corners > 8) {
                throw ConfigError(name + ": filter corners must be in 1..8");
            }
        }
        if (p.components.empty()) {
            throw ConfigError(name + ": no components selected");
        }
    }
    if (!(onset.taper_fraction >= 0 && onset.taper_fraction < 0.5)) {
        throw ConfigError("onset.taper_fraction must lie in [0, 0.5)");
    }

    requirePositive(scan.sampling_rate, "scan.sampling_rate");
    if (scan.threads < 1) throw ConfigError("scan.threads must be at least 1");
    requirePositive(scan.timestep, "scan.timestep");
    if (scan.block_size == 0) throw ConfigError("scan.block_size must be positive");

    requirePositive(trigger.threshold, "trigger.threshold");
    if (trigger.method == ThresholdMethod::Dynamic) {
        requirePositive(trigger.window, "trigger.window");
        if (trigger.multiplier < 0) throw ConfigError("trigger.multiplier must be non-negative");
    }
    if (trigger.min_event_interval < 0) {
        throw ConfigError("trigger.min_event_interval must be non-negative");
    }
    requirePositive(trigger.marginal_window, "trigger.marginal_window");

    requirePositive(locate.marginal_window, "locate.marginal_window");
    requirePositive(locate.sampling_rate, "locate.sampling_rate");
    requireFraction(locate.uncertainty_fraction, "locate.uncertainty_fraction");
    if (locate.flat_tolerance < 0) throw ConfigError("locate.flat_tolerance must be non-negative");
    if (locate.gaussian_half_width < 1) {
        throw ConfigError("locate.gaussian_half_width must be at least 1");
    }
    requireFraction(locate.covariance_fraction, "locate.covariance_fraction");
    requirePositive(locate.max_volume_mb, "locate.max_volume_mb");

    requirePositive(picker.half_width, "picker.half_width");
    requirePositive(picker.noise_window, "picker.noise_window");
    if (picker.threshold_multiplier < 0) {
        throw ConfigError("picker.threshold_multiplier must be non-negative");
    }
    requirePositive(picker.uncertainty_scale, "picker.uncertainty_scale");
    if (picker.max_iterations < 1) throw ConfigError("picker.max_iterations must be at least 1");

    if (magnitude.enabled) {
        static const char* curves[] = {"Hutton-Boore", "keir2006", "UK", "Richter"};
        if (std::find(std::begin(curves), std::end(curves), magnitude.a0) == std::end(curves)) {
            throw ConfigError("Unknown magnitude.a0: " + magnitude.a0);
        }
        if (magnitude.noise_measure != "RMS" && magnitude.noise_measure != "STD") {
            throw ConfigError("magnitude.noise_measure must be RMS or STD");
        }
        if (magnitude.signal_window < 0) throw ConfigError("magnitude.signal_window must be >= 0");
        requirePositive(magnitude.noise_window, "magnitude.noise_window");
        requirePositive(magnitude.amp_multiplier, "magnitude.amp_multiplier");
        if (magnitude.dist_filter < 0) throw ConfigError("magnitude.dist_filter must be >= 0");
        if (magnitude.filter != "none" && magnitude.filter != "bandpass" &&
            magnitude.filter != "highpass") {
            throw ConfigError("Unknown magnitude.filter: " + magnitude.filter);
        }
        if (magnitude.filter == "bandpass" && magnitude.filter_high <= magnitude.filter_low) {
            throw ConfigError("magnitude band-pass high corner must exceed low corner");
        }
        if (magnitude.amp_feature != "S_amp" && magnitude.amp_feature != "P_amp") {
            throw ConfigError("magnitude.amp_feature must be S_amp or P_amp");
        }
        if (magnitude.loc_method != "spline" && magnitude.loc_method != "gaussian" &&
            magnitude.loc_method != "covariance") {
            throw ConfigError("Unknown magnitude.loc_method: " + magnitude.loc_method);
        }
        try {
            std::regex check(magnitude.trace_filter);
        } catch (const std::regex_error& e) {
            throw ConfigError("Invalid magnitude.trace_filter '" + magnitude.trace_filter +
                              "': " + e.what());
        }
    }

    if (output.run_name.empty()) throw ConfigError("output.run_name is empty");
}

} // namespace quakemigrate
